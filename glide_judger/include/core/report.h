/**
 * @file report.h
 * @brief 报告序列化与题目文件读取
 *
 * 题目文件格式：
 *   {
 *     "id": "summation",
 *     "function": "summation",
 *     "cases": [ {"args": [1, 2], "expected": 3}, ... ]
 *   }
 */

#ifndef GLIDE_CORE_REPORT_H
#define GLIDE_CORE_REPORT_H

#include <string>
#include <vector>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/value.h"

namespace glide {

inline Value to_json(const Verdict &v) {
    Value j = Value::object();
    j["case_index"] = v.case_index;
    j["passed"] = v.passed;
    j["actual"] = v.actual;
    j["expected"] = v.expected;
    j["message"] = v.message;
    j["exit_status"] = exit_status_str(v.exit_status);
    j["wall_time_ms"] = v.wall_time_ms;
    j["stdout"] = v.stdout_text;
    j["stderr"] = v.stderr_text;
    j["args"] = v.args_text;
    if (v.failure != ErrorCode::OK) {
        j["failure"] = error_code_str(v.failure);
    }
    return j;
}

inline Value to_json(const GradingReport &r) {
    Value j = Value::object();
    j["submission"] = {
        {"id", r.submission_id},
        {"problem_id", r.problem_id},
        {"language", language_tag(r.language)}
    };
    j["status"] = overall_status_str(r.status);
    if (r.build_failure != ErrorCode::OK) {
        j["build_failure"] = error_code_str(r.build_failure);
    }
    j["diagnostic"] = r.diagnostic;
    j["passed"] = r.passed;
    j["failed"] = r.failed;
    j["total"] = r.total;
    j["wall_time_ms"] = r.wall_time_ms;
    Value verdicts = Value::array();
    for (const auto &v : r.verdicts) {
        verdicts.push_back(to_json(v));
    }
    j["verdicts"] = std::move(verdicts);
    return j;
}

inline Value to_json(const TraceReport &r) {
    Value steps = Value::array();
    for (const auto &s : r.steps) {
        Value locals = Value::object();
        for (const auto &kv : s.locals) {
            locals[kv.first] = kv.second;
        }
        Value step = {
            {"event", s.event},
            {"line", s.line},
            {"code", s.code},
            {"locals", std::move(locals)}
        };
        if (s.return_value) {
            step["return"] = *s.return_value;
        }
        steps.push_back(std::move(step));
    }

    Value j = Value::object();
    j["trace"] = std::move(steps);
    j["truncated"] = r.truncated;
    j["stdout"] = r.stdout_text;
    j["stderr"] = r.stderr_text;
    j["argsUsed"] = r.args_used;
    j["timed_out"] = r.timed_out;
    if (r.return_value) j["return"] = *r.return_value;
    if (r.error) j["error"] = *r.error;
    return j;
}

/**
 * @brief 题目：入口函数与测试点
 */
struct Problem {
    std::string id;
    std::string entry_function;
    std::vector<TestCase> cases;
};

inline Result<Problem> parse_problem(const Value &root) {
    GLIDE_ENSURE(root.is_object(), ErrorCode::INVALID_REQUEST, "problem must be a JSON object");
    Problem p;
    if (root.contains("id") && root["id"].is_string()) {
        p.id = root["id"].get<std::string>();
    }
    GLIDE_ENSURE(root.contains("function") && root["function"].is_string(),
                 ErrorCode::INVALID_REQUEST, "problem.function must be a string");
    p.entry_function = root["function"].get<std::string>();
    if (p.id.empty()) {
        p.id = p.entry_function;
    }

    GLIDE_ENSURE(root.contains("cases") && root["cases"].is_array(),
                 ErrorCode::INVALID_REQUEST, "problem.cases must be an array");
    int index = 0;
    for (const auto &c : root["cases"]) {
        std::string where = "cases[" + std::to_string(index) + "]";
        GLIDE_ENSURE(c.is_object(), ErrorCode::INVALID_REQUEST, where + " must be an object");
        GLIDE_ENSURE(c.contains("args") && c["args"].is_array(), ErrorCode::INVALID_REQUEST,
                     where + ".args must be an array");
        GLIDE_ENSURE(c.contains("expected"), ErrorCode::INVALID_REQUEST, where + ".expected is missing");
        TestCase tc;
        tc.case_index = index++;
        tc.args = c["args"];
        tc.expected = c["expected"];
        p.cases.push_back(std::move(tc));
    }
    return Ok(std::move(p));
}

inline Result<Problem> load_problem(const std::string &path) {
    GLIDE_TRY_UNWRAP(text, read_file(path));
    auto root = parse_json(text);
    GLIDE_ENSURE(root.has_value(), ErrorCode::CONFIG_PARSE_ERROR, path + ": not valid JSON");
    auto problem = parse_problem(*root);
    if (problem.is_error()) {
        problem.error().with_context(path);
    }
    return problem;
}

} // namespace glide

#endif // GLIDE_CORE_REPORT_H

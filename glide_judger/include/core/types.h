/**
 * @file types.h
 * @brief 评测数据结构
 *
 * - Submission:       一次提交
 * - TestCase:         测试点
 * - ExecutionOutcome: 单个测试点的执行结果
 * - BuildResult:      编译结果
 * - Verdict:          单个测试点的判定
 * - GradingReport:    汇总报告
 * - Trace*:           单步追踪
 */

#ifndef GLIDE_CORE_TYPES_H
#define GLIDE_CORE_TYPES_H

#include <string>
#include <vector>
#include <optional>

#include "core/error.h"
#include "core/language.h"
#include "core/value.h"

namespace glide {

/**
 * @brief 提交
 *
 * 创建后不再修改，由一次评测请求独占。
 */
struct Submission {
    std::string id;
    GuestLanguage language = GuestLanguage::Python;
    std::string source_code;
    std::string problem_id;
    std::string entry_function;   ///< 题目约定的入口函数名
};

/**
 * @brief 未校验语言标签的提交请求（Dispatcher 入口）
 */
struct SubmissionRequest {
    std::string language_tag;
    std::string source_code;
    std::string problem_id;
    std::string entry_function;
};

struct TestCase {
    int case_index = 0;
    Value args = Value::array();
    Value expected;
};

enum class ExitStatus {
    Success,
    NonZero,
    Timeout,
    Crash
};

inline const char* exit_status_str(ExitStatus s) {
    switch (s) {
        case ExitStatus::Success: return "success";
        case ExitStatus::NonZero: return "non_zero";
        case ExitStatus::Timeout: return "timeout";
        case ExitStatus::Crash:   return "crash";
    }
    return "unknown";
}

/**
 * @brief 单个测试点的执行结果
 *
 * returned_value 是桩代码输出的原始文本（通常为 JSON），缺失表示没有产出结果。
 */
struct ExecutionOutcome {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<std::string> returned_value;
    ExitStatus exit_status = ExitStatus::Success;
    int exit_code = 0;
    int term_signal = 0;
    long wall_time_ms = 0;
    bool output_truncated = false;
};

struct BuildResult {
    bool succeeded = true;
    bool skipped = false;          ///< 解释型语言无编译步骤
    ErrorCode failure = ErrorCode::OK;   ///< COMPILE_ERROR / COMPILE_TIMEOUT
    std::string diagnostic;
    long wall_time_ms = 0;

    static BuildResult no_build() {
        BuildResult r;
        r.skipped = true;
        return r;
    }
};

struct Verdict {
    int case_index = 0;
    bool passed = false;
    Value actual;
    Value expected;
    std::string message;
    ErrorCode failure = ErrorCode::OK;   ///< RUNTIME_ERROR / TIMEOUT / TYPE_MISMATCH / RESULT_MISSING
    ExitStatus exit_status = ExitStatus::Success;
    long wall_time_ms = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::string args_text;
};

enum class OverallStatus {
    AllPassed,
    Partial,
    CompileError,
    RuntimeError
};

inline const char* overall_status_str(OverallStatus s) {
    switch (s) {
        case OverallStatus::AllPassed:    return "all_passed";
        case OverallStatus::Partial:      return "partial";
        case OverallStatus::CompileError: return "compile_error";
        case OverallStatus::RuntimeError: return "runtime_error";
    }
    return "unknown";
}

struct GradingReport {
    std::string submission_id;
    std::string problem_id;
    GuestLanguage language = GuestLanguage::Python;

    std::vector<Verdict> verdicts;
    OverallStatus status = OverallStatus::AllPassed;
    ErrorCode build_failure = ErrorCode::OK;
    std::string diagnostic;

    int passed = 0;
    int failed = 0;
    int total = 0;
    long wall_time_ms = 0;
};

//==============================================================================
// 单步追踪
//==============================================================================

struct TraceStep {
    std::string event;      ///< call / line / return
    int line = 0;
    std::string code;
    std::vector<std::pair<std::string, std::string>> locals;   ///< 变量名 -> repr
    std::optional<std::string> return_value;
};

struct TraceRequest {
    SubmissionRequest submission;
    std::optional<Value> args;            ///< 显式参数（JSON 数组）
    std::optional<int> test_index;        ///< 取 test_cases 中的某一个
    std::vector<TestCase> test_cases;
    std::vector<int> breakpoints;         ///< 为空时记录每一行
    int max_steps = 0;                    ///< 0 = 引擎默认值
};

struct TraceReport {
    std::vector<TraceStep> steps;
    bool truncated = false;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<std::string> return_value;
    std::string args_used;
    std::optional<std::string> error;
    bool timed_out = false;
};

} // namespace glide

#endif // GLIDE_CORE_TYPES_H

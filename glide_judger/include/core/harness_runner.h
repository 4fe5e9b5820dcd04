/**
 * @file harness_runner.h
 * @brief 一个提交对一组测试点的评测
 *
 * 流程：编译一次 -> 按顺序逐个运行测试点 -> 比较 -> 汇总。
 * 每个测试点恰好产生一个 Verdict，顺序与输入一致；
 * 编译失败时不运行任何测试点，Verdict 序列为空。
 */

#ifndef GLIDE_CORE_HARNESS_RUNNER_H
#define GLIDE_CORE_HARNESS_RUNNER_H

#include <string>
#include <vector>
#include <chrono>
#include <csignal>
#include <cstring>

#include "core/error.h"
#include "core/types.h"
#include "core/comparator.h"
#include "core/grader_logger.h"
#include "executor/executor.h"
#include "sandbox/workspace.h"

namespace glide {

class HarnessRunner {
private:
    Executor &executor_;
    Comparator comparator_;
    size_t capture_limit_;

    static std::string signal_text(int sig) {
        const char *name = sig > 0 ? strsignal(sig) : nullptr;
        return name ? std::string(name) : "signal " + std::to_string(sig);
    }

    static std::string last_line(const std::string &text) {
        std::string t = trim(text);
        size_t nl = t.find_last_of('\n');
        return nl == std::string::npos ? t : t.substr(nl + 1);
    }

    /**
     * @brief 执行结果 -> 判定
     */
    Verdict judge(const TestCase &tc, ExecutionOutcome &&outcome) const {
        Verdict v;
        v.case_index = tc.case_index;
        v.expected = tc.expected;
        v.exit_status = outcome.exit_status;
        v.wall_time_ms = outcome.wall_time_ms;
        v.stdout_text = truncate_text(outcome.stdout_text, capture_limit_);
        v.stderr_text = truncate_text(outcome.stderr_text, capture_limit_);
        v.args_text = render(tc.args);

        switch (outcome.exit_status) {
            case ExitStatus::Timeout:
                v.failure = ErrorCode::TIMEOUT;
                v.message = "Timeout: exceeded " +
                            std::to_string(executor_.descriptor().run_timeout_ms) + " ms";
                return v;
            case ExitStatus::Crash:
                v.failure = ErrorCode::RUNTIME_ERROR;
                v.message = "RuntimeError: killed by " + signal_text(outcome.term_signal);
                return v;
            case ExitStatus::NonZero: {
                v.failure = ErrorCode::RUNTIME_ERROR;
                std::string detail = last_line(outcome.stderr_text);
                v.message = "RuntimeError: " +
                            (detail.empty() ? "exit code " + std::to_string(outcome.exit_code)
                                            : truncate_text(detail, 500));
                return v;
            }
            case ExitStatus::Success:
                break;
        }

        if (!outcome.returned_value) {
            v.failure = ErrorCode::RESULT_MISSING;
            v.message = "RuntimeError: no return value was produced";
            return v;
        }

        Comparison c = comparator_.compare_raw(tc.expected, *outcome.returned_value);
        v.passed = c.passed;
        v.actual = std::move(c.actual);
        if (!c.passed) {
            v.failure = c.type_mismatch ? ErrorCode::TYPE_MISMATCH : ErrorCode::OK;
            v.message = std::move(c.message);
        }
        return v;
    }

public:
    HarnessRunner(Executor &executor, const TolerancePolicy &tolerance)
        : executor_(executor), comparator_(tolerance),
          capture_limit_(static_cast<size_t>(executor.settings().output_limit_kb) * 1024) {}

    /**
     * @brief 整体状态
     *
     * compile_error 由调用方在编译失败时设置；
     * 其余情况：全部通过 -> all_passed，出现运行错误/超时/无返回值 -> runtime_error，否则 partial。
     */
    static OverallStatus aggregate(const std::vector<Verdict> &verdicts) {
        bool all_passed = true;
        bool runtime_failure = false;
        for (const auto &v : verdicts) {
            if (v.passed) continue;
            all_passed = false;
            if (v.failure == ErrorCode::RUNTIME_ERROR || v.failure == ErrorCode::TIMEOUT ||
                v.failure == ErrorCode::RESULT_MISSING) {
                runtime_failure = true;
            }
        }
        if (all_passed) return OverallStatus::AllPassed;
        return runtime_failure ? OverallStatus::RuntimeError : OverallStatus::Partial;
    }

    /**
     * @brief 评测
     *
     * 只有基础设施故障返回 Err；用户代码的任何失败都折叠进报告。
     */
    Result<GradingReport> run(sandbox::Workspace &ws, const Submission &submission,
                              const std::vector<TestCase> &cases) {
        auto start = std::chrono::steady_clock::now();
        GradingReport report;
        report.submission_id = submission.id;
        report.problem_id = submission.problem_id;
        report.language = submission.language;
        report.total = static_cast<int>(cases.size());

        GLIDE_TRY_UNWRAP(build, executor_.build(ws, submission));
        if (!build.succeeded) {
            report.status = OverallStatus::CompileError;
            report.build_failure = build.failure != ErrorCode::OK ? build.failure : ErrorCode::COMPILE_ERROR;
            report.diagnostic = build.diagnostic;
            report.failed = report.total;
            TLOG_INFO << submission.id << ": compile_error (" << report.build_failure << ")";
            return Ok(std::move(report));
        }

        report.verdicts.reserve(cases.size());
        for (const auto &tc : cases) {
            GLIDE_TRY_UNWRAP(outcome, executor_.execute(ws, submission, tc));
            Verdict v = judge(tc, std::move(outcome));
            TLOG_DEBUG << submission.id << " case " << v.case_index << ": "
                       << (v.passed ? "passed" : v.message) << " (" << v.wall_time_ms << " ms)";
            if (v.passed) report.passed++;
            else report.failed++;
            report.verdicts.push_back(std::move(v));
        }

        report.status = aggregate(report.verdicts);
        for (const auto &v : report.verdicts) {
            if (!v.passed) {
                report.diagnostic = v.message;
                break;
            }
        }
        report.wall_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        TLOG_INFO << submission.id << ": " << overall_status_str(report.status) << " "
                  << report.passed << "/" << report.total;
        return Ok(std::move(report));
    }
};

} // namespace glide

#endif // GLIDE_CORE_HARNESS_RUNNER_H

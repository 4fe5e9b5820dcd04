/**
 * @file compiled_executor.h
 * @brief 先编译再运行（C++ / Java）
 *
 * 编译在工作目录根下进行，产物由该提交的所有测试点共享。
 * 编译失败时诊断信息截断到 diagnostic_limit_kb。
 */

#ifndef GLIDE_EXECUTOR_COMPILED_EXECUTOR_H
#define GLIDE_EXECUTOR_COMPILED_EXECUTOR_H

#include <sys/stat.h>

#include "executor/process_executor.h"

namespace glide {

class CompiledExecutor : public ProcessExecutor {
private:
    std::string diagnostic_of(const sandbox::SandboxResult &r) const {
        if (r.status == ExitStatus::Timeout) {
            return "Build timed out after " + std::to_string(descriptor_.build_timeout_ms) + " ms";
        }
        std::string text = r.stderr_text;
        if (!r.stdout_text.empty()) {
            if (!text.empty() && text.back() != '\n') text += '\n';
            text += r.stdout_text;
        }
        if (text.empty()) {
            text = r.message.empty() ? "Build failed" : r.message;
        }
        return truncate_text(text, static_cast<size_t>(settings_.diagnostic_limit_kb) * 1024);
    }

public:
    using ProcessExecutor::ProcessExecutor;

    Result<BuildResult> build(sandbox::Workspace &ws, const Submission &submission) override {
        GLIDE_TRY(write_harness(ws, submission));
        GLIDE_ENSURE(descriptor_.build_command.has_value(), ErrorCode::SANDBOX_FAILURE,
                     std::string("No build command for ") + descriptor_.tag);

        sandbox::SandboxConfig cfg = base_config(ws);
        cfg.argv = descriptor_.expand(*descriptor_.build_command, ws.path());
        cfg.work_dir = ws.path();
        cfg.timeout_ms = descriptor_.build_timeout_ms > 0 ? descriptor_.build_timeout_ms : 10000;
        cfg.memory_limit_mb = descriptor_.build_memory_mb;
        cfg.max_processes = std::max(run_max_processes(), 64);

        BLOG_INFO << "Building " << submission.id << " (" << descriptor_.tag << "): " << cfg.argv[0];
        sandbox::Sandbox box(std::move(cfg));
        GLIDE_TRY_UNWRAP(r, box.run());

        BuildResult result;
        result.wall_time_ms = r.wall_time_ms;
        result.succeeded = r.status == ExitStatus::Success;
        if (result.succeeded && !descriptor_.artifact.empty()) {
            struct stat st;
            if (stat(ws.file(descriptor_.artifact).c_str(), &st) != 0) {
                result.succeeded = false;
                result.diagnostic = "Build produced no " + descriptor_.artifact;
            }
        }
        if (!result.succeeded) {
            result.failure = r.status == ExitStatus::Timeout ? ErrorCode::COMPILE_TIMEOUT
                                                             : ErrorCode::COMPILE_ERROR;
            if (result.diagnostic.empty()) {
                result.diagnostic = diagnostic_of(r);
            }
        }

        if (result.succeeded) {
            BLOG_INFO << "Build of " << submission.id << " finished in " << r.wall_time_ms << " ms";
        } else {
            BLOG_WARN << "Build of " << submission.id << " failed (" << exit_status_str(r.status) << ")";
            BLOG_DEBUG << result.diagnostic;
        }
        return Ok(std::move(result));
    }
};

} // namespace glide

#endif // GLIDE_EXECUTOR_COMPILED_EXECUTOR_H

/**
 * @file process_executor.h
 * @brief 子进程执行器公共部分：生成调用桩、逐测试点在沙箱中运行
 */

#ifndef GLIDE_EXECUTOR_PROCESS_EXECUTOR_H
#define GLIDE_EXECUTOR_PROCESS_EXECUTOR_H

#include "executor/executor.h"
#include "executor/harness.h"
#include "core/grader_logger.h"

namespace glide {

class ProcessExecutor : public Executor {
protected:
    /// 执行器按提交创建，标记随之每个提交一个
    const std::string marker_ = make_result_marker();

    /**
     * @brief 写入调用桩文件（描述中没有桩文件时什么都不做）
     */
    Result<void> write_harness(sandbox::Workspace &ws, const Submission &submission) const {
        if (descriptor_.harness_file.empty()) {
            return Ok();
        }
        GLIDE_TRY_UNWRAP(code, harness::generate(descriptor_, submission.source_code,
                                                 submission.entry_function, marker_));
        auto written = ws.write(descriptor_.harness_file, code);
        if (written.is_error()) {
            return Err(ErrorCode::SANDBOX_FAILURE, written.error().message());
        }
        return Ok();
    }

    sandbox::SandboxConfig base_config(const sandbox::Workspace &ws) const {
        sandbox::SandboxConfig cfg;
        cfg.env = descriptor_.env;
        cfg.workspace_dir = ws.path();
        cfg.output_limit_kb = settings_.output_limit_kb;
        cfg.use_namespace = settings_.use_namespace;
        cfg.disable_address_limit = descriptor_.disable_address_limit;
        return cfg;
    }

public:
    ProcessExecutor(GuestRuntimeDescriptor descriptor, ExecutorSettings settings)
        : Executor(std::move(descriptor), settings) {}

    const std::string& result_marker() const { return marker_; }

    Result<ExecutionOutcome> execute(sandbox::Workspace &ws, const Submission &,
                                     const TestCase &test_case) override {
        GLIDE_TRY_UNWRAP(scratch, ws.make_case_dir(test_case.case_index));

        sandbox::SandboxConfig cfg = base_config(ws);
        cfg.argv = descriptor_.expand(descriptor_.run_command, ws.path());
        cfg.work_dir = scratch.path();
        cfg.stdin_data = render(test_case.args);
        cfg.timeout_ms = descriptor_.run_timeout_ms;
        cfg.memory_limit_mb = run_memory_mb();
        cfg.max_processes = run_max_processes();

        sandbox::Sandbox box(std::move(cfg));
        GLIDE_TRY_UNWRAP(result, box.run());
        return Ok(to_outcome(std::move(result), marker_));
    }
};

} // namespace glide

#endif // GLIDE_EXECUTOR_PROCESS_EXECUTOR_H

/**
 * @file script_executor.h
 * @brief 子进程解释执行（JavaScript）
 *
 * 没有编译步骤；build() 只生成 "源码 + 调用桩" 文件。
 */

#ifndef GLIDE_EXECUTOR_SCRIPT_EXECUTOR_H
#define GLIDE_EXECUTOR_SCRIPT_EXECUTOR_H

#include "executor/process_executor.h"

namespace glide {

class ScriptExecutor : public ProcessExecutor {
public:
    using ProcessExecutor::ProcessExecutor;

    Result<BuildResult> build(sandbox::Workspace &ws, const Submission &submission) override {
        GLIDE_TRY(write_harness(ws, submission));
        return Ok(BuildResult::no_build());
    }
};

} // namespace glide

#endif // GLIDE_EXECUTOR_SCRIPT_EXECUTOR_H

/**
 * @file python_executor.h
 * @brief 嵌入式 Python 执行器
 *
 * 每次运行 fork 一个沙箱子进程（不 exec），由子进程初始化自己的 CPython，
 * 父进程从不初始化解释器。子进程内的受限环境：
 * - 只允许导入白名单模块
 * - 去掉 open/exec/eval/compile/input 等内置函数
 * - stdout/stderr 重定向到有上限的缓冲
 *
 * 两级截止时间：
 * - 追踪函数在 timeout_ms 处抛出 GlideDeadline，保留已捕获的输出和追踪步骤
 * - 沙箱在 timeout_ms + KILL_GRACE_MS 处 SIGKILL 整个进程组，原生代码里的死循环也能结束
 *
 * 运行结果序列化为 JSON 经 fd 3 交回父进程。
 */

#ifndef GLIDE_EXECUTOR_PYTHON_EXECUTOR_H
#define GLIDE_EXECUTOR_PYTHON_EXECUTOR_H

#include <string>
#include <vector>
#include <set>
#include <optional>

#include "executor/executor.h"

namespace glide {

/**
 * @brief 一次嵌入式运行的输入
 */
struct GuestRun {
    std::string source;
    std::string entry_function;
    std::string args_json = "[]";
    int timeout_ms = 5000;
    size_t output_limit = 64 * 1024;

    std::string work_dir;               ///< 子进程工作目录（必须存在）
    std::string workspace_dir;          ///< 提交根目录，空则与 work_dir 相同
    bool use_namespace = true;
    int memory_limit_mb = 512;
    int max_processes = 64;

    bool record = false;
    std::set<int> breakpoints;
    int max_steps = 500;
    int repr_limit = 200;
};

/**
 * @brief 一次嵌入式运行的输出
 */
struct GuestRunResult {
    bool completed = false;           ///< 入口函数正常返回
    bool timed_out = false;
    int term_signal = 0;              ///< 子进程被信号杀死（超时以外）
    std::optional<std::string> result_json;
    std::optional<std::string> return_repr;
    std::string args_repr;
    std::string stdout_text;
    std::string stderr_text;
    bool output_truncated = false;
    std::optional<std::string> error;   ///< "Type: message"
    std::vector<TraceStep> steps;
    bool steps_truncated = false;
    long wall_time_ms = 0;
};

/// 协作式截止时间之后，到强制 SIGKILL 之前的宽限期
constexpr int KILL_GRACE_MS = 1000;

/**
 * @brief 在新的沙箱子进程中运行入口函数
 *
 * 只有解释器本身或沙箱故障时返回 Err；用户代码的异常、超时、崩溃都在结果中。
 */
Result<GuestRunResult> run_guest_python(const GuestRun &run);

class PythonExecutor : public Executor, public TracingExecutor {
private:
    GuestRun base_run(const sandbox::Workspace &ws, const std::string &work_dir,
                      const Submission &submission) const;

public:
    PythonExecutor(GuestRuntimeDescriptor descriptor, ExecutorSettings settings)
        : Executor(std::move(descriptor), settings) {}

    Result<BuildResult> build(sandbox::Workspace &ws, const Submission &submission) override;

    Result<ExecutionOutcome> execute(sandbox::Workspace &ws, const Submission &submission,
                                     const TestCase &test_case) override;

    TracingExecutor* tracing() override {
        return descriptor_.supports_tracing ? this : nullptr;
    }

    Result<TraceReport> trace(sandbox::Workspace &ws, const Submission &submission,
                              const TraceOptions &options) override;
};

} // namespace glide

#endif // GLIDE_EXECUTOR_PYTHON_EXECUTOR_H

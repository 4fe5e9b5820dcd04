/**
 * @file executor.h
 * @brief 语言执行器接口
 *
 * 每种执行策略一个实现：
 * - PythonExecutor:   嵌入解释器，在 fork 出的沙箱子进程中运行，支持单步追踪
 * - ScriptExecutor:   子进程解释执行（JavaScript）
 * - CompiledExecutor: 编译一次，逐测试点运行产物（C++ / Java）
 */

#ifndef GLIDE_EXECUTOR_EXECUTOR_H
#define GLIDE_EXECUTOR_EXECUTOR_H

#include <string>
#include <vector>
#include <random>

#include "core/error.h"
#include "core/types.h"
#include "core/config.h"
#include "core/language.h"
#include "core/utils.h"
#include "glide_env.h"
#include "sandbox/workspace.h"
#include "sandbox/sandbox.h"

namespace glide {

/**
 * @brief 执行器从引擎配置中取用的限制
 */
struct ExecutorSettings {
    int output_limit_kb = 64;
    int diagnostic_limit_kb = 8;
    int memory_limit_mb = 512;
    int max_processes = 64;
    bool use_namespace = true;
    int trace_max_steps = 500;
    int trace_repr_limit = 200;

    static ExecutorSettings from_engine(const EngineConfig &cfg) {
        ExecutorSettings s;
        s.output_limit_kb = cfg.output_limit_kb;
        s.diagnostic_limit_kb = cfg.diagnostic_limit_kb;
        s.memory_limit_mb = cfg.memory_limit_mb;
        s.max_processes = cfg.max_processes;
        s.use_namespace = cfg.sandbox_namespace;
        s.trace_max_steps = cfg.trace_max_steps;
        s.trace_repr_limit = cfg.trace_repr_limit;
        return s;
    }
};

/**
 * @brief 单步追踪参数
 */
struct TraceOptions {
    std::string entry_function;
    Value args = Value::array();
    std::vector<int> breakpoints;
    int max_steps = 500;
};

class TracingExecutor;

class Executor {
protected:
    GuestRuntimeDescriptor descriptor_;
    ExecutorSettings settings_;

    int run_memory_mb() const {
        return descriptor_.run_memory_mb > 0 ? descriptor_.run_memory_mb : settings_.memory_limit_mb;
    }

    int run_max_processes() const {
        return descriptor_.max_processes > 0 ? descriptor_.max_processes : settings_.max_processes;
    }

public:
    Executor(GuestRuntimeDescriptor descriptor, ExecutorSettings settings)
        : descriptor_(std::move(descriptor)), settings_(settings) {}
    virtual ~Executor() = default;

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    const GuestRuntimeDescriptor& descriptor() const { return descriptor_; }
    const ExecutorSettings& settings() const { return settings_; }

    /**
     * @brief 编译（每个提交一次）
     *
     * 编译失败不是错误：返回 succeeded = false 的 BuildResult。
     * 只有基础设施故障返回 Err。
     */
    virtual Result<BuildResult> build(sandbox::Workspace &ws, const Submission &submission) = 0;

    /**
     * @brief 运行一个测试点
     */
    virtual Result<ExecutionOutcome> execute(sandbox::Workspace &ws, const Submission &submission,
                                             const TestCase &test_case) = 0;

    /**
     * @brief 可选能力：单步追踪，不支持时返回 nullptr
     */
    virtual TracingExecutor* tracing() { return nullptr; }
};

class TracingExecutor {
public:
    virtual ~TracingExecutor() = default;
    virtual Result<TraceReport> trace(sandbox::Workspace &ws, const Submission &submission,
                                      const TraceOptions &options) = 0;
};

/// 返回值标记中 nonce 的十六进制位数
constexpr size_t RESULT_NONCE_DIGITS = 32;

/**
 * @brief 为一个提交生成返回值行标记
 */
inline std::string make_result_marker() {
    static const char digits[] = "0123456789abcdef";
    std::random_device rd;
    std::string marker = env::RESULT_MARKER_PREFIX;
    for (size_t i = 0; i < RESULT_NONCE_DIGITS; i += 8) {
        unsigned int word = rd();
        for (int k = 0; k < 8; k++) {
            marker += digits[word & 0xF];
            word >>= 4;
        }
    }
    marker += env::RESULT_MARKER_SUFFIX;
    return marker;
}

/**
 * @brief 检查标记格式，标记会被原样写进桩代码的字符串字面量
 */
inline bool is_result_marker(const std::string &marker) {
    const std::string prefix = env::RESULT_MARKER_PREFIX;
    const std::string suffix = env::RESULT_MARKER_SUFFIX;
    if (marker.size() != prefix.size() + RESULT_NONCE_DIGITS + suffix.size()) return false;
    if (marker.compare(0, prefix.size(), prefix) != 0) return false;
    if (marker.compare(marker.size() - suffix.size(), suffix.size(), suffix) != 0) return false;
    for (size_t i = prefix.size(); i < prefix.size() + RESULT_NONCE_DIGITS; i++) {
        char c = marker[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

/**
 * @brief 从桩代码的 stdout 中取出返回值行
 *
 * 最后一个以 marker 开头的行为返回值，这些行从用户输出中移除。
 * 其他形似标记的行（nonce 不同）是用户自己的输出，原样保留。
 */
inline std::optional<std::string> extract_result_marker(std::string &stdout_text, const std::string &marker) {
    std::optional<std::string> value;
    if (marker.empty()) return value;
    std::string kept;
    kept.reserve(stdout_text.size());

    size_t pos = 0;
    while (pos < stdout_text.size()) {
        size_t nl = stdout_text.find('\n', pos);
        size_t end = nl == std::string::npos ? stdout_text.size() : nl + 1;
        if (stdout_text.compare(pos, marker.size(), marker) == 0) {
            std::string line = stdout_text.substr(pos + marker.size(),
                                                  (nl == std::string::npos ? end : nl) - pos - marker.size());
            if (!line.empty() && line.back() == '\r') line.pop_back();
            value = line;
        } else {
            kept.append(stdout_text, pos, end - pos);
        }
        pos = end;
    }
    // 桩代码在标记前补的换行
    if (value && !kept.empty() && kept.back() == '\n' &&
        (kept.size() == 1 || kept[kept.size() - 2] == '\n')) {
        kept.pop_back();
    }
    stdout_text = std::move(kept);
    return value;
}

/**
 * @brief 入口函数名必须是合法标识符，避免注入桩代码
 */
inline bool is_valid_identifier(const std::string &name) {
    if (name.empty() || name.size() > 128) return false;
    auto head = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
    };
    if (!head(name[0])) return false;
    for (char c : name) {
        if (!head(c) && !(c >= '0' && c <= '9')) return false;
    }
    return true;
}

/**
 * @brief SandboxResult -> ExecutionOutcome，并取出返回值
 */
inline ExecutionOutcome to_outcome(sandbox::SandboxResult &&r, const std::string &marker) {
    ExecutionOutcome out;
    out.stdout_text = std::move(r.stdout_text);
    out.stderr_text = std::move(r.stderr_text);
    out.exit_status = r.status;
    out.exit_code = r.exit_code;
    out.term_signal = r.term_signal;
    out.wall_time_ms = r.wall_time_ms;
    out.output_truncated = r.output_truncated;
    out.returned_value = extract_result_marker(out.stdout_text, marker);
    return out;
}

} // namespace glide

#endif // GLIDE_EXECUTOR_EXECUTOR_H

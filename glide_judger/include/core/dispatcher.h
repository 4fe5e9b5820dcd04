/**
 * @file dispatcher.h
 * @brief 评测入口
 *
 * 校验语言标签与入口函数名（在分配任何资源之前）-> 选择执行器 ->
 * 在线程池中分配工作目录并评测 -> 返回报告。
 *
 * 离开 Dispatcher 的错误只有：
 *   UNSUPPORTED_LANGUAGE  语言标签未知 / 语言不支持追踪
 *   INVALID_REQUEST       请求本身不合法（入口函数名、追踪参数）
 *   SANDBOX_FAILURE       基础设施故障（含工作线程中逃逸的 std::exception）
 */

#ifndef GLIDE_CORE_DISPATCHER_H
#define GLIDE_CORE_DISPATCHER_H

#include <string>
#include <vector>
#include <atomic>
#include <future>
#include <exception>

#include "core/error.h"
#include "core/types.h"
#include "core/config.h"
#include "core/language.h"
#include "core/harness_runner.h"
#include "core/worker_pool.h"
#include "core/grader_logger.h"
#include "executor/executor_factory.h"
#include "sandbox/workspace.h"

namespace glide {

class Dispatcher {
private:
    EngineConfig config_;
    DescriptorTable table_;
    ExecutorSettings settings_;
    ExecutorFactory factory_;
    std::atomic<unsigned long> next_id_{0};
    WorkerPool pool_;

    /**
     * @brief 对外只暴露三类错误，其余基础设施错误统一为 SANDBOX_FAILURE
     */
    template<typename T>
    static Result<T> normalize(Result<T> &&r) {
        if (r.ok()) return std::move(r);
        ErrorCode code = r.error().code();
        if (code == ErrorCode::UNSUPPORTED_LANGUAGE || code == ErrorCode::INVALID_REQUEST ||
            code == ErrorCode::SANDBOX_FAILURE) {
            return std::move(r);
        }
        return Err<T>(ErrorCode::SANDBOX_FAILURE, r.error().to_string());
    }

    /**
     * @brief 校验请求并生成不可变的 Submission
     */
    Result<Submission> admit(const SubmissionRequest &request, const GuestRuntimeDescriptor *&descriptor) {
        GLIDE_TRY_UNWRAP(desc, table_.lookup(request.language_tag));
        GLIDE_ENSURE(is_valid_identifier(request.entry_function), ErrorCode::INVALID_REQUEST,
                     "Invalid entry function name: '" + request.entry_function + "'");
        descriptor = desc;

        Submission s;
        s.id = "sub-" + std::to_string(++next_id_);
        s.language = desc->language;
        s.source_code = request.source_code;
        s.problem_id = request.problem_id;
        s.entry_function = request.entry_function;
        return Ok(std::move(s));
    }

    Result<GradingReport> grade_admitted(const Submission &submission,
                                         const GuestRuntimeDescriptor &descriptor,
                                         const std::vector<TestCase> &cases) {
        std::unique_ptr<Executor> executor = factory_(descriptor, settings_);
        GLIDE_ENSURE(executor != nullptr, ErrorCode::SANDBOX_FAILURE,
                     std::string("No executor for ") + descriptor.tag);
        GLIDE_TRY_UNWRAP(ws, sandbox::Workspace::prepare(config_.workspace_root, submission, descriptor));
        HarnessRunner runner(*executor, config_.tolerance);
        return runner.run(ws, submission, cases);
    }

    /**
     * @brief 在工作线程中执行，std::exception 转换为 SANDBOX_FAILURE
     */
    template<typename T, typename F>
    std::future<Result<T>> schedule(const std::string &what, F &&body) {
        return pool_.enqueue([what, body = std::forward<F>(body)]() mutable -> Result<T> {
            try {
                return normalize<T>(body());
            } catch (const std::exception &e) {
                GLOG_ERROR << what << " failed with exception: " << e.what();
                return Err<T>(ErrorCode::SANDBOX_FAILURE, std::string("internal error: ") + e.what());
            }
        });
    }

    template<typename T>
    static std::future<Result<T>> ready(Result<T> &&r) {
        std::promise<Result<T>> p;
        p.set_value(std::move(r));
        return p.get_future();
    }

    template<typename T>
    static Result<T> wait(std::future<Result<T>> &&f) {
        try {
            return f.get();
        } catch (const std::exception &e) {
            return Err<T>(ErrorCode::SANDBOX_FAILURE, std::string("internal error: ") + e.what());
        }
    }

public:
    explicit Dispatcher(const EngineConfig &config,
                        DescriptorTable table = DescriptorTable(),
                        ExecutorFactory factory = make_executor)
        : config_(config),
          table_(std::move(table)),
          settings_(ExecutorSettings::from_engine(config)),
          factory_(std::move(factory)),
          pool_(config.effective_workers()) {}

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief 异步评测
     *
     * 语言与入口函数在调用线程上同步校验，失败时返回已就绪的 future。
     */
    std::future<Result<GradingReport>> submit(const SubmissionRequest &request,
                                              std::vector<TestCase> cases) {
        const GuestRuntimeDescriptor *descriptor = nullptr;
        auto admitted = admit(request, descriptor);
        if (admitted.is_error()) {
            GLOG_WARN << "Rejected submission: " << admitted.error().message();
            return ready(Result<GradingReport>(admitted.error()));
        }
        Submission submission = std::move(admitted.value());
        GLOG_INFO << "Accepted " << submission.id << " (" << descriptor->tag << ", "
                  << cases.size() << " case(s))";

        return schedule<GradingReport>(submission.id,
            [this, submission = std::move(submission), descriptor, cases = std::move(cases)]() {
                return grade_admitted(submission, *descriptor, cases);
            });
    }

    /**
     * @brief 同步评测
     */
    Result<GradingReport> grade(const SubmissionRequest &request, std::vector<TestCase> cases) {
        return wait(submit(request, std::move(cases)));
    }

    /**
     * @brief 单步追踪（仅支持 supports_tracing 的语言）
     *
     * 参数来源依次为：显式参数、test_index 指定的测试点、第一个测试点、空参数。
     */
    Result<TraceReport> trace(const TraceRequest &request) {
        const GuestRuntimeDescriptor *descriptor = nullptr;
        GLIDE_TRY_UNWRAP(submission, admit(request.submission, descriptor));
        GLIDE_ENSURE(descriptor->supports_tracing, ErrorCode::UNSUPPORTED_LANGUAGE,
                     std::string("tracing not supported for ") + descriptor->tag);

        TraceOptions options;
        options.entry_function = submission.entry_function;
        options.breakpoints = request.breakpoints;
        options.max_steps = request.max_steps > 0 ? request.max_steps : config_.trace_max_steps;
        if (request.args) {
            GLIDE_ENSURE(request.args->is_array(), ErrorCode::INVALID_REQUEST,
                         "trace arguments must be a JSON array");
            options.args = *request.args;
        } else if (request.test_index) {
            int i = *request.test_index;
            GLIDE_ENSURE(i >= 0 && static_cast<size_t>(i) < request.test_cases.size(),
                         ErrorCode::INVALID_REQUEST, "Invalid test index " + std::to_string(i));
            options.args = request.test_cases[static_cast<size_t>(i)].args;
        } else if (!request.test_cases.empty()) {
            options.args = request.test_cases.front().args;
        }
        GLOG_INFO << "Tracing " << submission.id << " (" << descriptor->tag << ")";

        return wait(schedule<TraceReport>(submission.id,
            [this, submission = std::move(submission), descriptor, options = std::move(options)]() mutable
                -> Result<TraceReport> {
                std::unique_ptr<Executor> executor = factory_(*descriptor, settings_);
                GLIDE_ENSURE(executor != nullptr, ErrorCode::SANDBOX_FAILURE,
                             std::string("No executor for ") + descriptor->tag);
                TracingExecutor *tracer = executor->tracing();
                GLIDE_ENSURE(tracer != nullptr, ErrorCode::UNSUPPORTED_LANGUAGE,
                             std::string("tracing not supported for ") + descriptor->tag);
                GLIDE_TRY_UNWRAP(ws, sandbox::Workspace::prepare(config_.workspace_root, submission, *descriptor));
                return tracer->trace(ws, submission, options);
            }));
    }

    const DescriptorTable& descriptors() const { return table_; }
    const EngineConfig& config() const { return config_; }
    size_t queue_depth() { return pool_.queue_depth(); }
};

} // namespace glide

#endif // GLIDE_CORE_DISPATCHER_H

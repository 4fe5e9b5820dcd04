/**
 * @file executor_factory.h
 * @brief 按执行策略创建执行器
 */

#ifndef GLIDE_EXECUTOR_EXECUTOR_FACTORY_H
#define GLIDE_EXECUTOR_EXECUTOR_FACTORY_H

#include <memory>
#include <functional>

#include "executor/executor.h"
#include "executor/python_executor.h"
#include "executor/script_executor.h"
#include "executor/compiled_executor.h"

namespace glide {

using ExecutorFactory =
    std::function<std::unique_ptr<Executor>(const GuestRuntimeDescriptor&, const ExecutorSettings&)>;

inline std::unique_ptr<Executor> make_executor(const GuestRuntimeDescriptor &descriptor,
                                               const ExecutorSettings &settings) {
    switch (descriptor.strategy) {
        case ExecutionStrategy::InProcess:
            return std::make_unique<PythonExecutor>(descriptor, settings);
        case ExecutionStrategy::Script:
            return std::make_unique<ScriptExecutor>(descriptor, settings);
        case ExecutionStrategy::Compiled:
            return std::make_unique<CompiledExecutor>(descriptor, settings);
    }
    return nullptr;
}

} // namespace glide

#endif // GLIDE_EXECUTOR_EXECUTOR_FACTORY_H

/**
 * @file worker_pool.h
 * @brief 固定大小的评测线程池
 *
 * 每个评测请求在一个工作线程上完整执行（编译、逐测试点运行、比较），
 * 请求之间不共享可变状态。
 */

#ifndef GLIDE_CORE_WORKER_POOL_H
#define GLIDE_CORE_WORKER_POOL_H

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>

#include "core/grader_logger.h"

namespace glide {

class WorkerPool {
private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;

    void worker_loop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
                if (tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

public:
    explicit WorkerPool(int threads) {
        if (threads < 1) threads = 1;
        workers_.reserve(static_cast<size_t>(threads));
        for (int i = 0; i < threads; i++) {
            workers_.emplace_back(&WorkerPool::worker_loop, this);
        }
        GLOG_INFO << "Worker pool started with " << threads << " thread(s)";
    }

    /**
     * @brief 排空队列后退出
     */
    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto &t : workers_) {
            if (t.joinable()) t.join();
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<typename F>
    auto enqueue(F &&f) -> std::future<decltype(f())> {
        using R = decltype(f());
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> future = task->get_future();
        size_t depth;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.emplace([task] { (*task)(); });
            depth = tasks_.size();
        }
        cv_.notify_one();
        GLOG_DEBUG << "Queue depth " << depth;
        return future;
    }

    size_t size() const { return workers_.size(); }

    size_t queue_depth() {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }
};

} // namespace glide

#endif // GLIDE_CORE_WORKER_POOL_H

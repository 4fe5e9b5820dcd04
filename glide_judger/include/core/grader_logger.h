/**
 * @file grader_logger.h
 * @brief 评测引擎日志通道
 *
 * 四个通道：
 * - main:    启动、配置、调度
 * - sandbox: 工作区分配与回收、子进程启动、超时强杀
 * - build:   编译阶段
 * - grade:   逐测试点判定
 */

#ifndef GLIDE_CORE_GRADER_LOGGER_H
#define GLIDE_CORE_GRADER_LOGGER_H

#include "core/logger.h"
#include <string>
#include <mutex>
#include <filesystem>
#include <system_error>

namespace glide {

/**
 * @brief 评测引擎日志管理器
 */
class GraderLogger {
private:
    Logger main_logger_;
    Logger sandbox_logger_;
    Logger build_logger_;
    Logger grade_logger_;
    std::string log_dir_;
    bool initialized_ = false;
    std::mutex mutex_;

public:
    GraderLogger()
        : main_logger_("main"),
          sandbox_logger_("sandbox"),
          build_logger_("build"),
          grade_logger_("grade") {}

    /**
     * @brief 初始化日志系统，只生效一次
     * @param level   日志级别
     * @param console 是否输出到控制台（stderr）
     * @param log_dir 日志目录，为空时不写文件
     */
    void init(LogLevel level, bool console, const std::string &log_dir) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) return;
        initialized_ = true;
        log_dir_ = log_dir;

        bool to_file = false;
        if (!log_dir_.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(log_dir_, ec);
            to_file = !ec;
        }

        struct Channel { Logger &logger; const char *file; };
        Channel channels[] = {
            {main_logger_, "/main.log"},
            {sandbox_logger_, "/sandbox.log"},
            {build_logger_, "/build.log"},
            {grade_logger_, "/grade.log"},
        };
        for (auto &ch : channels) {
            ch.logger.set_level(level)
                     .show_timestamp(true)
                     .show_thread(true)
                     .show_location(level <= LogLevel::DEBUG);
            if (console) {
                ch.logger.add_console(true);
            }
            if (to_file) {
                ch.logger.add_file(log_dir_ + ch.file);
            }
        }
    }

    bool initialized() const { return initialized_; }
    const std::string& log_dir() const { return log_dir_; }

    Logger& main()    { return main_logger_; }
    Logger& sandbox() { return sandbox_logger_; }
    Logger& build()   { return build_logger_; }
    Logger& grade()   { return grade_logger_; }

    void flush_all() {
        main_logger_.flush();
        sandbox_logger_.flush();
        build_logger_.flush();
        grade_logger_.flush();
    }

    void set_all_levels(LogLevel level) {
        main_logger_.set_level(level);
        sandbox_logger_.set_level(level);
        build_logger_.set_level(level);
        grade_logger_.set_level(level);
    }
};

/**
 * @brief 全局评测日志器
 *
 * 未调用 init() 时各通道没有 sink，日志被丢弃。
 */
inline GraderLogger& grader_log() {
    static GraderLogger instance;
    return instance;
}

} // namespace glide

//==============================================================================
// 评测专用日志宏
//==============================================================================

// 主日志
#define GLOG_TRACE GLIDE_LOGGER_TRACE(glide::grader_log().main())
#define GLOG_DEBUG GLIDE_LOGGER_DEBUG(glide::grader_log().main())
#define GLOG_INFO  GLIDE_LOGGER_INFO(glide::grader_log().main())
#define GLOG_WARN  GLIDE_LOGGER_WARN(glide::grader_log().main())
#define GLOG_ERROR GLIDE_LOGGER_ERROR(glide::grader_log().main())
#define GLOG_FATAL GLIDE_LOGGER_FATAL(glide::grader_log().main())

// 沙箱日志
#define SLOG_TRACE GLIDE_LOGGER_TRACE(glide::grader_log().sandbox())
#define SLOG_DEBUG GLIDE_LOGGER_DEBUG(glide::grader_log().sandbox())
#define SLOG_INFO  GLIDE_LOGGER_INFO(glide::grader_log().sandbox())
#define SLOG_WARN  GLIDE_LOGGER_WARN(glide::grader_log().sandbox())
#define SLOG_ERROR GLIDE_LOGGER_ERROR(glide::grader_log().sandbox())

// 编译日志
#define BLOG_DEBUG GLIDE_LOGGER_DEBUG(glide::grader_log().build())
#define BLOG_INFO  GLIDE_LOGGER_INFO(glide::grader_log().build())
#define BLOG_WARN  GLIDE_LOGGER_WARN(glide::grader_log().build())
#define BLOG_ERROR GLIDE_LOGGER_ERROR(glide::grader_log().build())

// 评测日志
#define TLOG_TRACE GLIDE_LOGGER_TRACE(glide::grader_log().grade())
#define TLOG_DEBUG GLIDE_LOGGER_DEBUG(glide::grader_log().grade())
#define TLOG_INFO  GLIDE_LOGGER_INFO(glide::grader_log().grade())
#define TLOG_WARN  GLIDE_LOGGER_WARN(glide::grader_log().grade())
#define TLOG_ERROR GLIDE_LOGGER_ERROR(glide::grader_log().grade())

// printf 风格
#define GLOG_INFOF(fmt, ...)  glide::grader_log().main().logf(glide::LogLevel::INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define SLOG_INFOF(fmt, ...)  glide::grader_log().sandbox().logf(glide::LogLevel::INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define TLOG_INFOF(fmt, ...)  glide::grader_log().grade().logf(glide::LogLevel::INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#endif // GLIDE_CORE_GRADER_LOGGER_H

/**
 * @file logger.h
 * @brief 轻量级日志系统
 *
 * 特性：
 * - 多日志级别 (TRACE ~ FATAL)
 * - 控制台彩色输出 / 文件输出
 * - 时间戳、级别、线程号、位置
 * - 线程安全（评测 worker 并发写日志）
 */

#ifndef GLIDE_CORE_LOGGER_H
#define GLIDE_CORE_LOGGER_H

#include <string>
#include <fstream>
#include <iostream>
#include <sstream>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <memory>
#include <vector>
#include <thread>
#include <algorithm>
#include <cstdarg>
#include <cstdio>

namespace glide {

/**
 * @brief 日志级别
 */
enum class LogLevel {
    TRACE = 0,  ///< 逐步细节（沙箱系统调用级）
    DEBUG = 1,  ///< 每次 spawn、每个测试点
    INFO  = 2,  ///< 提交的开始与结束
    WARN  = 3,  ///< 降级运行（无命名空间、无 cgroup）
    ERROR = 4,
    FATAL = 5,
    OFF   = 6   ///< 关闭该通道
};

/**
 * @brief 级别名，定宽 5 个字符以便日志列对齐
 */
inline const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

/**
 * @brief 控制台输出使用的 ANSI 颜色前缀
 */
inline const char* level_to_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";     // 灰
        case LogLevel::DEBUG: return "\033[36m";     // 青
        case LogLevel::INFO:  return "\033[32m";     // 绿
        case LogLevel::WARN:  return "\033[33m";     // 黄
        case LogLevel::ERROR: return "\033[31m";     // 红
        case LogLevel::FATAL: return "\033[35;1m";   // 亮紫
        default: return "";
    }
}

/**
 * @brief 从配置字符串解析日志级别，无法识别时返回 fallback
 */
inline LogLevel parse_log_level(std::string name, LogLevel fallback = LogLevel::INFO) {
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info")  return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    if (name == "off")   return LogLevel::OFF;
    return fallback;
}

/**
 * @brief 日志输出接口
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string &message) = 0;
    virtual void flush() = 0;
};

/**
 * @brief 控制台输出
 *
 * 所有级别都写 stderr，stdout 留给评测报告。
 */
class ConsoleSink : public LogSink {
private:
    bool use_color_;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool use_color = true) : use_color_(use_color) {}

    void write(LogLevel level, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (use_color_) {
            std::cerr << level_to_color(level) << message << "\033[0m" << '\n';
        } else {
            std::cerr << message << '\n';
        }
    }

    void flush() override {
        std::cerr.flush();
    }
};

/**
 * @brief 文件输出
 */
class FileSink : public LogSink {
private:
    std::ofstream file_;
    std::mutex mutex_;
    bool auto_flush_;

public:
    explicit FileSink(const std::string &filename, bool append = true, bool auto_flush = false)
        : auto_flush_(auto_flush) {
        file_.open(filename, append ? std::ios::app : std::ios::trunc);
    }

    bool is_open() const { return file_.is_open(); }

    void write(LogLevel, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!file_.is_open()) return;
        file_ << message << '\n';
        if (auto_flush_) {
            file_.flush();
        }
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.flush();
        }
    }
};

/**
 * @brief 日志记录器
 */
class Logger {
private:
    std::string name_;
    LogLevel level_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex mutex_;
    bool show_timestamp_;
    bool show_thread_;
    bool show_location_;

    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        localtime_r(&time, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static std::string basename(const std::string &path) {
        size_t pos = path.find_last_of('/');
        return (pos == std::string::npos) ? path : path.substr(pos + 1);
    }

public:
    explicit Logger(const std::string &name = "glide")
        : name_(name), level_(LogLevel::INFO),
          show_timestamp_(true), show_thread_(false), show_location_(false) {}

    Logger& set_level(LogLevel level) { level_ = level; return *this; }
    Logger& show_timestamp(bool show) { show_timestamp_ = show; return *this; }
    Logger& show_thread(bool show) { show_thread_ = show; return *this; }
    Logger& show_location(bool show) { show_location_ = show; return *this; }

    LogLevel level() const { return level_; }
    const std::string& name() const { return name_; }
    bool enabled(LogLevel level) const { return level >= level_ && !sinks_.empty(); }

    Logger& add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
        return *this;
    }

    Logger& add_console(bool use_color = true) {
        return add_sink(std::make_shared<ConsoleSink>(use_color));
    }

    /**
     * @brief 添加文件输出，文件打不开时静默跳过
     */
    Logger& add_file(const std::string &filename, bool append = true) {
        auto sink = std::make_shared<FileSink>(filename, append);
        if (sink->is_open()) {
            add_sink(sink);
        }
        return *this;
    }

    void clear_sinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->flush();
        }
    }

    void log(LogLevel level, const char *file, int line, const std::string &message) {
        if (level < level_) return;

        std::ostringstream oss;
        if (show_timestamp_) {
            oss << "[" << get_timestamp() << "] ";
        }
        oss << "[" << level_to_string(level) << "] ";
        oss << "[" << name_ << "] ";
        if (show_thread_) {
            oss << "[t" << std::this_thread::get_id() << "] ";
        }
        if (show_location_ && file) {
            oss << "[" << basename(file) << ":" << line << "] ";
        }
        oss << message;

        std::string formatted = oss.str();

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->write(level, formatted);
        }
    }

    /**
     * @brief printf 风格日志
     */
    void logf(LogLevel level, const char *file, int line, const char *fmt, ...) {
        if (level < level_) return;

        char buffer[4096];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        log(level, file, line, buffer);
    }
};

/**
 * @brief 流式日志构建器，析构时提交
 */
class LogStream {
private:
    Logger &logger_;
    LogLevel level_;
    const char *file_;
    int line_;
    std::ostringstream stream_;

public:
    LogStream(Logger &logger, LogLevel level, const char *file, int line)
        : logger_(logger), level_(level), file_(file), line_(line) {}

    ~LogStream() {
        logger_.log(level_, file_, line_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T &value) {
        stream_ << value;
        return *this;
    }
};

} // namespace glide

//==============================================================================
// 日志宏
//==============================================================================

#define GLIDE_LOGGER_TRACE(logger) glide::LogStream(logger, glide::LogLevel::TRACE, __FILE__, __LINE__)
#define GLIDE_LOGGER_DEBUG(logger) glide::LogStream(logger, glide::LogLevel::DEBUG, __FILE__, __LINE__)
#define GLIDE_LOGGER_INFO(logger)  glide::LogStream(logger, glide::LogLevel::INFO,  __FILE__, __LINE__)
#define GLIDE_LOGGER_WARN(logger)  glide::LogStream(logger, glide::LogLevel::WARN,  __FILE__, __LINE__)
#define GLIDE_LOGGER_ERROR(logger) glide::LogStream(logger, glide::LogLevel::ERROR, __FILE__, __LINE__)
#define GLIDE_LOGGER_FATAL(logger) glide::LogStream(logger, glide::LogLevel::FATAL, __FILE__, __LINE__)

#endif // GLIDE_CORE_LOGGER_H

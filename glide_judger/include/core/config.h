/**
 * @file config.h
 * @brief 引擎配置
 *
 * engine.conf 为空白分隔的 key value 文件：
 *   workspace_root      /tmp/glide_judger/work
 *   float_abs_tolerance 1e-6
 *   sandbox_namespace   on
 */

#ifndef GLIDE_CORE_CONFIG_H
#define GLIDE_CORE_CONFIG_H

#include <string>
#include <map>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cerrno>
#include <thread>
#include <algorithm>

#include "glide_env.h"
#include "core/error.h"
#include "core/logger.h"

namespace glide {

/**
 * @brief key-value 配置表
 */
class Config {
private:
    std::map<std::string, std::string> data_;

public:
    Config() = default;

    /**
     * @brief 从文件加载，# 开头的行视为注释
     */
    Result<void> load(const std::string &filename) {
        std::ifstream fin(filename);
        if (!fin) {
            return Err(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + filename);
        }
        std::string line;
        int line_no = 0;
        while (std::getline(fin, line)) {
            line_no++;
            std::istringstream iss(line);
            std::string key, val;
            if (!(iss >> key) || key[0] == '#') {
                continue;
            }
            if (!(iss >> val)) {
                return Err(ErrorCode::CONFIG_PARSE_ERROR,
                           filename + ":" + std::to_string(line_no) + ": missing value for '" + key + "'");
            }
            data_[key] = val;
        }
        return Ok();
    }

    void set(const std::string &key, const std::string &val) {
        data_[key] = val;
    }

    bool has(const std::string &key) const {
        return data_.count(key) != 0;
    }

    bool is(const std::string &key, const std::string &val) const {
        auto it = data_.find(key);
        return it != data_.end() && it->second == val;
    }

    std::string get_str(const std::string &key, const std::string &default_val = "") const {
        auto it = data_.find(key);
        return (it != data_.end()) ? it->second : default_val;
    }

    Result<long long> get_int(const std::string &key, long long default_val) const {
        auto it = data_.find(key);
        if (it == data_.end()) return Ok(default_val);
        char *end = nullptr;
        errno = 0;
        long long v = std::strtoll(it->second.c_str(), &end, 10);
        if (errno != 0 || !end || *end != '\0') {
            return Err<long long>(ErrorCode::CONFIG_INVALID_VALUE,
                                  key + ": not an integer: " + it->second);
        }
        return Ok(v);
    }

    Result<double> get_double(const std::string &key, double default_val) const {
        auto it = data_.find(key);
        if (it == data_.end()) return Ok(default_val);
        char *end = nullptr;
        errno = 0;
        double v = std::strtod(it->second.c_str(), &end);
        if (errno != 0 || !end || *end != '\0') {
            return Err<double>(ErrorCode::CONFIG_INVALID_VALUE,
                               key + ": not a number: " + it->second);
        }
        return Ok(v);
    }

    /**
     * @brief on/off 开关
     */
    Result<bool> get_switch(const std::string &key, bool default_val) const {
        auto it = data_.find(key);
        if (it == data_.end()) return Ok(default_val);
        if (it->second == "on" || it->second == "true" || it->second == "1") return Ok(true);
        if (it->second == "off" || it->second == "false" || it->second == "0") return Ok(false);
        return Err<bool>(ErrorCode::CONFIG_INVALID_VALUE, key + ": expected on/off, got " + it->second);
    }

    const std::map<std::string, std::string>& data() const { return data_; }
};

/**
 * @brief 比较器容差策略
 *
 * |actual - expected| <= max(abs_tolerance, rel_tolerance * max(|actual|, |expected|))
 */
struct TolerancePolicy {
    double abs_tolerance = 1e-6;
    double rel_tolerance = 1e-9;
};

/**
 * @brief 引擎运行配置
 */
struct EngineConfig {
    std::string workspace_root = env::DEFAULT_WORKSPACE_ROOT;
    std::string language_dir = env::DEFAULT_LANGUAGE_DIR;
    std::string log_dir = env::DEFAULT_LOG_DIR;
    LogLevel log_level = LogLevel::INFO;
    bool log_console = true;

    int worker_threads = 0;           ///< 0 = 硬件并发数
    int output_limit_kb = 64;         ///< 每个流捕获上限
    int diagnostic_limit_kb = 8;      ///< 编译诊断截断长度
    int memory_limit_mb = 512;
    int max_processes = 64;
    bool sandbox_namespace = true;

    TolerancePolicy tolerance;

    int trace_max_steps = 500;
    int trace_repr_limit = 200;

    int effective_workers() const {
        if (worker_threads > 0) return worker_threads;
        unsigned hc = std::thread::hardware_concurrency();
        return hc == 0 ? 1 : static_cast<int>(hc);
    }

    /**
     * @brief 从 Config 读取，未出现的键保持默认值
     */
    static Result<EngineConfig> from_config(const Config &cfg) {
        EngineConfig ec;
        ec.workspace_root = cfg.get_str("workspace_root", ec.workspace_root);
        ec.language_dir = cfg.get_str("language_dir", ec.language_dir);
        ec.log_dir = cfg.get_str("log_dir", ec.log_dir);
        ec.log_level = parse_log_level(cfg.get_str("log_level", "info"), LogLevel::INFO);

        GLIDE_TRY_UNWRAP(console, cfg.get_switch("log_console", ec.log_console));
        GLIDE_TRY_UNWRAP(workers, cfg.get_int("worker_threads", ec.worker_threads));
        GLIDE_TRY_UNWRAP(output_kb, cfg.get_int("output_limit_kb", ec.output_limit_kb));
        GLIDE_TRY_UNWRAP(diag_kb, cfg.get_int("diagnostic_limit_kb", ec.diagnostic_limit_kb));
        GLIDE_TRY_UNWRAP(mem_mb, cfg.get_int("memory_limit_mb", ec.memory_limit_mb));
        GLIDE_TRY_UNWRAP(procs, cfg.get_int("max_processes", ec.max_processes));
        GLIDE_TRY_UNWRAP(use_ns, cfg.get_switch("sandbox_namespace", ec.sandbox_namespace));
        GLIDE_TRY_UNWRAP(abs_tol, cfg.get_double("float_abs_tolerance", ec.tolerance.abs_tolerance));
        GLIDE_TRY_UNWRAP(rel_tol, cfg.get_double("float_rel_tolerance", ec.tolerance.rel_tolerance));
        GLIDE_TRY_UNWRAP(max_steps, cfg.get_int("trace_max_steps", ec.trace_max_steps));
        GLIDE_TRY_UNWRAP(repr_limit, cfg.get_int("trace_repr_limit", ec.trace_repr_limit));

        GLIDE_ENSURE(workers >= 0, ErrorCode::CONFIG_INVALID_VALUE, "worker_threads must be >= 0");
        GLIDE_ENSURE(output_kb > 0, ErrorCode::CONFIG_INVALID_VALUE, "output_limit_kb must be > 0");
        GLIDE_ENSURE(diag_kb > 0, ErrorCode::CONFIG_INVALID_VALUE, "diagnostic_limit_kb must be > 0");
        GLIDE_ENSURE(mem_mb > 0, ErrorCode::CONFIG_INVALID_VALUE, "memory_limit_mb must be > 0");
        GLIDE_ENSURE(procs > 0, ErrorCode::CONFIG_INVALID_VALUE, "max_processes must be > 0");
        GLIDE_ENSURE(abs_tol >= 0 && rel_tol >= 0, ErrorCode::CONFIG_INVALID_VALUE,
                     "float tolerances must be >= 0");
        GLIDE_ENSURE(max_steps > 0 && repr_limit > 0, ErrorCode::CONFIG_INVALID_VALUE,
                     "trace limits must be > 0");

        ec.log_console = console;
        ec.worker_threads = static_cast<int>(workers);
        ec.output_limit_kb = static_cast<int>(output_kb);
        ec.diagnostic_limit_kb = static_cast<int>(diag_kb);
        ec.memory_limit_mb = static_cast<int>(mem_mb);
        ec.max_processes = static_cast<int>(procs);
        ec.sandbox_namespace = use_ns;
        ec.tolerance.abs_tolerance = abs_tol;
        ec.tolerance.rel_tolerance = rel_tol;
        ec.trace_max_steps = static_cast<int>(max_steps);
        ec.trace_repr_limit = static_cast<int>(repr_limit);
        return Ok(std::move(ec));
    }

    static Result<EngineConfig> load(const std::string &filename) {
        Config cfg;
        GLIDE_TRY(cfg.load(filename));
        auto ec = from_config(cfg);
        if (ec.is_error()) {
            ec.error().with_context(filename);
        }
        return ec;
    }
};

} // namespace glide

#endif // GLIDE_CORE_CONFIG_H

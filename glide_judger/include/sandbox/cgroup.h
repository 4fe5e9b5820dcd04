/**
 * @file cgroup.h
 * @brief cgroups v2 资源限制
 *
 * 层级结构（遵循 cgroup v2 "no internal processes" 规则）：
 *
 *   <base>/                 被委派的 cgroup 或容器根
 *   ├── grader/             glide_judger 进程移动到这里
 *   └── sandbox/            每次运行一个子 cgroup
 *       ├── run_<pid>_0/
 *       └── ...
 *
 * 只有在可执行程序中调用 CgroupManager::initialize() 成功后，沙箱才会使用 cgroup；
 * 否则退化为 rlimit + 进程组限制。
 */

#ifndef GLIDE_SANDBOX_CGROUP_H
#define GLIDE_SANDBOX_CGROUP_H

#include <string>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <mutex>
#include <memory>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <cerrno>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/vfs.h>
#include <linux/magic.h>

#include "core/error.h"
#include "core/grader_logger.h"

namespace glide {
namespace sandbox {

namespace fs = std::filesystem;

struct CgroupStats {
    uint64_t memory_peak = 0;      ///< bytes
    bool oom_killed = false;
    uint64_t cpu_usage_usec = 0;
    uint64_t pids_current = 0;
};

struct CgroupLimits {
    uint64_t memory_max = 0;       ///< bytes, 0 = 不限制
    uint64_t pids_max = 0;         ///< 0 = 不限制

    CgroupLimits& set_memory(uint64_t mb) {
        memory_max = mb * 1024 * 1024;
        return *this;
    }

    CgroupLimits& set_max_pids(uint64_t max) {
        pids_max = max;
        return *this;
    }
};

/**
 * @brief 当前进程所在的 cgroup（相对 /sys/fs/cgroup）
 *
 * cgroup v2 下 /proc/self/cgroup 的格式为 "0::/path"
 */
inline std::string get_self_cgroup_path() {
    std::ifstream cgroup_file("/proc/self/cgroup");
    if (!cgroup_file) {
        return "";
    }
    std::string line;
    while (std::getline(cgroup_file, line)) {
        if (line.compare(0, 3, "0::") == 0) {
            return line.substr(3);
        }
    }
    return "";
}

/**
 * @brief 单个 cgroup，析构时删除
 */
class CgroupController {
private:
    std::string cgroup_path_;
    bool created_ = false;

    Result<void> write_control(const std::string &filename, const std::string &content) {
        std::string path = cgroup_path_ + "/" + filename;
        std::ofstream file(path);
        if (!file) {
            return Err(ErrorCode::FILE_WRITE_ERROR, "Cannot write to " + path);
        }
        file << content;
        file.flush();
        if (!file) {
            return Err(ErrorCode::FILE_WRITE_ERROR, "Write failed: " + path);
        }
        return Ok();
    }

    Result<std::string> read_control(const std::string &filename) const {
        std::string path = cgroup_path_ + "/" + filename;
        std::ifstream file(path);
        if (!file) {
            return Err<std::string>(ErrorCode::FILE_READ_ERROR, "Cannot read " + path);
        }
        std::ostringstream oss;
        oss << file.rdbuf();
        return Ok(oss.str());
    }

    uint64_t read_uint64(const std::string &filename) const {
        auto content = read_control(filename);
        if (!content.ok()) return 0;
        return std::strtoull(content.value().c_str(), nullptr, 10);
    }

    /**
     * @brief 解析 "key value" 格式的状态文件
     */
    static uint64_t parse_stat(const std::string &content, const std::string &key) {
        std::istringstream iss(content);
        std::string name;
        uint64_t value = 0;
        while (iss >> name >> value) {
            if (name == key) return value;
        }
        return 0;
    }

public:
    CgroupController(const std::string &name, const std::string &parent_path)
        : cgroup_path_(parent_path + "/" + name) {}

    ~CgroupController() {
        if (created_) {
            auto res = destroy();
            if (res.is_error()) {
                SLOG_WARN << res.error().to_string();
            }
        }
    }

    CgroupController(const CgroupController&) = delete;
    CgroupController& operator=(const CgroupController&) = delete;

    Result<void> create() {
        if (mkdir(cgroup_path_.c_str(), 0755) < 0 && errno != EEXIST) {
            return Err(ErrorCode::FILE_WRITE_ERROR, "Cannot create cgroup: " + cgroup_path_);
        }
        created_ = true;
        return Ok();
    }

    /**
     * @brief 删除 cgroup；仍有进程时先 kill 再重试
     */
    Result<void> destroy() {
        if (!created_) return Ok();
        for (int attempt = 0; attempt < 50; attempt++) {
            if (rmdir(cgroup_path_.c_str()) == 0 || errno == ENOENT) {
                created_ = false;
                return Ok();
            }
            if (errno != EBUSY) break;
            GLIDE_TRY(kill_all());
            usleep(2000);
        }
        created_ = false;
        return Err(ErrorCode::FILE_WRITE_ERROR, "Cannot remove cgroup: " + cgroup_path_);
    }

    Result<void> apply_limits(const CgroupLimits &limits) {
        if (limits.memory_max > 0) {
            GLIDE_TRY(write_control("memory.max", std::to_string(limits.memory_max)));
            GLIDE_TRY(write_control("memory.swap.max", "0"));
        }
        if (limits.pids_max > 0) {
            GLIDE_TRY(write_control("pids.max", std::to_string(limits.pids_max)));
        }
        return Ok();
    }

    Result<void> add_process(pid_t pid) {
        return write_control("cgroup.procs", std::to_string(pid));
    }

    /**
     * @brief 杀死 cgroup 内全部进程（含已脱离进程组的后代）
     */
    Result<void> kill_all() {
        return write_control("cgroup.kill", "1");
    }

    CgroupStats get_stats() const {
        CgroupStats stats;
        stats.memory_peak = read_uint64("memory.peak");
        auto events = read_control("memory.events");
        if (events.ok()) {
            stats.oom_killed = parse_stat(events.value(), "oom_kill") > 0;
        }
        auto cpu_stat = read_control("cpu.stat");
        if (cpu_stat.ok()) {
            stats.cpu_usage_usec = parse_stat(cpu_stat.value(), "usage_usec");
        }
        stats.pids_current = read_uint64("pids.current");
        return stats;
    }

    const std::string& path() const { return cgroup_path_; }
};

/**
 * @brief 使用 statfs 判断 /sys/fs/cgroup 是否为 cgroup2
 */
inline bool is_cgroup_v2_available() {
    struct statfs buf;
    if (statfs("/sys/fs/cgroup", &buf) != 0) {
        return false;
    }
    return buf.f_type == CGROUP2_SUPER_MAGIC;
}

/**
 * @brief cgroup 管理器（进程级单例）
 */
class CgroupManager {
private:
    std::string base_path_;
    std::string sandbox_parent_;
    std::atomic<bool> initialized_{false};
    std::atomic<unsigned> next_id_{0};
    std::mutex mutex_;

    static constexpr const char* CGROUP_ROOT = "/sys/fs/cgroup";

    CgroupManager() = default;

    static bool enable_controllers(const std::string &path) {
        std::ofstream subtree(path + "/cgroup.subtree_control");
        if (!subtree) return false;
        subtree << "+memory +pids";
        subtree.flush();
        return subtree.good();
    }

    static bool create_dir(const std::string &path) {
        return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
    }

    static bool move_process(const std::string &cgroup_path, pid_t pid) {
        std::ofstream procs(cgroup_path + "/cgroup.procs");
        if (!procs) return false;
        procs << pid;
        procs.flush();
        return procs.good();
    }

public:
    static CgroupManager& instance() {
        static CgroupManager mgr;
        return mgr;
    }

    /**
     * @brief 建立 grader/ 与 sandbox/ 子树，并把当前进程移入 grader/
     *
     * 必须先移动进程，再开启 subtree_control，否则内核返回 EBUSY。
     */
    Result<void> initialize() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) {
            return Ok();
        }
        GLIDE_ENSURE(is_cgroup_v2_available(), ErrorCode::SANDBOX_FAILURE, "cgroup v2 not mounted");

        std::string self_cgroup = get_self_cgroup_path();
        if (self_cgroup.empty() || self_cgroup == "/") {
            base_path_ = CGROUP_ROOT;
        } else {
            base_path_ = std::string(CGROUP_ROOT) + self_cgroup;
        }
        std::error_code ec;
        GLIDE_ENSURE(fs::exists(base_path_, ec), ErrorCode::FILE_READ_ERROR,
                     "Base cgroup path does not exist: " + base_path_);

        std::string grader_path = base_path_ + "/grader";
        GLIDE_ENSURE(create_dir(grader_path), ErrorCode::FILE_WRITE_ERROR,
                     "Cannot create grader cgroup: " + grader_path);
        GLIDE_ENSURE(move_process(grader_path, getpid()), ErrorCode::FILE_WRITE_ERROR,
                     "Cannot move self to grader cgroup");

        if (!enable_controllers(base_path_)) {
            SLOG_WARN << "Cannot enable controllers in " << base_path_;
        }

        sandbox_parent_ = base_path_ + "/sandbox";
        GLIDE_ENSURE(create_dir(sandbox_parent_), ErrorCode::FILE_WRITE_ERROR,
                     "Cannot create sandbox cgroup: " + sandbox_parent_);
        if (!enable_controllers(sandbox_parent_)) {
            SLOG_WARN << "Cannot enable controllers in " << sandbox_parent_;
        }

        initialized_ = true;
        SLOG_INFO << "cgroup v2 ready under " << base_path_;
        return Ok();
    }

    bool is_initialized() const { return initialized_; }

    const std::string& sandbox_parent_path() const { return sandbox_parent_; }

    /**
     * @brief 为一次运行创建带限制的 cgroup
     */
    Result<std::unique_ptr<CgroupController>> acquire(uint64_t memory_mb, uint64_t max_pids) {
        GLIDE_ENSURE(initialized_, ErrorCode::SANDBOX_FAILURE, "cgroup manager not initialized");
        std::string name = "run_" + std::to_string(getpid()) + "_" + std::to_string(next_id_++);
        auto cg = std::make_unique<CgroupController>(name, sandbox_parent_);
        GLIDE_TRY(cg->create());
        CgroupLimits limits;
        limits.set_memory(memory_mb).set_max_pids(max_pids);
        GLIDE_TRY(cg->apply_limits(limits));
        return Ok(std::move(cg));
    }
};

} // namespace sandbox
} // namespace glide

#endif // GLIDE_SANDBOX_CGROUP_H

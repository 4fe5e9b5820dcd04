/**
 * @file sandbox.h
 * @brief 子进程沙箱
 *
 * run() 的流程：
 *   1. fork 前准备 argv/envp、rlimit、隔离步骤
 *   2. 子进程等待同步信号（父进程先把它放进 cgroup），成为新进程组组长，
 *      进入命名空间、设置 rlimit 后 execve
 *   3. exec 失败通过 close-on-exec 的状态管道报告给父进程
 *   4. 父进程用 poll 喂 stdin、收 stdout/stderr，直到退出或到达截止时间
 *   5. 截止时间到达时向整个进程组发送 SIGKILL，并写 cgroup.kill
 *
 * 命名空间不可用时记录一次警告，仍保留 rlimit、进程组和截止时间。
 *
 * 设置了 child_main 时子进程不 execve，而是在完成同样的隔离与限制后调用它，
 * 结果经由 fd 3 上的结果管道交回父进程。
 */

#ifndef GLIDE_SANDBOX_SANDBOX_H
#define GLIDE_SANDBOX_SANDBOX_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <chrono>
#include <atomic>
#include <mutex>
#include <algorithm>
#include <cstring>
#include <cstdlib>
#include <cerrno>

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <dirent.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>

#include "core/error.h"
#include "core/types.h"
#include "core/grader_logger.h"
#include "sandbox/cgroup.h"
#include "sandbox/namespace.h"

namespace glide {
namespace sandbox {

struct SandboxConfig {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;
    std::string work_dir;            ///< 子进程的工作目录
    std::string workspace_dir;       ///< 可写绑定进新根的目录，为空时取 work_dir
    std::string stdin_data;

    int timeout_ms = 5000;
    int memory_limit_mb = 512;
    bool disable_address_limit = false;
    int output_limit_kb = 64;
    int max_processes = 64;

    bool use_namespace = true;
    bool use_cgroup = true;

    /// 非空时子进程调用它并以返回值退出；argv[0] 只作为日志中的名字，env 不生效
    std::function<int(int channel_fd)> child_main;
    int channel_limit_kb = 16 * 1024;
};

struct SandboxResult {
    ExitStatus status = ExitStatus::Crash;
    int exit_code = 0;
    int term_signal = 0;
    long wall_time_ms = 0;
    long cpu_time_ms = 0;
    std::string stdout_text;
    std::string stderr_text;
    bool output_truncated = false;
    std::string channel_text;        ///< child_main 写入结果管道的内容
    bool channel_truncated = false;
    bool isolated = false;
    std::string message;
};

/// child_main 看到的结果管道描述符
constexpr int CHANNEL_FD = 3;

namespace detail {

/**
 * @brief 持有一个文件描述符，析构时关闭
 */
class UniqueFd {
private:
    int fd_ = -1;

public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd &&other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset() {
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

inline Result<Pipe> make_pipe() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return Err<Pipe>(ErrorCode::PIPE_FAILED, std::string("pipe2 failed: ") + strerror(errno));
    }
    Pipe p;
    p.read_end = UniqueFd(fds[0]);
    p.write_end = UniqueFd(fds[1]);
    return Ok(std::move(p));
}

inline void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

/**
 * @brief 父进程忽略 SIGPIPE，子进程 exec 前恢复
 */
inline void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { signal(SIGPIPE, SIG_IGN); });
}

/**
 * @brief 统计某个 uid 当前的线程数（RLIMIT_NPROC 按用户计数）
 */
inline long count_user_tasks(uid_t uid) {
    DIR *proc = opendir("/proc");
    if (!proc) return 0;
    long total = 0;
    while (struct dirent *ent = readdir(proc)) {
        if (ent->d_name[0] < '0' || ent->d_name[0] > '9') continue;
        std::string base = std::string("/proc/") + ent->d_name;
        struct stat st;
        if (stat(base.c_str(), &st) != 0 || st.st_uid != uid) continue;
        std::string task_dir = base + "/task";
        DIR *tasks = opendir(task_dir.c_str());
        if (!tasks) {
            total++;
            continue;
        }
        while (struct dirent *t = readdir(tasks)) {
            if (t->d_name[0] >= '0' && t->d_name[0] <= '9') total++;
        }
        closedir(tasks);
    }
    closedir(proc);
    return total;
}

/**
 * @brief 有上限的输出缓冲，超出部分读出后丢弃
 */
struct CaptureBuffer {
    std::string data;
    size_t limit = 0;
    bool truncated = false;

    void append(const char *buf, size_t n) {
        size_t room = data.size() < limit ? limit - data.size() : 0;
        if (n > room) {
            truncated = true;
            n = room;
        }
        data.append(buf, n);
    }
};

struct RlimitPlan {
    rlim_t cpu_seconds = 0;
    rlim_t address_bytes = 0;       ///< 0 = 不限制
    rlim_t file_bytes = 0;
    rlim_t nproc = 0;               ///< 0 = 不限制
};

/**
 * @brief 当前进程的虚拟内存大小（子进程中调用，只用系统调用）
 *
 * 不 exec 的子进程继承了父进程的全部映射，地址空间上限要在此基础上累加。
 */
inline rlim_t current_vm_bytes() {
    int fd = open("/proc/self/statm", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return 0;
    char buf[64];
    ssize_t n = read(fd, buf, sizeof(buf) - 1);
    close(fd);
    if (n <= 0) return 0;
    rlim_t pages = 0;
    for (ssize_t i = 0; i < n && buf[i] >= '0' && buf[i] <= '9'; i++) {
        pages = pages * 10 + static_cast<rlim_t>(buf[i] - '0');
    }
    return pages * static_cast<rlim_t>(sysconf(_SC_PAGESIZE));
}

/**
 * @brief 关闭 from 及以上的所有描述符
 *
 * 不 exec 的子进程不会触发 O_CLOEXEC，必须自己关掉从父进程继承的
 * 其他沙箱的管道，否则会拖住它们的 EOF。
 */
inline void close_fds_from(int from) {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, static_cast<unsigned>(from), ~0U, 0) == 0) {
        return;
    }
#endif
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
    for (int fd = from; fd < max_fd; fd++) {
        close(fd);
    }
}

inline bool apply_rlimits(const RlimitPlan &plan) {
    struct rlimit rl;

    rl.rlim_cur = plan.cpu_seconds;
    rl.rlim_max = plan.cpu_seconds + 1;
    if (setrlimit(RLIMIT_CPU, &rl) != 0) return false;

    if (plan.address_bytes > 0) {
        rl.rlim_cur = rl.rlim_max = plan.address_bytes;
        if (setrlimit(RLIMIT_AS, &rl) != 0) return false;
    }

    rl.rlim_cur = rl.rlim_max = plan.file_bytes;
    if (setrlimit(RLIMIT_FSIZE, &rl) != 0) return false;

    rl.rlim_cur = rl.rlim_max = 0;
    if (setrlimit(RLIMIT_CORE, &rl) != 0) return false;

    if (plan.nproc > 0) {
        rl.rlim_cur = rl.rlim_max = plan.nproc;
        if (setrlimit(RLIMIT_NPROC, &rl) != 0) return false;
    }
    return true;
}

[[noreturn]] inline void child_fail(int status_fd, ChildStage stage, int err) {
    ChildReport report{stage, err};
    ssize_t n = write(status_fd, &report, sizeof(report));
    (void)n;
    _exit(127);
}

/**
 * @brief 新根目录，结束后删除（挂载只存在于子进程的命名空间中）
 */
class RootDir {
private:
    std::string path_;

public:
    RootDir() = default;
    ~RootDir() {
        if (!path_.empty() && rmdir(path_.c_str()) != 0) {
            SLOG_WARN << "Cannot remove sandbox root " << path_ << ": " << strerror(errno);
        }
    }
    RootDir(const RootDir&) = delete;
    RootDir& operator=(const RootDir&) = delete;

    Result<void> create(const std::string &parent) {
        std::string tmpl = parent + "/.root_XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            return Err(ErrorCode::SANDBOX_FAILURE,
                       "Cannot create sandbox root under " + parent + ": " + strerror(errno));
        }
        path_ = buf.data();
        return Ok();
    }

    const std::string& path() const { return path_; }
};

inline std::string parent_dir(const std::string &path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return path.substr(0, pos);
}

} // namespace detail

class Sandbox {
private:
    SandboxConfig config_;

    bool inline_child() const { return static_cast<bool>(config_.child_main); }

    /// launch() 的结果：隔离步骤失败时需要回退重跑
    struct LaunchOutcome {
        bool isolation_failed = false;
        int isolation_errno = 0;
        SandboxResult result;
    };

    static void warn_no_namespace_once(const std::string &why) {
        static std::atomic<bool> warned{false};
        if (!warned.exchange(true)) {
            SLOG_WARN << "Namespace isolation unavailable (" << why
                      << "), continuing with rlimits and process-group control only";
        }
    }

    std::vector<std::string> build_env() const {
        std::map<std::string, std::string> merged = {
            {"PATH", "/usr/local/bin:/usr/bin:/bin"},
            {"HOME", config_.work_dir},
            {"TMPDIR", "/tmp"}
        };
        for (const auto &kv : config_.env) {
            merged[kv.first] = kv.second;
        }
        std::vector<std::string> env;
        for (const auto &kv : merged) {
            env.push_back(kv.first + "=" + kv.second);
        }
        return env;
    }

    detail::RlimitPlan build_rlimits(bool with_cgroup) const {
        detail::RlimitPlan plan;
        plan.cpu_seconds = static_cast<rlim_t>((config_.timeout_ms + 999) / 1000 + 1);
        if (!config_.disable_address_limit) {
            plan.address_bytes = static_cast<rlim_t>(config_.memory_limit_mb) * 1024 * 1024;
        }
        plan.file_bytes = static_cast<rlim_t>(std::max(config_.memory_limit_mb, 64)) * 1024 * 1024;
        // root 不受 RLIMIT_NPROC 约束；非 root 时计数包含该用户已有的全部线程
        if (!with_cgroup && config_.max_processes > 0 && geteuid() != 0) {
            plan.nproc = static_cast<rlim_t>(detail::count_user_tasks(geteuid()) + config_.max_processes);
        }
        return plan;
    }

    std::unique_ptr<CgroupController> acquire_cgroup() const {
        if (!config_.use_cgroup || !CgroupManager::instance().is_initialized()) {
            return nullptr;
        }
        uint64_t memory_mb = static_cast<uint64_t>(config_.memory_limit_mb) + 64;
        auto cg = CgroupManager::instance().acquire(memory_mb, static_cast<uint64_t>(config_.max_processes));
        if (cg.is_error()) {
            SLOG_WARN << "cgroup unavailable for this run: " << cg.error().message();
            return nullptr;
        }
        return std::move(cg.value());
    }

    static ExitStatus classify(int status, bool timed_out, long cpu_ms, int timeout_ms,
                               const CgroupStats *stats, SandboxResult &result) {
        if (timed_out) {
            result.message = "Deadline of " + std::to_string(timeout_ms) + " ms exceeded";
            return ExitStatus::Timeout;
        }
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
            if (result.exit_code == 0) return ExitStatus::Success;
            result.message = "Exit code " + std::to_string(result.exit_code);
            return ExitStatus::NonZero;
        }
        if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
            if (result.term_signal == SIGXCPU ||
                (result.term_signal == SIGKILL && cpu_ms >= timeout_ms)) {
                result.message = "CPU time limit exceeded";
                return ExitStatus::Timeout;
            }
            if (stats && stats->oom_killed) {
                result.message = "Memory limit exceeded";
                return ExitStatus::Crash;
            }
            result.message = std::string("Killed by signal ") + strsignal(result.term_signal);
            return ExitStatus::Crash;
        }
        result.message = "Unknown wait status " + std::to_string(status);
        return ExitStatus::Crash;
    }

    Result<LaunchOutcome> launch(const IsolationPlan *plan) {
        using clock = std::chrono::steady_clock;
        LaunchOutcome outcome;
        SandboxResult &result = outcome.result;
        result.isolated = plan != nullptr;

        // fork 前准备好子进程需要的一切
        std::vector<std::string> env_strings = build_env();
        std::vector<char*> argv;
        for (const auto &a : config_.argv) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);
        std::vector<char*> envp;
        for (const auto &e : env_strings) envp.push_back(const_cast<char*>(e.c_str()));
        envp.push_back(nullptr);

        std::unique_ptr<CgroupController> cgroup = acquire_cgroup();
        detail::RlimitPlan limits = build_rlimits(cgroup != nullptr);
        const char *work_dir = config_.work_dir.c_str();

        GLIDE_TRY_UNWRAP(in_pipe, detail::make_pipe());
        GLIDE_TRY_UNWRAP(out_pipe, detail::make_pipe());
        GLIDE_TRY_UNWRAP(err_pipe, detail::make_pipe());
        GLIDE_TRY_UNWRAP(status_pipe, detail::make_pipe());
        GLIDE_TRY_UNWRAP(sync_pipe, detail::make_pipe());
        detail::Pipe chan_pipe;
        if (inline_child()) {
            GLIDE_TRY_UNWRAP(made, detail::make_pipe());
            chan_pipe = std::move(made);
        }

        SLOG_DEBUG << "spawn " << config_.argv[0] << " (deadline " << config_.timeout_ms
                   << " ms, cwd " << config_.work_dir << (plan ? ", isolated" : "") << ")";

        auto start = clock::now();
        pid_t pid = fork();
        if (pid < 0) {
            return Err<LaunchOutcome>(ErrorCode::FORK_FAILED, std::string("fork failed: ") + strerror(errno));
        }

        if (pid == 0) {
            int status_fd = status_pipe.write_end.get();
            char go;
            if (read(sync_pipe.read_end.get(), &go, 1) != 1) {
                _exit(127);
            }
            setpgid(0, 0);
            signal(SIGPIPE, SIG_DFL);

            if (dup2(in_pipe.read_end.get(), STDIN_FILENO) < 0 ||
                dup2(out_pipe.write_end.get(), STDOUT_FILENO) < 0 ||
                dup2(err_pipe.write_end.get(), STDERR_FILENO) < 0) {
                detail::child_fail(status_fd, ChildStage::Setup, errno);
            }

            if (inline_child() && limits.address_bytes > 0) {
                limits.address_bytes += detail::current_vm_bytes();
            }

            if (plan) {
                int err = apply_isolation_plan(*plan);
                if (err != 0) {
                    detail::child_fail(status_fd, ChildStage::Isolation, err);
                }
            }
            if (chdir(work_dir) != 0) {
                detail::child_fail(status_fd, ChildStage::Setup, errno);
            }
            if (!detail::apply_rlimits(limits)) {
                detail::child_fail(status_fd, ChildStage::Setup, errno);
            }

            if (inline_child()) {
                if (dup2(chan_pipe.write_end.get(), CHANNEL_FD) < 0) {
                    detail::child_fail(status_fd, ChildStage::Setup, errno);
                }
                // 同时关闭状态管道，父进程读到 EOF 即视为启动成功
                detail::close_fds_from(CHANNEL_FD + 1);
                _exit(config_.child_main(CHANNEL_FD));
            }

            execve(argv[0], argv.data(), envp.data());
            detail::child_fail(status_fd, ChildStage::Exec, errno);
        }

        // 父进程
        if (setpgid(pid, pid) != 0 && errno != EACCES) {
            SLOG_DEBUG << "setpgid(" << pid << ") failed: " << strerror(errno);
        }
        if (cgroup) {
            auto added = cgroup->add_process(pid);
            if (added.is_error()) {
                SLOG_WARN << "Cannot move pid " << pid << " into cgroup: " << added.error().message();
                cgroup.reset();
            }
        }
        in_pipe.read_end.reset();
        out_pipe.write_end.reset();
        err_pipe.write_end.reset();
        status_pipe.write_end.reset();
        chan_pipe.write_end.reset();
        sync_pipe.read_end.reset();
        if (write(sync_pipe.write_end.get(), "x", 1) != 1) {
            SLOG_ERROR << "Cannot release child " << pid << ": " << strerror(errno);
        }
        sync_pipe.write_end.reset();

        // exec 成功时状态管道因 O_CLOEXEC 关闭，读到 EOF
        ChildReport report{ChildStage::None, 0};
        ssize_t got;
        do {
            got = read(status_pipe.read_end.get(), &report, sizeof(report));
        } while (got < 0 && errno == EINTR);
        if (got == static_cast<ssize_t>(sizeof(report)) && report.stage != ChildStage::None) {
            int ignored;
            waitpid(pid, &ignored, 0);
            if (report.stage == ChildStage::Isolation) {
                outcome.isolation_failed = true;
                outcome.isolation_errno = report.error;
                return Ok(std::move(outcome));
            }
            ErrorCode code = report.stage == ChildStage::Exec ? ErrorCode::EXEC_FAILED : ErrorCode::SANDBOX_FAILURE;
            return Err<LaunchOutcome>(code, "Cannot spawn " + config_.argv[0] + ": " + strerror(report.error));
        }

        detail::CaptureBuffer out_buf, err_buf, chan_buf;
        out_buf.limit = err_buf.limit = static_cast<size_t>(config_.output_limit_kb) * 1024;
        chan_buf.limit = static_cast<size_t>(config_.channel_limit_kb) * 1024;

        int stdin_fd = in_pipe.write_end.get();
        size_t stdin_written = 0;
        if (config_.stdin_data.empty()) {
            in_pipe.write_end.reset();
            stdin_fd = -1;
        } else {
            detail::set_nonblocking(stdin_fd);
        }
        int out_fd = out_pipe.read_end.get();
        int err_fd = err_pipe.read_end.get();
        int chan_fd = chan_pipe.read_end.valid() ? chan_pipe.read_end.get() : -1;
        detail::set_nonblocking(out_fd);
        detail::set_nonblocking(err_fd);
        if (chan_fd >= 0) {
            detail::set_nonblocking(chan_fd);
        }

        auto deadline = start + std::chrono::milliseconds(config_.timeout_ms);
        bool exited = false;
        bool timed_out = false;
        clock::time_point drain_deadline;
        char buf[8192];

        while (out_fd >= 0 || err_fd >= 0 || chan_fd >= 0 || !exited) {
            auto now = clock::now();

            if (!exited) {
                siginfo_t info;
                memset(&info, 0, sizeof(info));
                // WNOWAIT：先杀掉进程组，再回收组长，避免 pgid 被复用
                if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
                    info.si_pid == pid) {
                    exited = true;
                } else if (now >= deadline) {
                    timed_out = true;
                    exited = true;
                    SLOG_WARN << "Deadline kill: " << config_.argv[0] << " pid " << pid
                              << " after " << config_.timeout_ms << " ms";
                }
                if (exited) {
                    kill(-pid, SIGKILL);
                    if (cgroup) {
                        auto killed = cgroup->kill_all();
                        if (killed.is_error()) {
                            SLOG_DEBUG << killed.error().message();
                        }
                    }
                    drain_deadline = clock::now() + std::chrono::milliseconds(200);
                }
            }

            if (exited && clock::now() >= drain_deadline) {
                // 仍有脱离进程组的后代持有管道
                break;
            }

            struct pollfd fds[4];
            int nfds = 0;
            int out_idx = -1, err_idx = -1, chan_idx = -1, in_idx = -1;
            if (out_fd >= 0) { out_idx = nfds; fds[nfds++] = {out_fd, POLLIN, 0}; }
            if (err_fd >= 0) { err_idx = nfds; fds[nfds++] = {err_fd, POLLIN, 0}; }
            if (chan_fd >= 0) { chan_idx = nfds; fds[nfds++] = {chan_fd, POLLIN, 0}; }
            if (stdin_fd >= 0 && !exited) { in_idx = nfds; fds[nfds++] = {stdin_fd, POLLOUT, 0}; }

            if (nfds == 0) {
                if (exited) break;
                usleep(1000);
                continue;
            }

            int ready = poll(fds, static_cast<nfds_t>(nfds), 10);
            if (ready < 0) {
                if (errno == EINTR) continue;
                SLOG_ERROR << "poll failed: " << strerror(errno);
                break;
            }

            auto pump = [&](int idx, int &fd, detail::Pipe &p, detail::CaptureBuffer &sink) {
                if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) return;
                while (true) {
                    ssize_t n = read(fd, buf, sizeof(buf));
                    if (n > 0) {
                        sink.append(buf, static_cast<size_t>(n));
                        continue;
                    }
                    if (n < 0 && errno == EINTR) continue;
                    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
                    p.read_end.reset();
                    fd = -1;
                    return;
                }
            };
            pump(out_idx, out_fd, out_pipe, out_buf);
            pump(err_idx, err_fd, err_pipe, err_buf);
            pump(chan_idx, chan_fd, chan_pipe, chan_buf);

            if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
                const std::string &data = config_.stdin_data;
                ssize_t n = write(stdin_fd, data.data() + stdin_written, data.size() - stdin_written);
                if (n > 0) {
                    stdin_written += static_cast<size_t>(n);
                }
                if ((n < 0 && errno != EAGAIN && errno != EINTR) || stdin_written >= data.size()) {
                    in_pipe.write_end.reset();
                    stdin_fd = -1;
                }
            }
        }

        int status = 0;
        struct rusage usage;
        memset(&usage, 0, sizeof(usage));
        while (wait4(pid, &status, 0, &usage) < 0) {
            if (errno != EINTR) {
                return Err<LaunchOutcome>(ErrorCode::SANDBOX_FAILURE,
                                          std::string("wait4 failed: ") + strerror(errno));
            }
        }
        auto end = clock::now();

        result.wall_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
        result.cpu_time_ms = usage.ru_utime.tv_sec * 1000 + usage.ru_utime.tv_usec / 1000 +
                             usage.ru_stime.tv_sec * 1000 + usage.ru_stime.tv_usec / 1000;

        CgroupStats stats;
        if (cgroup) {
            stats = cgroup->get_stats();
        }
        result.status = classify(status, timed_out, result.cpu_time_ms, config_.timeout_ms,
                                 cgroup ? &stats : nullptr, result);
        result.stdout_text = std::move(out_buf.data);
        result.stderr_text = std::move(err_buf.data);
        result.output_truncated = out_buf.truncated || err_buf.truncated;
        result.channel_text = std::move(chan_buf.data);
        result.channel_truncated = chan_buf.truncated;

        SLOG_DEBUG << config_.argv[0] << " finished: " << exit_status_str(result.status)
                   << " wall " << result.wall_time_ms << " ms, cpu " << result.cpu_time_ms << " ms";
        return Ok(std::move(outcome));
    }

public:
    explicit Sandbox(SandboxConfig config) : config_(std::move(config)) {
        if (config_.workspace_dir.empty()) {
            config_.workspace_dir = config_.work_dir;
        }
    }

    /**
     * @brief 运行并等待结束
     *
     * 只有基础设施故障（管道、fork、exec）返回错误；
     * 客体程序的退出码、信号、超时都体现在 SandboxResult 中。
     */
    Result<SandboxResult> run() {
        GLIDE_ENSURE(!config_.argv.empty() && !config_.argv[0].empty(),
                     ErrorCode::SANDBOX_FAILURE, "empty command");
        GLIDE_ENSURE(config_.timeout_ms > 0, ErrorCode::SANDBOX_FAILURE, "timeout must be positive");
        detail::ignore_sigpipe_once();

        bool isolate = false;
        if (config_.use_namespace) {
            if (namespace_disabled()) {
                warn_no_namespace_once("disabled after an earlier failure");
            } else if (!is_namespace_available()) {
                warn_no_namespace_once("unshare not permitted");
            } else {
                isolate = true;
            }
        }

        if (isolate) {
            detail::RootDir root;
            GLIDE_TRY(root.create(detail::parent_dir(config_.workspace_dir)));
            IsolationPlan plan = build_isolation_plan(root.path(), config_.workspace_dir);
            GLIDE_TRY_UNWRAP(launched, launch(&plan));
            if (!launched.isolation_failed) {
                return Ok(std::move(launched.result));
            }
            namespace_disabled() = true;
            warn_no_namespace_once(std::string("setup failed: ") + strerror(launched.isolation_errno));
        }

        GLIDE_TRY_UNWRAP(plain, launch(nullptr));
        return Ok(std::move(plain.result));
    }

    const SandboxConfig& config() const { return config_; }
};

} // namespace sandbox
} // namespace glide

#endif // GLIDE_SANDBOX_SANDBOX_H

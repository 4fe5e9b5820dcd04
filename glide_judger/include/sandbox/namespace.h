/**
 * @file namespace.h
 * @brief Linux 命名空间与最小根文件系统
 *
 * 父进程在 fork 前把所有路径、映射内容算好（IsolationPlan），
 * 子进程只按顺序执行系统调用，不再分配内存。
 *
 * 隔离内容：
 * - user:  非 root 运行时启用，uid/gid 原样映射
 * - mount: pivot_root 到 tmpfs 新根，系统目录只读绑定，工作目录可写绑定
 * - net:   空网络命名空间，没有任何接口
 * - ipc / uts
 */

#ifndef GLIDE_SANDBOX_NAMESPACE_H
#define GLIDE_SANDBOX_NAMESPACE_H

#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <climits>
#include <cstring>

#include <sched.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/mount.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>

#include "core/error.h"

namespace glide {
namespace sandbox {

/// 只读绑定进新根的系统目录
inline const std::vector<std::string>& default_readonly_paths() {
    static const std::vector<std::string> paths = {
        "/usr", "/lib", "/lib64", "/lib32", "/bin", "/sbin", "/etc"
    };
    return paths;
}

/// 绑定进新根的设备文件
inline const std::vector<std::string>& default_device_paths() {
    static const std::vector<std::string> paths = {
        "/dev/null", "/dev/zero", "/dev/random", "/dev/urandom"
    };
    return paths;
}

enum class MountOpType {
    MakeDir,
    MakeFile,
    Tmpfs,
    Bind,
    Symlink
};

struct MountOp {
    MountOpType type;
    std::string source;          ///< Bind 的源 / Symlink 的链接内容 / Tmpfs 的选项
    std::string target;          ///< 新根内的绝对路径（已带新根前缀）
    bool readonly = false;
    bool optional = false;       ///< 失败时跳过
    unsigned long keep_flags = 0;   ///< 只读重挂载时需保留的原挂载标志
};

/**
 * @brief 子进程隔离步骤（fork 前构造完成）
 */
struct IsolationPlan {
    int unshare_flags = 0;
    bool map_ids = false;
    std::string uid_map;
    std::string gid_map;
    std::string new_root;
    std::string hostname = "glide";
    std::vector<MountOp> ops;
};

/**
 * @brief 子进程报告给父进程的失败阶段
 */
enum class ChildStage : int {
    None = 0,
    Isolation = 1,
    Setup = 2,
    Exec = 3
};

struct ChildReport {
    ChildStage stage;
    int error;
};

inline int namespace_flags() {
    int flags = CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS;
    if (geteuid() != 0) {
        flags |= CLONE_NEWUSER;
    }
    return flags;
}

/**
 * @brief 探测能否创建沙箱所需的命名空间（结果缓存）
 */
inline bool is_namespace_available() {
    static std::once_flag once;
    static bool available = false;
    std::call_once(once, [] {
        int flags = namespace_flags();
        pid_t pid = fork();
        if (pid < 0) return;
        if (pid == 0) {
            _exit(unshare(flags) == 0 ? 0 : 1);
        }
        int status = 0;
        if (waitpid(pid, &status, 0) == pid) {
            available = WIFEXITED(status) && WEXITSTATUS(status) == 0;
        }
    });
    return available;
}

/**
 * @brief 运行中发现隔离失败后全局关闭命名空间
 */
inline std::atomic<bool>& namespace_disabled() {
    static std::atomic<bool> disabled{false};
    return disabled;
}

namespace detail {

inline unsigned long mount_flags_of(const std::string &path) {
    struct statvfs sv;
    if (statvfs(path.c_str(), &sv) != 0) return 0;
    unsigned long flags = 0;
    if (sv.f_flag & ST_NOSUID)     flags |= MS_NOSUID;
    if (sv.f_flag & ST_NODEV)      flags |= MS_NODEV;
    if (sv.f_flag & ST_NOEXEC)     flags |= MS_NOEXEC;
    if (sv.f_flag & ST_NOATIME)    flags |= MS_NOATIME;
    if (sv.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (sv.f_flag & ST_RELATIME)   flags |= MS_RELATIME;
    return flags;
}

/**
 * @brief 追加创建 path 各级父目录的步骤（不含 path 本身）
 */
inline void add_parent_dirs(std::vector<MountOp> &ops, const std::string &root,
                            const std::string &path) {
    size_t pos = 1;
    while ((pos = path.find('/', pos)) != std::string::npos) {
        ops.push_back({MountOpType::MakeDir, "", root + path.substr(0, pos)});
        pos++;
    }
}

inline void add_bind(std::vector<MountOp> &ops, const std::string &root,
                     const std::string &src, bool readonly, bool optional) {
    struct stat lst;
    if (lstat(src.c_str(), &lst) != 0) {
        return;
    }
    add_parent_dirs(ops, root, src);
    std::string target = root + src;
    if (S_ISLNK(lst.st_mode)) {
        char link[PATH_MAX];
        ssize_t len = readlink(src.c_str(), link, sizeof(link) - 1);
        if (len > 0) {
            ops.push_back({MountOpType::Symlink, std::string(link, static_cast<size_t>(len)), target});
        }
        return;
    }
    ops.push_back({S_ISDIR(lst.st_mode) ? MountOpType::MakeDir : MountOpType::MakeFile, "", target});
    MountOp bind{MountOpType::Bind, src, target};
    bind.readonly = readonly;
    bind.optional = optional;
    bind.keep_flags = mount_flags_of(src);
    ops.push_back(bind);
}

//==============================================================================
// 子进程侧（只使用系统调用）
//==============================================================================

inline int write_proc_file(const char *path, const std::string &content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return errno;
    ssize_t n = write(fd, content.data(), content.size());
    int err = (n == static_cast<ssize_t>(content.size())) ? 0 : (n < 0 ? errno : EIO);
    close(fd);
    return err;
}

inline int run_mount_op(const MountOp &op) {
    const char *target = op.target.c_str();
    switch (op.type) {
        case MountOpType::MakeDir:
            if (mkdir(target, 0755) != 0 && errno != EEXIST) return errno;
            return 0;
        case MountOpType::MakeFile: {
            int fd = open(target, O_CREAT | O_RDONLY | O_CLOEXEC, 0644);
            if (fd < 0) return errno;
            close(fd);
            return 0;
        }
        case MountOpType::Tmpfs:
            if (mount("tmpfs", target, "tmpfs", MS_NOSUID | MS_NODEV, op.source.c_str()) != 0) return errno;
            return 0;
        case MountOpType::Symlink:
            if (symlink(op.source.c_str(), target) != 0 && errno != EEXIST) return errno;
            return 0;
        case MountOpType::Bind:
            if (mount(op.source.c_str(), target, nullptr, MS_BIND | MS_REC, nullptr) != 0) return errno;
            if (op.readonly &&
                mount(nullptr, target, nullptr,
                      MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | op.keep_flags, nullptr) != 0) {
                return errno;
            }
            return 0;
    }
    return EINVAL;
}

} // namespace detail

/**
 * @brief 构造隔离步骤
 * @param new_root  父进程已创建的空目录
 * @param workspace 可写绑定的工作目录（新根内路径不变）
 */
inline IsolationPlan build_isolation_plan(const std::string &new_root, const std::string &workspace) {
    IsolationPlan plan;
    plan.unshare_flags = namespace_flags();
    plan.new_root = new_root;
    if (plan.unshare_flags & CLONE_NEWUSER) {
        plan.map_ids = true;
        plan.uid_map = std::to_string(geteuid()) + " " + std::to_string(geteuid()) + " 1\n";
        plan.gid_map = std::to_string(getegid()) + " " + std::to_string(getegid()) + " 1\n";
    }

    auto &ops = plan.ops;
    ops.push_back({MountOpType::Tmpfs, "size=64m,mode=755", new_root});

    for (const auto &path : default_readonly_paths()) {
        detail::add_bind(ops, new_root, path, true, false);
    }
    detail::add_bind(ops, new_root, "/proc", true, true);

    ops.push_back({MountOpType::MakeDir, "", new_root + "/dev"});
    for (const auto &dev : default_device_paths()) {
        detail::add_bind(ops, new_root, dev, false, true);
    }

    ops.push_back({MountOpType::MakeDir, "", new_root + "/tmp"});
    ops.push_back({MountOpType::Tmpfs, "size=64m,mode=1777", new_root + "/tmp"});

    detail::add_bind(ops, new_root, workspace, false, false);
    return plan;
}

/**
 * @brief 在子进程中执行隔离步骤
 * @return 0 或 errno
 */
inline int apply_isolation_plan(const IsolationPlan &plan) {
    if (unshare(plan.unshare_flags) != 0) return errno;

    if (plan.map_ids) {
        int err = detail::write_proc_file("/proc/self/setgroups", "deny");
        if (err != 0 && err != ENOENT) return err;
        if ((err = detail::write_proc_file("/proc/self/uid_map", plan.uid_map)) != 0) return err;
        if ((err = detail::write_proc_file("/proc/self/gid_map", plan.gid_map)) != 0) return err;
    }

    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) return errno;

    for (const auto &op : plan.ops) {
        int err = detail::run_mount_op(op);
        if (err != 0 && !op.optional) return err;
    }

    if (syscall(SYS_pivot_root, plan.new_root.c_str(), plan.new_root.c_str()) != 0) return errno;
    if (umount2("/", MNT_DETACH) != 0) return errno;
    if (chdir("/") != 0) return errno;

    if (sethostname(plan.hostname.c_str(), plan.hostname.size()) != 0) return errno;
    return 0;
}

} // namespace sandbox
} // namespace glide

#endif // GLIDE_SANDBOX_NAMESPACE_H

/**
 * @file workspace.h
 * @brief 每次提交独占的工作目录
 *
 *   <workspace_root>/            0711
 *   └── sub_XXXXXX/              0700，mkdtemp 保证唯一
 *       ├── solution.cpp         用户源码
 *       ├── glide_main.cpp       调用桩
 *       ├── solution             编译产物（各测试点共享）
 *       └── case_3/              当前测试点的工作目录，结束即删除
 *
 * Workspace 与 ScratchDir 都是只能移动的 RAII 句柄，析构时 remove_all。
 */

#ifndef GLIDE_SANDBOX_WORKSPACE_H
#define GLIDE_SANDBOX_WORKSPACE_H

#include <string>
#include <vector>
#include <filesystem>
#include <system_error>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/stat.h>

#include "core/error.h"
#include "core/utils.h"
#include "core/types.h"
#include "core/language.h"
#include "core/grader_logger.h"

namespace glide {
namespace sandbox {

namespace fs = std::filesystem;

namespace detail {

inline void remove_tree(const std::string &path, const char *what) {
    if (path.empty()) return;
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        SLOG_ERROR << "Failed to remove " << what << " " << path << ": " << ec.message();
    }
}

} // namespace detail

/**
 * @brief 单个测试点的临时目录
 */
class ScratchDir {
private:
    std::string path_;

public:
    ScratchDir() = default;
    explicit ScratchDir(std::string path) : path_(std::move(path)) {}

    ~ScratchDir() { detail::remove_tree(path_, "scratch dir"); }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    ScratchDir(ScratchDir &&other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }

    ScratchDir& operator=(ScratchDir &&other) noexcept {
        if (this != &other) {
            detail::remove_tree(path_, "scratch dir");
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    const std::string& path() const { return path_; }
};

class Workspace {
private:
    std::string path_;
    std::string root_;

    Workspace(std::string path, std::string root)
        : path_(std::move(path)), root_(std::move(root)) {}

public:
    Workspace() = default;

    ~Workspace() { teardown(); }

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    Workspace(Workspace &&other) noexcept
        : path_(std::move(other.path_)), root_(std::move(other.root_)) {
        other.path_.clear();
    }

    Workspace& operator=(Workspace &&other) noexcept {
        if (this != &other) {
            teardown();
            path_ = std::move(other.path_);
            root_ = std::move(other.root_);
            other.path_.clear();
        }
        return *this;
    }

    /**
     * @brief 分配一个新的工作目录
     */
    static Result<Workspace> allocate(const std::string &root) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            fs::create_directories(root, ec);
            if (ec) {
                return Err<Workspace>(ErrorCode::SANDBOX_FAILURE,
                                      "Cannot create workspace root " + root + ": " + ec.message());
            }
            if (chmod(root.c_str(), 0711) != 0) {
                SLOG_WARN << "chmod 0711 failed on " << root << ": " << strerror(errno);
            }
        }

        std::string tmpl = root + "/sub_XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            return Err<Workspace>(ErrorCode::SANDBOX_FAILURE,
                                  "mkdtemp failed under " + root + ": " + strerror(errno));
        }
        std::string path(buf.data());
        SLOG_DEBUG << "Allocated workspace " << path;
        return Ok(Workspace(path, root));
    }

    /**
     * @brief 分配工作目录并按语言描述写入源码
     */
    static Result<Workspace> prepare(const std::string &root, const Submission &submission,
                                     const GuestRuntimeDescriptor &descriptor) {
        GLIDE_TRY_UNWRAP(ws, allocate(root));
        auto written = ws.write(descriptor.source_file, submission.source_code);
        if (written.is_error()) {
            return Err<Workspace>(ErrorCode::SANDBOX_FAILURE, written.error().message());
        }
        return Ok(std::move(ws));
    }

    /**
     * @brief 写入工作目录内的文件
     */
    Result<void> write(const std::string &name, const std::string &content) const {
        GLIDE_ENSURE(valid(), ErrorCode::SANDBOX_FAILURE, "workspace already torn down");
        GLIDE_ENSURE(!name.empty() && name.find('/') == std::string::npos && name != "..",
                     ErrorCode::INVALID_REQUEST, "invalid workspace file name: " + name);
        return write_file(file(name), content);
    }

    /**
     * @brief 为第 index 个测试点创建临时目录
     */
    Result<ScratchDir> make_case_dir(int index) const {
        GLIDE_ENSURE(valid(), ErrorCode::SANDBOX_FAILURE, "workspace already torn down");
        std::string dir = path_ + "/case_" + std::to_string(index);
        detail::remove_tree(dir, "stale scratch dir");
        if (mkdir(dir.c_str(), 0700) != 0) {
            return Err<ScratchDir>(ErrorCode::SANDBOX_FAILURE,
                                   "Cannot create " + dir + ": " + strerror(errno));
        }
        return Ok(ScratchDir(dir));
    }

    /**
     * @brief 删除整个工作目录，可重复调用
     */
    void teardown() {
        if (path_.empty()) return;
        detail::remove_tree(path_, "workspace");
        SLOG_DEBUG << "Released workspace " << path_;
        path_.clear();
    }

    bool valid() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& root() const { return root_; }
    std::string file(const std::string &name) const { return path_ + "/" + name; }
};

} // namespace sandbox
} // namespace glide

#endif // GLIDE_SANDBOX_WORKSPACE_H

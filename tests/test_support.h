/**
 * @file test_support.h
 * @brief 测试公用工具
 */

#ifndef GLIDE_TESTS_TEST_SUPPORT_H
#define GLIDE_TESTS_TEST_SUPPORT_H

#include <string>
#include <filesystem>
#include <unistd.h>

#include "core/config.h"

namespace glide {
namespace testutil {

inline bool have_binary(const std::string &path) {
    return access(path.c_str(), X_OK) == 0;
}

/**
 * @brief 每个测试进程独立的临时根目录，析构时删除
 */
class TempRoot {
private:
    std::string path_;

public:
    explicit TempRoot(const std::string &tag) {
        path_ = "/tmp/glide_judger_test/" + tag + "_" + std::to_string(getpid());
        std::filesystem::create_directories(path_);
    }

    ~TempRoot() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempRoot(const TempRoot&) = delete;
    TempRoot& operator=(const TempRoot&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string &name) const { return path_ + "/" + name; }
};

/**
 * @brief 测试用引擎配置：不写日志文件，线程数固定
 */
inline EngineConfig test_engine_config(const std::string &workspace_root, int workers = 2) {
    EngineConfig ec;
    ec.workspace_root = workspace_root;
    ec.log_dir = "";
    ec.worker_threads = workers;
    return ec;
}

} // namespace testutil
} // namespace glide

#endif // GLIDE_TESTS_TEST_SUPPORT_H

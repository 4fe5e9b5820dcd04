/**
 * @file glide_env.h
 * @brief 编译期默认路径与常量
 *
 * 运行期可由 engine.conf 覆盖（见 core/config.h）。
 */

#ifndef GLIDE_ENV_H
#define GLIDE_ENV_H

#ifndef GLIDE_INSTALL_PREFIX
#define GLIDE_INSTALL_PREFIX "/opt/glide_judger"
#endif

namespace glide {
namespace env {

constexpr const char *DEFAULT_CONFIG_FILE   = GLIDE_INSTALL_PREFIX "/config/engine.conf";
constexpr const char *DEFAULT_LANGUAGE_DIR  = GLIDE_INSTALL_PREFIX "/config/languages";
constexpr const char *DEFAULT_WORKSPACE_ROOT = "/tmp/glide_judger/work";
constexpr const char *DEFAULT_LOG_DIR       = "/tmp/glide_judger/log";

/// 返回值行标记的固定部分，完整标记为 PREFIX + 32 位十六进制 nonce + SUFFIX
constexpr const char *RESULT_MARKER_PREFIX = "@@GLIDE_RESULT_";
constexpr const char *RESULT_MARKER_SUFFIX = "@@";

/// 嵌入式解释器中提交代码的文件名，用于区分用户帧
constexpr const char *SUBMISSION_FILENAME = "<submission>";

} // namespace env
} // namespace glide

#endif // GLIDE_ENV_H

/**
 * @file utils.h
 * @brief 工具函数
 *
 * - 文件读写
 * - 字符串裁剪、截断、占位符替换
 */

#ifndef GLIDE_CORE_UTILS_H
#define GLIDE_CORE_UTILS_H

#include <string>
#include <vector>
#include <map>
#include <sstream>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <unistd.h>

#include "core/error.h"

namespace glide {

//==============================================================================
// 文件操作
//==============================================================================

inline Result<void> write_file(const std::string &path, const std::string &content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err(ErrorCode::FILE_WRITE_ERROR, "Cannot open " + path + " for writing");
    }
    out << content;
    out.close();
    if (!out) {
        return Err(ErrorCode::FILE_WRITE_ERROR, "Write failed: " + path);
    }
    return Ok();
}

inline Result<std::string> read_file(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Err<std::string>(ErrorCode::FILE_NOT_FOUND, "Cannot open " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return Ok(oss.str());
}

inline bool is_executable(const std::string &path) {
    return !path.empty() && access(path.c_str(), X_OK) == 0;
}

//==============================================================================
// 字符串处理
//==============================================================================

inline std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief 截断到 limit 字节并追加 "…"，不会切断 UTF-8 多字节字符
 */
inline std::string truncate_text(const std::string &s, size_t limit) {
    if (s.size() <= limit) return s;
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return s.substr(0, cut) + "\xE2\x80\xA6";
}

inline std::vector<std::string> split_lines(const std::string &s) {
    std::vector<std::string> lines;
    std::istringstream iss(s);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

/**
 * @brief 替换 {key} 形式的占位符
 */
inline std::string replace_placeholders(const std::string &str,
                                        const std::map<std::string, std::string> &vars) {
    std::string result = str;
    for (const auto &kv : vars) {
        std::string placeholder = "{" + kv.first + "}";
        size_t pos = 0;
        while ((pos = result.find(placeholder, pos)) != std::string::npos) {
            result.replace(pos, placeholder.length(), kv.second);
            pos += kv.second.length();
        }
    }
    return result;
}

} // namespace glide

#endif // GLIDE_CORE_UTILS_H

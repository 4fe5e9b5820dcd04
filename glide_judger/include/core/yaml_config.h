/**
 * @file yaml_config.h
 * @brief 轻量级 YAML 配置解析器
 *
 * 只覆盖语言描述文件用到的子集：
 * - 键值对与嵌套对象（按缩进）
 * - 块式列表 / 流式列表 [a, "b, c"]
 * - 流式对象 {a: 1}
 * - # 注释、带引号和不带引号的字符串
 */

#ifndef GLIDE_CORE_YAML_CONFIG_H
#define GLIDE_CORE_YAML_CONFIG_H

#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <variant>
#include <memory>
#include <cstdlib>
#include <cerrno>
#include <cstdint>

#include "core/error.h"

namespace glide {
namespace yaml {

class YamlNode;
using YamlNodePtr = std::shared_ptr<YamlNode>;
using YamlMap = std::map<std::string, YamlNodePtr>;
using YamlList = std::vector<YamlNodePtr>;
using YamlValue = std::variant<std::monostate, std::string, int64_t, double, bool, YamlMap, YamlList>;

/**
 * @brief YAML 节点
 */
class YamlNode {
public:
    YamlValue value;

    YamlNode() : value(std::monostate{}) {}
    explicit YamlNode(const std::string &s) : value(s) {}
    explicit YamlNode(int64_t i) : value(i) {}
    explicit YamlNode(double d) : value(d) {}
    explicit YamlNode(bool b) : value(b) {}
    explicit YamlNode(const YamlMap &m) : value(m) {}
    explicit YamlNode(const YamlList &l) : value(l) {}

    bool is_null() const { return std::holds_alternative<std::monostate>(value); }
    bool is_string() const { return std::holds_alternative<std::string>(value); }
    bool is_int() const { return std::holds_alternative<int64_t>(value); }
    bool is_double() const { return std::holds_alternative<double>(value); }
    bool is_bool() const { return std::holds_alternative<bool>(value); }
    bool is_map() const { return std::holds_alternative<YamlMap>(value); }
    bool is_list() const { return std::holds_alternative<YamlList>(value); }

    std::string as_string(const std::string &def = "") const {
        if (is_string()) return std::get<std::string>(value);
        if (is_int()) return std::to_string(std::get<int64_t>(value));
        if (is_double()) {
            std::ostringstream oss;
            oss << std::get<double>(value);
            return oss.str();
        }
        if (is_bool()) return std::get<bool>(value) ? "true" : "false";
        return def;
    }

    int64_t as_int(int64_t def = 0) const {
        if (is_int()) return std::get<int64_t>(value);
        if (is_double()) return static_cast<int64_t>(std::get<double>(value));
        return def;
    }

    double as_double(double def = 0.0) const {
        if (is_double()) return std::get<double>(value);
        if (is_int()) return static_cast<double>(std::get<int64_t>(value));
        return def;
    }

    bool as_bool(bool def = false) const {
        if (is_bool()) return std::get<bool>(value);
        if (is_int()) return std::get<int64_t>(value) != 0;
        return def;
    }

    const YamlMap& as_map() const {
        static const YamlMap empty;
        return is_map() ? std::get<YamlMap>(value) : empty;
    }

    const YamlList& as_list() const {
        static const YamlList empty;
        return is_list() ? std::get<YamlList>(value) : empty;
    }

    YamlNodePtr get(const std::string &key) const {
        if (!is_map()) return nullptr;
        const auto &m = std::get<YamlMap>(value);
        auto it = m.find(key);
        return it != m.end() ? it->second : nullptr;
    }

    /**
     * @brief 按点分路径访问，如 "build.timeout_ms"
     */
    YamlNodePtr operator[](const std::string &path) const {
        size_t pos = path.find('.');
        if (pos == std::string::npos) {
            return get(path);
        }
        auto child = get(path.substr(0, pos));
        if (!child) return nullptr;
        return (*child)[path.substr(pos + 1)];
    }

    bool has(const std::string &key) const {
        return get(key) != nullptr;
    }

    std::vector<std::string> as_string_list() const {
        std::vector<std::string> result;
        for (const auto &item : as_list()) {
            result.push_back(item->as_string());
        }
        return result;
    }
};

//==============================================================================
// YAML 解析器
//==============================================================================

class YamlParser {
private:
    std::vector<std::string> lines_;
    size_t current_line_ = 0;

    static std::string trim(const std::string &s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    static size_t get_indent(const std::string &line) {
        size_t indent = 0;
        for (char c : line) {
            if (c == ' ') indent++;
            else if (c == '\t') indent += 2;
            else break;
        }
        return indent;
    }

    static std::string remove_comment(const std::string &line) {
        char quote = 0;
        for (size_t i = 0; i < line.size(); i++) {
            char c = line[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
                return line.substr(0, i);
            }
        }
        return line;
    }

    static bool is_quoted(const std::string &s) {
        return s.size() >= 2 &&
               ((s.front() == '"' && s.back() == '"') ||
                (s.front() == '\'' && s.back() == '\''));
    }

    static std::string unquote(const std::string &s) {
        return is_quoted(s) ? s.substr(1, s.size() - 2) : s;
    }

    /**
     * @brief 查找键值分隔符（引号外的 ": " 或行尾的 ":"）
     */
    static size_t find_key_colon(const std::string &s) {
        char quote = 0;
        for (size_t i = 0; i < s.size(); i++) {
            char c = s[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == ':' && (i + 1 == s.size() || s[i + 1] == ' ')) {
                return i;
            }
        }
        return std::string::npos;
    }

    /**
     * @brief 按引号外、括号外的逗号切分流式集合
     */
    static std::vector<std::string> split_flow(const std::string &content) {
        std::vector<std::string> parts;
        std::string cur;
        char quote = 0;
        int depth = 0;
        for (char c : content) {
            if (quote) {
                if (c == quote) quote = 0;
                cur += c;
                continue;
            }
            if (c == '"' || c == '\'') quote = c;
            else if (c == '[' || c == '{') depth++;
            else if (c == ']' || c == '}') depth--;
            if (c == ',' && depth == 0) {
                parts.push_back(trim(cur));
                cur.clear();
            } else {
                cur += c;
            }
        }
        if (!trim(cur).empty()) {
            parts.push_back(trim(cur));
        }
        return parts;
    }

    static YamlNodePtr parse_scalar(const std::string &s) {
        std::string value = trim(s);

        if (value.empty() || value == "~" || value == "null") {
            return std::make_shared<YamlNode>();
        }
        if (is_quoted(value)) {
            return std::make_shared<YamlNode>(unquote(value));
        }

        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        if (lower == "true" || lower == "yes" || lower == "on") {
            return std::make_shared<YamlNode>(true);
        }
        if (lower == "false" || lower == "no" || lower == "off") {
            return std::make_shared<YamlNode>(false);
        }

        const char *begin = value.c_str();
        char *end = nullptr;
        errno = 0;
        if (value.find_first_of(".eE") == std::string::npos) {
            long long i = std::strtoll(begin, &end, 10);
            if (errno == 0 && end && *end == '\0') {
                return std::make_shared<YamlNode>(static_cast<int64_t>(i));
            }
        } else {
            double d = std::strtod(begin, &end);
            if (errno == 0 && end && *end == '\0') {
                return std::make_shared<YamlNode>(d);
            }
        }

        return std::make_shared<YamlNode>(value);
    }

    YamlNodePtr parse_value(const std::string &s) {
        std::string value = trim(s);

        if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
            YamlList list;
            for (const auto &item : split_flow(value.substr(1, value.size() - 2))) {
                list.push_back(parse_value(item));
            }
            return std::make_shared<YamlNode>(list);
        }

        if (value.size() >= 2 && value.front() == '{' && value.back() == '}') {
            YamlMap map;
            for (const auto &pair : split_flow(value.substr(1, value.size() - 2))) {
                size_t colon = find_key_colon(pair);
                if (colon != std::string::npos) {
                    map[unquote(trim(pair.substr(0, colon)))] = parse_value(pair.substr(colon + 1));
                }
            }
            return std::make_shared<YamlNode>(map);
        }

        return parse_scalar(value);
    }

    /**
     * @brief 读取与列表项同级的后续键值对，合并进 item_map
     */
    void parse_item_continuation(size_t item_indent, YamlMap &item_map) {
        while (current_line_ < lines_.size()) {
            std::string line = remove_comment(lines_[current_line_]);
            std::string trimmed = trim(line);
            if (trimmed.empty()) {
                current_line_++;
                continue;
            }
            size_t indent = get_indent(line);
            if (indent <= item_indent || trimmed[0] == '-') {
                break;
            }
            size_t colon = find_key_colon(trimmed);
            if (colon == std::string::npos) {
                break;
            }
            std::string key = unquote(trim(trimmed.substr(0, colon)));
            std::string val = trim(trimmed.substr(colon + 1));
            current_line_++;
            item_map[key] = val.empty() ? parse_block(indent + 1) : parse_value(val);
        }
    }

    /**
     * @brief 解析缩进不小于 min_indent 的块
     */
    YamlNodePtr parse_block(size_t min_indent) {
        YamlMap map;
        YamlList list;
        bool is_list_mode = false;
        bool have_indent = false;
        size_t block_indent = 0;

        while (current_line_ < lines_.size()) {
            std::string line = remove_comment(lines_[current_line_]);
            std::string trimmed = trim(line);

            if (trimmed.empty()) {
                current_line_++;
                continue;
            }

            size_t indent = get_indent(line);
            if (indent < min_indent) break;
            if (!have_indent) {
                block_indent = indent;
                have_indent = true;
            } else if (indent != block_indent) {
                break;
            }

            if (trimmed[0] == '-' && (trimmed.size() == 1 || trimmed[1] == ' ')) {
                is_list_mode = true;
                std::string item = trim(trimmed.substr(1));
                current_line_++;

                if (item.empty()) {
                    list.push_back(parse_block(indent + 1));
                    continue;
                }

                size_t colon = find_key_colon(item);
                if (colon != std::string::npos && !is_quoted(item)) {
                    YamlMap item_map;
                    std::string key = unquote(trim(item.substr(0, colon)));
                    std::string val = trim(item.substr(colon + 1));
                    item_map[key] = val.empty() ? parse_block(indent + 3) : parse_value(val);
                    parse_item_continuation(indent, item_map);
                    list.push_back(std::make_shared<YamlNode>(item_map));
                } else {
                    list.push_back(parse_value(item));
                }
                continue;
            }

            size_t colon = find_key_colon(trimmed);
            current_line_++;
            if (colon == std::string::npos) {
                continue;
            }
            std::string key = unquote(trim(trimmed.substr(0, colon)));
            std::string val = trim(trimmed.substr(colon + 1));
            map[key] = val.empty() ? parse_block(indent + 1) : parse_value(val);
        }

        if (is_list_mode) {
            return std::make_shared<YamlNode>(list);
        }
        if (map.empty() && !have_indent) {
            return std::make_shared<YamlNode>();
        }
        return std::make_shared<YamlNode>(map);
    }

public:
    YamlNodePtr parse(const std::string &content) {
        lines_.clear();
        current_line_ = 0;

        std::istringstream iss(content);
        std::string line;
        while (std::getline(iss, line)) {
            lines_.push_back(line);
        }

        auto root = parse_block(0);
        if (root->is_null()) {
            return std::make_shared<YamlNode>(YamlMap{});
        }
        return root;
    }
};

//==============================================================================
// 便捷函数
//==============================================================================

inline YamlNodePtr parse_yaml(const std::string &content) {
    YamlParser parser;
    return parser.parse(content);
}

inline Result<YamlNodePtr> load_yaml(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return Err<YamlNodePtr>(ErrorCode::FILE_NOT_FOUND, "Cannot open file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return Ok(parse_yaml(buffer.str()));
}

} // namespace yaml
} // namespace glide

#endif // GLIDE_CORE_YAML_CONFIG_H

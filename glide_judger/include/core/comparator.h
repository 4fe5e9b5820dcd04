/**
 * @file comparator.h
 * @brief 跨语言返回值比较
 *
 * 以期望值的类型为提示解析实际输出：
 * - 数值：整数之间精确比较，含浮点时按容差比较；文本 "5" 视作数值 5
 * - 布尔：true/false（不区分大小写）以及整数 0/1
 * - 文本：精确比较
 * - null：null、"None"、"null"
 * - 序列：按顺序逐元素比较；内容为 JSON 数组的文本也接受
 * - 映射：键集合相同，值逐个比较
 * 无法解析为期望类型时判为 TypeMismatch。
 */

#ifndef GLIDE_CORE_COMPARATOR_H
#define GLIDE_CORE_COMPARATOR_H

#include <string>
#include <cmath>
#include <cstdlib>
#include <cerrno>
#include <optional>
#include <algorithm>
#include <cctype>

#include "core/config.h"
#include "core/value.h"
#include "core/utils.h"

namespace glide {

struct Comparison {
    bool passed = false;
    bool type_mismatch = false;
    Value actual;                 ///< 归一化后的实际值
    std::string message;
};

class Comparator {
private:
    TolerancePolicy policy_;

    static bool looks_decimal(const std::string &s) {
        size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
        if (i >= s.size()) return false;
        if (!std::isdigit(static_cast<unsigned char>(s[i])) && s[i] != '.') return false;
        return s.find_first_of("xX") == std::string::npos;
    }

    static std::optional<double> parse_number(const std::string &text) {
        std::string s = trim(text);
        if (s.empty() || !looks_decimal(s)) return std::nullopt;
        char *end = nullptr;
        errno = 0;
        double v = std::strtod(s.c_str(), &end);
        if (errno == ERANGE || !end || *end != '\0') return std::nullopt;
        if (std::isnan(v) || std::isinf(v)) return std::nullopt;
        return v;
    }

    static std::optional<long long> parse_integer(const std::string &text) {
        std::string s = trim(text);
        if (s.empty() || !looks_decimal(s)) return std::nullopt;
        char *end = nullptr;
        errno = 0;
        long long v = std::strtoll(s.c_str(), &end, 10);
        if (errno == ERANGE || !end || *end != '\0') return std::nullopt;
        return v;
    }

    static std::string describe(const Value &v) {
        std::string text = render(v);
        return std::string(kind_name(kind_of(v))) + " " + truncate_text(text, 80);
    }

    static Comparison mismatch(const std::string &path, const Value &expected, const Value &actual) {
        Comparison c;
        c.type_mismatch = true;
        c.actual = actual;
        c.message = "TypeMismatch" + (path.empty() ? std::string() : " at " + path) +
                    ": expected " + kind_name(kind_of(expected)) + ", got " + describe(actual);
        return c;
    }

    static Comparison wrong(const std::string &path, const Value &expected, const Value &actual) {
        Comparison c;
        c.actual = actual;
        c.message = "Wrong answer" + (path.empty() ? std::string() : " at " + path) +
                    ": expected " + truncate_text(render(expected), 200) +
                    ", got " + truncate_text(render(actual), 200);
        return c;
    }

    static Comparison pass(const Value &actual) {
        Comparison c;
        c.passed = true;
        c.actual = actual;
        return c;
    }

    Comparison compare_number(const std::string &path, const Value &expected, const Value &actual) const {
        Value normalized;
        ValueKind ak = kind_of(actual);
        if (is_numeric(ak)) {
            normalized = actual;
        } else if (ak == ValueKind::Text) {
            const std::string &text = actual.get_ref<const std::string&>();
            if (auto i = parse_integer(text)) {
                normalized = *i;
            } else if (auto d = parse_number(text)) {
                normalized = *d;
            } else {
                return mismatch(path, expected, actual);
            }
        } else {
            return mismatch(path, expected, actual);
        }

        if (kind_of(expected) == ValueKind::Integer && kind_of(normalized) == ValueKind::Integer) {
            // 有符号与无符号整数的规范文本一致即相等
            return render(expected) == render(normalized) ? pass(normalized)
                                                          : wrong(path, expected, normalized);
        }
        return floats_equal(expected.get<double>(), normalized.get<double>())
                   ? pass(normalized) : wrong(path, expected, normalized);
    }

    static Comparison compare_bool(const std::string &path, const Value &expected, const Value &actual) {
        std::optional<bool> b;
        switch (kind_of(actual)) {
            case ValueKind::Boolean:
                b = actual.get<bool>();
                break;
            case ValueKind::Integer:
                if (actual.get<long long>() == 0) b = false;
                else if (actual.get<long long>() == 1) b = true;
                break;
            case ValueKind::Text: {
                std::string t = to_lower(trim(actual.get<std::string>()));
                if (t == "true") b = true;
                else if (t == "false") b = false;
                break;
            }
            default:
                break;
        }
        if (!b) return mismatch(path, expected, actual);
        Value normalized = *b;
        return *b == expected.get<bool>() ? pass(normalized) : wrong(path, expected, normalized);
    }

    static Comparison compare_null(const std::string &path, const Value &expected, const Value &actual) {
        if (actual.is_null()) return pass(actual);
        if (actual.is_string()) {
            std::string t = trim(actual.get<std::string>());
            if (t == "None" || t == "null") return pass(Value());
        }
        return wrong(path, expected, actual);
    }

    /**
     * @brief 文本形式的结构化值（如 Python repr 回退的 "[1, 2]"）
     */
    static Value unwrap_structured(const Value &actual, ValueKind want) {
        if (!actual.is_string()) return actual;
        auto parsed = parse_json(actual.get<std::string>());
        if (parsed && kind_of(*parsed) == want) return *parsed;
        return actual;
    }

    Comparison compare_sequence(const std::string &path, const Value &expected, const Value &raw) const {
        Value actual = unwrap_structured(raw, ValueKind::Sequence);
        if (!actual.is_array()) return mismatch(path, expected, raw);
        if (actual.size() != expected.size()) {
            Comparison c = wrong(path, expected, actual);
            c.message += " (length " + std::to_string(actual.size()) +
                         " vs " + std::to_string(expected.size()) + ")";
            return c;
        }
        Value normalized = Value::array();
        for (size_t i = 0; i < expected.size(); i++) {
            Comparison item = compare_at(path + "[" + std::to_string(i) + "]", expected[i], actual[i]);
            if (!item.passed) {
                item.actual = actual;
                return item;
            }
            normalized.push_back(std::move(item.actual));
        }
        return pass(normalized);
    }

    Comparison compare_mapping(const std::string &path, const Value &expected, const Value &raw) const {
        Value actual = unwrap_structured(raw, ValueKind::Mapping);
        if (!actual.is_object()) return mismatch(path, expected, raw);
        for (auto it = actual.begin(); it != actual.end(); ++it) {
            if (!expected.contains(it.key())) {
                Comparison c = wrong(path, expected, actual);
                c.message += " (unexpected key '" + it.key() + "')";
                return c;
            }
        }
        Value normalized = Value::object();
        for (auto it = expected.begin(); it != expected.end(); ++it) {
            std::string sub = path + "." + it.key();
            if (!actual.contains(it.key())) {
                Comparison c = wrong(path, expected, actual);
                c.message += " (missing key '" + it.key() + "')";
                return c;
            }
            Comparison item = compare_at(sub, it.value(), actual.at(it.key()));
            if (!item.passed) {
                item.actual = actual;
                return item;
            }
            normalized[it.key()] = std::move(item.actual);
        }
        return pass(normalized);
    }

    Comparison compare_at(const std::string &path, const Value &expected, const Value &actual) const {
        switch (kind_of(expected)) {
            case ValueKind::Integer:
            case ValueKind::Float:
                return compare_number(path, expected, actual);
            case ValueKind::Boolean:
                return compare_bool(path, expected, actual);
            case ValueKind::Text:
                if (!actual.is_string()) return mismatch(path, expected, actual);
                return actual == expected ? pass(actual) : wrong(path, expected, actual);
            case ValueKind::Null:
                return compare_null(path, expected, actual);
            case ValueKind::Sequence:
                return compare_sequence(path, expected, actual);
            case ValueKind::Mapping:
                return compare_mapping(path, expected, actual);
        }
        return mismatch(path, expected, actual);
    }

public:
    Comparator() = default;
    explicit Comparator(const TolerancePolicy &policy) : policy_(policy) {}

    const TolerancePolicy& policy() const { return policy_; }

    /**
     * @brief |a - e| <= max(abs, rel * max(|a|, |e|))
     */
    bool floats_equal(double expected, double actual) const {
        if (std::isnan(expected) || std::isnan(actual)) return false;
        if (expected == actual) return true;
        double diff = std::fabs(actual - expected);
        double scale = std::max(std::fabs(actual), std::fabs(expected));
        return diff <= std::max(policy_.abs_tolerance, policy_.rel_tolerance * scale);
    }

    /**
     * @brief 比较已解析的实际值
     */
    Comparison compare(const Value &expected, const Value &actual) const {
        return compare_at("", expected, actual);
    }

    /**
     * @brief 比较桩代码输出的原始文本
     *
     * 先尝试按 JSON 解析；不是合法 JSON 的文本按字符串处理。
     */
    Comparison compare_raw(const Value &expected, const std::string &raw) const {
        auto parsed = parse_json(raw);
        if (parsed) {
            return compare_at("", expected, *parsed);
        }
        return compare_at("", expected, Value(trim(raw)));
    }
};

} // namespace glide

#endif // GLIDE_CORE_COMPARATOR_H

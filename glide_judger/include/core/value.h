/**
 * @file value.h
 * @brief 测试数据的类型化取值
 *
 * 参数与期望值统一用 JSON 表示，跨语言桩代码也以 JSON 交换结果。
 */

#ifndef GLIDE_CORE_VALUE_H
#define GLIDE_CORE_VALUE_H

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace glide {

using Value = nlohmann::json;

enum class ValueKind {
    Null,
    Boolean,
    Integer,
    Float,
    Text,
    Sequence,
    Mapping
};

inline ValueKind kind_of(const Value &v) {
    switch (v.type()) {
        case Value::value_t::boolean:         return ValueKind::Boolean;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: return ValueKind::Integer;
        case Value::value_t::number_float:    return ValueKind::Float;
        case Value::value_t::string:          return ValueKind::Text;
        case Value::value_t::array:           return ValueKind::Sequence;
        case Value::value_t::object:          return ValueKind::Mapping;
        default:                              return ValueKind::Null;
    }
}

inline const char* kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null:     return "null";
        case ValueKind::Boolean:  return "boolean";
        case ValueKind::Integer:  return "integer";
        case ValueKind::Float:    return "float";
        case ValueKind::Text:     return "text";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Mapping:  return "mapping";
    }
    return "unknown";
}

inline bool is_numeric(ValueKind kind) {
    return kind == ValueKind::Integer || kind == ValueKind::Float;
}

/**
 * @brief 解析 JSON 文本，失败返回 nullopt（不抛异常）
 */
inline std::optional<Value> parse_json(const std::string &text) {
    Value v = Value::parse(text, nullptr, false);
    if (v.is_discarded()) {
        return std::nullopt;
    }
    return v;
}

/**
 * @brief 紧凑输出，非法 UTF-8 以替换字符输出
 */
inline std::string render(const Value &v) {
    return v.dump(-1, ' ', false, Value::error_handler_t::replace);
}

} // namespace glide

#endif // GLIDE_CORE_VALUE_H

/**
 * @file harness.h
 * @brief 子进程语言的调用桩
 *
 * 约定：参数以一个 JSON 数组从 stdin 传入；桩代码把实参转换为入口函数的参数类型，
 * 调用后在 stdout 输出一行 "\n<marker><json>\n"。marker 每个提交随机生成
 * （见 make_result_marker），用户代码无法预先知道，也就无法伪造返回值行。
 *
 * 桩代码退出码：
 *   2  参数无法解析或转换
 *   3  找不到入口函数
 *   其余非零退出码来自用户代码本身
 */

#ifndef GLIDE_EXECUTOR_HARNESS_H
#define GLIDE_EXECUTOR_HARNESS_H

#include <string>
#include <map>

#include "core/error.h"
#include "core/language.h"
#include "core/utils.h"
#include "executor/executor.h"

namespace glide {
namespace harness {

//==============================================================================
// JavaScript：追加在用户源码之后
//==============================================================================

constexpr const char *JS_TEMPLATE = R"GLIDE(
;(function () {
  const glideFs = require('fs');
  let glideArgs;
  try {
    const text = glideFs.readFileSync(0, 'utf8');
    glideArgs = text.trim() === '' ? [] : JSON.parse(text);
  } catch (e) {
    process.stderr.write('glide: cannot parse arguments: ' + e.message + '\n');
    process.exit(2);
  }
  if (!Array.isArray(glideArgs)) {
    process.stderr.write('glide: arguments must be a JSON array\n');
    process.exit(2);
  }
  let glideFn = (typeof {entry} === 'function') ? {entry} : undefined;
  if (glideFn === undefined && typeof module.exports === 'function') {
    glideFn = module.exports;
  } else if (glideFn === undefined && module.exports && typeof module.exports['{entry}'] === 'function') {
    glideFn = module.exports['{entry}'];
  }
  if (typeof glideFn !== 'function') {
    process.stderr.write("glide: function '{entry}' is not defined\n");
    process.exit(3);
  }
  Promise.resolve()
    .then(() => glideFn(...glideArgs))
    .then((value) => {
      let text = JSON.stringify(value === undefined ? null : value);
      if (text === undefined) text = 'null';
      process.stdout.write('\n{marker}' + text + '\n');
    }, (err) => {
      process.stderr.write((err && err.stack ? err.stack : String(err)) + '\n');
      process.exitCode = 1;
    });
})();
)GLIDE";

//==============================================================================
// C++：独立的 glide_main.cpp，#include 用户源码
//==============================================================================

constexpr const char *CPP_TEMPLATE = R"GLIDE(#include <bits/stdc++.h>
using namespace std;
#include "{source}"

namespace glide_harness {

struct HarnessError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct J {
    enum Kind { Null, Bool, Num, Str, Arr, Obj } kind = Null;
    bool b = false;
    std::string text;                       // Num 的原文 / Str 的内容
    std::vector<J> items;
    std::vector<std::pair<std::string, J>> fields;
};

class Parser {
    const std::string &in_;
    size_t p_ = 0;

    [[noreturn]] void fail(const char *what) const {
        throw HarnessError(std::string("malformed JSON (") + what + ") at offset " + std::to_string(p_));
    }
    void ws() { while (p_ < in_.size() && std::isspace(static_cast<unsigned char>(in_[p_]))) p_++; }
    char next() { if (p_ >= in_.size()) fail("unexpected end"); return in_[p_++]; }
    bool lit(const char *word) {
        size_t n = std::strlen(word);
        if (in_.compare(p_, n, word) != 0) return false;
        p_ += n;
        return true;
    }
    static void put_utf8(std::string &out, unsigned cp) {
        if (cp < 0x80) out += static_cast<char>(cp);
        else if (cp < 0x800) { out += static_cast<char>(0xC0 | (cp >> 6)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
        else if (cp < 0x10000) { out += static_cast<char>(0xE0 | (cp >> 12)); out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
        else { out += static_cast<char>(0xF0 | (cp >> 18)); out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F)); out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
    }
    unsigned hex4() {
        if (p_ + 4 > in_.size()) fail("short \\u escape");
        unsigned v = static_cast<unsigned>(std::stoul(in_.substr(p_, 4), nullptr, 16));
        p_ += 4;
        return v;
    }
    std::string str() {
        std::string out;
        while (true) {
            char c = next();
            if (c == '"') return out;
            if (c != '\\') { out += c; continue; }
            char e = next();
            switch (e) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'u': {
                    unsigned cp = hex4();
                    if (cp >= 0xD800 && cp < 0xDC00 && lit("\\u")) {
                        unsigned lo = hex4();
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    put_utf8(out, cp);
                    break;
                }
                default: out += e;
            }
        }
    }

public:
    explicit Parser(const std::string &in) : in_(in) {}

    J value() {
        ws();
        J j;
        if (p_ >= in_.size()) fail("unexpected end");
        char c = in_[p_];
        if (c == '[') {
            p_++;
            j.kind = J::Arr;
            ws();
            if (p_ < in_.size() && in_[p_] == ']') { p_++; return j; }
            while (true) {
                j.items.push_back(value());
                ws();
                char d = next();
                if (d == ']') return j;
                if (d != ',') fail("expected , or ]");
            }
        }
        if (c == '{') {
            p_++;
            j.kind = J::Obj;
            ws();
            if (p_ < in_.size() && in_[p_] == '}') { p_++; return j; }
            while (true) {
                ws();
                if (next() != '"') fail("expected key");
                std::string key = str();
                ws();
                if (next() != ':') fail("expected :");
                j.fields.emplace_back(key, value());
                ws();
                char d = next();
                if (d == '}') return j;
                if (d != ',') fail("expected , or }");
            }
        }
        if (c == '"') { p_++; j.kind = J::Str; j.text = str(); return j; }
        if (lit("true")) { j.kind = J::Bool; j.b = true; return j; }
        if (lit("false")) { j.kind = J::Bool; return j; }
        if (lit("null")) return j;
        size_t start = p_;
        while (p_ < in_.size() && std::strchr("+-0123456789.eE", in_[p_])) p_++;
        if (start == p_) fail("unexpected character");
        j.kind = J::Num;
        j.text = in_.substr(start, p_ - start);
        return j;
    }
};

[[noreturn]] inline void type_error(const char *want, const J &j) {
    static const char *names[] = {"null", "boolean", "number", "string", "array", "object"};
    throw HarnessError(std::string("cannot convert ") + names[j.kind] + " to " + want);
}

template<class T> struct is_vector : std::false_type {};
template<class T, class A> struct is_vector<std::vector<T, A>> : std::true_type {};

template<class T>
T conv(const J &j) {
    if constexpr (std::is_same<T, bool>::value) {
        if (j.kind == J::Bool) return j.b;
        if (j.kind == J::Num) return std::stod(j.text) != 0;
        type_error("bool", j);
    } else if constexpr (std::is_same<T, char>::value) {
        if (j.kind == J::Str) return j.text.empty() ? '\0' : j.text[0];
        if (j.kind == J::Num) return static_cast<char>(std::stoi(j.text));
        type_error("char", j);
    } else if constexpr (std::is_integral<T>::value) {
        if (j.kind == J::Bool) return static_cast<T>(j.b);
        if (j.kind != J::Num) type_error("integer", j);
        if (j.text.find_first_of(".eE") != std::string::npos) return static_cast<T>(std::stold(j.text));
        if (std::is_unsigned<T>::value && j.text[0] != '-') return static_cast<T>(std::stoull(j.text));
        return static_cast<T>(std::stoll(j.text));
    } else if constexpr (std::is_floating_point<T>::value) {
        if (j.kind != J::Num) type_error("floating point", j);
        return static_cast<T>(std::stold(j.text));
    } else if constexpr (std::is_same<T, std::string>::value) {
        if (j.kind != J::Str) type_error("string", j);
        return j.text;
    } else if constexpr (is_vector<T>::value) {
        if (j.kind != J::Arr) type_error("vector", j);
        T out;
        out.reserve(j.items.size());
        for (const auto &item : j.items) out.push_back(conv<typename T::value_type>(item));
        return out;
    } else {
        static_assert(sizeof(T) == 0, "unsupported parameter type for the call harness");
    }
}

inline void emit_str(std::ostream &o, const std::string &s) {
    o << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"':  o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    o << buf;
                } else {
                    o << static_cast<char>(c);
                }
        }
    }
    o << '"';
}

template<class T, class = void> struct is_map : std::false_type {};
template<class T> struct is_map<T, std::void_t<typename T::mapped_type>> : std::true_type {};
template<class T, class = void> struct is_iterable : std::false_type {};
template<class T> struct is_iterable<T, std::void_t<decltype(std::begin(std::declval<const T&>()))>> : std::true_type {};
template<class T> struct is_pair : std::false_type {};
template<class A, class B> struct is_pair<std::pair<A, B>> : std::true_type {};

template<class T>
void emit(std::ostream &o, const T &v) {
    if constexpr (std::is_same<T, bool>::value) {
        o << (v ? "true" : "false");
    } else if constexpr (std::is_same<T, char>::value) {
        emit_str(o, std::string(1, v));
    } else if constexpr (std::is_integral<T>::value) {
        o << +v;
    } else if constexpr (std::is_floating_point<T>::value) {
        if (!std::isfinite(v)) { o << "null"; return; }
        std::ostringstream s;
        s << std::setprecision(15) << static_cast<double>(v);
        if (std::stod(s.str()) != static_cast<double>(v)) {
            s.str("");
            s << std::setprecision(17) << static_cast<double>(v);
        }
        o << s.str();
    } else if constexpr (std::is_convertible<T, std::string>::value) {
        emit_str(o, std::string(v));
    } else if constexpr (is_pair<T>::value) {
        o << '[';
        emit(o, v.first);
        o << ',';
        emit(o, v.second);
        o << ']';
    } else if constexpr (is_map<T>::value) {
        o << '{';
        bool first = true;
        for (const auto &kv : v) {
            if (!first) o << ',';
            first = false;
            std::ostringstream key;
            if constexpr (std::is_convertible<typename T::key_type, std::string>::value) {
                key << std::string(kv.first);
            } else {
                emit(key, kv.first);
            }
            emit_str(o, key.str());
            o << ':';
            emit(o, kv.second);
        }
        o << '}';
    } else if constexpr (is_iterable<T>::value) {
        o << '[';
        bool first = true;
        for (const auto &item : v) {
            if (!first) o << ',';
            first = false;
            emit(o, item);
        }
        o << ']';
    } else {
        static_assert(sizeof(T) == 0, "unsupported return type for the call harness");
    }
}

template<class F> struct fn_traits;
template<class R, class... A>
struct fn_traits<R (*)(A...)> {
    using ret = R;
    using args = std::tuple<std::decay_t<A>...>;
    static constexpr size_t arity = sizeof...(A);
};

template<class F, size_t... I>
std::string call(F fn, const J &args, std::index_sequence<I...>) {
    using Traits = fn_traits<F>;
    using Args = typename Traits::args;
    if (args.items.size() != Traits::arity) {
        throw HarnessError("expected " + std::to_string(Traits::arity) + " arguments, got " +
                           std::to_string(args.items.size()));
    }
    Args converted{conv<std::tuple_element_t<I, Args>>(args.items[I])...};
    (void)converted;
    std::ostringstream out;
    if constexpr (std::is_void<typename Traits::ret>::value) {
        fn(std::get<I>(converted)...);
        out << "null";
    } else {
        auto result = fn(std::get<I>(converted)...);
        emit(out, result);
    }
    return out.str();
}

} // namespace glide_harness

int main() {
    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    auto fn = &::{entry};
    using F = decltype(fn);
    glide_harness::J args;
    try {
        if (input.find_first_not_of(" \t\r\n") == std::string::npos) input = "[]";
        args = glide_harness::Parser(input).value();
        if (args.kind != glide_harness::J::Arr) throw glide_harness::HarnessError("arguments must be a JSON array");
    } catch (const std::exception &e) {
        std::cerr << "glide: " << e.what() << std::endl;
        return 2;
    }
    std::string result;
    try {
        result = glide_harness::call(fn, args, std::make_index_sequence<glide_harness::fn_traits<F>::arity>{});
    } catch (const glide_harness::HarnessError &e) {
        std::cerr << "glide: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception &e) {
        std::cerr << "uncaught exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << std::flush;
    std::cout << "\n{marker}" << result << "\n" << std::flush;
    return 0;
}
)GLIDE";

//==============================================================================
// Java：GlideRunner.java，反射调用 Solution
//==============================================================================

constexpr const char *JAVA_TEMPLATE = R"GLIDE(import java.io.*;
import java.lang.reflect.*;
import java.nio.charset.StandardCharsets;
import java.util.*;

public class GlideRunner {
    static final String MARKER = "{marker}";
    static final String ENTRY = "{entry}";

    static final class Parser {
        final String s;
        int p = 0;

        Parser(String s) { this.s = s; }

        void ws() { while (p < s.length() && Character.isWhitespace(s.charAt(p))) p++; }
        boolean peek(char c) { return p < s.length() && s.charAt(p) == c; }
        IllegalArgumentException err() { return new IllegalArgumentException("malformed JSON at offset " + p); }
        char next() { if (p >= s.length()) throw err(); return s.charAt(p++); }

        Object value() {
            ws();
            if (p >= s.length()) throw err();
            char c = s.charAt(p);
            if (c == '[') {
                p++;
                List<Object> out = new ArrayList<>();
                ws();
                if (peek(']')) { p++; return out; }
                while (true) {
                    out.add(value());
                    ws();
                    char d = next();
                    if (d == ']') return out;
                    if (d != ',') throw err();
                }
            }
            if (c == '{') {
                p++;
                Map<String, Object> out = new LinkedHashMap<>();
                ws();
                if (peek('}')) { p++; return out; }
                while (true) {
                    ws();
                    if (next() != '"') throw err();
                    String key = str();
                    ws();
                    if (next() != ':') throw err();
                    out.put(key, value());
                    ws();
                    char d = next();
                    if (d == '}') return out;
                    if (d != ',') throw err();
                }
            }
            if (c == '"') { p++; return str(); }
            if (s.startsWith("true", p)) { p += 4; return Boolean.TRUE; }
            if (s.startsWith("false", p)) { p += 5; return Boolean.FALSE; }
            if (s.startsWith("null", p)) { p += 4; return null; }
            int start = p;
            while (p < s.length() && "+-0123456789.eE".indexOf(s.charAt(p)) >= 0) p++;
            if (start == p) throw err();
            String num = s.substring(start, p);
            if (num.indexOf('.') >= 0 || num.indexOf('e') >= 0 || num.indexOf('E') >= 0) {
                return Double.parseDouble(num);
            }
            try {
                return Long.parseLong(num);
            } catch (NumberFormatException e) {
                return new java.math.BigInteger(num);
            }
        }

        String str() {
            StringBuilder sb = new StringBuilder();
            while (true) {
                char c = next();
                if (c == '"') return sb.toString();
                if (c != '\\') { sb.append(c); continue; }
                char e = next();
                switch (e) {
                    case 'n': sb.append('\n'); break;
                    case 't': sb.append('\t'); break;
                    case 'r': sb.append('\r'); break;
                    case 'b': sb.append('\b'); break;
                    case 'f': sb.append('\f'); break;
                    case 'u':
                        if (p + 4 > s.length()) throw err();
                        sb.append((char) Integer.parseInt(s.substring(p, p + 4), 16));
                        p += 4;
                        break;
                    default: sb.append(e);
                }
            }
        }
    }

    static List<?> asList(Object v) {
        if (v instanceof List) return (List<?>) v;
        throw new IllegalArgumentException("expected array, got " + describe(v));
    }

    static Map<?, ?> asMap(Object v) {
        if (v instanceof Map) return (Map<?, ?>) v;
        throw new IllegalArgumentException("expected object, got " + describe(v));
    }

    static Number num(Object v) {
        if (v instanceof Number) return (Number) v;
        throw new IllegalArgumentException("expected number, got " + describe(v));
    }

    static String describe(Object v) {
        return v == null ? "null" : v.getClass().getSimpleName();
    }

    static Object convert(Object v, Type type) {
        if (type instanceof ParameterizedType) {
            ParameterizedType pt = (ParameterizedType) type;
            Class<?> raw = (Class<?>) pt.getRawType();
            if (Collection.class.isAssignableFrom(raw)) {
                Type item = pt.getActualTypeArguments()[0];
                List<Object> out = new ArrayList<>();
                for (Object o : asList(v)) out.add(convert(o, item));
                return out;
            }
            if (Map.class.isAssignableFrom(raw)) {
                Type valueType = pt.getActualTypeArguments()[1];
                Map<String, Object> out = new LinkedHashMap<>();
                for (Map.Entry<?, ?> e : asMap(v).entrySet()) {
                    out.put(String.valueOf(e.getKey()), convert(e.getValue(), valueType));
                }
                return out;
            }
            return convert(v, raw);
        }
        if (!(type instanceof Class)) {
            return v;
        }
        Class<?> c = (Class<?>) type;
        if (v == null) {
            if (c.isPrimitive()) throw new IllegalArgumentException("null for primitive " + c.getName());
            return null;
        }
        if (c == int.class || c == Integer.class) return num(v).intValue();
        if (c == long.class || c == Long.class) return num(v).longValue();
        if (c == double.class || c == Double.class) return num(v).doubleValue();
        if (c == float.class || c == Float.class) return num(v).floatValue();
        if (c == short.class || c == Short.class) return num(v).shortValue();
        if (c == byte.class || c == Byte.class) return num(v).byteValue();
        if (c == boolean.class || c == Boolean.class) {
            if (v instanceof Boolean) return v;
            throw new IllegalArgumentException("expected boolean, got " + describe(v));
        }
        if (c == char.class || c == Character.class) {
            String s = String.valueOf(v);
            return s.isEmpty() ? '\0' : s.charAt(0);
        }
        if (c == String.class) {
            if (v instanceof String) return v;
            throw new IllegalArgumentException("expected string, got " + describe(v));
        }
        if (c.isArray()) {
            List<?> items = asList(v);
            Class<?> component = c.getComponentType();
            Object arr = Array.newInstance(component, items.size());
            for (int i = 0; i < items.size(); i++) Array.set(arr, i, convert(items.get(i), component));
            return arr;
        }
        if (Collection.class.isAssignableFrom(c)) return new ArrayList<>(asList(v));
        if (Map.class.isAssignableFrom(c)) return new LinkedHashMap<>(asMap(v));
        if (c == Object.class) return v;
        throw new IllegalArgumentException("unsupported parameter type " + c.getName());
    }

    static void quote(StringBuilder sb, String s) {
        sb.append('"');
        for (int i = 0; i < s.length(); i++) {
            char c = s.charAt(i);
            switch (c) {
                case '"': sb.append("\\\""); break;
                case '\\': sb.append("\\\\"); break;
                case '\n': sb.append("\\n"); break;
                case '\r': sb.append("\\r"); break;
                case '\t': sb.append("\\t"); break;
                default:
                    if (c < 0x20) sb.append(String.format("\\u%04x", (int) c));
                    else sb.append(c);
            }
        }
        sb.append('"');
    }

    static void write(StringBuilder sb, Object v) {
        if (v == null) {
            sb.append("null");
        } else if (v instanceof String || v instanceof Character) {
            quote(sb, v.toString());
        } else if (v instanceof Boolean) {
            sb.append(v);
        } else if (v instanceof Double || v instanceof Float) {
            double d = ((Number) v).doubleValue();
            if (Double.isNaN(d) || Double.isInfinite(d)) quote(sb, String.valueOf(d));
            else sb.append(d);
        } else if (v instanceof Number) {
            sb.append(v);
        } else if (v.getClass().isArray()) {
            sb.append('[');
            int n = Array.getLength(v);
            for (int i = 0; i < n; i++) {
                if (i > 0) sb.append(',');
                write(sb, Array.get(v, i));
            }
            sb.append(']');
        } else if (v instanceof Collection) {
            sb.append('[');
            boolean first = true;
            for (Object o : (Collection<?>) v) {
                if (!first) sb.append(',');
                first = false;
                write(sb, o);
            }
            sb.append(']');
        } else if (v instanceof Map) {
            sb.append('{');
            boolean first = true;
            for (Map.Entry<?, ?> e : ((Map<?, ?>) v).entrySet()) {
                if (!first) sb.append(',');
                first = false;
                quote(sb, String.valueOf(e.getKey()));
                sb.append(':');
                write(sb, e.getValue());
            }
            sb.append('}');
        } else {
            quote(sb, v.toString());
        }
    }

    public static void main(String[] argv) throws Exception {
        ByteArrayOutputStream buf = new ByteArrayOutputStream();
        byte[] chunk = new byte[8192];
        int n;
        while ((n = System.in.read(chunk)) > 0) buf.write(chunk, 0, n);
        String input = new String(buf.toByteArray(), StandardCharsets.UTF_8);

        List<?> args;
        try {
            Object parsed = new Parser(input.trim().isEmpty() ? "[]" : input).value();
            args = asList(parsed);
        } catch (RuntimeException e) {
            System.err.println("glide: cannot parse arguments: " + e.getMessage());
            System.exit(2);
            return;
        }

        Method target = null;
        for (Method m : Solution.class.getDeclaredMethods()) {
            if (m.getName().equals(ENTRY) && m.getParameterCount() == args.size()) {
                target = m;
                break;
            }
        }
        if (target == null) {
            System.err.println("glide: method Solution." + ENTRY + " with " + args.size() + " parameters not found");
            System.exit(3);
            return;
        }
        target.setAccessible(true);

        Type[] types = target.getGenericParameterTypes();
        Object[] call = new Object[args.size()];
        try {
            for (int i = 0; i < call.length; i++) call[i] = convert(args.get(i), types[i]);
        } catch (RuntimeException e) {
            System.err.println("glide: cannot convert arguments: " + e.getMessage());
            System.exit(2);
            return;
        }

        Object instance = null;
        if (!Modifier.isStatic(target.getModifiers())) {
            Constructor<?> ctor = Solution.class.getDeclaredConstructor();
            ctor.setAccessible(true);
            instance = ctor.newInstance();
        }

        Object result;
        try {
            result = target.invoke(instance, call);
        } catch (InvocationTargetException e) {
            e.getCause().printStackTrace();
            System.exit(1);
            return;
        }

        StringBuilder sb = new StringBuilder();
        write(sb, target.getReturnType() == void.class ? null : result);
        System.out.flush();
        System.out.print("\n" + MARKER + sb + "\n");
        System.out.flush();
    }
}
)GLIDE";

/**
 * @brief 生成调用桩
 *
 * 返回需要写入 descriptor.harness_file 的内容；进程内执行的语言返回空串。
 */
inline Result<std::string> generate(const GuestRuntimeDescriptor &descriptor,
                                    const std::string &source_code,
                                    const std::string &entry_function,
                                    const std::string &marker) {
    GLIDE_ENSURE(is_valid_identifier(entry_function), ErrorCode::INVALID_REQUEST,
                 "Invalid entry function name: '" + entry_function + "'");
    GLIDE_ENSURE(is_result_marker(marker), ErrorCode::INVALID_REQUEST, "Malformed result marker");
    std::map<std::string, std::string> vars = {
        {"entry", entry_function},
        {"source", descriptor.source_file},
        {"marker", marker}
    };

    switch (descriptor.language) {
        case GuestLanguage::Python:
            return Ok(std::string());
        case GuestLanguage::JavaScript: {
            std::string out = source_code;
            if (out.empty() || out.back() != '\n') out += '\n';
            out += replace_placeholders(JS_TEMPLATE, vars);
            return Ok(std::move(out));
        }
        case GuestLanguage::Java:
            return Ok(replace_placeholders(JAVA_TEMPLATE, vars));
        case GuestLanguage::Cpp:
            return Ok(replace_placeholders(CPP_TEMPLATE, vars));
    }
    return Err<std::string>(ErrorCode::UNSUPPORTED_LANGUAGE,
                            std::string("No harness for ") + language_tag(descriptor.language));
}

} // namespace harness
} // namespace glide

#endif // GLIDE_EXECUTOR_HARNESS_H

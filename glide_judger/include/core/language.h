/**
 * @file language.h
 * @brief 客体语言描述表
 *
 * 每种可提交的语言对应一条 GuestRuntimeDescriptor：
 * 执行策略、源文件命名、编译/运行命令模板、超时与资源限制、是否支持单步追踪。
 *
 * 语言集合是封闭的枚举，builtin_descriptor() 的 switch 不带 default，
 * 新增枚举值而未补描述时编译器会给出告警。
 */

#ifndef GLIDE_CORE_LANGUAGE_H
#define GLIDE_CORE_LANGUAGE_H

#include <string>
#include <vector>
#include <map>
#include <array>
#include <optional>

#include "core/error.h"
#include "core/utils.h"

namespace glide {

enum class GuestLanguage {
    Python,
    JavaScript,
    Java,
    Cpp
};

constexpr std::array<GuestLanguage, 4> ALL_GUEST_LANGUAGES = {
    GuestLanguage::Python,
    GuestLanguage::JavaScript,
    GuestLanguage::Java,
    GuestLanguage::Cpp
};

/**
 * @brief 执行策略
 */
enum class ExecutionStrategy {
    InProcess,   ///< 嵌入解释器，不经过 exec（每次运行 fork 一个子进程）
    Script,      ///< 子进程解释执行
    Compiled     ///< 先编译，再逐个测试点运行
};

inline const char* strategy_name(ExecutionStrategy s) {
    switch (s) {
        case ExecutionStrategy::InProcess: return "in-process";
        case ExecutionStrategy::Script:    return "script";
        case ExecutionStrategy::Compiled:  return "compiled";
    }
    return "unknown";
}

/**
 * @brief 语言描述
 *
 * 命令模板中的占位符：
 *   {workspace}  提交工作目录
 *   {source}     用户源文件
 *   {harness}    生成的调用桩文件
 *   {artifact}   编译产物
 */
struct GuestRuntimeDescriptor {
    GuestLanguage language = GuestLanguage::Python;
    std::string tag;
    std::string display_name;
    ExecutionStrategy strategy = ExecutionStrategy::InProcess;

    std::string source_file;
    std::string harness_file;                        ///< 空表示无需生成桩文件
    std::string artifact;                            ///< 编译产物名，解释型为空

    std::optional<std::vector<std::string>> build_command;
    std::vector<std::string> run_command;

    int build_timeout_ms = 0;
    int run_timeout_ms = 5000;
    int build_memory_mb = 2048;
    int run_memory_mb = 0;                           ///< 0 = 使用引擎默认值
    int max_processes = 0;                           ///< 0 = 使用引擎默认值
    bool disable_address_limit = false;              ///< JVM/V8 需要大块虚拟地址空间

    bool supports_tracing = false;

    std::map<std::string, std::string> env;

    bool needs_build() const { return build_command.has_value(); }

    /**
     * @brief 展开命令模板
     */
    std::vector<std::string> expand(const std::vector<std::string> &tmpl,
                                    const std::string &workspace) const {
        std::map<std::string, std::string> vars = {
            {"workspace", workspace},
            {"source", source_file},
            {"harness", harness_file},
            {"artifact", artifact}
        };
        std::vector<std::string> argv;
        argv.reserve(tmpl.size());
        for (const auto &arg : tmpl) {
            argv.push_back(replace_placeholders(arg, vars));
        }
        return argv;
    }
};

inline const char* language_tag(GuestLanguage lang) {
    switch (lang) {
        case GuestLanguage::Python:     return "python";
        case GuestLanguage::JavaScript: return "javascript";
        case GuestLanguage::Java:       return "java";
        case GuestLanguage::Cpp:        return "cpp";
    }
    return "unknown";
}

/**
 * @brief 解析语言标签（大小写不敏感，接受常见别名）
 */
inline Result<GuestLanguage> parse_language_tag(const std::string &tag) {
    static const std::map<std::string, GuestLanguage> aliases = {
        {"python",     GuestLanguage::Python},
        {"py",         GuestLanguage::Python},
        {"javascript", GuestLanguage::JavaScript},
        {"js",         GuestLanguage::JavaScript},
        {"node",       GuestLanguage::JavaScript},
        {"java",       GuestLanguage::Java},
        {"cpp",        GuestLanguage::Cpp},
        {"c++",        GuestLanguage::Cpp}
    };
    auto it = aliases.find(to_lower(trim(tag)));
    if (it == aliases.end()) {
        return Err<GuestLanguage>(ErrorCode::UNSUPPORTED_LANGUAGE,
                                  "Unsupported language: " + tag);
    }
    return Ok(it->second);
}

/**
 * @brief 内置描述
 */
inline GuestRuntimeDescriptor builtin_descriptor(GuestLanguage lang) {
    GuestRuntimeDescriptor d;
    d.language = lang;
    d.tag = language_tag(lang);
    d.env = {{"LANG", "C.UTF-8"}};

    switch (lang) {
        case GuestLanguage::Python:
            d.display_name = "Python 3";
            d.strategy = ExecutionStrategy::InProcess;
            d.source_file = "solution.py";
            d.run_timeout_ms = 5000;
            d.supports_tracing = true;
            break;

        case GuestLanguage::JavaScript:
            d.display_name = "JavaScript (Node.js)";
            d.strategy = ExecutionStrategy::Script;
            d.source_file = "solution.js";
            d.harness_file = "glide_main.js";
            d.run_command = {"/usr/bin/node", "{workspace}/{harness}"};
            d.run_timeout_ms = 5000;
            d.disable_address_limit = true;
            break;

        case GuestLanguage::Java:
            d.display_name = "Java";
            d.strategy = ExecutionStrategy::Compiled;
            d.source_file = "Solution.java";
            d.harness_file = "GlideRunner.java";
            d.artifact = "GlideRunner.class";
            d.build_command = std::vector<std::string>{
                "/usr/bin/javac", "-encoding", "UTF-8", "-d", ".", "{source}", "{harness}"};
            d.run_command = {"/usr/bin/java", "-Xss64m", "-XX:+UseSerialGC",
                             "-cp", "{workspace}", "GlideRunner"};
            d.build_timeout_ms = 10000;
            d.run_timeout_ms = 5000;
            d.disable_address_limit = true;
            break;

        case GuestLanguage::Cpp:
            d.display_name = "C++17";
            d.strategy = ExecutionStrategy::Compiled;
            d.source_file = "solution.cpp";
            d.harness_file = "glide_main.cpp";
            d.artifact = "solution";
            d.build_command = std::vector<std::string>{
                "/usr/bin/g++", "-std=c++17", "-O2", "-o", "{artifact}", "{harness}"};
            d.run_command = {"{workspace}/{artifact}"};
            d.build_timeout_ms = 10000;
            d.run_timeout_ms = 5000;
            break;
    }
    return d;
}

/**
 * @brief 语言描述表
 *
 * 构造后只读，由各评测线程共享。
 */
class DescriptorTable {
private:
    std::map<GuestLanguage, GuestRuntimeDescriptor> table_;

public:
    DescriptorTable() {
        for (auto lang : ALL_GUEST_LANGUAGES) {
            table_[lang] = builtin_descriptor(lang);
        }
    }

    const GuestRuntimeDescriptor& get(GuestLanguage lang) const {
        return table_.at(lang);
    }

    GuestRuntimeDescriptor& mutable_get(GuestLanguage lang) {
        return table_.at(lang);
    }

    Result<const GuestRuntimeDescriptor*> lookup(const std::string &tag) const {
        GLIDE_TRY_UNWRAP(lang, parse_language_tag(tag));
        return Ok(&table_.at(lang));
    }

    size_t size() const { return table_.size(); }
};

} // namespace glide

#endif // GLIDE_CORE_LANGUAGE_H

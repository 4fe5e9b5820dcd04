/**
 * @file language_loader.h
 * @brief 从 YAML 文件覆盖语言描述
 *
 * 示例（config/languages/cpp.yaml）：
 *
 *   language:
 *     id: cpp
 *     display_name: "C++17"
 *   build:
 *     command: [/usr/bin/g++, -std=c++17, -O2, -o, "{artifact}", "{harness}"]
 *     timeout_ms: 10000
 *     memory_mb: 2048
 *   run:
 *     command: ["{workspace}/{artifact}"]
 *     timeout_ms: 5000
 *   env:
 *     LANG: C.UTF-8
 *
 * 执行策略和 supports_tracing 不可覆盖。
 */

#ifndef GLIDE_CORE_LANGUAGE_LOADER_H
#define GLIDE_CORE_LANGUAGE_LOADER_H

#include <string>
#include <filesystem>
#include <algorithm>

#include "core/language.h"
#include "core/yaml_config.h"
#include "core/grader_logger.h"

namespace glide {

namespace detail {

inline Result<void> read_positive(const yaml::YamlNodePtr &section, const std::string &key,
                                  int &target, const std::string &where) {
    auto node = section->get(key);
    if (!node) return Ok();
    if (!node->is_int() || node->as_int() <= 0) {
        return Err(ErrorCode::CONFIG_INVALID_VALUE, where + ": " + key + " must be a positive integer");
    }
    target = static_cast<int>(node->as_int());
    return Ok();
}

inline Result<std::vector<std::string>> read_command(const yaml::YamlNodePtr &section,
                                                     const std::string &where) {
    auto node = section->get("command");
    if (!node || !node->is_list() || node->as_list().empty()) {
        return Err<std::vector<std::string>>(ErrorCode::CONFIG_INVALID_VALUE,
                                             where + ": command must be a non-empty list");
    }
    return Ok(node->as_string_list());
}

} // namespace detail

/**
 * @brief 将一份 YAML 描述应用到描述表
 * @param source 出错信息中的来源（通常是文件名）
 */
inline Result<GuestLanguage> apply_language_yaml(DescriptorTable &table,
                                                 const yaml::YamlNodePtr &root,
                                                 const std::string &source) {
    auto lang_node = root->get("language");
    GLIDE_ENSURE(lang_node && lang_node->is_map(), ErrorCode::CONFIG_MISSING_KEY,
                 source + ": missing 'language' section");
    auto id = lang_node->get("id");
    GLIDE_ENSURE(id && id->is_string(), ErrorCode::CONFIG_MISSING_KEY,
                 source + ": missing language.id");

    GLIDE_TRY_UNWRAP(lang, parse_language_tag(id->as_string()));
    GuestRuntimeDescriptor d = table.get(lang);

    if (auto name = lang_node->get("display_name")) {
        d.display_name = name->as_string(d.display_name);
    }

    if (auto build = root->get("build")) {
        GLIDE_ENSURE(d.strategy == ExecutionStrategy::Compiled, ErrorCode::CONFIG_INVALID_VALUE,
                     source + ": " + d.tag + " has no build step");
        if (build->has("command")) {
            GLIDE_TRY_UNWRAP(cmd, detail::read_command(build, source + " build"));
            d.build_command = cmd;
        }
        GLIDE_TRY(detail::read_positive(build, "timeout_ms", d.build_timeout_ms, source + " build"));
        GLIDE_TRY(detail::read_positive(build, "memory_mb", d.build_memory_mb, source + " build"));
    }

    if (auto run = root->get("run")) {
        if (run->has("command")) {
            GLIDE_ENSURE(d.strategy != ExecutionStrategy::InProcess, ErrorCode::CONFIG_INVALID_VALUE,
                         source + ": " + d.tag + " runs in-process and takes no run command");
            GLIDE_TRY_UNWRAP(cmd, detail::read_command(run, source + " run"));
            d.run_command = cmd;
        }
        GLIDE_TRY(detail::read_positive(run, "timeout_ms", d.run_timeout_ms, source + " run"));
        GLIDE_TRY(detail::read_positive(run, "memory_mb", d.run_memory_mb, source + " run"));
        GLIDE_TRY(detail::read_positive(run, "max_processes", d.max_processes, source + " run"));
        if (auto no_as = run->get("disable_address_limit")) {
            d.disable_address_limit = no_as->as_bool(d.disable_address_limit);
        }
    }

    if (auto env = root->get("env")) {
        GLIDE_ENSURE(env->is_map(), ErrorCode::CONFIG_INVALID_VALUE, source + ": env must be a map");
        for (const auto &kv : env->as_map()) {
            d.env[kv.first] = kv.second->as_string();
        }
    }

    if (root->has("supports_tracing") || lang_node->has("supports_tracing")) {
        GLOG_WARN << source << ": supports_tracing is fixed per language, ignored";
    }

    table.mutable_get(lang) = std::move(d);
    return Ok(lang);
}

/**
 * @brief 加载目录下所有 .yaml/.yml
 *
 * 语言 id 未知的文件记录日志后跳过；其余错误直接返回。
 * @return 成功应用的文件数
 */
inline Result<int> load_language_overrides(DescriptorTable &table, const std::string &dir) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        GLOG_DEBUG << "Language directory " << dir << " not found, using built-in descriptors";
        return Ok(0);
    }

    std::vector<fs::path> files;
    for (const auto &entry : fs::directory_iterator(dir, ec)) {
        auto ext = entry.path().extension();
        if (ext == ".yaml" || ext == ".yml") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return Err<int>(ErrorCode::FILE_READ_ERROR, "Cannot list " + dir + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    int applied = 0;
    for (const auto &path : files) {
        GLIDE_TRY_UNWRAP(root, yaml::load_yaml(path.string()));
        auto lang = apply_language_yaml(table, root, path.string());
        if (lang.is_error()) {
            if (lang.error().code() == ErrorCode::UNSUPPORTED_LANGUAGE) {
                GLOG_WARN << "Skipping " << path.string() << ": " << lang.error().message();
                continue;
            }
            return lang.error();
        }
        GLOG_INFO << "Loaded language override " << language_tag(lang.value())
                  << " from " << path.string();
        applied++;
    }
    return Ok(applied);
}

} // namespace glide

#endif // GLIDE_CORE_LANGUAGE_LOADER_H

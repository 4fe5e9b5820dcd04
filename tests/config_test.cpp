/**
 * @file config_test.cpp
 * @brief 引擎配置、YAML 子集解析与语言描述覆盖
 */

#include <gtest/gtest.h>

#include "core/config.h"
#include "core/yaml_config.h"
#include "core/language_loader.h"
#include "core/utils.h"
#include "test_support.h"

using namespace glide;

class EngineConfigTest : public ::testing::Test {
protected:
    testutil::TempRoot root{"config"};

    std::string write(const std::string &name, const std::string &content) {
        std::string path = root.file(name);
        EXPECT_TRUE(write_file(path, content).ok());
        return path;
    }
};

TEST_F(EngineConfigTest, DefaultsWhenKeysAbsent) {
    auto ec = EngineConfig::load(write("empty.conf", "# nothing here\n"));
    ASSERT_TRUE(ec.ok()) << ec.error().to_string();
    EXPECT_EQ(ec.value().output_limit_kb, 64);
    EXPECT_EQ(ec.value().diagnostic_limit_kb, 8);
    EXPECT_EQ(ec.value().memory_limit_mb, 512);
    EXPECT_EQ(ec.value().trace_max_steps, 500);
    EXPECT_EQ(ec.value().trace_repr_limit, 200);
    EXPECT_DOUBLE_EQ(ec.value().tolerance.abs_tolerance, 1e-6);
    EXPECT_DOUBLE_EQ(ec.value().tolerance.rel_tolerance, 1e-9);
    EXPECT_GE(ec.value().effective_workers(), 1);
}

TEST_F(EngineConfigTest, ReadsShippedConfig) {
    auto ec = EngineConfig::load(std::string(GLIDE_SOURCE_DIR) + "/config/engine.conf");
    ASSERT_TRUE(ec.ok()) << ec.error().to_string();
    EXPECT_EQ(ec.value().workspace_root, "/tmp/glide_judger/work");
    EXPECT_FALSE(ec.value().log_console);
    EXPECT_TRUE(ec.value().sandbox_namespace);
}

TEST_F(EngineConfigTest, OverridesValues) {
    auto ec = EngineConfig::load(write("custom.conf",
        "worker_threads 3\n"
        "float_abs_tolerance 0.01\n"
        "sandbox_namespace off\n"
        "log_level debug\n"));
    ASSERT_TRUE(ec.ok()) << ec.error().to_string();
    EXPECT_EQ(ec.value().effective_workers(), 3);
    EXPECT_DOUBLE_EQ(ec.value().tolerance.abs_tolerance, 0.01);
    EXPECT_FALSE(ec.value().sandbox_namespace);
    EXPECT_EQ(ec.value().log_level, LogLevel::DEBUG);
}

TEST_F(EngineConfigTest, RejectsInvalidValues) {
    auto not_int = EngineConfig::load(write("a.conf", "output_limit_kb lots\n"));
    ASSERT_TRUE(not_int.is_error());
    EXPECT_EQ(not_int.error().code(), ErrorCode::CONFIG_INVALID_VALUE);

    auto negative = EngineConfig::load(write("b.conf", "memory_limit_mb -5\n"));
    ASSERT_TRUE(negative.is_error());
    EXPECT_EQ(negative.error().code(), ErrorCode::CONFIG_INVALID_VALUE);

    auto bad_switch = EngineConfig::load(write("c.conf", "sandbox_namespace maybe\n"));
    ASSERT_TRUE(bad_switch.is_error());

    auto missing = EngineConfig::load(write("d.conf", "log_dir\n"));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code(), ErrorCode::CONFIG_PARSE_ERROR);
}

TEST_F(EngineConfigTest, MissingFile) {
    auto ec = EngineConfig::load(root.file("absent.conf"));
    ASSERT_TRUE(ec.is_error());
    EXPECT_EQ(ec.error().code(), ErrorCode::FILE_NOT_FOUND);
}

TEST(YamlTest, ParsesMapsListsAndScalars) {
    auto root = yaml::parse_yaml(
        "language:\n"
        "  id: cpp   # comment\n"
        "  display_name: \"C++ 17\"\n"
        "build:\n"
        "  command: [g++, -O2, \"{harness}\"]\n"
        "  timeout_ms: 8000\n"
        "run:\n"
        "  command:\n"
        "    - \"{workspace}/{artifact}\"\n"
        "  disable_address_limit: yes\n");
    ASSERT_TRUE(root->is_map());
    EXPECT_EQ(root->get("language")->get("id")->as_string(), "cpp");
    EXPECT_EQ(root->get("language")->get("display_name")->as_string(), "C++ 17");

    auto build_cmd = root->get("build")->get("command")->as_string_list();
    ASSERT_EQ(build_cmd.size(), 3u);
    EXPECT_EQ(build_cmd[1], "-O2");
    EXPECT_EQ(build_cmd[2], "{harness}");
    EXPECT_EQ(root->get("build")->get("timeout_ms")->as_int(), 8000);

    auto run_cmd = root->get("run")->get("command")->as_string_list();
    ASSERT_EQ(run_cmd.size(), 1u);
    EXPECT_EQ(run_cmd[0], "{workspace}/{artifact}");
    EXPECT_TRUE(root->get("run")->get("disable_address_limit")->as_bool(false));
}

TEST(LanguageLoaderTest, AppliesOverride) {
    DescriptorTable table;
    auto root = yaml::parse_yaml(
        "language:\n"
        "  id: js\n"
        "run:\n"
        "  timeout_ms: 1500\n"
        "  memory_mb: 256\n"
        "env:\n"
        "  NODE_OPTIONS: --max-old-space-size=128\n");
    auto lang = apply_language_yaml(table, root, "inline");
    ASSERT_TRUE(lang.ok()) << lang.error().to_string();
    EXPECT_EQ(lang.value(), GuestLanguage::JavaScript);

    const auto &d = table.get(GuestLanguage::JavaScript);
    EXPECT_EQ(d.run_timeout_ms, 1500);
    EXPECT_EQ(d.run_memory_mb, 256);
    EXPECT_EQ(d.env.at("NODE_OPTIONS"), "--max-old-space-size=128");
    EXPECT_EQ(d.run_command.front(), "/usr/bin/node");
}

TEST(LanguageLoaderTest, RejectsBuildSectionForInterpretedLanguage) {
    DescriptorTable table;
    auto root = yaml::parse_yaml(
        "language:\n"
        "  id: python\n"
        "build:\n"
        "  command: [python3, -m, py_compile]\n");
    auto lang = apply_language_yaml(table, root, "python.yaml");
    ASSERT_TRUE(lang.is_error());
    EXPECT_EQ(lang.error().code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST(LanguageLoaderTest, RejectsNonPositiveTimeout) {
    DescriptorTable table;
    auto root = yaml::parse_yaml(
        "language:\n"
        "  id: cpp\n"
        "run:\n"
        "  timeout_ms: 0\n");
    EXPECT_TRUE(apply_language_yaml(table, root, "cpp.yaml").is_error());
}

TEST(LanguageLoaderTest, LoadsShippedDirectory) {
    DescriptorTable table;
    auto applied = load_language_overrides(table, std::string(GLIDE_SOURCE_DIR) + "/config/languages");
    ASSERT_TRUE(applied.ok()) << applied.error().to_string();
    EXPECT_EQ(applied.value(), 4);

    const auto &cpp = table.get(GuestLanguage::Cpp);
    ASSERT_TRUE(cpp.build_command.has_value());
    EXPECT_EQ(cpp.build_command->front(), "/usr/bin/g++");
    EXPECT_EQ(cpp.build_command->back(), "{harness}");
    EXPECT_EQ(table.get(GuestLanguage::Java).run_command[2], "-XX:+UseSerialGC");
    EXPECT_TRUE(table.get(GuestLanguage::Python).supports_tracing);
}

TEST(LanguageLoaderTest, SkipsUnknownLanguage) {
    testutil::TempRoot root("languages");
    ASSERT_TRUE(write_file(root.file("ruby.yaml"), "language:\n  id: ruby\n").ok());
    ASSERT_TRUE(write_file(root.file("cpp.yaml"), "language:\n  id: cpp\nrun:\n  timeout_ms: 2000\n").ok());

    DescriptorTable table;
    auto applied = load_language_overrides(table, root.path());
    ASSERT_TRUE(applied.ok()) << applied.error().to_string();
    EXPECT_EQ(applied.value(), 1);
    EXPECT_EQ(table.get(GuestLanguage::Cpp).run_timeout_ms, 2000);
}

TEST(LanguageLoaderTest, MissingDirectoryKeepsBuiltins) {
    DescriptorTable table;
    auto applied = load_language_overrides(table, "/nonexistent/glide/languages");
    ASSERT_TRUE(applied.ok());
    EXPECT_EQ(applied.value(), 0);
    EXPECT_EQ(table.get(GuestLanguage::Cpp).run_timeout_ms, 5000);
}

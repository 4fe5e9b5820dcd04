/**
 * @file workspace_test.cpp
 * @brief 工作目录的唯一性与清理
 */

#include <gtest/gtest.h>
#include <set>
#include <filesystem>

#include "sandbox/workspace.h"
#include "core/language.h"
#include "test_support.h"

using namespace glide;
namespace fs = std::filesystem;

class WorkspaceTest : public ::testing::Test {
protected:
    testutil::TempRoot root{"workspace"};
};

TEST_F(WorkspaceTest, AllocatesDistinctDirectories) {
    std::set<std::string> paths;
    std::vector<sandbox::Workspace> held;
    for (int i = 0; i < 16; i++) {
        auto ws = sandbox::Workspace::allocate(root.path());
        ASSERT_TRUE(ws.ok()) << ws.error().to_string();
        EXPECT_TRUE(fs::is_directory(ws.value().path()));
        paths.insert(ws.value().path());
        held.push_back(std::move(ws.value()));
    }
    EXPECT_EQ(paths.size(), 16u);
}

TEST_F(WorkspaceTest, TeardownRemovesEverything) {
    std::string path;
    {
        auto ws = sandbox::Workspace::allocate(root.path());
        ASSERT_TRUE(ws.ok());
        path = ws.value().path();
        ASSERT_TRUE(ws.value().write("a.txt", "hello").ok());
        auto scratch = ws.value().make_case_dir(0);
        ASSERT_TRUE(scratch.ok());
        fs::create_directories(scratch.value().path() + "/nested/deeper");
        EXPECT_TRUE(fs::exists(path + "/a.txt"));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(WorkspaceTest, TeardownIsIdempotent) {
    auto ws = sandbox::Workspace::allocate(root.path());
    ASSERT_TRUE(ws.ok());
    std::string path = ws.value().path();
    ws.value().teardown();
    ws.value().teardown();
    EXPECT_FALSE(ws.value().valid());
    EXPECT_FALSE(fs::exists(path));
    EXPECT_TRUE(ws.value().write("late.txt", "x").is_error());
}

TEST_F(WorkspaceTest, MoveTransfersOwnership) {
    auto ws = sandbox::Workspace::allocate(root.path());
    ASSERT_TRUE(ws.ok());
    std::string path = ws.value().path();
    sandbox::Workspace moved = std::move(ws.value());
    EXPECT_FALSE(ws.value().valid());
    EXPECT_TRUE(fs::exists(path));
    moved.teardown();
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(WorkspaceTest, PrepareWritesSource) {
    DescriptorTable table;
    Submission s;
    s.id = "sub-1";
    s.language = GuestLanguage::Cpp;
    s.source_code = "int add(int a, int b) { return a + b; }\n";
    s.entry_function = "add";

    auto ws = sandbox::Workspace::prepare(root.path(), s, table.get(GuestLanguage::Cpp));
    ASSERT_TRUE(ws.ok()) << ws.error().to_string();
    auto text = read_file(ws.value().file("solution.cpp"));
    ASSERT_TRUE(text.ok());
    EXPECT_EQ(text.value(), s.source_code);
}

TEST_F(WorkspaceTest, RejectsPathsOutsideWorkspace) {
    auto ws = sandbox::Workspace::allocate(root.path());
    ASSERT_TRUE(ws.ok());
    EXPECT_TRUE(ws.value().write("../escape.txt", "x").is_error());
    EXPECT_TRUE(ws.value().write("", "x").is_error());
    EXPECT_FALSE(fs::exists(root.file("escape.txt")));
}

TEST_F(WorkspaceTest, CaseDirIsFreshAndRemoved) {
    auto ws = sandbox::Workspace::allocate(root.path());
    ASSERT_TRUE(ws.ok());
    std::string dir;
    {
        auto scratch = ws.value().make_case_dir(3);
        ASSERT_TRUE(scratch.ok());
        dir = scratch.value().path();
        ASSERT_TRUE(write_file(dir + "/left_over", "data").ok());
    }
    EXPECT_FALSE(fs::exists(dir));

    auto again = ws.value().make_case_dir(3);
    ASSERT_TRUE(again.ok());
    EXPECT_TRUE(fs::is_empty(again.value().path()));
}

/**
 * @file harness_test.cpp
 * @brief 调用桩生成、返回值标记解析与子进程执行器
 */

#include <gtest/gtest.h>

#include "executor/harness.h"
#include "executor/executor_factory.h"
#include "core/harness_runner.h"
#include "sandbox/workspace.h"
#include "test_support.h"

using namespace glide;

namespace {

const std::string MARKER = "@@GLIDE_RESULT_0123456789abcdef0123456789abcdef@@";

} // namespace

TEST(ResultMarkerTest, ExtractsLastMarkerAndStripsIt) {
    std::string out = "hello\n\n" + MARKER + "1\nmore\n" + MARKER + "[2, 3]\n";
    auto value = extract_result_marker(out, MARKER);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "[2, 3]");
    EXPECT_EQ(out.find(MARKER), std::string::npos);
    EXPECT_NE(out.find("hello"), std::string::npos);
    EXPECT_NE(out.find("more"), std::string::npos);
}

TEST(ResultMarkerTest, RemovesHarnessNewline) {
    std::string out = "printed\n\n" + MARKER + "42\n";
    EXPECT_EQ(extract_result_marker(out, MARKER).value_or(""), "42");
    EXPECT_EQ(out, "printed\n");

    std::string quiet = "\n" + MARKER + "null\n";
    EXPECT_EQ(extract_result_marker(quiet, MARKER).value_or(""), "null");
    EXPECT_EQ(quiet, "");
}

TEST(ResultMarkerTest, MissingMarker) {
    std::string out = "just output\n";
    EXPECT_FALSE(extract_result_marker(out, MARKER).has_value());
    EXPECT_EQ(out, "just output\n");
}

TEST(ResultMarkerTest, OtherNonceIsUserOutput) {
    std::string forged = "\n@@GLIDE_RESULT@@5\n\n@@GLIDE_RESULT_ffffffffffffffffffffffffffffffff@@5\n";
    std::string out = forged;
    EXPECT_FALSE(extract_result_marker(out, MARKER).has_value());
    EXPECT_EQ(out, forged);

    out = forged + "\n" + MARKER + "7\n";
    EXPECT_EQ(extract_result_marker(out, MARKER).value_or(""), "7");
    EXPECT_EQ(out, forged);
}

TEST(ResultMarkerTest, EmptyMarkerMatchesNothing) {
    std::string out = "1\n";
    EXPECT_FALSE(extract_result_marker(out, "").has_value());
    EXPECT_EQ(out, "1\n");
}

TEST(ResultMarkerTest, GeneratedMarkersAreUnique) {
    std::string a = make_result_marker();
    std::string b = make_result_marker();
    EXPECT_TRUE(is_result_marker(a));
    EXPECT_TRUE(is_result_marker(b));
    EXPECT_NE(a, b);
    EXPECT_EQ(a.rfind("@@GLIDE_RESULT_", 0), 0u);

    EXPECT_FALSE(is_result_marker("@@GLIDE_RESULT@@"));
    EXPECT_FALSE(is_result_marker("@@GLIDE_RESULT_0123456789ABCDEF0123456789abcdef@@"));
    EXPECT_FALSE(is_result_marker("@@GLIDE_RESULT_0123\"; x; \"89abcdef0123456789abcde@@"));
}

TEST(IdentifierTest, AcceptsAndRejects) {
    EXPECT_TRUE(is_valid_identifier("two_sum"));
    EXPECT_TRUE(is_valid_identifier("_private"));
    EXPECT_TRUE(is_valid_identifier("$jq"));
    EXPECT_FALSE(is_valid_identifier(""));
    EXPECT_FALSE(is_valid_identifier("1abc"));
    EXPECT_FALSE(is_valid_identifier("a-b"));
    EXPECT_FALSE(is_valid_identifier("f); system(\"rm\""));
    EXPECT_FALSE(is_valid_identifier(std::string(129, 'a')));
}

TEST(HarnessGenerateTest, PerLanguageOutput) {
    DescriptorTable table;

    auto py = harness::generate(table.get(GuestLanguage::Python), "def f(): pass", "f", MARKER);
    ASSERT_TRUE(py.ok());
    EXPECT_TRUE(py.value().empty());

    auto js = harness::generate(table.get(GuestLanguage::JavaScript), "function f() { return 1; }", "f", MARKER);
    ASSERT_TRUE(js.ok());
    EXPECT_EQ(js.value().rfind("function f() { return 1; }\n", 0), 0u);
    EXPECT_NE(js.value().find("typeof f === 'function'"), std::string::npos);
    EXPECT_NE(js.value().find("'\\n" + MARKER + "'"), std::string::npos);

    auto cpp = harness::generate(table.get(GuestLanguage::Cpp), "int f() { return 1; }", "f", MARKER);
    ASSERT_TRUE(cpp.ok());
    EXPECT_NE(cpp.value().find("using namespace std;\n#include \"solution.cpp\""), std::string::npos);
    EXPECT_NE(cpp.value().find("&::f"), std::string::npos);
    EXPECT_NE(cpp.value().find(MARKER), std::string::npos);
    EXPECT_EQ(cpp.value().find("{entry}"), std::string::npos);
    EXPECT_EQ(cpp.value().find("{marker}"), std::string::npos);

    auto java = harness::generate(table.get(GuestLanguage::Java), "class Solution {}", "f", MARKER);
    ASSERT_TRUE(java.ok());
    EXPECT_NE(java.value().find("class GlideRunner"), std::string::npos);
    EXPECT_NE(java.value().find("\"f\""), std::string::npos);
    EXPECT_NE(java.value().find("MARKER = \"" + MARKER + "\""), std::string::npos);
}

TEST(HarnessGenerateTest, RejectsBadEntryName) {
    DescriptorTable table;
    auto r = harness::generate(table.get(GuestLanguage::Cpp), "", "x;y", MARKER);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::INVALID_REQUEST);
}

TEST(HarnessGenerateTest, RejectsMalformedMarker) {
    DescriptorTable table;
    auto r = harness::generate(table.get(GuestLanguage::Java), "", "f", "\"; System.exit(0); //");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::INVALID_REQUEST);
}

//==============================================================================
// 子进程执行器（需要本机的 node / g++ / javac）
//==============================================================================

class ProcessExecutorTest : public ::testing::Test {
protected:
    testutil::TempRoot root{"harness"};
    DescriptorTable table;
    ExecutorSettings settings;

    void SetUp() override {
        settings.use_namespace = false;
    }

    Submission submission(GuestLanguage lang, const std::string &source, const std::string &entry) {
        Submission s;
        s.id = "test";
        s.language = lang;
        s.source_code = source;
        s.entry_function = entry;
        return s;
    }

    static std::vector<TestCase> cases(const char *json_cases) {
        std::vector<TestCase> out;
        int i = 0;
        auto parsed = parse_json(json_cases);
        for (const auto &c : *parsed) {
            TestCase tc;
            tc.case_index = i++;
            tc.args = c.at(0);
            tc.expected = c.at(1);
            out.push_back(tc);
        }
        return out;
    }

    Result<GradingReport> grade(GuestLanguage lang, const std::string &source,
                                const std::string &entry, const char *json_cases) {
        auto d = table.get(lang);
        auto executor = make_executor(d, settings);
        Submission s = submission(lang, source, entry);
        GLIDE_TRY_UNWRAP(ws, sandbox::Workspace::prepare(root.path(), s, d));
        HarnessRunner runner(*executor, TolerancePolicy());
        return runner.run(ws, s, cases(json_cases));
    }
};

TEST_F(ProcessExecutorTest, JavaScriptSum) {
    if (!testutil::have_binary("/usr/bin/node")) GTEST_SKIP() << "node not installed";
    auto r = grade(GuestLanguage::JavaScript,
                   "function add(a, b) { console.log('adding'); return a + b; }",
                   "add", R"([[[1, 2], 3], [[-5, 5], 0], [[0.1, 0.2], 0.3]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, OverallStatus::AllPassed);
    ASSERT_EQ(r.value().verdicts.size(), 3u);
    EXPECT_EQ(r.value().verdicts[0].stdout_text, "adding\n");
}

TEST_F(ProcessExecutorTest, JavaScriptAsyncAndStructures) {
    if (!testutil::have_binary("/usr/bin/node")) GTEST_SKIP() << "node not installed";
    auto r = grade(GuestLanguage::JavaScript,
                   "async function pairs(xs) { return xs.map((x) => ({v: x, sq: x * x})); }",
                   "pairs", R"([[[[1, 2]], [{"v": 1, "sq": 1}, {"v": 2, "sq": 4}]]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, OverallStatus::AllPassed);
}

TEST_F(ProcessExecutorTest, JavaScriptThrowIsRuntimeError) {
    if (!testutil::have_binary("/usr/bin/node")) GTEST_SKIP() << "node not installed";
    auto r = grade(GuestLanguage::JavaScript,
                   "function boom() { throw new RangeError('too big'); }",
                   "boom", R"([[[], 1]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, OverallStatus::RuntimeError);
    const Verdict &v = r.value().verdicts.at(0);
    EXPECT_EQ(v.failure, ErrorCode::RUNTIME_ERROR);
    EXPECT_NE(v.stderr_text.find("RangeError: too big"), std::string::npos);
}

TEST_F(ProcessExecutorTest, JavaScriptMissingFunction) {
    if (!testutil::have_binary("/usr/bin/node")) GTEST_SKIP() << "node not installed";
    auto r = grade(GuestLanguage::JavaScript, "function other() { return 1; }", "wanted", R"([[[], 1]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    const Verdict &v = r.value().verdicts.at(0);
    EXPECT_FALSE(v.passed);
    EXPECT_EQ(v.exit_status, ExitStatus::NonZero);
    EXPECT_NE(v.message.find("'wanted' is not defined"), std::string::npos);
}

TEST_F(ProcessExecutorTest, JavaScriptInfiniteLoopTimesOut) {
    if (!testutil::have_binary("/usr/bin/node")) GTEST_SKIP() << "node not installed";
    table.mutable_get(GuestLanguage::JavaScript).run_timeout_ms = 1000;
    auto r = grade(GuestLanguage::JavaScript, "function spin() { for (;;) {} }", "spin",
                   R"([[[], 0], [[], 0]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, OverallStatus::RuntimeError);
    ASSERT_EQ(r.value().verdicts.size(), 2u);
    for (const auto &v : r.value().verdicts) {
        EXPECT_EQ(v.exit_status, ExitStatus::Timeout);
        EXPECT_EQ(v.failure, ErrorCode::TIMEOUT);
    }
}

TEST_F(ProcessExecutorTest, CppSum) {
    if (!testutil::have_binary("/usr/bin/g++")) GTEST_SKIP() << "g++ not installed";
    auto r = grade(GuestLanguage::Cpp,
                   "long long add(long long a, long long b) { return a + b; }\n",
                   "add", R"([[[1, 2], 3], [[4000000000, 5], 4000000005], [[-1, 1], 0]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, OverallStatus::AllPassed);
    EXPECT_EQ(r.value().passed, 3);
}

TEST_F(ProcessExecutorTest, CppContainersAndPartialResult) {
    if (!testutil::have_binary("/usr/bin/g++")) GTEST_SKIP() << "g++ not installed";
    auto r = grade(GuestLanguage::Cpp,
                   "#include <vector>\n#include <string>\n"
                   "std::vector<int> doubled(std::vector<int> xs, std::string tag) {\n"
                   "  for (auto &x : xs) x *= 2;\n"
                   "  if (tag == \"off\") xs.push_back(0);\n"
                   "  return xs;\n"
                   "}\n",
                   "doubled", R"([[[[1, 2], "ok"], [2, 4]], [[[3], "off"], [6]]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, OverallStatus::Partial);
    EXPECT_TRUE(r.value().verdicts[0].passed);
    EXPECT_FALSE(r.value().verdicts[1].passed);
    EXPECT_EQ(r.value().verdicts[1].failure, ErrorCode::OK);
}

TEST_F(ProcessExecutorTest, CppCompileErrorRunsNoCases) {
    if (!testutil::have_binary("/usr/bin/g++")) GTEST_SKIP() << "g++ not installed";
    auto r = grade(GuestLanguage::Cpp, "int add(int a, int b) { return a + ; }\n", "add",
                   R"([[[1, 2], 3], [[2, 2], 4]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, OverallStatus::CompileError);
    EXPECT_TRUE(r.value().verdicts.empty());
    EXPECT_EQ(r.value().failed, 2);
    EXPECT_EQ(r.value().build_failure, ErrorCode::COMPILE_ERROR);
    EXPECT_NE(r.value().diagnostic.find("error"), std::string::npos);
}

TEST_F(ProcessExecutorTest, CppSlowBuildIsCompileTimeout) {
    if (!testutil::have_binary("/usr/bin/g++")) GTEST_SKIP() << "g++ not installed";
    table.mutable_get(GuestLanguage::Cpp).build_timeout_ms = 50;
    auto r = grade(GuestLanguage::Cpp, "int add(int a, int b) { return a + b; }\n", "add",
                   R"([[[1, 2], 3]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, OverallStatus::CompileError);
    EXPECT_EQ(r.value().build_failure, ErrorCode::COMPILE_TIMEOUT);
    EXPECT_TRUE(r.value().verdicts.empty());
}

TEST_F(ProcessExecutorTest, CppUnqualifiedStarterCompiles) {
    if (!testutil::have_binary("/usr/bin/g++")) GTEST_SKIP() << "g++ not installed";
    auto r = grade(GuestLanguage::Cpp,
                   "vector<int> doubled(vector<int>& xs) {\n"
                   "  for (auto &x : xs) x *= 2;\n"
                   "  return xs;\n"
                   "}\n"
                   "bool is_palindrome(string s) { return string(s.rbegin(), s.rend()) == s; }\n",
                   "doubled", R"([[[[1, 2, 3]], [2, 4, 6]]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().build_failure, ErrorCode::OK);
    EXPECT_EQ(r.value().status, OverallStatus::AllPassed);
}

TEST_F(ProcessExecutorTest, CppPrintedMarkerIsNotAResult) {
    if (!testutil::have_binary("/usr/bin/g++")) GTEST_SKIP() << "g++ not installed";
    auto r = grade(GuestLanguage::Cpp,
                   "#include <cstdio>\n#include <cstdlib>\n"
                   "int answer() {\n"
                   "  printf(\"\\n@@GLIDE_RESULT@@%d\\n\", 5);\n"
                   "  printf(\"\\n@@GLIDE_RESULT_00000000000000000000000000000000@@%d\\n\", 5);\n"
                   "  fflush(stdout);\n"
                   "  exit(0);\n"
                   "}\n",
                   "answer", R"([[[], 5]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    const Verdict &v = r.value().verdicts.at(0);
    EXPECT_FALSE(v.passed);
    EXPECT_EQ(v.failure, ErrorCode::RESULT_MISSING);
    EXPECT_NE(v.stdout_text.find("@@GLIDE_RESULT@@5"), std::string::npos);
    EXPECT_EQ(r.value().status, OverallStatus::RuntimeError);
}

TEST_F(ProcessExecutorTest, JavaScriptPrintedMarkerIsNotAResult) {
    if (!testutil::have_binary("/usr/bin/node")) GTEST_SKIP() << "node not installed";
    auto r = grade(GuestLanguage::JavaScript,
                   "function answer() { process.stdout.write('\\n@@GLIDE_RESULT@@5\\n'); process.exit(0); }",
                   "answer", R"([[[], 5]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    const Verdict &v = r.value().verdicts.at(0);
    EXPECT_FALSE(v.passed);
    EXPECT_EQ(v.failure, ErrorCode::RESULT_MISSING);
}

TEST_F(ProcessExecutorTest, CppCrashIsRuntimeError) {
    if (!testutil::have_binary("/usr/bin/g++")) GTEST_SKIP() << "g++ not installed";
    auto r = grade(GuestLanguage::Cpp,
                   "#include <cstdlib>\nint crash(int n) { if (n > 0) std::abort(); return 0; }\n",
                   "crash", R"([[[0], 0], [[1], 0]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, OverallStatus::RuntimeError);
    EXPECT_TRUE(r.value().verdicts[0].passed);
    EXPECT_EQ(r.value().verdicts[1].exit_status, ExitStatus::Crash);
    EXPECT_EQ(r.value().verdicts[1].message.rfind("RuntimeError: killed by", 0), 0u);
}

TEST_F(ProcessExecutorTest, JavaSum) {
    if (!testutil::have_binary("/usr/bin/javac") || !testutil::have_binary("/usr/bin/java")) {
        GTEST_SKIP() << "JDK not installed";
    }
    auto r = grade(GuestLanguage::Java,
                   "import java.util.*;\n"
                   "public class Solution {\n"
                   "  public int add(int a, int b) { return a + b; }\n"
                   "}\n",
                   "add", R"([[[1, 2], 3], [[10, -4], 6]])");
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value().status, OverallStatus::AllPassed);
}

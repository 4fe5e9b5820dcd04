/**
 * @file sandbox_test.cpp
 * @brief 子进程沙箱：输出捕获、超时、进程树清理、输出上限、隔离
 */

#include <gtest/gtest.h>
#include <csignal>
#include <fcntl.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include "sandbox/sandbox.h"
#include "sandbox/workspace.h"
#include "test_support.h"

using namespace glide;

class SandboxTest : public ::testing::Test {
protected:
    testutil::TempRoot root{"sandbox"};
    sandbox::Workspace ws;

    void SetUp() override {
        auto allocated = sandbox::Workspace::allocate(root.path());
        ASSERT_TRUE(allocated.ok()) << allocated.error().to_string();
        ws = std::move(allocated.value());
    }

    sandbox::SandboxConfig shell(const std::string &script, int timeout_ms = 3000) {
        sandbox::SandboxConfig cfg;
        cfg.argv = {"/bin/sh", "-c", script};
        cfg.work_dir = ws.path();
        cfg.timeout_ms = timeout_ms;
        cfg.use_namespace = false;
        return cfg;
    }

    sandbox::SandboxResult run(const sandbox::SandboxConfig &cfg) {
        auto r = sandbox::Sandbox(cfg).run();
        EXPECT_TRUE(r.ok()) << r.error().to_string();
        return r.ok() ? std::move(r.value()) : sandbox::SandboxResult();
    }
};

TEST_F(SandboxTest, CapturesStdoutAndStderr) {
    auto r = run(shell("echo out; echo err >&2"));
    EXPECT_EQ(r.status, ExitStatus::Success);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_text, "out\n");
    EXPECT_EQ(r.stderr_text, "err\n");
    EXPECT_FALSE(r.output_truncated);
}

TEST_F(SandboxTest, ReportsNonZeroExit) {
    auto r = run(shell("exit 3"));
    EXPECT_EQ(r.status, ExitStatus::NonZero);
    EXPECT_EQ(r.exit_code, 3);
}

TEST_F(SandboxTest, FeedsStdin) {
    auto cfg = shell("cat");
    cfg.stdin_data = "[1, 2, 3]";
    auto r = run(cfg);
    EXPECT_EQ(r.status, ExitStatus::Success);
    EXPECT_EQ(r.stdout_text, "[1, 2, 3]");
}

TEST_F(SandboxTest, LargeStdinDoesNotDeadlock) {
    auto cfg = shell("wc -c");
    cfg.stdin_data.assign(1 << 20, 'x');
    auto r = run(cfg);
    EXPECT_EQ(r.status, ExitStatus::Success);
    EXPECT_EQ(trim(r.stdout_text), "1048576");
}

TEST_F(SandboxTest, RunsInWorkDirWithControlledEnv) {
    auto cfg = shell("pwd; echo $HOME; echo $GLIDE_MARK");
    cfg.env["GLIDE_MARK"] = "set";
    auto r = run(cfg);
    EXPECT_EQ(r.stdout_text, ws.path() + "\n" + ws.path() + "\nset\n");
}

TEST_F(SandboxTest, KillsOnTimeout) {
    auto r = run(shell("sleep 10", 300));
    EXPECT_EQ(r.status, ExitStatus::Timeout);
    EXPECT_GE(r.wall_time_ms, 300);
    EXPECT_LT(r.wall_time_ms, 3000);
}

TEST_F(SandboxTest, KillsWholeProcessTree) {
    // 孙进程持有输出管道，必须随进程组一起被杀掉
    auto r = run(shell("sleep 30 & sleep 30 & wait", 300));
    EXPECT_EQ(r.status, ExitStatus::Timeout);
    EXPECT_LT(r.wall_time_ms, 3000);
}

TEST_F(SandboxTest, BusyLoopTimesOut) {
    auto r = run(shell("while :; do :; done", 500));
    EXPECT_EQ(r.status, ExitStatus::Timeout);
    EXPECT_LT(r.wall_time_ms, 4000);
}

TEST_F(SandboxTest, CapsOutput) {
    auto cfg = shell("head -c 1000000 /dev/zero | tr '\\0' a");
    cfg.output_limit_kb = 1;
    auto r = run(cfg);
    EXPECT_TRUE(r.output_truncated);
    EXPECT_EQ(r.stdout_text.size(), 1024u);
    EXPECT_NE(r.status, ExitStatus::Timeout);
}

TEST_F(SandboxTest, ReportsFatalSignal) {
    auto r = run(shell("kill -SEGV $$"));
    EXPECT_EQ(r.status, ExitStatus::Crash);
    EXPECT_EQ(r.term_signal, SIGSEGV);
}

TEST_F(SandboxTest, MissingExecutableIsInfrastructureFailure) {
    sandbox::SandboxConfig cfg;
    cfg.argv = {"/nonexistent/glide/binary"};
    cfg.work_dir = ws.path();
    cfg.use_namespace = false;
    auto r = sandbox::Sandbox(cfg).run();
    ASSERT_TRUE(r.is_error());
    EXPECT_TRUE(is_infrastructure_error(r.error().code()));
}

TEST_F(SandboxTest, EmptyCommandRejected) {
    sandbox::SandboxConfig cfg;
    cfg.work_dir = ws.path();
    auto r = sandbox::Sandbox(cfg).run();
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::SANDBOX_FAILURE);
}

TEST_F(SandboxTest, IsolationFallsBackWhenUnavailable) {
    auto cfg = shell("echo isolated-or-not > result.txt; cat result.txt");
    cfg.use_namespace = true;
    auto r = run(cfg);
    EXPECT_EQ(r.status, ExitStatus::Success);
    EXPECT_EQ(r.stdout_text, "isolated-or-not\n");
}

//==============================================================================
// child_main：不 exec，结果经 fd 3 交回
//==============================================================================

TEST_F(SandboxTest, InlineChildWritesChannel) {
    sandbox::SandboxConfig cfg = shell("");
    cfg.argv = {"inline"};
    cfg.child_main = [](int fd) {
        const char text[] = "channel-data";
        if (write(fd, text, sizeof(text) - 1) < 0) return 1;
        if (write(STDOUT_FILENO, "out\n", 4) < 0) return 1;
        return 7;
    };
    auto r = run(cfg);
    EXPECT_EQ(r.status, ExitStatus::NonZero);
    EXPECT_EQ(r.exit_code, 7);
    EXPECT_EQ(r.channel_text, "channel-data");
    EXPECT_FALSE(r.channel_truncated);
    EXPECT_EQ(r.stdout_text, "out\n");
}

TEST_F(SandboxTest, InlineChildClosesInheritedDescriptors) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    sandbox::SandboxConfig cfg = shell("");
    cfg.argv = {"inline"};
    int inherited_fd = fds[0] > fds[1] ? fds[0] : fds[1];
    cfg.child_main = [inherited_fd](int) {
        return fcntl(inherited_fd, F_GETFD) == -1 ? 0 : 1;
    };
    auto r = run(cfg);
    close(fds[0]);
    close(fds[1]);
    EXPECT_EQ(r.status, ExitStatus::Success);
}

TEST_F(SandboxTest, InlineChildCapsChannel) {
    sandbox::SandboxConfig cfg = shell("");
    cfg.argv = {"inline"};
    cfg.channel_limit_kb = 1;
    cfg.child_main = [](int fd) {
        std::string big(8192, 'x');
        return write(fd, big.data(), big.size()) > 0 ? 0 : 1;
    };
    auto r = run(cfg);
    EXPECT_TRUE(r.channel_truncated);
    EXPECT_EQ(r.channel_text.size(), 1024u);
}

TEST_F(SandboxTest, InlineChildKilledAtDeadline) {
    sandbox::SandboxConfig cfg = shell("", 300);
    cfg.argv = {"inline"};
    cfg.child_main = [](int) {
        for (;;) {
            pause();
        }
        return 0;
    };
    auto r = run(cfg);
    EXPECT_EQ(r.status, ExitStatus::Timeout);
    EXPECT_TRUE(r.channel_text.empty());
}

//==============================================================================
// 命名空间隔离（内核不允许 unshare 时跳过）
//==============================================================================

class IsolatedSandboxTest : public SandboxTest {
protected:
    void SetUp() override {
        if (!sandbox::is_namespace_available()) {
            GTEST_SKIP() << "user namespaces not permitted here";
        }
        SandboxTest::SetUp();
    }

    sandbox::SandboxConfig isolated(const std::string &script) {
        sandbox::SandboxConfig cfg = shell(script);
        cfg.use_namespace = true;
        return cfg;
    }
};

TEST_F(IsolatedSandboxTest, CannotReachLoopbackListener) {
    int listener = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listener, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(listen(listener, 1), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len), 0);

    sandbox::SandboxConfig cfg = isolated("");
    cfg.argv = {"inline"};
    cfg.child_main = [addr](int) {
        int s = socket(AF_INET, SOCK_STREAM, 0);
        if (s < 0) return 0;
        int rc = connect(s, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
        close(s);
        return rc == 0 ? 1 : 0;
    };
    auto r = run(cfg);
    close(listener);
    if (!r.isolated) GTEST_SKIP() << "isolation fell back: " << r.message;
    EXPECT_EQ(r.status, ExitStatus::Success) << "child connected to 127.0.0.1:" << ntohs(addr.sin_port);
}

TEST_F(IsolatedSandboxTest, CannotReadSiblingWorkspace) {
    auto sibling = sandbox::Workspace::allocate(root.path());
    ASSERT_TRUE(sibling.ok()) << sibling.error().to_string();
    ASSERT_TRUE(sibling.value().write("secret", "other-submission").ok());
    ASSERT_TRUE(ws.write("mine", "own-file").ok());

    auto r = run(isolated("cat mine; cat " + sibling.value().file("secret")));
    if (!r.isolated) GTEST_SKIP() << "isolation fell back: " << r.message;
    EXPECT_EQ(r.status, ExitStatus::NonZero);
    EXPECT_EQ(r.stdout_text.find("other-submission"), std::string::npos);
    EXPECT_NE(r.stdout_text.find("own-file"), std::string::npos);
}

TEST_F(IsolatedSandboxTest, WorkspaceIsWritable) {
    auto r = run(isolated("echo written > out.txt && cat out.txt"));
    if (!r.isolated) GTEST_SKIP() << "isolation fell back: " << r.message;
    EXPECT_EQ(r.status, ExitStatus::Success);
    EXPECT_EQ(r.stdout_text, "written\n");
}

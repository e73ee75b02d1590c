#include <gtest/gtest.h>
#include <capture/terminal_proxy.hpp>
#include <platform/pty_host.hpp>
#include <privacy/redaction_engine.hpp>
#include "test_fakes.hpp"
#include <fcntl.h>
#include <unistd.h>

// Real pseudo-terminals. The operator side is a pipe the test controls.
class PosixTerminalHostTest : public ::testing::Test {
protected:
    int in_pipe[2] = {-1, -1};
    int out_fd = -1;

    void SetUp() override {
        ASSERT_EQ(pipe(in_pipe), 0);
        out_fd = open("/dev/null", O_WRONLY);
        ASSERT_GE(out_fd, 0);

        platform::PosixTerminalHost probe(in_pipe[0], out_fd);
        if (probe.allocate_pty().is_err()) {
            GTEST_SKIP() << "no pseudo-terminal available";
        }
    }

    void TearDown() override {
        for (int fd : {in_pipe[0], in_pipe[1], out_fd}) {
            if (fd >= 0) close(fd);
        }
    }
};

TEST_F(PosixTerminalHostTest, AllocatesSlave) {
    platform::PosixTerminalHost host(in_pipe[0], out_fd);
    ASSERT_TRUE(host.allocate_pty().is_ok());
    EXPECT_EQ(host.slave_name().rfind("/dev/", 0), 0u);
    host.close();
    host.close();
}

TEST_F(PosixTerminalHostTest, SpawnMissingProgramFails) {
    platform::PosixTerminalHost host(in_pipe[0], out_fd);
    ASSERT_TRUE(host.allocate_pty().is_ok());
    auto r = host.spawn("cctrace-no-such-program-xyz");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("cctrace-no-such-program-xyz"), std::string::npos);
    EXPECT_FALSE(host.child_running());
}

TEST_F(PosixTerminalHostTest, SpawnBeforeAllocateFails) {
    platform::PosixTerminalHost host(in_pipe[0], out_fd);
    EXPECT_TRUE(host.spawn("true").is_err());
}

TEST_F(PosixTerminalHostTest, ChildExitIsObserved) {
    platform::PosixTerminalHost host(in_pipe[0], out_fd);
    ASSERT_TRUE(host.allocate_pty().is_ok());
    ASSERT_TRUE(host.spawn("true").is_ok());

    char buf[256];
    for (int i = 0; i < 200 && host.child_running(); i++) {
        auto ready = host.wait_readable(20);
        ASSERT_TRUE(ready.is_ok());
        if (ready.value.child_output && host.read_child(buf, sizeof(buf)) <= 0) break;
    }
    host.terminate_child(500);
    EXPECT_FALSE(host.child_running());
    EXPECT_EQ(host.child_exit_code(), 0);
}

TEST_F(PosixTerminalHostTest, ProxyRunsRealProgram) {
    platform::PosixTerminalHost host(in_pipe[0], out_fd);
    RedactionEngine engine(PrivacyMode::kStrict);
    PromptMarkerDetector detector(">");
    RecordingSink sink;
    ProxyOptions options;
    options.teardown_grace_ms = 200;

    TerminalProxy proxy(host, engine, detector, sink, options);
    auto r = proxy.start("true");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.status, SessionStatus::kCompleted);
    EXPECT_EQ(sink.begun.size(), 1u);
    EXPECT_EQ(sink.finished.size(), 1u);
    ASSERT_TRUE(r.value.exit_code.has_value());
    EXPECT_EQ(*r.value.exit_code, 0);
}

TEST_F(PosixTerminalHostTest, ProxyRejectsMissingProgram) {
    platform::PosixTerminalHost host(in_pipe[0], out_fd);
    RedactionEngine engine(PrivacyMode::kStrict);
    PromptMarkerDetector detector(">");
    RecordingSink sink;

    TerminalProxy proxy(host, engine, detector, sink);
    EXPECT_TRUE(proxy.start("cctrace-no-such-program-xyz").is_err());
    EXPECT_TRUE(sink.begun.empty());
}

#include <gtest/gtest.h>

#include "common/test_helpers.h"
#include <daemux/ipc/channel_identity.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <cstdio>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

using daemux::tests::ScopedEnvVar;
using daemux::tests::TempDir;

#ifndef _WIN32

namespace {

// Runs daemux through the shell with stdout captured
std::FILE* start(const std::string& args) {
    std::string cmd = std::string("'") + DAEMUX_BINARY + "' " + args;
    return ::popen(cmd.c_str(), "r");
}

std::string read_line(std::FILE* pipe) {
    char buf[256];
    if (!std::fgets(buf, sizeof(buf), pipe)) {
        return {};
    }
    return buf;
}

struct Finished {
    std::string output;
    int exitCode = -1;
};

Finished finish(std::FILE* pipe, std::string prefix = {}) {
    Finished f;
    f.output = std::move(prefix);
    if (!pipe) {
        return f;
    }
    char buf[1024];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        f.output.append(buf, n);
    }
    int status = ::pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        f.exitCode = WEXITSTATUS(status);
    }
    return f;
}

Finished run(const std::string& args) {
    return finish(start(args));
}

class DaemuxEndToEndTest : public ::testing::Test {
protected:
    TempDir dir_;
    ScopedEnvVar runtime_{"DAEMUX_RUNTIME_DIR", dir_.path().string()};
    ScopedEnvVar config_{"DAEMUX_CONFIG", std::string("/nonexistent/daemux-config.toml")};
    ScopedEnvVar logLevel_{"DAEMUX_LOG_LEVEL", std::string("warn")};
};

} // namespace

TEST_F(DaemuxEndToEndTest, StreamsShortLivedCommand) {
    auto first = run("echo hello");
    EXPECT_EQ(first.exitCode, 0);
    EXPECT_EQ(first.output, "hello\n");

    // Within the exit linger this is the first daemon's replay, afterwards a fresh run
    auto second = run("echo hello");
    EXPECT_EQ(second.exitCode, 0);
    EXPECT_EQ(second.output, "hello\n");
}

TEST_F(DaemuxEndToEndTest, ConcurrentClientsShareOneChild) {
    auto* a = start("sh -c 'echo $$; sleep 1'");
    auto* b = start("sh -c 'echo $$; sleep 1'");
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);

    auto ra = finish(a);
    auto rb = finish(b);
    EXPECT_EQ(ra.exitCode, 0);
    EXPECT_EQ(rb.exitCode, 0);
    EXPECT_FALSE(ra.output.empty());
    EXPECT_EQ(ra.output, rb.output);
}

TEST_F(DaemuxEndToEndTest, ConcurrentShortLivedClientsShareOneChild) {
    // The child usually exits before the second client connects
    auto* a = start("sh -c 'echo $$'");
    auto* b = start("sh -c 'echo $$'");
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);

    auto ra = finish(a);
    auto rb = finish(b);
    EXPECT_EQ(ra.exitCode, 0);
    EXPECT_EQ(rb.exitCode, 0);
    EXPECT_FALSE(ra.output.empty());
    EXPECT_EQ(ra.output, rb.output);
}

TEST_F(DaemuxEndToEndTest, RunAfterDaemonStopsStartsFreshChild) {
    auto first = run("sh -c 'echo $$'");
    ASSERT_EQ(first.exitCode, 0);
    ASSERT_FALSE(first.output.empty());

    bool stopped = false;
    for (int i = 0; i < 100 && !stopped; ++i) {
        stopped = run("--status sh -c 'echo $$'").output == "stopped\n";
        if (!stopped) {
            ::usleep(50 * 1000);
        }
    }
    ASSERT_TRUE(stopped);

    auto second = run("sh -c 'echo $$'");
    EXPECT_EQ(second.exitCode, 0);
    EXPECT_FALSE(second.output.empty());
    EXPECT_NE(first.output, second.output);
}

TEST_F(DaemuxEndToEndTest, LateJoinerReceivesReplay) {
    auto* early = start("sh -c 'echo first; sleep 1; echo second'");
    ASSERT_NE(early, nullptr);
    auto firstLine = read_line(early);
    EXPECT_EQ(firstLine, "first\n");

    auto late = run("sh -c 'echo first; sleep 1; echo second'");
    auto rest = finish(early, firstLine);
    EXPECT_EQ(rest.output, "first\nsecond\n");
    EXPECT_EQ(late.output, "first\nsecond\n");
    EXPECT_EQ(late.exitCode, 0);
}

TEST_F(DaemuxEndToEndTest, KillEndsRunningStream) {
    auto* stream = start("sh -c 'echo up; exec sleep 30'");
    ASSERT_NE(stream, nullptr);
    auto up = read_line(stream);
    ASSERT_EQ(up, "up\n");

    auto killed = run("--kill sh -c 'echo up; exec sleep 30'");
    EXPECT_EQ(killed.exitCode, 0);
    EXPECT_EQ(killed.output, "");

    auto rest = finish(stream, up);
    EXPECT_EQ(rest.exitCode, 0);
    EXPECT_EQ(rest.output, "up\n");
}

TEST_F(DaemuxEndToEndTest, RestartStartsFreshChild) {
    auto* original = start("sh -c 'echo $$; sleep 2'");
    ASSERT_NE(original, nullptr);
    auto pid1 = read_line(original);
    ASSERT_FALSE(pid1.empty());

    auto* restarted = start("--restart sh -c 'echo $$; sleep 2'");
    ASSERT_NE(restarted, nullptr);
    auto pid2 = read_line(restarted);
    EXPECT_FALSE(pid2.empty());
    EXPECT_NE(pid1, pid2);

    auto r1 = finish(original, pid1);
    auto r2 = finish(restarted, pid2);
    EXPECT_EQ(r1.exitCode, 0);
    EXPECT_EQ(r2.exitCode, 0);
    EXPECT_EQ(r2.output, pid2);
}

TEST_F(DaemuxEndToEndTest, RecoversFromStaleArtifact) {
    auto channel = daemux::ipc::resolve_channel_path({"echo", {"stale"}}, dir_.path());
    {
        boost::asio::io_context io;
        boost::asio::local::stream_protocol::acceptor acceptor(io);
        boost::asio::local::stream_protocol::endpoint ep(channel.string());
        acceptor.open(ep.protocol());
        acceptor.bind(ep);
        acceptor.close();
    }
    ASSERT_TRUE(std::filesystem::exists(channel));

    auto r = run("echo stale");
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_EQ(r.output, "stale\n");
}

TEST_F(DaemuxEndToEndTest, StatusReportsStopped) {
    auto r = run("--status sleep 30");
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_EQ(r.output, "stopped\n");
}

TEST_F(DaemuxEndToEndTest, MissingCommandIsUsageError) {
    auto r = run("--kill 2>/dev/null");
    EXPECT_EQ(r.exitCode, 1);
}

#endif

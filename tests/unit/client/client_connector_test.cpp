#include <gtest/gtest.h>

#include "common/fake_transport.h"
#include "common/test_helpers.h"
#include <daemux/client/client_connector.h>

#include <chrono>

using namespace daemux;
using namespace daemux::client;
using daemux::tests::ConnectStep;
using daemux::tests::RecordingLauncher;
using daemux::tests::run_coro;
using daemux::tests::ScriptedTransport;
using daemux::tests::TempDir;

namespace {

class ClientConnectorTest : public ::testing::Test {
protected:
    void script(std::vector<ConnectStep> steps, ConnectorConfig cfg = {Duration{10}, 3}) {
        transport_ = std::make_shared<ScriptedTransport>(std::move(steps));
        connector_ = std::make_unique<ClientConnector>(transport_, launcher_, cfg);
    }

    Result<ipc::local::socket> connect() {
        auto r = run_coro(io_, connector_->connect_or_spawn(request_, channel_));
        if (!r) {
            return Error{ErrorCode::Timeout, "test harness timed out"};
        }
        return std::move(*r);
    }

    TempDir dir_;
    std::filesystem::path channel_ = dir_.path() / "daemon-connector.sock";
    LaunchRequest request_{{"echo", {"hello"}}, dir_.path(), {}, "", ""};
    boost::asio::io_context io_;
    std::shared_ptr<ScriptedTransport> transport_;
    std::shared_ptr<RecordingLauncher> launcher_ = std::make_shared<RecordingLauncher>();
    std::unique_ptr<ClientConnector> connector_;
};

} // namespace

TEST_F(ClientConnectorTest, RunningDaemonIsUsedDirectly) {
    script({ConnectStep::connected()});
    auto conn = connect();
    ASSERT_TRUE(conn) << conn.error().message;
    EXPECT_TRUE(conn.value().is_open());
    EXPECT_EQ(transport_->connects, 1);
    EXPECT_TRUE(launcher_->launches.empty());
}

TEST_F(ClientConnectorTest, MissingDaemonIsLaunched) {
    script({ConnectStep::fail(ErrorCode::NotFound), ConnectStep::fail(ErrorCode::NotFound),
            ConnectStep::connected()});
    auto conn = connect();
    ASSERT_TRUE(conn) << conn.error().message;
    ASSERT_EQ(launcher_->launches.size(), 1u);
    EXPECT_EQ(launcher_->launches[0].command, request_.command);
    EXPECT_EQ(launcher_->launches[0].runtimeDir, dir_.path());
    EXPECT_TRUE(transport_->removed.empty());
}

TEST_F(ClientConnectorTest, StaleArtifactIsRemovedBeforeLaunch) {
    script({ConnectStep::fail(ErrorCode::ConnectionRefused),
            ConnectStep::fail(ErrorCode::ConnectionRefused), ConnectStep::connected()});
    auto conn = connect();
    ASSERT_TRUE(conn) << conn.error().message;
    ASSERT_EQ(transport_->removed.size(), 1u);
    EXPECT_EQ(transport_->removed[0], channel_);
    EXPECT_EQ(launcher_->launches.size(), 1u);
}

TEST_F(ClientConnectorTest, DaemonStartedByAnotherClientIsNotRelaunched) {
    script({ConnectStep::fail(ErrorCode::NotFound), ConnectStep::connected()});
    auto conn = connect();
    ASSERT_TRUE(conn);
    EXPECT_TRUE(launcher_->launches.empty());
    EXPECT_EQ(transport_->connects, 2);
}

TEST_F(ClientConnectorTest, NonRecoverableErrorsPropagate) {
    script({ConnectStep::fail(ErrorCode::PermissionDenied)});
    auto conn = connect();
    ASSERT_FALSE(conn);
    EXPECT_EQ(conn.error().code, ErrorCode::PermissionDenied);
    EXPECT_TRUE(launcher_->launches.empty());
}

TEST_F(ClientConnectorTest, ProbeErrorUnderLockPropagates) {
    script({ConnectStep::fail(ErrorCode::NotFound), ConnectStep::fail(ErrorCode::PathInvalid)});
    auto conn = connect();
    ASSERT_FALSE(conn);
    EXPECT_EQ(conn.error().code, ErrorCode::PathInvalid);
    EXPECT_TRUE(launcher_->launches.empty());
}

TEST_F(ClientConnectorTest, LaunchFailurePropagates) {
    script({});
    launcher_->failWith = ErrorCode::SpawnFailed;
    auto conn = connect();
    ASSERT_FALSE(conn);
    EXPECT_EQ(conn.error().code, ErrorCode::SpawnFailed);
    EXPECT_EQ(launcher_->launches.size(), 1u);
}

TEST_F(ClientConnectorTest, GivesUpAfterMaxAttemptsWithBackoff) {
    script({}, ConnectorConfig{Duration{20}, 3});
    auto begin = std::chrono::steady_clock::now();
    auto conn = connect();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    ASSERT_FALSE(conn);
    EXPECT_EQ(conn.error().code, ErrorCode::Timeout);
    EXPECT_EQ(launcher_->launches.size(), 3u);
    // Waits of 20 + 40 + 80 ms between launches and reconnects
    EXPECT_GE(elapsed, std::chrono::milliseconds(140));
    // Initial connect, then a locked recheck and a reconnect per attempt
    EXPECT_EQ(transport_->connects, 7);
}

TEST_F(ClientConnectorTest, ZeroAttemptsMeansOne) {
    script({}, ConnectorConfig{Duration{10}, 0});
    EXPECT_EQ(connector_->config().maxSpawnAttempts, 1u);
    auto conn = connect();
    ASSERT_FALSE(conn);
    EXPECT_EQ(conn.error().code, ErrorCode::Timeout);
    EXPECT_EQ(launcher_->launches.size(), 1u);
}

TEST(DaemonLauncherTest, ArgvForwardsSettingsThenCommandVerbatim) {
    DetachedDaemonLauncher launcher("/usr/local/bin/daemux");
    LaunchRequest request{{"tail", {"-f", "--kill", "log"}}, "/run/user/1", "/etc/d.toml", "debug",
                          ""};
    auto argv = launcher.build_argv(request);
    EXPECT_EQ(argv, (std::vector<std::string>{"/usr/local/bin/daemux", "--daemon",
                                              "--runtime-dir", "/run/user/1", "--config",
                                              "/etc/d.toml", "--log-level", "debug", "tail", "-f",
                                              "--kill", "log"}));
}

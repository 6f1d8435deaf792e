#pragma once

#include <daemux/core/types.h>
#include <daemux/daemon/child_process.h>
#include <daemux/daemon/client_session.h>
#include <daemux/daemon/session_state.h>
#include <daemux/ipc/channel_identity.h>
#include <daemux/ipc/channel_lock.h>
#include <daemux/ipc/endpoint_transport.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace daemux::daemon {

enum class ServerState { Idle, Running, Terminated };

/**
 * Owns exactly one child process and serves its stdout to any number of clients.
 *
 * start() takes the channel lock, listens, holds the liveness lock, then spawns the child.
 * While Running every stdout chunk is buffered and broadcast; a new client gets the buffer
 * replayed before live output. Any byte from a client requests a kill (SIGTERM, SIGKILL after
 * killGrace).
 *
 * The child is finished once it has been reaped and its stdout has reached end-of-stream (or
 * drainTimeout elapsed after exit). Attached clients are then flushed and closed, but the
 * server keeps listening: a client arriving afterwards gets the full replay and is closed.
 * The linger lasts firstClientTimeout while nobody has been served, then exitLinger from the
 * first client served. A connection only counts as served once its replay has been written.
 * A kill request, or a finish caused by one, ends the linger at once.
 *
 * On Terminated the server stops listening, drains its clients, then invokes the terminated
 * callback. All work runs on the supplied io_context; the server must outlive any run of it.
 */
class DaemonServer {
public:
    struct Config {
        ipc::CommandIdentity command;
        std::filesystem::path channelPath;
        Duration killGrace{3000};
        Duration drainTimeout{2000};
        Duration firstClientTimeout{5000};
        Duration exitLinger{1000};
        std::size_t readChunkSize = 64 * 1024;
        // SIGINT/SIGTERM/SIGHUP kill the child; off for in-process tests
        bool handleSignals = true;
    };

    DaemonServer(boost::asio::io_context& io, Config config,
                 std::shared_ptr<ipc::IEndpointTransport> transport);
    ~DaemonServer();

    DaemonServer(const DaemonServer&) = delete;
    DaemonServer& operator=(const DaemonServer&) = delete;

    // AddressInUse when anything already exists at the channel path; SpawnFailed when the child
    // cannot start
    Result<void> start();

    // Idempotent. Once the child has exited it only ends the linger.
    void request_kill();

    void on_terminated(std::function<void()> callback) { onTerminated_ = std::move(callback); }

    ServerState state() const noexcept { return state_; }
    // Child gone, still serving its replay
    bool lingering() const noexcept { return lingering_; }
    bool finished() const noexcept { return finished_; }
    int child_pid() const noexcept { return childPid_; }
    std::optional<int> child_exit_code() const noexcept;
    std::size_t client_count() const noexcept { return session_.client_count(); }
    const SessionState& session() const noexcept { return session_; }
    const Config& config() const noexcept { return config_; }

private:
    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> stdout_loop();
    boost::asio::awaitable<void> drain_clients();

    void wait_child_signal();
    void wait_stop_signal();
    void on_child_reaped();
    void on_client_closed(const std::shared_ptr<ClientSession>& client);
    void on_linger_client_served(const std::shared_ptr<ClientSession>& client);
    void arm_linger(Duration wait);
    void maybe_terminate();
    void enter_terminated(const char* reason);

    boost::asio::io_context& io_;
    Config config_;
    std::shared_ptr<ipc::IEndpointTransport> transport_;

    std::unique_ptr<ipc::ListeningEndpoint> listener_;
    std::optional<ipc::ChannelLock> liveness_;
    std::unique_ptr<ChildProcess> child_;
    std::unique_ptr<boost::asio::posix::stream_descriptor> stdout_;
    boost::asio::signal_set childSignals_;
    boost::asio::signal_set stopSignals_;
    boost::asio::steady_timer escalateTimer_;
    boost::asio::steady_timer stdoutTimer_;
    boost::asio::steady_timer lingerTimer_;
    boost::asio::steady_timer drainTimer_;

    SessionState session_;
    std::map<std::uint64_t, std::shared_ptr<ClientSession>> sessions_;
    std::uint64_t nextClientId_ = 1;

    ServerState state_ = ServerState::Idle;
    int childPid_ = -1;
    bool childReaped_ = false;
    bool stdoutClosed_ = false;
    bool killRequested_ = false;
    bool everAttached_ = false;
    bool lingering_ = false;
    bool served_ = false;
    bool finished_ = false;
    std::function<void()> onTerminated_;
};

} // namespace daemux::daemon

#pragma once

#include <daemux/client/client_connector.h>
#include <daemux/client/daemon_launcher.h>
#include <daemux/core/types.h>

#include <boost/asio/awaitable.hpp>

#include <filesystem>
#include <functional>
#include <string_view>

namespace daemux::client {

// Receives every byte the daemon forwards, in order
using OutputSink = std::function<void(std::string_view)>;

struct ControlConfig {
    Duration restartDelay{500};
    // Upper bound on each wait for the old daemon during a restart: its hangup, then the
    // release of its liveness lock
    Duration shutdownWait{5000};
};

/**
 * kill / restart / stream / status on top of the connector.
 *
 * The kill marker is the bytes "kill"; the daemon only looks for presence of data. A daemon
 * that hangs up before the marker is written (EPIPE, ECONNRESET) counts as killed.
 */
class ControlPlane {
public:
    ControlPlane(ClientConnector& connector, LaunchRequest request, std::filesystem::path channel,
                 ControlConfig config = {});

    boost::asio::awaitable<Result<void>> kill();
    boost::asio::awaitable<Result<void>> restart(OutputSink sink);
    boost::asio::awaitable<Result<void>> stream(OutputSink sink);

    // true while a daemon holds the channel's liveness lock; never connects or launches
    boost::asio::awaitable<Result<bool>> status();

    // Closes the active connection; a running stream() then returns success
    void interrupt();
    bool interrupted() const noexcept { return interrupted_; }

    const std::filesystem::path& channel() const noexcept { return channel_; }

private:
    boost::asio::awaitable<Result<void>> send_kill(ipc::local::socket& socket);
    boost::asio::awaitable<Result<void>> pump(ipc::local::socket& socket, const OutputSink& sink);
    boost::asio::awaitable<void> wait_for_hangup(ipc::local::socket& socket);
    boost::asio::awaitable<void> wait_for_release();

    ClientConnector& connector_;
    LaunchRequest request_;
    std::filesystem::path channel_;
    ControlConfig config_;
    ipc::local::socket* active_ = nullptr;
    bool interrupted_ = false;
};

} // namespace daemux::client

#pragma once

#include <daemux/client/daemon_launcher.h>
#include <daemux/core/types.h>
#include <daemux/ipc/endpoint_transport.h>

#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>

namespace daemux::client {

struct ConnectorConfig {
    Duration spawnGrace{200};
    std::size_t maxSpawnAttempts = 3;
};

/**
 * Connects to the daemon for a channel, launching one when nothing answers.
 *
 * NotFound launches a daemon. ConnectionRefused (stale artifact) removes the artifact first.
 * Both steps run under the channel lock after connecting once more, so concurrent clients
 * launch at most one daemon between them. Launch cycle n waits spawnGrace * 2^n before reconnecting; after
 * maxSpawnAttempts cycles the result is Timeout. Any other error is returned as is.
 */
class ClientConnector {
public:
    ClientConnector(std::shared_ptr<ipc::IEndpointTransport> transport,
                    std::shared_ptr<IDaemonLauncher> launcher, ConnectorConfig config = {});

    boost::asio::awaitable<Result<ipc::local::socket>>
    connect_or_spawn(const LaunchRequest& request, const std::filesystem::path& channel);

    const ConnectorConfig& config() const noexcept { return config_; }

private:
    static bool is_recoverable(const Error& error);

    std::shared_ptr<ipc::IEndpointTransport> transport_;
    std::shared_ptr<IDaemonLauncher> launcher_;
    ConnectorConfig config_;
};

} // namespace daemux::client

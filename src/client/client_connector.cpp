#include <daemux/client/client_connector.h>
#include <daemux/ipc/channel_lock.h>

#include <spdlog/spdlog.h>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace daemux::client {

using boost::asio::awaitable;
using boost::asio::use_awaitable;

ClientConnector::ClientConnector(std::shared_ptr<ipc::IEndpointTransport> transport,
                                 std::shared_ptr<IDaemonLauncher> launcher, ConnectorConfig config)
    : transport_(std::move(transport)), launcher_(std::move(launcher)), config_(config) {
    if (config_.maxSpawnAttempts == 0) {
        config_.maxSpawnAttempts = 1;
    }
}

bool ClientConnector::is_recoverable(const Error& error) {
    return error.code == ErrorCode::ConnectionRefused || error.code == ErrorCode::NotFound;
}

awaitable<Result<ipc::local::socket>>
ClientConnector::connect_or_spawn(const LaunchRequest& request,
                                  const std::filesystem::path& channel) {
    auto conn = co_await transport_->connect(channel);
    if (conn) {
        spdlog::debug("Attached to running daemon at {}", channel.string());
        co_return std::move(conn);
    }

    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor);

    for (std::size_t attempt = 0; attempt < config_.maxSpawnAttempts; ++attempt) {
        if (!is_recoverable(conn.error())) {
            co_return conn.error();
        }

        {
            auto lock = ipc::ChannelLock::acquire(channel);
            if (!lock) {
                co_return lock.error();
            }

            // Another client may have launched a daemon while we waited for the lock
            auto recheck = co_await transport_->connect(channel);
            if (recheck) {
                spdlog::debug("Daemon appeared at {} while acquiring the lock", channel.string());
                co_return std::move(recheck);
            }
            if (recheck.error().code == ErrorCode::ConnectionRefused) {
                spdlog::info("Stale channel artifact at {}; removing it", channel.string());
                if (auto removed = transport_->remove_artifact(channel); !removed) {
                    co_return removed.error();
                }
            } else if (recheck.error().code != ErrorCode::NotFound) {
                co_return recheck.error();
            }

            spdlog::info("Starting daemon for {} (attempt {}/{})", request.command.path,
                         attempt + 1, config_.maxSpawnAttempts);
            if (auto launched = launcher_->launch(request); !launched) {
                co_return launched.error();
            }
        }

        auto grace = config_.spawnGrace * (1LL << attempt);
        timer.expires_after(grace);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));

        conn = co_await transport_->connect(channel);
        if (conn) {
            co_return std::move(conn);
        }
        spdlog::debug("Daemon not reachable {} ms after launch: {}", grace.count(),
                      conn.error().message);
    }

    if (!is_recoverable(conn.error())) {
        co_return conn.error();
    }
    co_return Error{ErrorCode::Timeout, "Daemon did not become reachable at " + channel.string() +
                                            " after " + std::to_string(config_.maxSpawnAttempts) +
                                            " attempt(s)"};
}

} // namespace daemux::client

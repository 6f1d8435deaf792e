#include <daemux/client/control_plane.h>
#include <daemux/ipc/channel_lock.h>

#include <spdlog/spdlog.h>
#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <chrono>
#include <memory>
#include <string_view>

namespace daemux::client {

using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace {

constexpr std::string_view kKillMarker = "kill";
constexpr std::chrono::milliseconds kReleasePoll{20};

bool is_hangup(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof || ec == boost::asio::error::broken_pipe ||
           ec == boost::asio::error::connection_reset;
}

// Tracks the socket an interrupt should close for the duration of one operation
class ActiveGuard {
public:
    ActiveGuard(ipc::local::socket*& slot, ipc::local::socket& socket) : slot_(slot) {
        slot_ = &socket;
    }
    ~ActiveGuard() { slot_ = nullptr; }

    ActiveGuard(const ActiveGuard&) = delete;
    ActiveGuard& operator=(const ActiveGuard&) = delete;

private:
    ipc::local::socket*& slot_;
};

} // namespace

ControlPlane::ControlPlane(ClientConnector& connector, LaunchRequest request,
                           std::filesystem::path channel, ControlConfig config)
    : connector_(connector),
      request_(std::move(request)),
      channel_(std::move(channel)),
      config_(config) {}

void ControlPlane::interrupt() {
    interrupted_ = true;
    if (active_ && active_->is_open()) {
        boost::system::error_code ec;
        active_->close(ec);
    }
}

awaitable<Result<void>> ControlPlane::send_kill(ipc::local::socket& socket) {
    boost::system::error_code ec;
    co_await boost::asio::async_write(socket, boost::asio::buffer(kKillMarker),
                                      boost::asio::redirect_error(use_awaitable, ec));
    if (ec && !is_hangup(ec)) {
        co_return ipc::make_transport_error(ec, "write kill request to", channel_);
    }
    if (ec) {
        spdlog::debug("Daemon already gone: {}", ec.message());
    }
    co_return Result<void>();
}

awaitable<Result<void>> ControlPlane::kill() {
    auto conn = co_await connector_.connect_or_spawn(request_, channel_);
    if (!conn) {
        co_return conn.error();
    }
    auto socket = std::move(conn).value();
    auto sent = co_await send_kill(socket);
    boost::system::error_code ec;
    socket.close(ec);
    if (sent) {
        spdlog::info("Kill request sent to {}", channel_.string());
    }
    co_return sent;
}

awaitable<void> ControlPlane::wait_for_hangup(ipc::local::socket& socket) {
    struct WaitState {
        bool done = false;
        bool expired = false;
    };
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor);
    auto state = std::make_shared<WaitState>();
    timer.expires_after(config_.shutdownWait);
    timer.async_wait([&socket, state](const boost::system::error_code& ec) {
        if (!ec && !state->done) {
            state->expired = true;
            boost::system::error_code ignored;
            socket.cancel(ignored);
        }
    });

    std::array<char, 4096> discard{};
    for (;;) {
        boost::system::error_code ec;
        co_await socket.async_read_some(boost::asio::buffer(discard),
                                        boost::asio::redirect_error(use_awaitable, ec));
        if (ec) {
            break;
        }
    }
    state->done = true;
    timer.cancel();
    if (state->expired) {
        spdlog::warn("Old daemon still connected after {} ms; reconnecting anyway",
                     config_.shutdownWait.count());
    }
}

awaitable<Result<void>> ControlPlane::restart(OutputSink sink) {
    {
        auto conn = co_await connector_.connect_or_spawn(request_, channel_);
        if (!conn) {
            co_return conn.error();
        }
        auto socket = std::move(conn).value();
        ActiveGuard guard(active_, socket);
        if (auto sent = co_await send_kill(socket); !sent) {
            co_return sent;
        }
        spdlog::info("Restart: kill sent; waiting for the old daemon to exit");
        co_await wait_for_hangup(socket);
        boost::system::error_code ec;
        socket.close(ec);
    }
    co_await wait_for_release();
    if (interrupted_) {
        co_return Result<void>();
    }

    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer delay(executor);
    delay.expires_after(config_.restartDelay);
    boost::system::error_code ec;
    co_await delay.async_wait(boost::asio::redirect_error(use_awaitable, ec));
    if (interrupted_) {
        co_return Result<void>();
    }

    co_return co_await stream(std::move(sink));
}

awaitable<Result<void>> ControlPlane::stream(OutputSink sink) {
    auto conn = co_await connector_.connect_or_spawn(request_, channel_);
    if (!conn) {
        co_return conn.error();
    }
    auto socket = std::move(conn).value();
    ActiveGuard guard(active_, socket);
    if (interrupted_) {
        co_return Result<void>();
    }
    co_return co_await pump(socket, sink);
}

awaitable<Result<void>> ControlPlane::pump(ipc::local::socket& socket, const OutputSink& sink) {
    std::array<char, 64 * 1024> buf{};
    std::size_t total = 0;
    for (;;) {
        boost::system::error_code ec;
        auto n = co_await socket.async_read_some(boost::asio::buffer(buf),
                                                 boost::asio::redirect_error(use_awaitable, ec));
        if (n > 0) {
            total += n;
            if (sink) {
                sink(std::string_view(buf.data(), n));
            }
        }
        if (ec) {
            if (is_hangup(ec) ||
                (interrupted_ && ec == boost::asio::error::operation_aborted)) {
                break;
            }
            co_return ipc::make_transport_error(ec, "read from", channel_);
        }
    }
    spdlog::debug("Stream from {} ended after {} byte(s)", channel_.string(), total);
    co_return Result<void>();
}

awaitable<Result<bool>> ControlPlane::status() {
    // Connecting would count as a client of a daemon serving its replay
    co_return ipc::ChannelLock::is_live(channel_);
}

awaitable<void> ControlPlane::wait_for_release() {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor);
    auto deadline = std::chrono::steady_clock::now() + config_.shutdownWait;
    for (;;) {
        auto live = ipc::ChannelLock::is_live(channel_);
        if (!live) {
            spdlog::warn("Cannot check daemon liveness: {}", live.error().message);
            co_return;
        }
        if (!live.value() || interrupted_) {
            co_return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("Old daemon still live after {} ms; relaunching anyway",
                         config_.shutdownWait.count());
            co_return;
        }
        boost::system::error_code ec;
        timer.expires_after(kReleasePoll);
        co_await timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));
    }
}

} // namespace daemux::client

#include <daemux/daemon/client_session.h>

#include <spdlog/spdlog.h>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <utility>
#include <vector>

namespace daemux::daemon {

using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

ClientSession::ClientSession(ipc::local::socket socket, std::uint64_t id)
    : socket_(std::move(socket)), id_(id) {}

ClientSession::~ClientSession() {
    boost::system::error_code ec;
    socket_.close(ec);
}

void ClientSession::start(KillHandler onKill, CloseHandler onClosed) {
    onKill_ = std::move(onKill);
    onClosed_ = std::move(onClosed);
    co_spawn(socket_.get_executor(), [self = shared_from_this()]() { return self->read_loop(); },
             detached);
}

void ClientSession::deliver(OutputChunk chunk) {
    if (closing_ || !socket_.is_open() || !chunk || chunk->empty()) {
        return;
    }
    queue_.push_back(std::move(chunk));
    if (writing_) {
        return;
    }
    writing_ = true;
    co_spawn(socket_.get_executor(), [self = shared_from_this()]() { return self->write_loop(); },
             detached);
}

void ClientSession::shutdown() {
    closing_ = true;
    if (!writing_) {
        close_socket();
    }
}

void ClientSession::abort() {
    closing_ = true;
    queue_.clear();
    close_socket();
}

void ClientSession::when_flushed(std::function<void()> callback) {
    onFlushed_ = std::move(callback);
    if (is_flushed() && socket_.is_open()) {
        notify_flushed();
    }
}

void ClientSession::notify_flushed() {
    if (auto callback = std::exchange(onFlushed_, nullptr)) {
        callback();
    }
}

void ClientSession::close_socket() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(ipc::local::socket::shutdown_both, ec);
    socket_.close(ec);
}

awaitable<void> ClientSession::read_loop() {
    std::array<char, 256> buf{};
    bool killRequested = false;
    for (;;) {
        boost::system::error_code ec;
        auto n = co_await socket_.async_read_some(boost::asio::buffer(buf),
                                                  boost::asio::redirect_error(use_awaitable, ec));
        if (ec) {
            if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                spdlog::debug("Client {} read error: {}", id_, ec.message());
            }
            break;
        }
        // Payload is not parsed; presence of data is the signal
        if (n > 0 && !killRequested) {
            killRequested = true;
            if (onKill_) {
                onKill_(id_);
            }
        }
    }

    close_socket();
    if (!closedNotified_) {
        closedNotified_ = true;
        if (onClosed_) {
            onClosed_(shared_from_this());
        }
    }
}

awaitable<void> ClientSession::write_loop() {
    while (!queue_.empty() && socket_.is_open()) {
        // Gather everything queued so far into one write, preserving order
        std::vector<OutputChunk> batch(queue_.begin(), queue_.end());
        queue_.clear();
        std::vector<boost::asio::const_buffer> buffers;
        buffers.reserve(batch.size());
        for (const auto& chunk : batch) {
            buffers.emplace_back(boost::asio::buffer(*chunk));
        }

        boost::system::error_code ec;
        co_await boost::asio::async_write(socket_, buffers,
                                          boost::asio::redirect_error(use_awaitable, ec));
        if (ec) {
            spdlog::debug("Client {} write failed: {}", id_, ec.message());
            queue_.clear();
            writing_ = false;
            close_socket();
            co_return;
        }
    }
    writing_ = false;
    if (socket_.is_open()) {
        notify_flushed();
    }
    if (closing_) {
        close_socket();
    }
}

} // namespace daemux::daemon

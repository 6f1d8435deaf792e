#pragma once

#include <daemux/daemon/session_state.h>
#include <daemux/ipc/endpoint_transport.h>

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>

namespace daemux::daemon {

// One accepted connection: an ordered write queue toward the client and a read loop that
// turns any inbound byte into a kill request.
class ClientSession : public IClientChannel, public std::enable_shared_from_this<ClientSession> {
public:
    using KillHandler = std::function<void(std::uint64_t id)>;
    using CloseHandler = std::function<void(const std::shared_ptr<ClientSession>&)>;

    ClientSession(ipc::local::socket socket, std::uint64_t id);
    ~ClientSession() override;

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // Starts the read loop. onClosed fires once, when the connection ends for any reason.
    void start(KillHandler onKill, CloseHandler onClosed);

    void deliver(OutputChunk chunk) override;
    void shutdown() override;

    // Closes immediately, dropping anything still queued
    void abort();

    // Runs once, the next time everything queued so far has been written to the client.
    // Never runs if the connection fails first.
    void when_flushed(std::function<void()> callback);

    std::uint64_t id() const noexcept { return id_; }
    bool is_open() const noexcept { return socket_.is_open(); }
    bool is_flushed() const noexcept { return !writing_ && queue_.empty(); }

private:
    boost::asio::awaitable<void> read_loop();
    boost::asio::awaitable<void> write_loop();
    void close_socket();
    void notify_flushed();

    ipc::local::socket socket_;
    std::uint64_t id_;
    std::deque<OutputChunk> queue_;
    bool writing_ = false;
    bool closing_ = false;
    bool closedNotified_ = false;
    KillHandler onKill_;
    CloseHandler onClosed_;
    std::function<void()> onFlushed_;
};

} // namespace daemux::daemon

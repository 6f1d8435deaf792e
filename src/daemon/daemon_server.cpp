#include <daemux/daemon/daemon_server.h>
#include <daemux/ipc/channel_lock.h>

#include <spdlog/spdlog.h>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <csignal>
#include <initializer_list>
#include <vector>

namespace daemux::daemon {

using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

namespace {
constexpr std::chrono::milliseconds kAcceptBackoff{100};
constexpr std::chrono::milliseconds kDrainPoll{10};
} // namespace

DaemonServer::DaemonServer(boost::asio::io_context& io, Config config,
                           std::shared_ptr<ipc::IEndpointTransport> transport)
    : io_(io),
      config_(std::move(config)),
      transport_(std::move(transport)),
      childSignals_(io),
      stopSignals_(io),
      escalateTimer_(io),
      stdoutTimer_(io),
      lingerTimer_(io),
      drainTimer_(io) {}

DaemonServer::~DaemonServer() {
    boost::system::error_code ec;
    childSignals_.cancel(ec);
    stopSignals_.cancel(ec);
    for (auto& [id, client] : sessions_) {
        client->abort();
    }
    sessions_.clear();
    if (stdout_) {
        stdout_->close(ec);
    }
    if (listener_) {
        listener_->close();
    }
    // child_'s destructor kills and reaps a child that is still running
    child_.reset();
}

std::optional<int> DaemonServer::child_exit_code() const noexcept {
    return child_ ? child_->exit_code() : std::nullopt;
}

Result<void> DaemonServer::start() {
    if (state_ != ServerState::Idle) {
        return Error{ErrorCode::InvalidState, "Daemon server already started"};
    }
    if (config_.command.path.empty()) {
        return Error{ErrorCode::InvalidArgument, "No command to run"};
    }

    // Client writes must not raise SIGPIPE if a reader disappears mid-write
    std::signal(SIGPIPE, SIG_IGN);

    // Registered before the spawn so the child's exit can never be missed
    boost::system::error_code ec;
    childSignals_.add(SIGCHLD, ec);
    if (ec) {
        return Error{ErrorCode::InternalError, "Cannot watch SIGCHLD: " + ec.message()};
    }
    if (config_.handleSignals) {
        for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
            stopSignals_.add(sig, ec);
            if (ec) {
                spdlog::warn("Cannot watch signal {}: {}", sig, ec.message());
            }
        }
    }

    {
        auto lock = ipc::ChannelLock::acquire(config_.channelPath);
        if (!lock) {
            return lock.error();
        }
        auto listened = transport_->listen(io_.get_executor(), config_.channelPath);
        if (!listened) {
            childSignals_.cancel(ec);
            stopSignals_.cancel(ec);
            return listened.error();
        }
        listener_ = std::move(listened).value();

        auto live = ipc::ChannelLock::hold_liveness(config_.channelPath);
        if (!live) {
            listener_->close();
            childSignals_.cancel(ec);
            stopSignals_.cancel(ec);
            return live.error();
        }
        liveness_.emplace(std::move(live).value());
    }

    auto spawned = ChildProcess::spawn(config_.command);
    if (!spawned) {
        spdlog::error("{}", spawned.error().message);
        liveness_.reset();
        listener_->close();
        childSignals_.cancel(ec);
        stopSignals_.cancel(ec);
        return spawned.error();
    }
    child_ = std::move(spawned).value();
    childPid_ = child_->pid();
    stdout_ = std::make_unique<boost::asio::posix::stream_descriptor>(io_, child_->release_stdout());

    state_ = ServerState::Running;
    wait_child_signal();
    if (config_.handleSignals) {
        wait_stop_signal();
    }
    co_spawn(io_, stdout_loop(), detached);
    co_spawn(io_, accept_loop(), detached);

    spdlog::info("Daemon running: child pid={} channel={}", childPid_,
                 config_.channelPath.string());
    return Result<void>();
}

void DaemonServer::request_kill() {
    if (lingering_) {
        enter_terminated("kill requested after child exit");
        return;
    }
    if (state_ != ServerState::Running || !child_) {
        return;
    }
    if (childReaped_) {
        // Still draining stdout; skip the linger once it is done
        spdlog::debug("Kill request after child exit; no signal sent");
        killRequested_ = true;
        return;
    }
    if (killRequested_) {
        spdlog::debug("Kill already in progress for child {}", childPid_);
        return;
    }
    killRequested_ = true;
    spdlog::info("Kill requested; sending SIGTERM to child {}", childPid_);
    child_->terminate();

    escalateTimer_.expires_after(config_.killGrace);
    escalateTimer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || childReaped_ || !child_) {
            return;
        }
        spdlog::warn("Child {} still alive after {} ms; sending SIGKILL", childPid_,
                     config_.killGrace.count());
        child_->kill();
    });
}

void DaemonServer::wait_child_signal() {
    childSignals_.async_wait([this](const boost::system::error_code& ec, int) {
        if (ec) {
            return;
        }
        if (child_ && child_->poll_exit()) {
            on_child_reaped();
        } else {
            wait_child_signal();
        }
    });
}

void DaemonServer::wait_stop_signal() {
    stopSignals_.async_wait([this](const boost::system::error_code& ec, int sig) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}", sig);
        if (killRequested_ && child_ && !childReaped_) {
            // Second interrupt: no more grace
            spdlog::warn("Repeated signal; sending SIGKILL to child {}", childPid_);
            child_->kill();
        } else {
            request_kill();
        }
        if (state_ == ServerState::Running) {
            wait_stop_signal();
        }
    });
}

void DaemonServer::on_child_reaped() {
    if (childReaped_) {
        return;
    }
    childReaped_ = true;
    escalateTimer_.cancel();
    spdlog::info("Child {} {}", childPid_, child_->describe_exit());

    if (!stdoutClosed_) {
        // A grandchild may still hold the pipe; stop waiting for EOF after drainTimeout
        stdoutTimer_.expires_after(config_.drainTimeout);
        stdoutTimer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec || stdoutClosed_) {
                return;
            }
            spdlog::warn("Child stdout still open {} ms after exit; closing it",
                         config_.drainTimeout.count());
            boost::system::error_code cec;
            stdout_->close(cec);
        });
    }
    maybe_terminate();
}

awaitable<void> DaemonServer::stdout_loop() {
    std::vector<char> buf(config_.readChunkSize);
    for (;;) {
        boost::system::error_code ec;
        auto n = co_await stdout_->async_read_some(boost::asio::buffer(buf),
                                                   boost::asio::redirect_error(use_awaitable, ec));
        if (n > 0) {
            session_.append(std::string(buf.data(), n));
        }
        if (ec) {
            if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                spdlog::warn("Reading child stdout failed: {}", ec.message());
            }
            break;
        }
    }

    stdoutClosed_ = true;
    stdoutTimer_.cancel();
    boost::system::error_code ec;
    stdout_->close(ec);
    spdlog::debug("Child stdout closed after {} byte(s)", session_.buffered_bytes());

    if (!childReaped_ && child_ && child_->poll_exit()) {
        on_child_reaped();
        co_return;
    }
    maybe_terminate();
}

awaitable<void> DaemonServer::accept_loop() {
    spdlog::debug("Accept loop started");
    while (state_ == ServerState::Running && listener_ && listener_->is_open()) {
        ipc::local::socket socket(io_);
        boost::system::error_code ec;
        co_await listener_->acceptor().async_accept(socket,
                                                    boost::asio::redirect_error(use_awaitable, ec));
        if (ec) {
            if (ec == boost::asio::error::operation_aborted || !listener_->is_open() ||
                state_ != ServerState::Running) {
                break;
            }
            spdlog::warn("Accept error: {} ({})", ec.message(), ec.value());
            boost::asio::steady_timer timer(io_);
            timer.expires_after(kAcceptBackoff);
            co_await timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));
            continue;
        }
        if (state_ != ServerState::Running) {
            break;
        }

        auto id = nextClientId_++;
        auto client = std::make_shared<ClientSession>(std::move(socket), id);
        sessions_.emplace(id, client);
        client->start(
            [this](std::uint64_t clientId) {
                spdlog::info("Kill request from client {}", clientId);
                request_kill();
            },
            [this](const std::shared_ptr<ClientSession>& closed) { on_client_closed(closed); });

        // Replay and join in one step: no stdout chunk can be appended in between
        session_.attach(client);
        everAttached_ = true;
        if (!lingering_) {
            spdlog::info("Client {} attached ({} attached)", id, session_.client_count());
            continue;
        }

        // Served only once the whole replay is written; a connection that hangs up earlier
        // does not count
        spdlog::info("Client {} attached after child exit; replaying {} byte(s)", id,
                     session_.buffered_bytes());
        std::weak_ptr<ClientSession> weak = client;
        client->when_flushed([this, weak]() {
            if (auto served = weak.lock()) {
                on_linger_client_served(served);
            }
        });
    }
    spdlog::debug("Accept loop ended");
}

void DaemonServer::on_client_closed(const std::shared_ptr<ClientSession>& client) {
    session_.detach(client);
    sessions_.erase(client->id());
    if (state_ == ServerState::Running) {
        spdlog::info("Client {} detached ({} attached)", client->id(), session_.client_count());
    }
}

void DaemonServer::on_linger_client_served(const std::shared_ptr<ClientSession>& client) {
    if (state_ != ServerState::Running) {
        return;
    }
    spdlog::debug("Client {} received the full replay", client->id());
    client->shutdown();
    if (!served_) {
        served_ = true;
        arm_linger(config_.exitLinger);
    }
}

void DaemonServer::arm_linger(Duration wait) {
    if (wait.count() <= 0) {
        enter_terminated(served_ ? "child exited" : "no client attached");
        return;
    }
    // Rearming cancels the previous wait
    lingerTimer_.expires_after(wait);
    lingerTimer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || state_ != ServerState::Running) {
            return;
        }
        enter_terminated(served_ ? "exit linger elapsed" : "no client attached");
    });
}

void DaemonServer::maybe_terminate() {
    if (state_ != ServerState::Running || !childReaped_ || !stdoutClosed_ || lingering_) {
        return;
    }
    if (killRequested_) {
        enter_terminated("child exited after kill request");
        return;
    }

    lingering_ = true;
    served_ = everAttached_;
    session_.close_all();
    if (served_) {
        spdlog::info("Child exited; serving its output to late clients for {} ms",
                     config_.exitLinger.count());
        arm_linger(config_.exitLinger);
    } else {
        spdlog::info("Child exited before any client attached; waiting up to {} ms for one",
                     config_.firstClientTimeout.count());
        arm_linger(config_.firstClientTimeout);
    }
}

void DaemonServer::enter_terminated(const char* reason) {
    if (state_ == ServerState::Terminated) {
        return;
    }
    state_ = ServerState::Terminated;
    lingering_ = false;
    spdlog::info("Terminating ({}): closing {} client(s)", reason, session_.client_count());

    if (child_ && child_->is_alive()) {
        child_->kill();
    }
    // Released before the socket goes away, so a daemon that binds next can always take it
    liveness_.reset();
    if (listener_) {
        listener_->close();
    }
    boost::system::error_code ec;
    childSignals_.cancel(ec);
    stopSignals_.cancel(ec);
    escalateTimer_.cancel();
    stdoutTimer_.cancel();
    lingerTimer_.cancel();

    session_.close_all();
    co_spawn(io_, drain_clients(), detached);
}

awaitable<void> DaemonServer::drain_clients() {
    auto deadline = std::chrono::steady_clock::now() + config_.drainTimeout;
    while (!sessions_.empty() && std::chrono::steady_clock::now() < deadline) {
        boost::system::error_code ec;
        drainTimer_.expires_after(kDrainPoll);
        co_await drainTimer_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
    }

    if (!sessions_.empty()) {
        spdlog::warn("{} client(s) did not drain within {} ms; dropping them", sessions_.size(),
                     config_.drainTimeout.count());
        auto remaining = sessions_;
        for (auto& [id, client] : remaining) {
            client->abort();
        }
    }

    finished_ = true;
    spdlog::info("Daemon terminated");
    if (onTerminated_) {
        onTerminated_();
    }
}

} // namespace daemux::daemon

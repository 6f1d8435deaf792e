#pragma once

#include <daemux/client/daemon_launcher.h>
#include <daemux/ipc/endpoint_transport.h>

#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/this_coro.hpp>

#include <deque>
#include <filesystem>
#include <vector>

namespace daemux::tests {

// What the next connect() returns
struct ConnectStep {
    enum class Kind { Connected, PeerClosed, Fail };

    static ConnectStep connected() { return {Kind::Connected, ErrorCode::Success}; }
    static ConnectStep peer_closed() { return {Kind::PeerClosed, ErrorCode::Success}; }
    static ConnectStep fail(ErrorCode code) { return {Kind::Fail, code}; }

    Kind kind;
    ErrorCode code;
};

// Transport whose connect() results are scripted. Once the script runs out every connect
// yields the fallback error.
class ScriptedTransport : public ipc::IEndpointTransport {
public:
    explicit ScriptedTransport(std::vector<ConnectStep> steps = {},
                               ErrorCode fallback = ErrorCode::NotFound)
        : steps_(steps.begin(), steps.end()), fallback_(fallback) {}

    Result<std::unique_ptr<ipc::ListeningEndpoint>>
    listen(const boost::asio::any_io_executor&, const std::filesystem::path&) override {
        return Error{ErrorCode::NotSupported, "scripted transport does not listen"};
    }

    boost::asio::awaitable<Result<ipc::local::socket>>
    connect(const std::filesystem::path& path) override {
        auto executor = co_await boost::asio::this_coro::executor;
        ++connects;
        ConnectStep step = ConnectStep::fail(fallback_);
        if (!steps_.empty()) {
            step = steps_.front();
            steps_.pop_front();
        }
        if (step.kind == ConnectStep::Kind::Fail) {
            co_return Error{step.code, "scripted connect to " + path.string()};
        }

        ipc::local::socket ours(executor);
        ipc::local::socket theirs(executor);
        boost::asio::local::connect_pair(ours, theirs);
        if (step.kind == ConnectStep::Kind::PeerClosed) {
            theirs.close();
        } else {
            peers.push_back(std::move(theirs));
        }
        co_return std::move(ours);
    }

    Result<void> remove_artifact(const std::filesystem::path& path) override {
        removed.push_back(path);
        return Result<void>();
    }

    int connects = 0;
    std::vector<std::filesystem::path> removed;
    // Server ends of Connected sockets
    std::vector<ipc::local::socket> peers;

private:
    std::deque<ConnectStep> steps_;
    ErrorCode fallback_;
};

class RecordingLauncher : public client::IDaemonLauncher {
public:
    Result<void> launch(const client::LaunchRequest& request) override {
        launches.push_back(request);
        if (failWith != ErrorCode::Success) {
            return Error{failWith, "scripted launch failure"};
        }
        return Result<void>();
    }

    std::vector<client::LaunchRequest> launches;
    ErrorCode failWith = ErrorCode::Success;
};

} // namespace daemux::tests

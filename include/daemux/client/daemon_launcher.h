#pragma once

#include <daemux/core/types.h>
#include <daemux/ipc/channel_identity.h>

#include <filesystem>
#include <string>
#include <vector>

namespace daemux::client {

// Everything a freshly launched daemon needs to resolve the same channel and settings
struct LaunchRequest {
    ipc::CommandIdentity command;
    std::filesystem::path runtimeDir;
    std::filesystem::path configFile;
    std::string logLevel;
    std::string logFile;
};

class IDaemonLauncher {
public:
    virtual ~IDaemonLauncher() = default;
    // Starts a daemon for request.command; returns once it has been exec'd, not when it listens
    virtual Result<void> launch(const LaunchRequest& request) = 0;
};

// Re-executes this program with --daemon in a new session, detached from the caller.
// The daemon's stdin and stdout are /dev/null; stderr is inherited.
class DetachedDaemonLauncher : public IDaemonLauncher {
public:
    explicit DetachedDaemonLauncher(std::filesystem::path executable);

    Result<void> launch(const LaunchRequest& request) override;

    std::vector<std::string> build_argv(const LaunchRequest& request) const;

    // /proc/self/exe when readable, else argv0
    static std::filesystem::path self_executable(const char* argv0);

private:
    std::filesystem::path executable_;
};

} // namespace daemux::client

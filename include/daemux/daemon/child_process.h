#pragma once

#include <daemux/core/types.h>
#include <daemux/ipc/channel_identity.h>

#include <memory>
#include <optional>
#include <string>

namespace daemux::daemon {

/**
 * @brief The one child a daemon owns.
 *
 * Runs in its own process group. stdin is /dev/null, stdout is a pipe read by the daemon,
 * stderr is inherited.
 * Destroying a handle whose child has not been reaped sends SIGKILL and reaps it.
 */
class ChildProcess {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // SpawnFailed when fork fails or exec reports an error through the CLOEXEC status pipe
    static Result<std::unique_ptr<ChildProcess>> spawn(const ipc::CommandIdentity& command);

    // Only spawn() can name the tag
    ChildProcess(PrivateTag, int pid, int stdoutFd) : pid_(pid), stdoutFd_(stdoutFd) {}
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] int pid() const noexcept { return pid_; }

    // Hands the stdout read end to the caller (returns -1 after the first call)
    [[nodiscard]] int release_stdout() noexcept;

    [[nodiscard]] bool is_alive() const noexcept { return !exitStatus_.has_value(); }

    // SIGTERM / SIGKILL to the child's process group; false when the child is already reaped
    bool terminate();
    bool kill();

    // Reaps without blocking; true once the child has exited
    bool poll_exit();

    // Exit status, or 128 + signal for a signalled child
    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exitStatus_; }
    [[nodiscard]] std::string describe_exit() const;

private:
    bool signal(int sig);
    void record_status(int status);

    int pid_ = -1;
    int stdoutFd_ = -1;
    std::optional<int> exitStatus_;
    std::optional<int> termSignal_;
};

} // namespace daemux::daemon

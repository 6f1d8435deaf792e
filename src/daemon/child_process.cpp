#include <daemux/daemon/child_process.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace daemux::daemon {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const ipc::CommandIdentity& command) {
    if (command.path.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty command path"};
    }

    // Build argv before fork; the child only calls async-signal-safe functions
    std::vector<char*> argv;
    argv.reserve(command.args.size() + 2);
    argv.push_back(const_cast<char*>(command.path.c_str()));
    for (const auto& arg : command.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int outPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) < 0) {
        return Error{ErrorCode::SpawnFailed, std::string("pipe() failed: ") + strerror(errno)};
    }
    if (::pipe2(statusPipe, O_CLOEXEC) < 0) {
        int err = errno;
        close_fd(outPipe[0]);
        close_fd(outPipe[1]);
        return Error{ErrorCode::SpawnFailed, std::string("pipe() failed: ") + strerror(err)};
    }
    int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_fd(outPipe[0]);
        close_fd(outPipe[1]);
        close_fd(statusPipe[0]);
        close_fd(statusPipe[1]);
        close_fd(devNull);
        return Error{ErrorCode::SpawnFailed, std::string("fork() failed: ") + strerror(err)};
    }

    if (pid == 0) {
        // Child process: own process group so a kill reaches its descendants too
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);

        ::execvp(argv[0], argv.data());

        // If exec fails, report errno to the parent
        int err = errno;
        ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    ::setpgid(pid, pid);
    close_fd(outPipe[1]);
    close_fd(statusPipe[1]);
    close_fd(devNull);

    int execErr = 0;
    ssize_t n = 0;
    do {
        n = ::read(statusPipe[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    close_fd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(outPipe[0]);
        return Error{ErrorCode::SpawnFailed,
                     "Failed to start '" + command.path + "': " + strerror(execErr)};
    }

    spdlog::info("Spawned child {} (pid={})", command.path, pid);
    return std::make_unique<ChildProcess>(PrivateTag{}, pid, outPipe[0]);
}

ChildProcess::~ChildProcess() {
    if (is_alive() && pid_ > 0) {
        spdlog::debug("Child {} still running at teardown; killing", pid_);
        if (::kill(-pid_, SIGKILL) != 0) {
            ::kill(pid_, SIGKILL);
        }
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid_, &status, 0);
        } while (r < 0 && errno == EINTR);
        if (r == pid_) {
            record_status(status);
        }
    }
    close_fd(stdoutFd_);
}

int ChildProcess::release_stdout() noexcept {
    int fd = stdoutFd_;
    stdoutFd_ = -1;
    return fd;
}

bool ChildProcess::signal(int sig) {
    if (!is_alive() || pid_ <= 0) {
        return false;
    }
    if (::kill(-pid_, sig) == 0) {
        return true;
    }
    if (::kill(pid_, sig) != 0) {
        spdlog::debug("kill({}, {}) failed: {}", pid_, sig, strerror(errno));
        return false;
    }
    return true;
}

bool ChildProcess::terminate() {
    return signal(SIGTERM);
}

bool ChildProcess::kill() {
    return signal(SIGKILL);
}

bool ChildProcess::poll_exit() {
    if (!is_alive()) {
        return true;
    }
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        record_status(status);
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing more to learn
        exitStatus_ = -1;
        return true;
    }
    return false;
}

void ChildProcess::record_status(int status) {
    if (WIFEXITED(status)) {
        exitStatus_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        termSignal_ = WTERMSIG(status);
        exitStatus_ = 128 + WTERMSIG(status);
    } else {
        exitStatus_ = -1;
    }
}

std::string ChildProcess::describe_exit() const {
    if (!exitStatus_) {
        return "running";
    }
    if (termSignal_) {
        return "killed by signal " + std::to_string(*termSignal_);
    }
    return "exited with status " + std::to_string(*exitStatus_);
}

} // namespace daemux::daemon

#include <daemux/client/daemon_launcher.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace daemux::client {

DetachedDaemonLauncher::DetachedDaemonLauncher(std::filesystem::path executable)
    : executable_(std::move(executable)) {}

std::filesystem::path DetachedDaemonLauncher::self_executable(const char* argv0) {
    char buf[4096];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n > 0) {
        buf[n] = '\0';
        return std::filesystem::path(buf);
    }
    return argv0 ? std::filesystem::path(argv0) : std::filesystem::path("daemux");
}

std::vector<std::string> DetachedDaemonLauncher::build_argv(const LaunchRequest& request) const {
    std::vector<std::string> argv;
    argv.push_back(executable_.string());
    argv.push_back("--daemon");
    if (!request.runtimeDir.empty()) {
        argv.push_back("--runtime-dir");
        argv.push_back(request.runtimeDir.string());
    }
    if (!request.configFile.empty()) {
        argv.push_back("--config");
        argv.push_back(request.configFile.string());
    }
    if (!request.logLevel.empty()) {
        argv.push_back("--log-level");
        argv.push_back(request.logLevel);
    }
    if (!request.logFile.empty()) {
        argv.push_back("--log-file");
        argv.push_back(request.logFile);
    }
    // Everything from the command path on is passed through untouched
    argv.push_back(request.command.path);
    for (const auto& arg : request.command.args) {
        argv.push_back(arg);
    }
    return argv;
}

Result<void> DetachedDaemonLauncher::launch(const LaunchRequest& request) {
    auto args = build_argv(request);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    int statusPipe[2] = {-1, -1};
    if (::pipe2(statusPipe, O_CLOEXEC) < 0) {
        return Error{ErrorCode::SpawnFailed, std::string("pipe() failed: ") + strerror(errno)};
    }
    int devNull = ::open("/dev/null", O_RDWR | O_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(statusPipe[0]);
        ::close(statusPipe[1]);
        if (devNull >= 0)
            ::close(devNull);
        return Error{ErrorCode::SpawnFailed, std::string("fork() failed: ") + strerror(err)};
    }

    if (pid == 0) {
        // Intermediate process: new session, then fork again so the daemon is reparented
        ::close(statusPipe[0]);
        ::setsid();
        pid_t daemonPid = ::fork();
        if (daemonPid < 0) {
            int err = errno;
            ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(1);
        }
        if (daemonPid > 0) {
            _exit(0);
        }

        ::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::dup2(devNull, STDOUT_FILENO);
        }
        // The working directory is kept: a relative command path resolves as the caller saw it
        ::execv(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    ::close(statusPipe[1]);
    if (devNull >= 0)
        ::close(devNull);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    // EOF means the daemon exec'd; an int means fork or exec failed
    int launchErr = 0;
    ssize_t n = 0;
    do {
        n = ::read(statusPipe[0], &launchErr, sizeof(launchErr));
    } while (n < 0 && errno == EINTR);
    ::close(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(launchErr))) {
        return Error{ErrorCode::SpawnFailed,
                     "Failed to launch daemon '" + executable_.string() + "': " +
                         strerror(launchErr)};
    }

    spdlog::debug("Launched daemon: {} --daemon ... {}", executable_.string(),
                  request.command.path);
    return Result<void>();
}

} // namespace daemux::client

#include <daemux/ipc/channel_lock.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace daemux::ipc {

std::filesystem::path ChannelLock::lock_path(const std::filesystem::path& channel) {
    auto p = channel;
    p += ".lock";
    return p;
}

std::filesystem::path ChannelLock::liveness_path(const std::filesystem::path& channel) {
    auto p = channel;
    p += ".pid";
    return p;
}

Result<ChannelLock> ChannelLock::acquire(const std::filesystem::path& channel) {
    return lock(lock_path(channel), true);
}

Result<ChannelLock> ChannelLock::try_acquire(const std::filesystem::path& channel) {
    return lock(lock_path(channel), false);
}

#ifndef _WIN32
Result<ChannelLock> ChannelLock::hold_liveness(const std::filesystem::path& channel) {
    auto path = liveness_path(channel);
    auto held = lock(path, false);
    if (!held) {
        return held;
    }

    int fd = held.value().fd_;
    std::string pid = std::to_string(::getpid());
    if (::ftruncate(fd, 0) != 0 ||
        ::write(fd, pid.c_str(), pid.size()) != static_cast<ssize_t>(pid.size())) {
        return Error{ErrorCode::IOError,
                     "Failed to write pid to '" + path.string() + "': " + std::strerror(errno)};
    }
    return held;
}

Result<bool> ChannelLock::is_live(const std::filesystem::path& channel) {
    auto path = liveness_path(channel);
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return false;
        }
        return Error{ErrorCode::IOError,
                     "Failed to open '" + path.string() + "': " + std::strerror(errno)};
    }

    // A shared lock only fails while the daemon holds its exclusive one
    int rc;
    do {
        rc = ::flock(fd, LOCK_SH | LOCK_NB);
    } while (rc == -1 && errno == EINTR);
    if (rc == -1) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return true;
        }
        return Error{ErrorCode::IOError,
                     "Failed to lock '" + path.string() + "': " + std::strerror(err)};
    }
    ::flock(fd, LOCK_UN);
    ::close(fd);
    return false;
}

Result<ChannelLock> ChannelLock::lock(const std::filesystem::path& path, bool blocking) {
    std::error_code ec;
    if (auto parent = path.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd == -1) {
        int err = errno;
        auto code = (err == EACCES || err == EPERM) ? ErrorCode::PermissionDenied
                    : (err == ENAMETOOLONG || err == ENOTDIR) ? ErrorCode::PathInvalid
                                                               : ErrorCode::IOError;
        return Error{code, "Failed to open lock file '" + path.string() + "': " + std::strerror(err)};
    }

    int op = LOCK_EX | (blocking ? 0 : LOCK_NB);
    while (::flock(fd, op) == -1) {
        int err = errno;
        if (err == EINTR)
            continue;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return Error{ErrorCode::InvalidState, "Lock is held: " + path.string()};
        }
        return Error{ErrorCode::IOError,
                     "Failed to lock '" + path.string() + "': " + std::strerror(err)};
    }
    spdlog::trace("Acquired channel lock {}", path.string());
    return ChannelLock(fd);
}

void ChannelLock::release() noexcept {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}
#else
Result<ChannelLock> ChannelLock::hold_liveness(const std::filesystem::path&) {
    return Error{ErrorCode::NotSupported, "Channel locks are not supported on this platform"};
}

Result<bool> ChannelLock::is_live(const std::filesystem::path&) {
    return Error{ErrorCode::NotSupported, "Channel locks are not supported on this platform"};
}

Result<ChannelLock> ChannelLock::lock(const std::filesystem::path&, bool) {
    return Error{ErrorCode::NotSupported, "Channel locks are not supported on this platform"};
}

void ChannelLock::release() noexcept {
    fd_ = -1;
}
#endif

ChannelLock::ChannelLock(ChannelLock&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

ChannelLock& ChannelLock::operator=(ChannelLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

ChannelLock::~ChannelLock() {
    release();
}

} // namespace daemux::ipc

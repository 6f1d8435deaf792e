#pragma once

#include <daemux/core/types.h>

#include <filesystem>

namespace daemux::ipc {

// Advisory flock on "<channel>.lock" serializing stale-artifact cleanup and bind+listen,
// or on "<channel>.pid" marking a live daemon.
// The lock file itself is left on disk; only the flock is released.
class ChannelLock {
public:
    static std::filesystem::path lock_path(const std::filesystem::path& channel);
    // "<channel>.pid", exclusively locked by the daemon for as long as it serves the channel
    static std::filesystem::path liveness_path(const std::filesystem::path& channel);

    // Blocks until the lock is held
    static Result<ChannelLock> acquire(const std::filesystem::path& channel);
    // InvalidState when another process holds the lock
    static Result<ChannelLock> try_acquire(const std::filesystem::path& channel);

    // Taken by the daemon once it listens; records its pid. InvalidState when already held.
    static Result<ChannelLock> hold_liveness(const std::filesystem::path& channel);
    // True while some process holds the liveness lock. Never connects to the channel.
    static Result<bool> is_live(const std::filesystem::path& channel);

    ChannelLock(ChannelLock&& other) noexcept;
    ChannelLock& operator=(ChannelLock&& other) noexcept;
    ChannelLock(const ChannelLock&) = delete;
    ChannelLock& operator=(const ChannelLock&) = delete;
    ~ChannelLock();

    bool held() const noexcept { return fd_ >= 0; }
    void release() noexcept;

private:
    explicit ChannelLock(int fd) : fd_(fd) {}
    static Result<ChannelLock> lock(const std::filesystem::path& path, bool blocking);

    int fd_ = -1;
};

} // namespace daemux::ipc

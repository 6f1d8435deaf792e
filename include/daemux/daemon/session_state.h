#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace daemux::daemon {

// One read from the child's stdout, shared by every client it is queued to
using OutputChunk = std::shared_ptr<const std::string>;

// Server-side view of an attached client
class IClientChannel {
public:
    virtual ~IClientChannel() = default;

    // Queues a chunk behind everything delivered earlier
    virtual void deliver(OutputChunk chunk) = 0;
    // Flushes queued chunks, then closes the connection
    virtual void shutdown() = 0;
};

/**
 * Output buffer and attached-client set of one daemon.
 *
 * All calls happen on the daemon's single event-loop thread. attach() replays the buffer
 * and joins the set without yielding, so no chunk can fall between replay and live delivery.
 */
class SessionState {
public:
    // Buffers the chunk, then broadcasts it to every attached client
    void append(std::string bytes);

    // Replays the whole buffer to the client, then adds it to the attached set
    void attach(const std::shared_ptr<IClientChannel>& client);

    // No-op for unknown clients
    void detach(const std::shared_ptr<IClientChannel>& client);

    // Shuts down every attached client and empties the set
    void close_all();

    std::size_t client_count() const noexcept { return clients_.size(); }
    std::size_t chunk_count() const noexcept { return chunks_.size(); }
    std::size_t buffered_bytes() const noexcept { return bufferedBytes_; }
    bool is_attached(const std::shared_ptr<IClientChannel>& client) const;

    // Concatenated buffer contents
    std::string snapshot() const;

private:
    std::vector<OutputChunk> chunks_;
    std::size_t bufferedBytes_ = 0;
    std::unordered_set<std::shared_ptr<IClientChannel>> clients_;
};

} // namespace daemux::daemon

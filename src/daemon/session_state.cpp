#include <daemux/daemon/session_state.h>

#include <spdlog/spdlog.h>

namespace daemux::daemon {

void SessionState::append(std::string bytes) {
    if (bytes.empty()) {
        return;
    }
    auto chunk = std::make_shared<const std::string>(std::move(bytes));
    bufferedBytes_ += chunk->size();
    chunks_.push_back(chunk);
    for (const auto& client : clients_) {
        client->deliver(chunk);
    }
}

void SessionState::attach(const std::shared_ptr<IClientChannel>& client) {
    for (const auto& chunk : chunks_) {
        client->deliver(chunk);
    }
    clients_.insert(client);
    spdlog::debug("Replayed {} chunk(s) / {} byte(s) to new client", chunks_.size(),
                  bufferedBytes_);
}

void SessionState::detach(const std::shared_ptr<IClientChannel>& client) {
    clients_.erase(client);
}

void SessionState::close_all() {
    // Swap first so shutdown callbacks that detach do not touch the set being walked
    std::unordered_set<std::shared_ptr<IClientChannel>> clients;
    clients.swap(clients_);
    for (const auto& client : clients) {
        client->shutdown();
    }
}

bool SessionState::is_attached(const std::shared_ptr<IClientChannel>& client) const {
    return clients_.count(client) != 0;
}

std::string SessionState::snapshot() const {
    std::string out;
    out.reserve(bufferedBytes_);
    for (const auto& chunk : chunks_) {
        out += *chunk;
    }
    return out;
}

} // namespace daemux::daemon

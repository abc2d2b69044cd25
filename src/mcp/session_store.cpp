#include <pulsar_mcp/mcp/session_store.hpp>

#include <array>
#include <chrono>
#include <cstdio>
#include <random>

namespace pulsar_mcp {

std::string GenerateSessionId() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> byte(0, 255);

    std::array<unsigned, 16> b{};
    for (auto& v : b) {
        v = static_cast<unsigned>(byte(rng));
    }
    b[6] = (b[6] & 0x0Fu) | 0x40u;  // version 4
    b[8] = (b[8] & 0x3Fu) | 0x80u;  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-"
                  "%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return buf;
}

int64_t EpochMillisNow() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string SessionStore::Create(const std::string& protocol_version,
                                 const nlohmann::json& client_info) {
    McpSession session;
    session.protocol_version = protocol_version;
    session.client_info = client_info;
    session.created_at_ms = EpochMillisNow();

    std::lock_guard<std::mutex> lock(mutex_);
    do {
        session.id = GenerateSessionId();
    } while (sessions_.count(session.id) > 0);
    auto id = session.id;
    sessions_.emplace(id, std::move(session));
    return id;
}

std::optional<McpSession> SessionStore::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

bool SessionStore::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(id) > 0;
}

bool SessionStore::Erase(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(id) > 0;
}

std::size_t SessionStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace pulsar_mcp

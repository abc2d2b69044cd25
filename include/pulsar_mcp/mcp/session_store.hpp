#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace pulsar_mcp {

// ---------------------------------------------------------------------------
// McpSession — server-side record created by initialize.
// ---------------------------------------------------------------------------
struct McpSession {
    std::string id;
    bool initialized = true;
    std::string protocol_version;
    nlohmann::json client_info;  // as sent by the client, may be null
    int64_t created_at_ms = 0;   // epoch milliseconds
};

// ---------------------------------------------------------------------------
// SessionStore — in-memory map of live MCP sessions. Thread-safe.
// ---------------------------------------------------------------------------
class SessionStore {
public:
    /// Create a session with a fresh random id and return that id.
    std::string Create(const std::string& protocol_version,
                       const nlohmann::json& client_info);

    [[nodiscard]] std::optional<McpSession> Find(const std::string& id) const;

    [[nodiscard]] bool Contains(const std::string& id) const;

    /// Returns true if a session was removed.
    bool Erase(const std::string& id);

    [[nodiscard]] std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, McpSession> sessions_;
};

/// Random RFC 4122 version-4 UUID in canonical lowercase text form.
std::string GenerateSessionId();

/// Milliseconds since the Unix epoch.
int64_t EpochMillisNow();

} // namespace pulsar_mcp

#pragma once

#include <pulsar_mcp/core/result.hpp>

#include <cstdint>
#include <string>

namespace pulsar_mcp {

inline constexpr int kDefaultMaxPortAttempts = 100;

/// True if a TCP listener can be bound on host:port right now. The probe
/// socket is closed before returning.
bool IsPortAvailable(const std::string& host, uint16_t port);

/// First port in [start, start + max_attempts) that IsPortAvailable accepts.
/// Sequential and blocking. The port is released again, so a later bind can
/// still lose a race with another process.
Result<uint16_t, Error> FindAvailablePort(uint16_t start,
                                          const std::string& host = "127.0.0.1",
                                          int max_attempts = kDefaultMaxPortAttempts);

} // namespace pulsar_mcp

#pragma once

#include <pulsar_mcp/bridge/http_bridge.hpp>
#include <pulsar_mcp/core/result.hpp>
#include <pulsar_mcp/mcp/external_tools.hpp>
#include <pulsar_mcp/mcp/tool_registry.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pulsar_mcp {

// ---------------------------------------------------------------------------
// BridgeService — start/stop/status of the bridge for the hosting process,
// plus the entry point through which collaborators contribute tools.
// ---------------------------------------------------------------------------
class BridgeService {
public:
    BridgeService(BridgeOptions options, const ToolRegistry& builtins);
    ~BridgeService();

    BridgeService(const BridgeService&) = delete;
    BridgeService& operator=(const BridgeService&) = delete;

    Result<void, Error> Start();
    Result<void, Error> Stop();

    [[nodiscard]] std::string Status() const;
    [[nodiscard]] std::optional<uint16_t> BridgePort() const;
    [[nodiscard]] bool IsRunning() const;

    /// Register external tools. Works whether or not the bridge is running.
    [[nodiscard]] ToolRegistration ConsumeTools(
        const std::vector<std::shared_ptr<const ITool>>& tools);

    [[nodiscard]] const ExternalToolMap& ExternalTools() const noexcept {
        return externals_;
    }

private:
    BridgeOptions options_;
    const ToolRegistry& builtins_;
    ExternalToolMap externals_;
    mutable std::mutex mutex_;
    std::unique_ptr<BridgeHandle> handle_;
};

} // namespace pulsar_mcp

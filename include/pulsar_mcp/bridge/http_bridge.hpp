#pragma once

#include <pulsar_mcp/core/result.hpp>
#include <pulsar_mcp/mcp/external_tools.hpp>
#include <pulsar_mcp/mcp/tool_registry.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace pulsar_mcp {

struct BridgeOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 3000;  // first port probed
    int max_port_attempts = 100;
};

// ---------------------------------------------------------------------------
// BridgeHandle — a running HTTP bridge.
//
// Routes:
//   OPTIONS *              CORS preflight, 204
//   POST    /mcp           MCP JSON-RPC endpoint (single or batch)
//   DELETE  /mcp           end the session named by Mcp-Session-Id, 204
//   GET     /health        {status, timestamp}
//   GET     /tools         {tools:[...]}
//   POST    /tools/<Name>  direct tool invocation, returns the envelope
//
// Destroying a running handle stops it.
// ---------------------------------------------------------------------------
class BridgeHandle {
    struct Impl;
    // Only StartBridge can name Key, so only it can build a handle.
    struct Key {
        explicit Key() = default;
    };

public:
    BridgeHandle(Key, std::unique_ptr<Impl> impl);
    ~BridgeHandle();

    BridgeHandle(const BridgeHandle&) = delete;
    BridgeHandle& operator=(const BridgeHandle&) = delete;

    [[nodiscard]] uint16_t Port() const noexcept;
    [[nodiscard]] const std::string& Host() const noexcept;
    [[nodiscard]] std::string Url() const;
    [[nodiscard]] bool IsRunning() const noexcept;

    /// Stop accepting connections, let in-flight requests finish and join
    /// the listener thread. Fails if the handle is already stopped.
    Result<void, Error> Stop();

private:
    friend Result<std::unique_ptr<BridgeHandle>, Error> StartBridge(
        const BridgeOptions&, const ToolRegistry&, const ExternalToolMap&);

    std::unique_ptr<Impl> impl_;
};

/// Probe for a free port starting at options.port, bind it and start serving
/// on a background thread. The registries must outlive the handle.
Result<std::unique_ptr<BridgeHandle>, Error> StartBridge(
    const BridgeOptions& options,
    const ToolRegistry& builtins,
    const ExternalToolMap& externals);

} // namespace pulsar_mcp

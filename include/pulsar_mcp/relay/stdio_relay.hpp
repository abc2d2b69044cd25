#pragma once

#include <pulsar_mcp/relay/bridge_client.hpp>

#include <iosfwd>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace pulsar_mcp {

// ---------------------------------------------------------------------------
// StdioRelay — MCP over newline-delimited JSON on stdin/stdout, forwarding
// tool traffic to the HTTP bridge.
//
// Only JSON-RPC responses are written to the output stream, one per line.
// ---------------------------------------------------------------------------
class StdioRelay {
public:
    StdioRelay(IBridgeClient& client, std::istream& in, std::ostream& out);

    /// Process lines until end of input. Returns the process exit code.
    int Run();

    /// One input line to at most one response.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(const std::string& line);

    /// One parsed message to at most one response (none for notifications).
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

private:
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    std::string BridgeUnavailableMessage() const;

    IBridgeClient& client_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace pulsar_mcp

#pragma once

#include <pulsar_mcp/mcp/external_tools.hpp>
#include <pulsar_mcp/mcp/session_store.hpp>
#include <pulsar_mcp/mcp/tool_executor.hpp>
#include <pulsar_mcp/mcp/tool_registry.hpp>

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace pulsar_mcp {

inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kSessionHeader = "Mcp-Session-Id";
// Upper bound on batch elements dispatched at the same time.
inline constexpr std::size_t kMaxBatchWorkers = 8;

// JSON-RPC 2.0 error codes.
namespace rpc {
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message);
} // namespace rpc

// ---------------------------------------------------------------------------
// McpReply — outcome of one JSON-RPC message or body.
// ---------------------------------------------------------------------------
struct McpReply {
    // Response object, or array for batches. nullopt means "nothing to send"
    // (notification, or a batch made only of notifications): HTTP 202.
    std::optional<nlohmann::json> response;
    // Set when an initialize created a session; surfaced as Mcp-Session-Id.
    std::optional<std::string> session_id;
};

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 over JSON-RPC 2.0, request-scoped.
//
// Methods:
//   - initialize                 creates a session
//   - notifications/initialized  acknowledged, no response
//   - tools/list                 built-ins then external tools
//   - tools/call                 tool failures become isError results
//   - ping
//
// The transport owns the registries and the session store and injects them.
// A session id is never required to call tools.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(const ToolRegistry& builtins,
              const ExternalToolMap& externals,
              SessionStore& sessions,
              std::string server_name = "pulsar-mcp");

    /// Handle a parsed request body: one message or a batch array.
    [[nodiscard]] McpReply HandleBody(
        const nlohmann::json& body,
        const std::optional<std::string>& session_id = std::nullopt);

    /// Handle a single JSON-RPC message.
    [[nodiscard]] McpReply HandleMessage(
        const nlohmann::json& message,
        const std::optional<std::string>& session_id = std::nullopt);

    /// Built-in then external tool metadata, as served by tools/list and GET /tools.
    [[nodiscard]] nlohmann::json ListTools() const;

    [[nodiscard]] const ToolExecutor& Executor() const noexcept { return executor_; }

private:
    McpReply HandleBatch(const nlohmann::json& batch,
                         const std::optional<std::string>& session_id);
    McpReply HandleInitialize(const nlohmann::json& params,
                              const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);

    const ToolRegistry& builtins_;
    const ExternalToolMap& externals_;
    SessionStore& sessions_;
    ToolExecutor executor_;
    std::string server_name_;
};

} // namespace pulsar_mcp

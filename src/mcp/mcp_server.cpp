#include <pulsar_mcp/mcp/mcp_server.hpp>

#include <pulsar_mcp/core/log.hpp>
#include <pulsar_mcp/core/version.hpp>

#include <algorithm>
#include <atomic>
#include <future>
#include <vector>

namespace pulsar_mcp {

namespace rpc {

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace rpc

McpServer::McpServer(const ToolRegistry& builtins,
                     const ExternalToolMap& externals,
                     SessionStore& sessions,
                     std::string server_name)
    : builtins_(builtins),
      externals_(externals),
      sessions_(sessions),
      executor_(builtins, externals),
      server_name_(std::move(server_name)) {}

McpReply McpServer::HandleBody(const nlohmann::json& body,
                               const std::optional<std::string>& session_id) {
    if (body.is_array()) {
        return HandleBatch(body, session_id);
    }
    return HandleMessage(body, session_id);
}

McpReply McpServer::HandleBatch(const nlohmann::json& batch,
                                const std::optional<std::string>& session_id) {
    if (batch.empty()) {
        return {rpc::MakeError(nullptr, rpc::kInvalidRequest,
                               "Invalid Request: empty batch"),
                std::nullopt};
    }

    // At most kMaxBatchWorkers elements run at once; replies keep input order.
    std::vector<McpReply> replies(batch.size());
    std::atomic<std::size_t> next{0};
    const auto worker_count = std::min(batch.size(), kMaxBatchWorkers);
    {
        std::vector<std::future<void>> workers;
        workers.reserve(worker_count);
        for (std::size_t w = 0; w < worker_count; ++w) {
            workers.push_back(std::async(std::launch::async,
                [this, &batch, &replies, &next, &session_id] {
                    for (auto i = next++; i < batch.size(); i = next++) {
                        replies[i] = HandleMessage(batch[i], session_id);
                    }
                }));
        }
        for (auto& f : workers) {
            f.get();
        }
    }

    McpReply reply;
    auto responses = nlohmann::json::array();
    for (auto& one : replies) {
        if (one.response) {
            responses.push_back(std::move(*one.response));
        }
        if (one.session_id && !reply.session_id) {
            reply.session_id = std::move(one.session_id);
        }
    }
    if (!responses.empty()) {
        reply.response = std::move(responses);
    }
    return reply;
}

McpReply McpServer::HandleMessage(const nlohmann::json& message,
                                  const std::optional<std::string>& session_id) {
    const nlohmann::json id =
        message.is_object() && message.contains("id") ? message["id"] : nullptr;

    // Check for JSON-RPC 2.0.
    if (!message.is_object() || !message.contains("jsonrpc") ||
        message["jsonrpc"] != "2.0" ||
        !message.contains("method") || !message["method"].is_string()) {
        return {rpc::MakeError(id, rpc::kInvalidRequest,
                               "Invalid Request: must be JSON-RPC 2.0"),
                std::nullopt};
    }

    const bool is_notification = !message.contains("id");
    const auto method = message["method"].get<std::string>();
    auto params = message.value("params", nlohmann::json::object());
    if (!params.is_object()) {
        params = nlohmann::json::object();
    }

    LogDebug("mcp", "MCP request: " + method +
                    (is_notification ? "" : " id=" + id.dump()));
    if (session_id && !sessions_.Contains(*session_id)) {
        LogDebug("mcp", "Request carries unknown session id " + *session_id);
    }

    McpReply reply;
    if (method == "initialize") {
        reply = HandleInitialize(params, id);
    } else if (method == "notifications/initialized") {
        return {};
    } else if (method == "tools/list") {
        reply.response = rpc::MakeResult(id, {{"tools", ListTools()}});
    } else if (method == "tools/call") {
        reply.response = HandleToolsCall(params, id);
    } else if (method == "ping") {
        reply.response = rpc::MakeResult(id, nlohmann::json::object());
    } else {
        reply.response = rpc::MakeError(id, rpc::kMethodNotFound,
                                        "Method not found: " + method);
    }

    // Notifications run for their side effects only.
    if (is_notification) {
        reply.response.reset();
    }
    return reply;
}

McpReply McpServer::HandleInitialize(const nlohmann::json& params,
                                     const nlohmann::json& id) {
    std::string requested = kProtocolVersion;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        requested = params["protocolVersion"].get<std::string>();
    }
    auto session_id = sessions_.Create(
        requested, params.value("clientInfo", nlohmann::json()));
    LogDebug("mcp", "MCP session initialized: " + session_id);

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}}
    };
    result["serverInfo"] = {
        {"name", server_name_},
        {"version", kVersion}
    };

    return {rpc::MakeResult(id, result), std::move(session_id)};
}

nlohmann::json McpServer::ListTools() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& info : builtins_.List()) {
        tools.push_back(info.ToJson());
    }
    for (const auto& info : externals_.List()) {
        tools.push_back(info.ToJson());
    }
    return tools;
}

nlohmann::json McpServer::HandleToolsCall(const nlohmann::json& params,
                                          const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string() ||
        params["name"].get<std::string>().empty()) {
        return rpc::MakeError(id, rpc::kInvalidParams,
                              "Invalid params: missing tool name");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }

    auto result = executor_.Execute(tool_name, arguments);

    nlohmann::json text;
    if (result.success) {
        text = result.data.dump(2, ' ', false,
                                nlohmann::json::error_handler_t::replace);
    } else {
        text = result.error.value_or(kToolFailedFallback);
    }

    return rpc::MakeResult(id, {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
        {"isError", !result.success}
    });
}

} // namespace pulsar_mcp

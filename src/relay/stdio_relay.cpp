#include <pulsar_mcp/relay/stdio_relay.hpp>

#include <pulsar_mcp/core/log.hpp>
#include <pulsar_mcp/core/version.hpp>
#include <pulsar_mcp/mcp/mcp_server.hpp>

#include <istream>
#include <ostream>

namespace pulsar_mcp {

namespace {

bool IsBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // anonymous namespace

StdioRelay::StdioRelay(IBridgeClient& client, std::istream& in, std::ostream& out)
    : client_(client), in_(in), out_(out) {}

int StdioRelay::Run() {
    LogInfo("relay", "MCP server started, bridge at " + client_.BaseUrl());

    std::string line;
    while (std::getline(in_, line)) {
        auto response = HandleLine(line);
        if (!response) {
            continue;
        }
        out_ << response->dump(-1, ' ', false,
                               nlohmann::json::error_handler_t::replace)
             << "\n";
        out_.flush();
    }

    LogInfo("relay", "Input closed, shutting down");
    return 0;
}

std::optional<nlohmann::json> StdioRelay::HandleLine(const std::string& line) {
    if (IsBlank(line)) {
        return std::nullopt;
    }
    auto message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        LogWarn("relay", "Unparseable input: " + TruncateForLog(line));
        return rpc::MakeError(nullptr, rpc::kParseError, "Parse error");
    }
    return HandleMessage(message);
}

std::optional<nlohmann::json> StdioRelay::HandleMessage(const nlohmann::json& message) {
    // Notifications get no answer.
    if (!message.is_object() || !message.contains("id")) {
        return std::nullopt;
    }

    const auto& id = message["id"];
    const auto method = message.contains("method") && message["method"].is_string()
                            ? message["method"].get<std::string>()
                            : std::string();
    auto params = message.value("params", nlohmann::json::object());
    if (!params.is_object()) {
        params = nlohmann::json::object();
    }
    LogDebug("relay", "Request: " + method + " id=" + id.dump());

    if (method == "initialize") {
        return rpc::MakeResult(id, {
            {"protocolVersion", kProtocolVersion},
            {"capabilities", {{"tools", nlohmann::json::object()}}},
            {"serverInfo", {{"name", "pulsar"}, {"version", kVersion}}}
        });
    }
    if (method == "tools/list") {
        return HandleToolsList(id);
    }
    if (method == "tools/call") {
        return HandleToolsCall(params, id);
    }
    return rpc::MakeError(id, rpc::kMethodNotFound, "Method not found: " + method);
}

std::string StdioRelay::BridgeUnavailableMessage() const {
    return "Pulsar bridge not available at " + client_.BaseUrl() +
           ". Make sure Pulsar is running with the pulsar-mcp package activated.";
}

nlohmann::json StdioRelay::HandleToolsList(const nlohmann::json& id) {
    auto health = client_.CheckHealth();
    if (health.IsErr()) {
        LogDebug("relay", "Health check failed: " + health.Error().ToString());
        return rpc::MakeError(id, rpc::kInternalError, BridgeUnavailableMessage());
    }

    auto response = client_.FetchTools().Map([&id](const nlohmann::json& tools) {
        return rpc::MakeResult(id, {{"tools", tools}});
    });
    if (response.IsErr()) {
        return rpc::MakeError(id, rpc::kInternalError, response.Error().message);
    }
    return response.Value();
}

nlohmann::json StdioRelay::HandleToolsCall(const nlohmann::json& params,
                                           const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string() ||
        params["name"].get<std::string>().empty()) {
        return rpc::MakeError(id, rpc::kInvalidParams,
                              "Invalid params: missing tool name");
    }
    const auto name = params["name"].get<std::string>();
    auto args = params.value("arguments", nlohmann::json::object());
    if (args.is_null()) {
        args = nlohmann::json::object();
    }

    auto health = client_.CheckHealth();
    if (health.IsErr()) {
        LogDebug("relay", "Health check failed: " + health.Error().ToString());
        return rpc::MakeError(id, rpc::kInternalError, BridgeUnavailableMessage());
    }

    auto called = client_.CallTool(name, args);
    if (called.IsErr()) {
        return rpc::MakeError(id, rpc::kInternalError, called.Error().message);
    }

    const auto& response = called.Value();
    const auto& body = response.body;
    const bool ok = response.status_code >= 200 && response.status_code < 300 &&
                    body.is_object() && body.contains("success") &&
                    body["success"] == true;
    if (!ok) {
        int code = rpc::kInternalError;
        std::string message = "Tool call failed: " + name;
        if (body.is_object()) {
            if (body.contains("code") && body["code"].is_number_integer()) {
                code = body["code"].get<int>();
            }
            if (body.contains("error") && body["error"].is_string() &&
                !body["error"].get<std::string>().empty()) {
                message = body["error"].get<std::string>();
            }
        }
        return rpc::MakeError(id, code, message);
    }

    const auto data = body.value("data", nlohmann::json());
    auto text = data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    return rpc::MakeResult(id, {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}
    });
}

} // namespace pulsar_mcp

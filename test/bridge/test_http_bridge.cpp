#include <catch2/catch_test_macros.hpp>

#include <pulsar_mcp/bridge/http_bridge.hpp>
#include <pulsar_mcp/mcp/mcp_server.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>

using namespace pulsar_mcp;

namespace {

constexpr uint16_t kTestStartPort = 38100;

ToolRegistry MakeRegistry() {
    ToolRegistry registry;
    registry.Register(ToolDefinition{
        {"Echo", "Echo text", nullptr, {{"readOnlyHint", true}}},
        {{"text", validators::String()}},
        [](const nlohmann::json& args) -> nlohmann::json {
            return {{"text", args["text"]}};
        },
        {}});
    registry.Register(ToolDefinition{
        {"Fails", "Returns false", nullptr, nullptr},
        {},
        [](const nlohmann::json&) -> nlohmann::json { return false; },
        {}});
    return registry;
}

// Starts a bridge on a free loopback port and stops it on scope exit.
struct RunningBridge {
    ToolRegistry builtins = MakeRegistry();
    ExternalToolMap externals;
    std::unique_ptr<BridgeHandle> handle;

    RunningBridge() {
        BridgeOptions options;
        options.port = kTestStartPort;
        options.max_port_attempts = 200;
        auto started = StartBridge(options, builtins, externals);
        if (started.IsErr()) {
            throw std::runtime_error(started.Error().ToString());
        }
        handle = std::move(started).Value();
    }

    httplib::Client Client() const {
        httplib::Client client("127.0.0.1", handle->Port());
        client.set_connection_timeout(5);
        client.set_read_timeout(5);
        return client;
    }
};

std::string Rpc(const nlohmann::json& id, const std::string& method,
                const nlohmann::json& params = nlohmann::json::object()) {
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id},
                          {"method", method}, {"params", params}}.dump();
}

} // anonymous namespace

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_CASE("StartBridge: listens on a free port", "[bridge][http]") {
    RunningBridge bridge;
    CHECK(bridge.handle->IsRunning());
    CHECK(bridge.handle->Port() >= kTestStartPort);
    CHECK(bridge.handle->Host() == "127.0.0.1");
    CHECK(bridge.handle->Url() ==
          "http://127.0.0.1:" + std::to_string(bridge.handle->Port()));

    REQUIRE(bridge.handle->Stop().IsOk());
    CHECK_FALSE(bridge.handle->IsRunning());

    auto again = bridge.handle->Stop();
    REQUIRE(again.IsErr());
    CHECK(again.Error().message == "Bridge is not running");
}

TEST_CASE("StartBridge: second bridge takes the next free port", "[bridge][http]") {
    RunningBridge first;
    BridgeOptions options;
    options.port = first.handle->Port();
    options.max_port_attempts = 50;
    auto second = StartBridge(options, first.builtins, first.externals);
    REQUIRE(second.IsOk());
    CHECK(second.Value()->Port() > first.handle->Port());
}

TEST_CASE("StartBridge: exhausted port window is an error", "[bridge][http]") {
    RunningBridge first;
    BridgeOptions options;
    options.port = first.handle->Port();
    options.max_port_attempts = 1;
    auto second = StartBridge(options, first.builtins, first.externals);
    REQUIRE(second.IsErr());
    CHECK(second.Error().category == ErrorCategory::PortExhausted);
    CHECK(first.handle->IsRunning());
}

// ===========================================================================
// REST routes
// ===========================================================================

TEST_CASE("HttpBridge: GET /health", "[bridge][http]") {
    RunningBridge bridge;
    auto client = bridge.Client();
    auto res = client.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(res->get_header_value("Access-Control-Allow-Origin") == "*");
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["status"] == "ok");
    CHECK(body["timestamp"].is_number_integer());
}

TEST_CASE("HttpBridge: GET /tools lists built-ins and externals", "[bridge][http]") {
    RunningBridge bridge;
    auto reg = bridge.externals.Add({std::make_shared<DefinedTool>(ToolDefinition{
        {"Extra", "", nullptr, nullptr}, {},
        [](const nlohmann::json&) -> nlohmann::json { return 1; }, {}})});

    auto client = bridge.Client();
    auto res = client.Get("/tools");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto tools = nlohmann::json::parse(res->body)["tools"];
    REQUIRE(tools.size() == 3);
    CHECK(tools[0]["name"] == "Echo");
    CHECK(tools[2]["name"] == "Extra");
}

TEST_CASE("HttpBridge: POST /tools/<Name>", "[bridge][http]") {
    RunningBridge bridge;
    auto client = bridge.Client();

    SECTION("success is 200 with the envelope") {
        auto res = client.Post("/tools/Echo", R"({"text":"hi"})", "application/json");
        REQUIRE(res);
        CHECK(res->status == 200);
        auto body = nlohmann::json::parse(res->body);
        CHECK(body["success"] == true);
        CHECK(body["data"]["text"] == "hi");
    }

    SECTION("validation failure is 400") {
        auto res = client.Post("/tools/Echo", "{}", "application/json");
        REQUIRE(res);
        CHECK(res->status == 400);
        CHECK(nlohmann::json::parse(res->body)["error"] == "text is required");
    }

    SECTION("false result is 400 with the fallback message") {
        auto res = client.Post("/tools/Fails", "", "application/json");
        REQUIRE(res);
        CHECK(res->status == 400);
        CHECK(nlohmann::json::parse(res->body)["error"] == kToolFailedFallback);
    }

    SECTION("unknown tool is 400") {
        auto res = client.Post("/tools/Missing", "{}", "application/json");
        REQUIRE(res);
        CHECK(res->status == 400);
        CHECK(nlohmann::json::parse(res->body)["error"] == "Unknown tool: Missing");
    }

    SECTION("malformed body is 500") {
        auto res = client.Post("/tools/Echo", "{not json", "application/json");
        REQUIRE(res);
        CHECK(res->status == 500);
        CHECK(nlohmann::json::parse(res->body).contains("error"));
    }

    SECTION("lowercase tool names do not match the route") {
        auto res = client.Post("/tools/echo", "{}", "application/json");
        REQUIRE(res);
        CHECK(res->status == 404);
        CHECK(nlohmann::json::parse(res->body)["error"] == "Not found");
    }
}

TEST_CASE("HttpBridge: unknown route is a JSON 404", "[bridge][http]") {
    RunningBridge bridge;
    auto client = bridge.Client();
    auto res = client.Get("/nowhere");
    REQUIRE(res);
    CHECK(res->status == 404);
    CHECK(nlohmann::json::parse(res->body)["error"] == "Not found");
}

TEST_CASE("HttpBridge: OPTIONS preflight", "[bridge][http]") {
    RunningBridge bridge;
    auto client = bridge.Client();
    auto res = client.Options("/mcp");
    REQUIRE(res);
    CHECK(res->status == 204);
    CHECK(res->get_header_value("Access-Control-Allow-Origin") == "*");
    CHECK(res->get_header_value("Access-Control-Allow-Methods").find("POST") !=
          std::string::npos);
}

// ===========================================================================
// MCP endpoint
// ===========================================================================

TEST_CASE("HttpBridge: POST /mcp initialize sets the session header", "[bridge][http][mcp]") {
    RunningBridge bridge;
    auto client = bridge.Client();
    auto res = client.Post("/mcp", Rpc(1, "initialize"), "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK_FALSE(res->get_header_value(kSessionHeader).empty());
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["result"]["protocolVersion"] == kProtocolVersion);
}

TEST_CASE("HttpBridge: POST /mcp tools/call", "[bridge][http][mcp]") {
    RunningBridge bridge;
    auto client = bridge.Client();
    auto res = client.Post("/mcp",
                           Rpc(2, "tools/call", {{"name", "Echo"},
                                                 {"arguments", {{"text", "x"}}}}),
                           "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["id"] == 2);
    CHECK(body["result"]["isError"] == false);
}

TEST_CASE("HttpBridge: POST /mcp parse error is 400", "[bridge][http][mcp]") {
    RunningBridge bridge;
    auto client = bridge.Client();
    auto res = client.Post("/mcp", "{oops", "application/json");
    REQUIRE(res);
    CHECK(res->status == 400);
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["error"]["code"] == rpc::kParseError);
    CHECK(body["error"]["message"] == "Parse error: invalid JSON");
    CHECK(body["id"].is_null());
}

TEST_CASE("HttpBridge: POST /mcp notification is 202", "[bridge][http][mcp]") {
    RunningBridge bridge;
    auto client = bridge.Client();
    auto res = client.Post("/mcp",
                           R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                           "application/json");
    REQUIRE(res);
    CHECK(res->status == 202);
    CHECK(res->body.empty());
}

TEST_CASE("HttpBridge: POST /mcp batch", "[bridge][http][mcp]") {
    RunningBridge bridge;
    auto client = bridge.Client();
    auto batch = nlohmann::json::array({
        nlohmann::json::parse(Rpc(1, "ping")),
        nlohmann::json::parse(Rpc(2, "tools/list"))
    });
    auto res = client.Post("/mcp", batch.dump(), "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = nlohmann::json::parse(res->body);
    REQUIRE(body.is_array());
    REQUIRE(body.size() == 2);
    CHECK(body[0]["id"] == 1);
    CHECK(body[1]["result"]["tools"].size() == 2);
}

TEST_CASE("HttpBridge: DELETE /mcp is 204", "[bridge][http][mcp]") {
    RunningBridge bridge;
    auto client = bridge.Client();
    auto init = client.Post("/mcp", Rpc(1, "initialize"), "application/json");
    REQUIRE(init);
    auto session = init->get_header_value(kSessionHeader);

    httplib::Headers headers = {{kSessionHeader, session}};
    auto res = client.Delete("/mcp", headers);
    REQUIRE(res);
    CHECK(res->status == 204);

    auto unknown = client.Delete("/mcp");
    REQUIRE(unknown);
    CHECK(unknown->status == 204);
}

#include <pulsar_mcp/relay/bridge_client.hpp>

#include <pulsar_mcp/core/log.hpp>

#include <httplib.h>

namespace pulsar_mcp {

namespace {

Error MakeTransportError(const std::string& operation,
                         const std::string& endpoint,
                         httplib::Error error) {
    return Error{operation, endpoint, std::nullopt,
                 "HTTP request failed: " + httplib::to_string(error),
                 ErrorCategory::Connection};
}

bool IsSuccess(int status) { return status >= 200 && status < 300; }

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct HttpBridgeClient::Impl {
    std::string base_url;
    httplib::Client client;

    explicit Impl(std::string url) : base_url(std::move(url)), client(base_url) {}
};

HttpBridgeClient::HttpBridgeClient(std::string host, uint16_t port)
    : impl_(std::make_unique<Impl>("http://" + host + ":" + std::to_string(port))) {}

HttpBridgeClient::~HttpBridgeClient() = default;

std::string HttpBridgeClient::BaseUrl() const { return impl_->base_url; }

Result<void, Error> HttpBridgeClient::CheckHealth() {
    auto res = impl_->client.Get("/health");
    if (!res) {
        return Result<void, Error>::Err(
            MakeTransportError("CheckHealth", "/health", res.error()));
    }
    if (!IsSuccess(res->status)) {
        return Result<void, Error>::Err(
            Error::FromHttpStatus("CheckHealth", "/health", res->status, res->body));
    }
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> HttpBridgeClient::FetchTools() {
    auto res = impl_->client.Get("/tools");
    if (!res) {
        return Result<nlohmann::json, Error>::Err(
            MakeTransportError("FetchTools", "/tools", res.error()));
    }
    if (!IsSuccess(res->status)) {
        return Result<nlohmann::json, Error>::Err(Error{
            "FetchTools", "/tools", res->status,
            "Failed to fetch tools from bridge", ErrorCategory::Protocol});
    }

    auto body = nlohmann::json::parse(res->body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Result<nlohmann::json, Error>::Err(Error{
            "FetchTools", "/tools", res->status,
            "Bridge returned invalid JSON", ErrorCategory::Protocol});
    }
    auto tools = body.value("tools", nlohmann::json::array());
    return Result<nlohmann::json, Error>::Ok(std::move(tools));
}

Result<BridgeToolResponse, Error> HttpBridgeClient::CallTool(
    const std::string& name, const nlohmann::json& args) {
    const auto path = "/tools/" + name;
    LogDebug("relay", "POST " + path + " " + TruncateForLog(args.dump()));

    auto res = impl_->client.Post(path, args.dump(), "application/json");
    if (!res) {
        return Result<BridgeToolResponse, Error>::Err(
            MakeTransportError("CallTool", path, res.error()));
    }

    BridgeToolResponse out;
    out.status_code = res->status;
    auto body = nlohmann::json::parse(res->body, nullptr, false);
    if (!body.is_discarded()) {
        out.body = std::move(body);
    }
    return Result<BridgeToolResponse, Error>::Ok(std::move(out));
}

} // namespace pulsar_mcp

#pragma once

#include <pulsar_mcp/core/result.hpp>

#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace pulsar_mcp {

// ---------------------------------------------------------------------------
// BridgeToolResponse — raw answer of POST /tools/<name>.
// body is null when the bridge did not answer with JSON.
// ---------------------------------------------------------------------------
struct BridgeToolResponse {
    int status_code = 0;
    nlohmann::json body;
};

// ---------------------------------------------------------------------------
// IBridgeClient — what the stdio relay needs from the HTTP bridge.
//
// Transport failures are returned as Err; HTTP-level failures of a tool call
// are returned as Ok with the status so the relay can read the envelope.
// ---------------------------------------------------------------------------
class IBridgeClient {
public:
    virtual ~IBridgeClient() = default;

    IBridgeClient(const IBridgeClient&) = delete;
    IBridgeClient& operator=(const IBridgeClient&) = delete;

    /// http://host:port, used in diagnostics.
    [[nodiscard]] virtual std::string BaseUrl() const = 0;

    /// GET /health; Ok only for a 2xx answer.
    [[nodiscard]] virtual Result<void, Error> CheckHealth() = 0;

    /// GET /tools; the "tools" array, or [] when the key is missing.
    [[nodiscard]] virtual Result<nlohmann::json, Error> FetchTools() = 0;

    /// POST /tools/<name> with args as the JSON body.
    [[nodiscard]] virtual Result<BridgeToolResponse, Error> CallTool(
        const std::string& name, const nlohmann::json& args) = 0;

protected:
    IBridgeClient() = default;
};

// ---------------------------------------------------------------------------
// HttpBridgeClient — IBridgeClient over cpp-httplib.
// ---------------------------------------------------------------------------
class HttpBridgeClient : public IBridgeClient {
public:
    HttpBridgeClient(std::string host, uint16_t port);
    ~HttpBridgeClient() override;

    [[nodiscard]] std::string BaseUrl() const override;
    [[nodiscard]] Result<void, Error> CheckHealth() override;
    [[nodiscard]] Result<nlohmann::json, Error> FetchTools() override;
    [[nodiscard]] Result<BridgeToolResponse, Error> CallTool(
        const std::string& name, const nlohmann::json& args) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pulsar_mcp

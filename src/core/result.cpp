#include <pulsar_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

namespace pulsar_mcp {

namespace {

// The bridge reports failures as {"success":false,"error":"..."} or
// {"error":"..."}; anything else yields nullopt.
std::optional<std::string> ExtractBridgeError(const std::string& body) {
    if (body.empty()) return std::nullopt;
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
    auto it = parsed.find("error");
    if (it == parsed.end() || !it->is_string()) return std::nullopt;
    auto msg = it->get<std::string>();
    if (msg.empty()) return std::nullopt;
    return msg;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto bridge_error = ExtractBridgeError(response_body);

    ErrorCategory category = ErrorCategory::Internal;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Internal;
            message = bridge_error.value_or("Bad request");
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = bridge_error.value_or("Not found");
            break;
        case 500:
            category = ErrorCategory::Internal;
            message = bridge_error.has_value()
                ? *bridge_error
                : "Bridge internal error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "Bridge unavailable";
            break;
        default:
            category = ErrorCategory::Protocol;
            message = bridge_error.value_or(
                "Unexpected HTTP " + std::to_string(status_code));
            break;
    }

    return Error{operation, endpoint, status_code, message, category};
}

} // namespace pulsar_mcp

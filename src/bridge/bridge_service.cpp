#include <pulsar_mcp/bridge/bridge_service.hpp>

#include <pulsar_mcp/core/log.hpp>

namespace pulsar_mcp {

BridgeService::BridgeService(BridgeOptions options, const ToolRegistry& builtins)
    : options_(std::move(options)), builtins_(builtins) {}

BridgeService::~BridgeService() {
    std::lock_guard<std::mutex> lock(mutex_);
    handle_.reset();
}

Result<void, Error> BridgeService::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_) {
        return Result<void, Error>::Err(Error{
            "Start", handle_->Url(), std::nullopt,
            "MCP bridge is already running", ErrorCategory::Internal});
    }

    auto started = StartBridge(options_, builtins_, externals_);
    if (started.IsErr()) {
        LogError("service", "Failed to start MCP bridge: " + started.Error().ToString());
        return Result<void, Error>::Err(std::move(started).Error());
    }
    handle_ = std::move(started).Value();
    return Result<void, Error>::Ok();
}

Result<void, Error> BridgeService::Stop() {
    std::unique_ptr<BridgeHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!handle_) {
            return Result<void, Error>::Err(Error{
                "Stop", "", std::nullopt, "MCP bridge is not running",
                ErrorCategory::Internal});
        }
        handle = std::move(handle_);
    }
    return handle->Stop();
}

std::string BridgeService::Status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
        return "MCP bridge is not running";
    }
    return "MCP bridge is running\nPort: " + std::to_string(handle_->Port()) +
           "\nHost: " + handle_->Host() + "\nURL: " + handle_->Url();
}

std::optional<uint16_t> BridgeService::BridgePort() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) return std::nullopt;
    return handle_->Port();
}

bool BridgeService::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ != nullptr;
}

ToolRegistration BridgeService::ConsumeTools(
    const std::vector<std::shared_ptr<const ITool>>& tools) {
    return externals_.Add(tools);
}

} // namespace pulsar_mcp

#include <pulsar_mcp/mcp/tool_executor.hpp>

#include <pulsar_mcp/core/log.hpp>

#include <chrono>
#include <cstdio>

namespace pulsar_mcp {

namespace {

// false and null signal failure; 0, "", {} and [] do not.
bool IsFailureSentinel(const nlohmann::json& raw) {
    return raw.is_null() || (raw.is_boolean() && !raw.get<bool>());
}

std::string FormatMs(std::chrono::steady_clock::duration elapsed) {
    const double ms =
        std::chrono::duration<double, std::milli>(elapsed).count();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", ms);
    return buf;
}

const nlohmann::json& ArgOrNull(const nlohmann::json& args, const std::string& name) {
    static const nlohmann::json kNull;
    if (!args.is_object()) return kNull;
    auto it = args.find(name);
    return it == args.end() ? kNull : *it;
}

} // anonymous namespace

nlohmann::json ToolCallResult::ToJson() const {
    if (success) {
        return {{"success", true}, {"data", data}};
    }
    return {{"success", false}, {"error", error.value_or(kToolFailedFallback)}};
}

ToolCallResult RunTool(const ITool& tool, const nlohmann::json& args) {
    for (const auto& [arg_name, validator] : tool.Validators()) {
        if (auto message = validator(ArgOrNull(args, arg_name), arg_name)) {
            return ToolCallResult::Fail(std::move(*message));
        }
    }

    try {
        auto raw = tool.Invoke(args);
        if (IsFailureSentinel(raw)) {
            return ToolCallResult::Fail(std::nullopt);
        }
        return ToolCallResult::Ok(tool.Format(raw, args));
    } catch (const std::exception& e) {
        return ToolCallResult::Fail(std::string(e.what()));
    } catch (...) {
        return ToolCallResult::Fail(std::string("Unknown error"));
    }
}

ToolExecutor::ToolExecutor(const ToolRegistry& builtins,
                           const ExternalToolMap& externals)
    : builtins_(builtins), externals_(externals) {}

ToolCallResult ToolExecutor::Execute(const std::string& name,
                                     const nlohmann::json& args) const {
    LogDebug("executor", "Executing tool: " + name + " " +
                         TruncateForLog(args.dump()));
    const auto start = std::chrono::steady_clock::now();

    ToolCallResult result;
    if (auto tool = builtins_.Lookup(name)) {
        result = RunTool(*tool, args);
    } else if (auto external = externals_.Lookup(name)) {
        result = RunTool(*external, args);
    } else {
        result = ToolCallResult::Fail("Unknown tool: " + name);
    }

    const auto duration = FormatMs(std::chrono::steady_clock::now() - start);
    if (result.success) {
        LogDebug("executor", "Tool " + name + " completed in " + duration +
                             "ms " + TruncateForLog(result.data.dump(
                                 -1, ' ', false,
                                 nlohmann::json::error_handler_t::replace)));
    } else {
        LogDebug("executor", "Tool " + name + " failed in " + duration + "ms " +
                             TruncateForLog(result.error.value_or(kToolFailedFallback)));
    }
    return result;
}

} // namespace pulsar_mcp

#pragma once

#include <pulsar_mcp/mcp/external_tools.hpp>
#include <pulsar_mcp/mcp/tool_registry.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace pulsar_mcp {

/// Text used when a tool fails without a message of its own (false/null result).
inline constexpr const char* kToolFailedFallback = "Tool execution failed";

// ---------------------------------------------------------------------------
// ToolCallResult — the normalized envelope every execution path produces.
//
// data is meaningful only when success is true. error is set for thrown,
// validation and unknown-tool failures; a false/null result leaves it empty.
// ---------------------------------------------------------------------------
struct ToolCallResult {
    bool success = false;
    nlohmann::json data;
    std::optional<std::string> error;

    static ToolCallResult Ok(nlohmann::json data) {
        return {true, std::move(data), std::nullopt};
    }
    static ToolCallResult Fail(std::optional<std::string> error) {
        return {false, nullptr, std::move(error)};
    }

    /// {success:true,data} or {success:false,error} (error falls back to
    /// kToolFailedFallback so the key is always present on failure).
    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolExecutor — resolves a tool by name and runs it.
//
// Built-ins are consulted first; the external map only on a miss.
// ---------------------------------------------------------------------------
class ToolExecutor {
public:
    ToolExecutor(const ToolRegistry& builtins, const ExternalToolMap& externals);

    [[nodiscard]] ToolCallResult Execute(const std::string& name,
                                         const nlohmann::json& args) const;

private:
    const ToolRegistry& builtins_;
    const ExternalToolMap& externals_;
};

/// Run one tool: validators, procedure, sentinel check, formatter.
/// Never throws for failures inside the tool; a non-std exception becomes
/// "Unknown error".
ToolCallResult RunTool(const ITool& tool, const nlohmann::json& args);

} // namespace pulsar_mcp

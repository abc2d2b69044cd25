#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace pulsar_mcp {

// ---------------------------------------------------------------------------
// ToolInfo — public metadata of a tool as advertised by tools/list.
// ---------------------------------------------------------------------------
struct ToolInfo {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object; null means "none given"
    nlohmann::json annotations;   // e.g. {"readOnlyHint": true}; null if absent

    /// {name, description, inputSchema[, annotations]} with the empty-object
    /// schema substituted when input_schema is null.
    [[nodiscard]] nlohmann::json ToJson() const;
};

/// {"type":"object","properties":{},"required":[]}
nlohmann::json EmptyInputSchema();

// ---------------------------------------------------------------------------
// Argument validators.
//
// A validator receives the argument value (null when absent) and the
// argument name, and returns an error message or nullopt when valid.
// ---------------------------------------------------------------------------
using ArgValidator = std::function<std::optional<std::string>(
    const nlohmann::json& value, const std::string& name)>;

// Ordered: the executor checks them in declaration order.
using ArgValidators = std::vector<std::pair<std::string, ArgValidator>>;

namespace validators {

ArgValidator String();    // non-empty string        -> "<name> is required"
ArgValidator AnyString(); // any string, even empty  -> "<name> is required"
ArgValidator Number();    // any JSON number         -> "<name> is required"
ArgValidator Array();     // non-empty array         -> "<name> array is required"
ArgValidator Enum(std::vector<std::string> allowed);  // -> "<name> must be one of: a, b"
ArgValidator Optional();  // always valid

} // namespace validators

// ---------------------------------------------------------------------------
// ITool — an executable tool, built-in or contributed at runtime.
//
// Invoke() may throw; the executor turns exceptions into failure envelopes.
// A raw result of JSON false or null is a non-exceptional failure.
// ---------------------------------------------------------------------------
class ITool {
public:
    virtual ~ITool() = default;

    [[nodiscard]] virtual const ToolInfo& Info() const = 0;

    [[nodiscard]] virtual const ArgValidators& Validators() const;

    virtual nlohmann::json Invoke(const nlohmann::json& args) const = 0;

    /// Shape a successful raw result into the envelope's data. Identity by default.
    [[nodiscard]] virtual nlohmann::json Format(const nlohmann::json& raw,
                                                const nlohmann::json& args) const;

protected:
    ITool() = default;
};

// ---------------------------------------------------------------------------
// ToolDefinition — declarative description of a tool.
// ---------------------------------------------------------------------------
using ToolProcedure = std::function<nlohmann::json(const nlohmann::json& args)>;
using ToolFormatter = std::function<nlohmann::json(const nlohmann::json& raw,
                                                   const nlohmann::json& args)>;

struct ToolDefinition {
    ToolInfo info;
    ArgValidators validate;
    ToolProcedure execute;
    ToolFormatter format;  // empty means identity
};

// ITool backed by a ToolDefinition.
class DefinedTool : public ITool {
public:
    explicit DefinedTool(ToolDefinition definition);

    [[nodiscard]] const ToolInfo& Info() const override { return definition_.info; }
    [[nodiscard]] const ArgValidators& Validators() const override {
        return definition_.validate;
    }
    nlohmann::json Invoke(const nlohmann::json& args) const override;
    [[nodiscard]] nlohmann::json Format(const nlohmann::json& raw,
                                        const nlohmann::json& args) const override;

private:
    ToolDefinition definition_;
};

} // namespace pulsar_mcp

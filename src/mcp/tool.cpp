#include <pulsar_mcp/mcp/tool.hpp>

#include <algorithm>
#include <stdexcept>

namespace pulsar_mcp {

nlohmann::json EmptyInputSchema() {
    return {{"type", "object"},
            {"properties", nlohmann::json::object()},
            {"required", nlohmann::json::array()}};
}

nlohmann::json ToolInfo::ToJson() const {
    nlohmann::json out = {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema.is_null() ? EmptyInputSchema() : input_schema},
    };
    if (!annotations.is_null()) {
        out["annotations"] = annotations;
    }
    return out;
}

namespace validators {

ArgValidator String() {
    return [](const nlohmann::json& value,
              const std::string& name) -> std::optional<std::string> {
        if (value.is_string() && !value.get_ref<const std::string&>().empty()) {
            return std::nullopt;
        }
        return name + " is required";
    };
}

ArgValidator AnyString() {
    return [](const nlohmann::json& value,
              const std::string& name) -> std::optional<std::string> {
        if (value.is_string()) return std::nullopt;
        return name + " is required";
    };
}

ArgValidator Number() {
    return [](const nlohmann::json& value,
              const std::string& name) -> std::optional<std::string> {
        if (value.is_number()) return std::nullopt;
        return name + " is required";
    };
}

ArgValidator Array() {
    return [](const nlohmann::json& value,
              const std::string& name) -> std::optional<std::string> {
        if (value.is_array() && !value.empty()) return std::nullopt;
        return name + " array is required";
    };
}

ArgValidator Enum(std::vector<std::string> allowed) {
    return [allowed = std::move(allowed)](
               const nlohmann::json& value,
               const std::string& name) -> std::optional<std::string> {
        if (value.is_string() &&
            std::find(allowed.begin(), allowed.end(),
                      value.get<std::string>()) != allowed.end()) {
            return std::nullopt;
        }
        std::string joined;
        for (const auto& a : allowed) {
            if (!joined.empty()) joined += ", ";
            joined += a;
        }
        return name + " must be one of: " + joined;
    };
}

ArgValidator Optional() {
    return [](const nlohmann::json&,
              const std::string&) -> std::optional<std::string> {
        return std::nullopt;
    };
}

} // namespace validators

const ArgValidators& ITool::Validators() const {
    static const ArgValidators kNone;
    return kNone;
}

nlohmann::json ITool::Format(const nlohmann::json& raw,
                             const nlohmann::json& /*args*/) const {
    return raw;
}

DefinedTool::DefinedTool(ToolDefinition definition)
    : definition_(std::move(definition)) {
    if (!definition_.execute) {
        throw std::invalid_argument("Tool '" + definition_.info.name +
                                    "' has no execute procedure");
    }
}

nlohmann::json DefinedTool::Invoke(const nlohmann::json& args) const {
    return definition_.execute(args);
}

nlohmann::json DefinedTool::Format(const nlohmann::json& raw,
                                   const nlohmann::json& args) const {
    if (!definition_.format) {
        return raw;
    }
    return definition_.format(raw, args);
}

} // namespace pulsar_mcp

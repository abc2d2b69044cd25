#include <pulsar_mcp/mcp/tool_registry.hpp>

#include <stdexcept>

namespace pulsar_mcp {

void ToolRegistry::Register(ToolDefinition definition) {
    Register(std::make_shared<DefinedTool>(std::move(definition)));
}

void ToolRegistry::Register(std::shared_ptr<const ITool> tool) {
    if (!tool || tool->Info().name.empty()) {
        throw std::invalid_argument("ToolRegistry: tool must have a name");
    }
    const auto& name = tool->Info().name;
    if (tools_.count(name) == 0) {
        order_.push_back(name);
    }
    tools_[name] = std::move(tool);
}

std::shared_ptr<const ITool> ToolRegistry::Lookup(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : it->second;
}

std::vector<ToolInfo> ToolRegistry::List() const {
    std::vector<ToolInfo> infos;
    infos.reserve(order_.size());
    for (const auto& name : order_) {
        infos.push_back(tools_.at(name)->Info());
    }
    return infos;
}

} // namespace pulsar_mcp

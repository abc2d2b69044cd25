#pragma once

#include <pulsar_mcp/mcp/tool.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pulsar_mcp {

// ---------------------------------------------------------------------------
// ToolRegistry — the built-in tool set.
//
// Filled once at startup and read-only afterwards, so lookups need no lock.
// List() preserves registration order; re-registering a name replaces the
// tool in place.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(ToolDefinition definition);
    void Register(std::shared_ptr<const ITool> tool);

    /// nullptr when no tool has that name.
    [[nodiscard]] std::shared_ptr<const ITool> Lookup(const std::string& name) const;

    [[nodiscard]] std::vector<ToolInfo> List() const;

    [[nodiscard]] std::size_t Size() const noexcept { return order_.size(); }

private:
    std::vector<std::string> order_;
    std::map<std::string, std::shared_ptr<const ITool>> tools_;
};

} // namespace pulsar_mcp

#pragma once

#include <pulsar_mcp/editor/i_editor_host.hpp>
#include <pulsar_mcp/mcp/tool_registry.hpp>

namespace pulsar_mcp {

// Register the built-in editor tools with the registry.
// Each tool captures &host by reference; host must outlive the registry.
void RegisterEditorTools(ToolRegistry& registry, IEditorHost& host);

} // namespace pulsar_mcp

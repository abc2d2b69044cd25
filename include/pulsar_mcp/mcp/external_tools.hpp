#pragma once

#include <pulsar_mcp/mcp/tool.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pulsar_mcp {

class ExternalToolMap;

// ---------------------------------------------------------------------------
// ToolRegistration — disposal handle for one batch of external tools.
//
// Dispose() (or destruction) removes exactly the names the batch added.
// Safe to outlive the ExternalToolMap it came from.
// ---------------------------------------------------------------------------
class ToolRegistration {
public:
    ToolRegistration() = default;
    ~ToolRegistration();

    ToolRegistration(const ToolRegistration&) = delete;
    ToolRegistration& operator=(const ToolRegistration&) = delete;
    ToolRegistration(ToolRegistration&& other) noexcept;
    ToolRegistration& operator=(ToolRegistration&& other) noexcept;

    void Dispose();

    [[nodiscard]] const std::vector<std::string>& Names() const noexcept {
        return names_;
    }

private:
    friend class ExternalToolMap;
    struct State;

    ToolRegistration(std::weak_ptr<State> state, std::vector<std::string> names);

    std::weak_ptr<State> state_;
    std::vector<std::string> names_;
};

// ---------------------------------------------------------------------------
// ExternalToolMap — tools contributed by collaborators at runtime.
//
// Thread-safe: the HTTP worker pool reads it while the host adds and removes
// tools. The lock is never held while a tool runs.
// ---------------------------------------------------------------------------
class ExternalToolMap {
public:
    ExternalToolMap();

    /// Register a batch. Entries that are null or unnamed are skipped with an
    /// error log. An existing name is replaced.
    [[nodiscard]] ToolRegistration Add(
        const std::vector<std::shared_ptr<const ITool>>& tools);

    /// nullptr when no external tool has that name.
    [[nodiscard]] std::shared_ptr<const ITool> Lookup(const std::string& name) const;

    /// Metadata in insertion order.
    [[nodiscard]] std::vector<ToolInfo> List() const;

    [[nodiscard]] std::size_t Size() const;

private:
    std::shared_ptr<ToolRegistration::State> state_;
};

} // namespace pulsar_mcp

#include <pulsar_mcp/mcp/external_tools.hpp>

#include <pulsar_mcp/core/log.hpp>

#include <algorithm>

namespace pulsar_mcp {

struct ToolRegistration::State {
    mutable std::mutex mutex;
    std::vector<std::shared_ptr<const ITool>> tools;  // insertion order

    // Caller holds mutex.
    std::vector<std::shared_ptr<const ITool>>::iterator Find(const std::string& name) {
        return std::find_if(tools.begin(), tools.end(),
            [&](const auto& t) { return t->Info().name == name; });
    }

    void RemoveNames(const std::vector<std::string>& names) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& name : names) {
            auto it = Find(name);
            if (it != tools.end()) {
                tools.erase(it);
            }
        }
    }
};

namespace {

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out.empty() ? "(none)" : out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ToolRegistration
// ---------------------------------------------------------------------------
ToolRegistration::ToolRegistration(std::weak_ptr<State> state,
                                   std::vector<std::string> names)
    : state_(std::move(state)), names_(std::move(names)) {}

ToolRegistration::~ToolRegistration() {
    Dispose();
}

ToolRegistration::ToolRegistration(ToolRegistration&& other) noexcept
    : state_(std::move(other.state_)), names_(std::move(other.names_)) {
    other.state_.reset();
    other.names_.clear();
}

ToolRegistration& ToolRegistration::operator=(ToolRegistration&& other) noexcept {
    if (this != &other) {
        Dispose();
        state_ = std::move(other.state_);
        names_ = std::move(other.names_);
        other.state_.reset();
        other.names_.clear();
    }
    return *this;
}

void ToolRegistration::Dispose() {
    auto state = state_.lock();
    state_.reset();
    if (!state || names_.empty()) {
        return;
    }
    state->RemoveNames(names_);
    LogDebug("tools", "Unregistered external MCP tools: " + JoinNames(names_));
    names_.clear();
}

// ---------------------------------------------------------------------------
// ExternalToolMap
// ---------------------------------------------------------------------------
ExternalToolMap::ExternalToolMap()
    : state_(std::make_shared<ToolRegistration::State>()) {}

ToolRegistration ExternalToolMap::Add(
    const std::vector<std::shared_ptr<const ITool>>& tools) {
    std::vector<std::string> registered;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        for (const auto& tool : tools) {
            if (!tool || tool->Info().name.empty()) {
                LogError("tools", "Invalid tool definition: must have name and execute");
                continue;
            }
            const auto& name = tool->Info().name;
            auto it = state_->Find(name);
            if (it != state_->tools.end()) {
                *it = tool;
            } else {
                state_->tools.push_back(tool);
            }
            registered.push_back(name);
        }
    }
    LogDebug("tools", "Registered " + std::to_string(registered.size()) +
                      " external MCP tools: " + JoinNames(registered));
    return ToolRegistration(state_, std::move(registered));
}

std::shared_ptr<const ITool> ExternalToolMap::Lookup(const std::string& name) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->Find(name);
    return it == state_->tools.end() ? nullptr : *it;
}

std::vector<ToolInfo> ExternalToolMap::List() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<ToolInfo> infos;
    infos.reserve(state_->tools.size());
    for (const auto& tool : state_->tools) {
        infos.push_back(tool->Info());
    }
    return infos;
}

std::size_t ExternalToolMap::Size() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->tools.size();
}

} // namespace pulsar_mcp

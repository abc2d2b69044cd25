#include <pulsar_mcp/editor/workspace.hpp>

#include <pulsar_mcp/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace pulsar_mcp {

std::string GrammarForPath(const std::string& path) {
    static const std::map<std::string, std::string> kGrammars = {
        {".c", "C"},
        {".h", "C++"},
        {".cc", "C++"},
        {".cpp", "C++"},
        {".cxx", "C++"},
        {".hpp", "C++"},
        {".cmake", "CMake"},
        {".css", "CSS"},
        {".go", "Go"},
        {".html", "HTML"},
        {".java", "Java"},
        {".js", "JavaScript"},
        {".json", "JSON"},
        {".md", "GitHub Markdown"},
        {".py", "Python"},
        {".rb", "Ruby"},
        {".rs", "Rust"},
        {".sh", "Shell Script"},
        {".ts", "TypeScript"},
        {".xml", "XML"},
        {".yaml", "YAML"},
        {".yml", "YAML"},
    };

    const fs::path p(path);
    if (p.filename() == "CMakeLists.txt") return "CMake";
    auto ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kGrammars.find(ext);
    return it == kGrammars.end() ? "Plain Text" : it->second;
}

// ---------------------------------------------------------------------------
// Path and buffer helpers
// ---------------------------------------------------------------------------

std::string Workspace::ResolvePath(const std::string& path) const {
    fs::path p(path);
    if (p.is_relative()) {
        p = project_paths_.empty() ? fs::current_path() / p
                                   : fs::path(project_paths_.front()) / p;
    }
    return p.lexically_normal().string();
}

Workspace::Buffer* Workspace::FindBuffer(const std::optional<std::string>& path) {
    if (!path) {
        return ActiveBuffer();
    }
    const auto resolved = ResolvePath(*path);
    auto it = std::find_if(buffers_.begin(), buffers_.end(),
        [&](const Buffer& b) { return b.path == resolved; });
    return it == buffers_.end() ? nullptr : &*it;
}

Workspace::Buffer* Workspace::ActiveBuffer() {
    return active_ ? &buffers_[*active_] : nullptr;
}

const Workspace::Buffer* Workspace::ActiveBuffer() const {
    return active_ ? &buffers_[*active_] : nullptr;
}

void Workspace::WriteBuffer(Buffer& buffer) {
    const fs::path p(buffer.path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
    }
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Could not write file: " + buffer.path);
    }
    out << buffer.text;
    out.flush();
    if (!out) {
        throw std::runtime_error("Could not write file: " + buffer.path);
    }
    buffer.modified = false;
    LogDebug("workspace", "Saved " + buffer.path);
}

// ---------------------------------------------------------------------------
// Active editor
// ---------------------------------------------------------------------------

std::optional<EditorSnapshot> Workspace::ActiveEditor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* buffer = ActiveBuffer();
    if (!buffer) return std::nullopt;

    EditorSnapshot snap;
    snap.path = buffer->path;
    snap.cursor = buffer->selections.front().end;
    snap.grammar = GrammarForPath(buffer->path);
    snap.modified = buffer->modified;
    snap.text = buffer->text;
    return snap;
}

std::optional<std::vector<SelectionSnapshot>> Workspace::Selections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* buffer = ActiveBuffer();
    if (!buffer) return std::nullopt;

    std::vector<SelectionSnapshot> out;
    out.reserve(buffer->selections.size());
    for (const auto& range : buffer->selections) {
        out.push_back({TextInRange(buffer->text, range), range});
    }
    return out;
}

bool Workspace::SetSelections(const std::vector<Range>& ranges) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* buffer = ActiveBuffer();
    if (!buffer || ranges.empty()) return false;

    std::vector<Range> clamped;
    clamped.reserve(ranges.size());
    for (const auto& r : ranges) {
        auto n = r.Normalized();
        clamped.push_back({ClampPosition(buffer->text, n.start),
                           ClampPosition(buffer->text, n.end)});
    }
    buffer->selections = std::move(clamped);
    return true;
}

std::optional<InsertOutcome> Workspace::InsertText(
    const std::string& text, const std::optional<Range>& range) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* buffer = ActiveBuffer();
    if (!buffer) return std::nullopt;

    InsertOutcome outcome;
    outcome.path = buffer->path;

    if (range) {
        const auto r = range->Normalized();
        const auto begin = OffsetOf(buffer->text, r.start);
        const auto end = std::max(begin, OffsetOf(buffer->text, r.end));
        outcome.old_text = buffer->text.substr(begin, end - begin);
        buffer->text.replace(begin, end - begin, text);
        const auto cursor = PositionAt(buffer->text, begin + text.size());
        buffer->selections = {Range{cursor, cursor}};
        buffer->modified = true;
        return outcome;
    }

    // Replace every selection, last first so earlier offsets stay valid.
    std::vector<std::pair<std::size_t, std::size_t>> spans;
    for (const auto& sel : buffer->selections) {
        const auto r = sel.Normalized();
        spans.emplace_back(OffsetOf(buffer->text, r.start),
                           OffsetOf(buffer->text, r.end));
    }
    std::vector<std::size_t> order(spans.size());
    for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return spans[a].first > spans[b].first;
    });

    std::vector<std::size_t> cursors(spans.size());
    for (std::size_t k = 0; k < order.size(); ++k) {
        const auto i = order[k];
        const auto [begin, end] = spans[i];
        buffer->text.replace(begin, end - begin, text);
        const auto delta = static_cast<std::ptrdiff_t>(text.size()) -
                           static_cast<std::ptrdiff_t>(end - begin);
        for (std::size_t j = 0; j < k; ++j) {
            cursors[order[j]] = static_cast<std::size_t>(
                static_cast<std::ptrdiff_t>(cursors[order[j]]) + delta);
        }
        cursors[i] = begin + text.size();
    }

    std::vector<Range> updated;
    updated.reserve(cursors.size());
    for (auto offset : cursors) {
        const auto pos = PositionAt(buffer->text, offset);
        updated.push_back({pos, pos});
    }
    buffer->selections = std::move(updated);
    buffer->modified = true;
    return outcome;
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

void Workspace::OpenFile(const std::string& path,
                         const std::optional<Position>& cursor) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto resolved = ResolvePath(path);

    auto it = std::find_if(buffers_.begin(), buffers_.end(),
        [&](const Buffer& b) { return b.path == resolved; });
    if (it == buffers_.end()) {
        Buffer buffer;
        buffer.path = resolved;
        std::error_code ec;
        if (fs::is_directory(resolved, ec)) {
            throw std::runtime_error("Cannot open a directory: " + resolved);
        }
        if (fs::exists(resolved, ec)) {
            std::ifstream in(resolved, std::ios::binary);
            if (!in) {
                throw std::runtime_error("Could not read file: " + resolved);
            }
            std::ostringstream ss;
            ss << in.rdbuf();
            buffer.text = ss.str();
            LogDebug("workspace", "Opened " + resolved);
        } else {
            LogDebug("workspace", "Opened new file " + resolved);
        }
        buffer.selections = {Range{}};
        buffers_.push_back(std::move(buffer));
        it = std::prev(buffers_.end());
    }
    active_ = static_cast<std::size_t>(std::distance(buffers_.begin(), it));

    if (cursor) {
        const auto pos = ClampPosition(it->text, *cursor);
        it->selections = {Range{pos, pos}};
    }
}

bool Workspace::SaveFile(const std::optional<std::string>& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* buffer = FindBuffer(path);
    if (!buffer) return false;
    WriteBuffer(*buffer);
    return true;
}

bool Workspace::CloseFile(const std::optional<std::string>& path, bool save) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* buffer = FindBuffer(path);
    if (!buffer) return false;

    if (save && buffer->modified) {
        WriteBuffer(*buffer);
    }

    const auto index = static_cast<std::size_t>(buffer - buffers_.data());
    LogDebug("workspace", "Closed " + buffer->path);
    buffers_.erase(buffers_.begin() + static_cast<std::ptrdiff_t>(index));

    if (buffers_.empty()) {
        active_.reset();
    } else if (active_ && *active_ == index) {
        active_ = buffers_.size() - 1;
    } else if (active_ && *active_ > index) {
        active_ = *active_ - 1;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Project
// ---------------------------------------------------------------------------

std::vector<std::string> Workspace::ProjectPaths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return project_paths_;
}

bool Workspace::AddProjectPath(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::is_directory(path, ec)) {
        return false;
    }
    auto absolute = fs::absolute(path, ec);
    if (ec) return false;
    auto normalized = absolute.lexically_normal().string();
    if (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(project_paths_.begin(), project_paths_.end(), normalized) ==
        project_paths_.end()) {
        project_paths_.push_back(normalized);
        LogDebug("workspace", "Added project path " + normalized);
    }
    return true;
}

std::size_t Workspace::OpenBufferCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffers_.size();
}

} // namespace pulsar_mcp

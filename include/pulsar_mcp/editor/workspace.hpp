#pragma once

#include <pulsar_mcp/editor/i_editor_host.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pulsar_mcp {

/// Grammar display name for a file path, "Plain Text" when unknown.
std::string GrammarForPath(const std::string& path);

// ---------------------------------------------------------------------------
// Workspace — IEditorHost over the local filesystem.
//
// Keeps open buffers as whole text in memory with one active buffer. Paths
// are resolved against the first project root, or the working directory when
// no root is set. All public methods lock one mutex.
// ---------------------------------------------------------------------------
class Workspace : public IEditorHost {
public:
    Workspace() = default;

    [[nodiscard]] std::optional<EditorSnapshot> ActiveEditor() const override;
    [[nodiscard]] std::optional<std::vector<SelectionSnapshot>>
        Selections() const override;
    bool SetSelections(const std::vector<Range>& ranges) override;
    std::optional<InsertOutcome> InsertText(
        const std::string& text, const std::optional<Range>& range) override;

    void OpenFile(const std::string& path,
                  const std::optional<Position>& cursor) override;
    bool SaveFile(const std::optional<std::string>& path) override;
    bool CloseFile(const std::optional<std::string>& path, bool save) override;

    [[nodiscard]] std::vector<std::string> ProjectPaths() const override;
    bool AddProjectPath(const std::string& path) override;

    [[nodiscard]] std::size_t OpenBufferCount() const;

private:
    struct Buffer {
        std::string path;
        std::string text;
        bool modified = false;
        std::vector<Range> selections;  // never empty; [0] is primary
    };

    // Callers hold mutex_.
    std::string ResolvePath(const std::string& path) const;
    Buffer* FindBuffer(const std::optional<std::string>& path);
    Buffer* ActiveBuffer();
    const Buffer* ActiveBuffer() const;
    static void WriteBuffer(Buffer& buffer);

    mutable std::mutex mutex_;
    std::vector<std::string> project_paths_;
    std::vector<Buffer> buffers_;
    std::optional<std::size_t> active_;
};

} // namespace pulsar_mcp

#pragma once

#include <pulsar_mcp/editor/text_position.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pulsar_mcp {

// ---------------------------------------------------------------------------
// EditorSnapshot — state of the active editor at one point in time.
// ---------------------------------------------------------------------------
struct EditorSnapshot {
    std::optional<std::string> path;  // nullopt for an untitled buffer
    Position cursor;
    std::string grammar;
    bool modified = false;
    std::string text;  // includes unsaved changes
};

struct SelectionSnapshot {
    std::string text;
    Range range;
};

struct InsertOutcome {
    std::optional<std::string> path;
    std::optional<std::string> old_text;  // set when a range was replaced
};

// ---------------------------------------------------------------------------
// IEditorHost — the editor the built-in tools drive.
//
// "No editor" is reported through nullopt/false; I/O failures throw.
// Implementations must be safe to call from concurrent tool invocations.
// ---------------------------------------------------------------------------
class IEditorHost {
public:
    virtual ~IEditorHost() = default;

    IEditorHost(const IEditorHost&) = delete;
    IEditorHost& operator=(const IEditorHost&) = delete;

    // -- Active editor -------------------------------------------------------

    [[nodiscard]] virtual std::optional<EditorSnapshot> ActiveEditor() const = 0;

    /// First element is the primary selection. nullopt without an editor.
    [[nodiscard]] virtual std::optional<std::vector<SelectionSnapshot>>
        Selections() const = 0;

    /// Replace all selections. false without an editor.
    virtual bool SetSelections(const std::vector<Range>& ranges) = 0;

    /// Replace range, or every selection when range is nullopt.
    /// nullopt without an editor.
    virtual std::optional<InsertOutcome> InsertText(
        const std::string& text, const std::optional<Range>& range) = 0;

    // -- Files ---------------------------------------------------------------

    /// Open (or activate) a file, optionally moving the cursor. A missing
    /// file opens as a new empty buffer.
    virtual void OpenFile(const std::string& path,
                          const std::optional<Position>& cursor) = 0;

    /// Save the named (or active) buffer. false if there is no such buffer.
    virtual bool SaveFile(const std::optional<std::string>& path) = 0;

    /// Close the named (or active) buffer, saving first if asked.
    /// false if there is no such buffer.
    virtual bool CloseFile(const std::optional<std::string>& path, bool save) = 0;

    // -- Project -------------------------------------------------------------

    [[nodiscard]] virtual std::vector<std::string> ProjectPaths() const = 0;

    /// false if path is not a directory.
    virtual bool AddProjectPath(const std::string& path) = 0;

protected:
    IEditorHost() = default;
};

} // namespace pulsar_mcp

#include <pulsar_mcp/editor/editor_tools.hpp>

#include <pulsar_mcp/editor/text_position.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pulsar_mcp {

namespace {

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

bool Has(const nlohmann::json& args, const char* key) {
    return args.is_object() && args.contains(key) && !args[key].is_null();
}

std::optional<std::string> OptString(const nlohmann::json& args, const char* key) {
    if (Has(args, key) && args[key].is_string() &&
        !args[key].get_ref<const std::string&>().empty()) {
        return args[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<Position> OptPosition(const nlohmann::json& args, const char* key) {
    if (!Has(args, key)) return std::nullopt;
    return PositionFromJson(args[key], key);
}

nlohmann::json PathOrNull(const std::optional<std::string>& path) {
    return path ? nlohmann::json(*path) : nlohmann::json(nullptr);
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json NumberProp(const std::string& desc) {
    return {{"type", "number"}, {"description", desc}};
}

nlohmann::json BoolProp(const std::string& desc) {
    return {{"type", "boolean"}, {"description", desc}};
}

nlohmann::json PositionProp(const std::string& desc) {
    return {{"type", "object"},
            {"description", desc},
            {"properties", {{"row", NumberProp("Row (0-indexed)")},
                            {"column", NumberProp("Column (0-indexed)")}}},
            {"required", {"row", "column"}}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

nlohmann::json NoArgsSchema() {
    return MakeSchema(nlohmann::json::object(), nlohmann::json::array());
}

nlohmann::json ReadOnly() { return {{"readOnlyHint", true}}; }
nlohmann::json Mutating() { return {{"readOnlyHint", false}}; }

// ---------------------------------------------------------------------------
// Tool procedures. Each returns the raw result; null or false means failure.
// ---------------------------------------------------------------------------

nlohmann::json GetActiveEditor(const IEditorHost& host) {
    auto editor = host.ActiveEditor();
    if (!editor) return nullptr;
    return {{"path", PathOrNull(editor->path)},
            {"cursorPosition", ToJson(editor->cursor)},
            {"grammar", editor->grammar},
            {"modified", editor->modified},
            {"lineCount", LineCount(editor->text)},
            {"charCount", editor->text.size()}};
}

nlohmann::json ReadText(const IEditorHost& host, const nlohmann::json& args) {
    auto start = OptPosition(args, "start");
    auto end = OptPosition(args, "end");

    auto editor = host.ActiveEditor();
    if (!editor) return nullptr;

    nlohmann::json out = {{"path", PathOrNull(editor->path)}};
    if (start || end) {
        const Position s = start.value_or(Position{});
        const Position e = end ? *end : EndOfText(editor->text);
        out["content"] = TextInRange(editor->text, Range{s, e});
        out["range"] = ToJson(Range{s, e});
    } else {
        out["content"] = editor->text;
    }
    return out;
}

nlohmann::json OpenFile(IEditorHost& host, const nlohmann::json& args) {
    std::optional<Position> cursor;
    if (Has(args, "row")) {
        Position pos;
        pos.row = CoordinateFromJson(args["row"], "row");
        if (Has(args, "column") && args["column"].is_number()) {
            pos.column = CoordinateFromJson(args["column"], "column");
        }
        cursor = pos;
    }
    host.OpenFile(args["path"].get<std::string>(), cursor);
    return true;
}

nlohmann::json GetSelections(const IEditorHost& host) {
    auto selections = host.Selections();
    if (!selections) return nullptr;

    nlohmann::json out = nlohmann::json::array();
    for (const auto& sel : *selections) {
        out.push_back({{"text", sel.text},
                       {"isEmpty", sel.range.IsEmpty()},
                       {"range", ToJson(sel.range)}});
    }
    return out;
}

nlohmann::json SetSelections(IEditorHost& host, const nlohmann::json& args) {
    std::vector<Range> ranges;
    for (const auto& sel : args["selections"]) {
        if (!sel.is_object() || !sel.contains("start")) {
            throw std::invalid_argument("each selection needs a start position");
        }
        Range r;
        r.start = PositionFromJson(sel["start"], "start");
        r.end = Has(sel, "end") ? PositionFromJson(sel["end"], "end") : r.start;
        ranges.push_back(r);
    }
    return host.SetSelections(ranges);
}

nlohmann::json InsertText(IEditorHost& host, const nlohmann::json& args) {
    auto start = OptPosition(args, "start");
    auto end = OptPosition(args, "end");
    std::optional<Range> range;
    if (start && end) {
        range = Range{*start, *end};
    }

    auto outcome = host.InsertText(args["text"].get<std::string>(), range);
    if (!outcome) return false;

    nlohmann::json out = {{"path", PathOrNull(outcome->path)}};
    if (outcome->old_text) {
        out["oldText"] = *outcome->old_text;
    }
    return out;
}

nlohmann::json CloseFile(IEditorHost& host, const nlohmann::json& args) {
    bool save = false;
    if (Has(args, "save")) {
        if (!args["save"].is_boolean()) {
            throw std::invalid_argument("save must be a boolean");
        }
        save = args["save"].get<bool>();
    }
    return host.CloseFile(OptString(args, "path"), save);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterEditorTools
// ---------------------------------------------------------------------------
void RegisterEditorTools(ToolRegistry& registry, IEditorHost& host) {
    // === Read-only tools ===

    registry.Register(ToolDefinition{
        {"GetActiveEditor",
         "Get active editor metadata. Returns {path, cursorPosition: {row, column}, "
         "grammar, modified, lineCount, charCount}. Use ReadText to get content.",
         NoArgsSchema(), ReadOnly()},
        {},
        [&host](const nlohmann::json&) { return GetActiveEditor(host); },
        {}});

    registry.Register(ToolDefinition{
        {"ReadText",
         "Read buffer content from active editor (includes unsaved changes). "
         "Without start/end: returns full content. With start/end: returns text "
         "in that range.",
         MakeSchema(
             {{"start", PositionProp("Start position (0-indexed). If omitted, reads from beginning.")},
              {"end", PositionProp("End position (0-indexed). If omitted, reads to end of file.")}},
             nlohmann::json::array()),
         ReadOnly()},
        {},
        [&host](const nlohmann::json& args) { return ReadText(host, args); },
        {}});

    registry.Register(ToolDefinition{
        {"GetProjectPaths",
         "Get project root folders. Returns string[] of absolute paths. "
         "Empty array if no project open.",
         NoArgsSchema(), ReadOnly()},
        {},
        [&host](const nlohmann::json&) {
            return nlohmann::json(host.ProjectPaths());
        },
        {}});

    registry.Register(ToolDefinition{
        {"GetSelections",
         "Get all selections/cursors. Returns array of {text, isEmpty, range: "
         "{start: {row, column}, end: {row, column}}} (0-indexed). First element "
         "is primary selection. Fails if no editor.",
         NoArgsSchema(), ReadOnly()},
        {},
        [&host](const nlohmann::json&) { return GetSelections(host); },
        {}});

    // === Mutating tools ===

    registry.Register(ToolDefinition{
        {"OpenFile",
         "Open a file in editor. All positions are 0-indexed. Creates new file "
         "if path doesn't exist.",
         MakeSchema(
             {{"path", StringProp("File path (absolute or relative to project root)")},
              {"row", NumberProp("Row to navigate to (0-indexed, optional)")},
              {"column", NumberProp("Column to navigate to (0-indexed, optional)")}},
             {"path"}),
         Mutating()},
        {{"path", validators::String()}},
        [&host](const nlohmann::json& args) { return OpenFile(host, args); },
        [](const nlohmann::json&, const nlohmann::json&) {
            return nlohmann::json{{"opened", true}};
        }});

    registry.Register(ToolDefinition{
        {"SaveFile",
         "Save a file. Fails if file not found or no editor. If path omitted, "
         "saves active editor.",
         MakeSchema(
             {{"path", StringProp("File path to save (optional, defaults to active editor)")}},
             nlohmann::json::array()),
         Mutating()},
        {},
        [&host](const nlohmann::json& args) {
            return nlohmann::json(host.SaveFile(OptString(args, "path")));
        },
        [](const nlohmann::json&, const nlohmann::json&) {
            return nlohmann::json{{"saved", true}};
        }});

    registry.Register(ToolDefinition{
        {"SetSelections",
         "Set selections/cursors in active editor. All positions are 0-indexed. "
         "If end equals start (or omitted), places cursor without selection. "
         "First selection becomes primary. Returns {set: true, count}.",
         MakeSchema(
             {{"selections",
               {{"type", "array"},
                {"description", "Array of selection ranges to set"},
                {"items", MakeSchema(
                     {{"start", PositionProp("Start position (0-indexed)")},
                      {"end", PositionProp("End position (0-indexed). Omit or set "
                                           "equal to start for cursor-only.")}},
                     {"start"})},
                {"minItems", 1}}}},
             {"selections"}),
         Mutating()},
        {{"selections", validators::Array()}},
        [&host](const nlohmann::json& args) { return SetSelections(host, args); },
        [](const nlohmann::json&, const nlohmann::json& args) {
            return nlohmann::json{{"set", true}, {"count", args["selections"].size()}};
        }});

    registry.Register(ToolDefinition{
        {"InsertText",
         "Insert text into active editor. Without start/end: inserts at cursor or "
         "replaces selection. With start/end: replaces text in that range. "
         "Returns {inserted: true, path, oldText?}.",
         MakeSchema(
             {{"text", StringProp("The text to insert")},
              {"start", PositionProp("Start position (0-indexed). If omitted, inserts at cursor.")},
              {"end", PositionProp("End position (0-indexed). Required if start is provided.")}},
             {"text"}),
         Mutating()},
        {{"text", validators::AnyString()}},
        [&host](const nlohmann::json& args) { return InsertText(host, args); },
        [](const nlohmann::json& raw, const nlohmann::json&) {
            nlohmann::json out = {{"inserted", true}};
            out.update(raw);
            return out;
        }});

    registry.Register(ToolDefinition{
        {"CloseFile",
         "Close an editor tab. Fails if file not found. If path omitted, closes "
         "active editor. Unsaved changes are discarded unless save=true.",
         MakeSchema(
             {{"path", StringProp("File path to close (optional, defaults to active editor)")},
              {"save", BoolProp("Save before closing if modified (default: false)")}},
             nlohmann::json::array()),
         {{"readOnlyHint", false}, {"destructiveHint", true}}},
        {},
        [&host](const nlohmann::json& args) { return CloseFile(host, args); },
        [](const nlohmann::json&, const nlohmann::json&) {
            return nlohmann::json{{"closed", true}};
        }});

    registry.Register(ToolDefinition{
        {"AddProjectPath",
         "Add a folder to project roots without removing existing paths. "
         "Fails if path is not a directory.",
         MakeSchema(
             {{"path", StringProp("Absolute folder path to add")}},
             {"path"}),
         Mutating()},
        {{"path", validators::String()}},
        [&host](const nlohmann::json& args) {
            return nlohmann::json(host.AddProjectPath(args["path"].get<std::string>()));
        },
        [](const nlohmann::json&, const nlohmann::json&) {
            return nlohmann::json{{"added", true}};
        }});
}

} // namespace pulsar_mcp

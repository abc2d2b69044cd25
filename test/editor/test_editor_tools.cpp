#include <catch2/catch_test_macros.hpp>

#include <pulsar_mcp/editor/editor_tools.hpp>
#include <pulsar_mcp/mcp/tool_executor.hpp>

#include "../../test/mocks/mock_editor_host.hpp"

#include <set>

using namespace pulsar_mcp;
using pulsar_mcp::testing::MockEditorHost;

namespace {

EditorSnapshot Snapshot(std::string text) {
    EditorSnapshot snap;
    snap.path = "/project/src/app.js";
    snap.cursor = {1, 2};
    snap.grammar = "JavaScript";
    snap.modified = true;
    snap.text = std::move(text);
    return snap;
}

// Registry plus executor wired to one mock host.
struct ToolsFixture {
    MockEditorHost host;
    ToolRegistry registry;
    ExternalToolMap externals;
    ToolExecutor executor{registry, externals};

    ToolsFixture() { RegisterEditorTools(registry, host); }

    ToolCallResult Run(const std::string& name,
                       const nlohmann::json& args = nlohmann::json::object()) {
        return executor.Execute(name, args);
    }
};

} // anonymous namespace

// ===========================================================================
// Registration
// ===========================================================================

TEST_CASE("EditorTools: registers the ten built-in tools", "[editor][tools]") {
    ToolsFixture f;
    std::set<std::string> names;
    for (const auto& info : f.registry.List()) {
        names.insert(info.name);
        CHECK_FALSE(info.description.empty());
        CHECK(info.input_schema["type"] == "object");
        CHECK(info.annotations.contains("readOnlyHint"));
    }
    CHECK(names == std::set<std::string>{
        "GetActiveEditor", "ReadText", "GetProjectPaths", "GetSelections",
        "OpenFile", "SaveFile", "SetSelections", "InsertText", "CloseFile",
        "AddProjectPath"});
}

TEST_CASE("EditorTools: annotations", "[editor][tools]") {
    ToolsFixture f;
    CHECK(f.registry.Lookup("ReadText")->Info().annotations["readOnlyHint"] == true);
    CHECK(f.registry.Lookup("InsertText")->Info().annotations["readOnlyHint"] == false);
    auto close = f.registry.Lookup("CloseFile")->Info().annotations;
    CHECK(close["destructiveHint"] == true);
    CHECK(f.registry.Lookup("OpenFile")->Info().input_schema["required"] ==
          nlohmann::json::array({"path"}));
}

// ===========================================================================
// Read-only tools
// ===========================================================================

TEST_CASE("EditorTools: GetActiveEditor", "[editor][tools]") {
    ToolsFixture f;

    SECTION("without an editor fails with the fallback") {
        auto r = f.Run("GetActiveEditor");
        CHECK_FALSE(r.success);
        CHECK(r.ToJson()["error"] == kToolFailedFallback);
    }

    SECTION("reports metadata") {
        f.host.editor = Snapshot("line1\nline2\n");
        auto r = f.Run("GetActiveEditor");
        REQUIRE(r.success);
        CHECK(r.data["path"] == "/project/src/app.js");
        CHECK(r.data["cursorPosition"] == nlohmann::json{{"row", 1}, {"column", 2}});
        CHECK(r.data["grammar"] == "JavaScript");
        CHECK(r.data["modified"] == true);
        CHECK(r.data["lineCount"] == 3);
        CHECK(r.data["charCount"] == 12);
    }

    SECTION("untitled buffer has a null path") {
        auto snap = Snapshot("");
        snap.path.reset();
        f.host.editor = snap;
        auto r = f.Run("GetActiveEditor");
        REQUIRE(r.success);
        CHECK(r.data["path"].is_null());
    }
}

TEST_CASE("EditorTools: ReadText", "[editor][tools]") {
    ToolsFixture f;
    f.host.editor = Snapshot("alpha\nbeta\ngamma");

    SECTION("full content") {
        auto r = f.Run("ReadText");
        REQUIRE(r.success);
        CHECK(r.data["content"] == "alpha\nbeta\ngamma");
        CHECK_FALSE(r.data.contains("range"));
    }

    SECTION("range") {
        auto r = f.Run("ReadText", {{"start", {{"row", 1}, {"column", 0}}},
                                    {"end", {{"row", 2}, {"column", 3}}}});
        REQUIRE(r.success);
        CHECK(r.data["content"] == "beta\ngam");
        CHECK(r.data["range"]["end"]["row"] == 2);
    }

    SECTION("only start reads to the end") {
        auto r = f.Run("ReadText", {{"start", {{"row", 2}, {"column", 1}}}});
        REQUIRE(r.success);
        CHECK(r.data["content"] == "amma");
    }

    SECTION("malformed position is an error") {
        auto r = f.Run("ReadText", {{"start", "top"}});
        CHECK_FALSE(r.success);
        CHECK(r.error == std::optional<std::string>(
                             "start must be an object with numeric row and column"));
    }

    SECTION("huge row is an error") {
        auto r = f.Run("ReadText", {{"start", {{"row", 1e20}, {"column", 0}}}});
        CHECK_FALSE(r.success);
        CHECK(r.error == std::optional<std::string>("start.row is out of range"));
    }
}

TEST_CASE("EditorTools: GetProjectPaths", "[editor][tools]") {
    ToolsFixture f;
    auto empty = f.Run("GetProjectPaths");
    REQUIRE(empty.success);
    CHECK(empty.data == nlohmann::json::array());

    f.host.project_paths = {"/a", "/b"};
    CHECK(f.Run("GetProjectPaths").data == nlohmann::json::array({"/a", "/b"}));
}

TEST_CASE("EditorTools: GetSelections", "[editor][tools]") {
    ToolsFixture f;
    CHECK_FALSE(f.Run("GetSelections").success);

    f.host.selections = std::vector<SelectionSnapshot>{
        {"abc", Range{{0, 0}, {0, 3}}},
        {"", Range{{2, 1}, {2, 1}}}};
    auto r = f.Run("GetSelections");
    REQUIRE(r.success);
    REQUIRE(r.data.size() == 2);
    CHECK(r.data[0]["text"] == "abc");
    CHECK(r.data[0]["isEmpty"] == false);
    CHECK(r.data[1]["isEmpty"] == true);
    CHECK(r.data[1]["range"]["start"] == nlohmann::json{{"row", 2}, {"column", 1}});
}

// ===========================================================================
// Mutating tools
// ===========================================================================

TEST_CASE("EditorTools: OpenFile", "[editor][tools]") {
    ToolsFixture f;

    SECTION("path is required") {
        auto r = f.Run("OpenFile");
        CHECK(r.error == std::optional<std::string>("path is required"));
        CHECK(f.host.open_calls.empty());

        auto empty = f.Run("OpenFile", {{"path", ""}});
        CHECK_FALSE(empty.success);
    }

    SECTION("opens with an optional cursor") {
        auto r = f.Run("OpenFile", {{"path", "src/a.cpp"}, {"row", 4}, {"column", 2}});
        REQUIRE(r.success);
        CHECK(r.data == nlohmann::json{{"opened", true}});
        REQUIRE(f.host.open_calls.size() == 1);
        CHECK(f.host.open_calls[0].path == "src/a.cpp");
        CHECK(f.host.open_calls[0].cursor == std::optional<Position>(Position{4, 2}));
    }

    SECTION("row alone puts the cursor at column zero") {
        REQUIRE(f.Run("OpenFile", {{"path", "x"}, {"row", 3}}).success);
        CHECK(f.host.open_calls[0].cursor == std::optional<Position>(Position{3, 0}));
    }

    SECTION("row outside the int range is an error") {
        auto r = f.Run("OpenFile", {{"path", "x"}, {"row", 1e20}});
        CHECK_FALSE(r.success);
        CHECK(r.error == std::optional<std::string>("row is out of range"));
        CHECK(f.host.open_calls.empty());

        auto col = f.Run("OpenFile", {{"path", "x"}, {"row", 0}, {"column", -1e20}});
        CHECK(col.error == std::optional<std::string>("column is out of range"));
    }

    SECTION("host failure becomes the error text") {
        f.host.open_error = "Cannot open a directory: /tmp";
        auto r = f.Run("OpenFile", {{"path", "/tmp"}});
        CHECK(r.error == std::optional<std::string>("Cannot open a directory: /tmp"));
    }
}

TEST_CASE("EditorTools: SaveFile", "[editor][tools]") {
    ToolsFixture f;
    auto saved = f.Run("SaveFile", {{"path", "a.txt"}});
    REQUIRE(saved.success);
    CHECK(saved.data == nlohmann::json{{"saved", true}});
    CHECK(f.host.save_calls[0] == std::optional<std::string>("a.txt"));

    REQUIRE(f.Run("SaveFile").success);
    CHECK_FALSE(f.host.save_calls[1].has_value());

    f.host.save_result = false;
    auto failed = f.Run("SaveFile");
    CHECK_FALSE(failed.success);
    CHECK_FALSE(failed.error.has_value());
}

TEST_CASE("EditorTools: SetSelections", "[editor][tools]") {
    ToolsFixture f;
    f.host.editor = Snapshot("text");

    SECTION("requires a non-empty array") {
        CHECK(f.Run("SetSelections", {{"selections", nlohmann::json::array()}}).error ==
              std::optional<std::string>("selections array is required"));
    }

    SECTION("missing end means a cursor") {
        auto r = f.Run("SetSelections", {{"selections", {
            {{"start", {{"row", 0}, {"column", 1}}}, {"end", {{"row", 0}, {"column", 3}}}},
            {{"start", {{"row", 1}, {"column", 0}}}}
        }}});
        REQUIRE(r.success);
        CHECK(r.data == nlohmann::json{{"set", true}, {"count", 2}});
        REQUIRE(f.host.set_selection_calls.size() == 1);
        const auto& ranges = f.host.set_selection_calls[0];
        REQUIRE(ranges.size() == 2);
        CHECK(ranges[0].end == Position{0, 3});
        CHECK(ranges[1].IsEmpty());
    }

    SECTION("selection without start is an error") {
        auto r = f.Run("SetSelections", {{"selections", {{{"end", 1}}}}});
        CHECK(r.error == std::optional<std::string>("each selection needs a start position"));
    }

    SECTION("no editor fails") {
        f.host.editor.reset();
        auto r = f.Run("SetSelections", {{"selections", {
            {{"start", {{"row", 0}, {"column", 0}}}}}}});
        CHECK_FALSE(r.success);
    }
}

TEST_CASE("EditorTools: InsertText", "[editor][tools]") {
    ToolsFixture f;

    SECTION("text is required") {
        CHECK(f.Run("InsertText").error == std::optional<std::string>("text is required"));
    }

    SECTION("no editor fails") {
        CHECK_FALSE(f.Run("InsertText", {{"text", "x"}}).success);
        REQUIRE(f.host.insert_calls.size() == 1);
        CHECK_FALSE(f.host.insert_calls[0].range.has_value());
    }

    SECTION("range replacement reports old text") {
        f.host.insert_outcome = InsertOutcome{std::string("/p/a.txt"), std::string("old")};
        auto r = f.Run("InsertText", {{"text", "new"},
                                      {"start", {{"row", 0}, {"column", 0}}},
                                      {"end", {{"row", 0}, {"column", 3}}}});
        REQUIRE(r.success);
        CHECK(r.data == nlohmann::json{{"inserted", true}, {"path", "/p/a.txt"},
                                       {"oldText", "old"}});
        REQUIRE(f.host.insert_calls[0].range.has_value());
        CHECK(f.host.insert_calls[0].range->end == Position{0, 3});
    }

    SECTION("empty text over a range deletes it") {
        f.host.insert_outcome = InsertOutcome{std::string("/p/a.txt"), std::string("gone")};
        auto r = f.Run("InsertText", {{"text", ""},
                                      {"start", {{"row", 0}, {"column", 1}}},
                                      {"end", {{"row", 0}, {"column", 5}}}});
        REQUIRE(r.success);
        CHECK(r.data["oldText"] == "gone");
        REQUIRE(f.host.insert_calls.size() == 1);
        CHECK(f.host.insert_calls[0].text.empty());
        REQUIRE(f.host.insert_calls[0].range.has_value());
        CHECK(f.host.insert_calls[0].range->start == Position{0, 1});
        CHECK(f.host.insert_calls[0].range->end == Position{0, 5});
    }

    SECTION("start without end inserts at the cursor") {
        f.host.insert_outcome = InsertOutcome{std::string("/p/a.txt"), std::nullopt};
        auto r = f.Run("InsertText", {{"text", "x"}, {"start", {{"row", 0}, {"column", 0}}}});
        REQUIRE(r.success);
        CHECK_FALSE(r.data.contains("oldText"));
        CHECK_FALSE(f.host.insert_calls[0].range.has_value());
    }
}

TEST_CASE("EditorTools: CloseFile", "[editor][tools]") {
    ToolsFixture f;

    auto r = f.Run("CloseFile", {{"path", "a.txt"}, {"save", true}});
    REQUIRE(r.success);
    CHECK(r.data == nlohmann::json{{"closed", true}});
    CHECK(f.host.close_calls[0].path == std::optional<std::string>("a.txt"));
    CHECK(f.host.close_calls[0].save);

    REQUIRE(f.Run("CloseFile").success);
    CHECK_FALSE(f.host.close_calls[1].save);

    auto bad = f.Run("CloseFile", {{"save", "yes"}});
    CHECK(bad.error == std::optional<std::string>("save must be a boolean"));

    f.host.close_result = false;
    CHECK_FALSE(f.Run("CloseFile").success);
}

TEST_CASE("EditorTools: AddProjectPath", "[editor][tools]") {
    ToolsFixture f;
    CHECK(f.Run("AddProjectPath").error == std::optional<std::string>("path is required"));

    auto r = f.Run("AddProjectPath", {{"path", "/work"}});
    REQUIRE(r.success);
    CHECK(r.data == nlohmann::json{{"added", true}});
    CHECK(f.host.add_path_calls == std::vector<std::string>{"/work"});

    f.host.add_path_result = false;
    CHECK_FALSE(f.Run("AddProjectPath", {{"path", "/file.txt"}}).success);
}

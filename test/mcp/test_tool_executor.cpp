#include <catch2/catch_test_macros.hpp>

#include <pulsar_mcp/mcp/tool_executor.hpp>

#include <atomic>
#include <stdexcept>

using namespace pulsar_mcp;

namespace {

ToolDefinition Returning(const std::string& name, nlohmann::json raw) {
    return ToolDefinition{
        {name, "", nullptr, nullptr},
        {},
        [raw](const nlohmann::json&) { return raw; },
        {}};
}

} // anonymous namespace

// ===========================================================================
// Dispatch
// ===========================================================================

TEST_CASE("ToolExecutor: unknown tool", "[mcp][executor]") {
    ToolRegistry builtins;
    ExternalToolMap externals;
    ToolExecutor executor(builtins, externals);

    auto r = executor.Execute("NoSuchTool", nlohmann::json::object());
    CHECK_FALSE(r.success);
    REQUIRE(r.error.has_value());
    CHECK(*r.error == "Unknown tool: NoSuchTool");
    CHECK(r.ToJson() == nlohmann::json{{"success", false},
                                       {"error", "Unknown tool: NoSuchTool"}});
}

TEST_CASE("ToolExecutor: built-ins shadow external tools", "[mcp][executor]") {
    ToolRegistry builtins;
    builtins.Register(Returning("Same", "builtin"));
    ExternalToolMap externals;
    auto reg = externals.Add({std::make_shared<DefinedTool>(Returning("Same", "external")),
                              std::make_shared<DefinedTool>(Returning("Other", "external"))});
    ToolExecutor executor(builtins, externals);

    CHECK(executor.Execute("Same", {}).data == "builtin");
    CHECK(executor.Execute("Other", {}).data == "external");
}

// ===========================================================================
// Failure sentinel
// ===========================================================================

TEST_CASE("ToolExecutor: false and null results are failures", "[mcp][executor]") {
    ToolRegistry builtins;
    builtins.Register(Returning("False", false));
    builtins.Register(Returning("Null", nullptr));
    ExternalToolMap externals;
    ToolExecutor executor(builtins, externals);

    for (const auto* name : {"False", "Null"}) {
        auto r = executor.Execute(name, {});
        CHECK_FALSE(r.success);
        CHECK_FALSE(r.error.has_value());
        CHECK(r.ToJson()["error"] == kToolFailedFallback);
    }
}

TEST_CASE("ToolExecutor: other falsy-looking values succeed", "[mcp][executor]") {
    ToolRegistry builtins;
    builtins.Register(Returning("Zero", 0));
    builtins.Register(Returning("Empty", ""));
    builtins.Register(Returning("Obj", nlohmann::json::object()));
    builtins.Register(Returning("Arr", nlohmann::json::array()));
    ExternalToolMap externals;
    ToolExecutor executor(builtins, externals);

    CHECK(executor.Execute("Zero", {}).success);
    CHECK(executor.Execute("Zero", {}).data == 0);
    CHECK(executor.Execute("Empty", {}).success);
    CHECK(executor.Execute("Obj", {}).success);
    CHECK(executor.Execute("Arr", {}).success);
    CHECK(executor.Execute("Arr", {}).ToJson() ==
          nlohmann::json{{"success", true}, {"data", nlohmann::json::array()}});
}

// ===========================================================================
// Validation, exceptions, formatting
// ===========================================================================

TEST_CASE("ToolExecutor: first failing validator wins and procedure is skipped",
          "[mcp][executor]") {
    std::atomic<int> calls{0};
    ToolRegistry builtins;
    builtins.Register(ToolDefinition{
        {"Needs", "", nullptr, nullptr},
        {{"text", validators::String()}, {"path", validators::String()}},
        [&calls](const nlohmann::json&) -> nlohmann::json {
            ++calls;
            return true;
        },
        {}});
    ExternalToolMap externals;
    ToolExecutor executor(builtins, externals);

    auto r = executor.Execute("Needs", {{"path", "a.txt"}});
    CHECK_FALSE(r.success);
    CHECK(r.error == std::optional<std::string>("text is required"));
    CHECK(calls == 0);

    auto ok = executor.Execute("Needs", {{"path", "a.txt"}, {"text", "x"}});
    CHECK(ok.success);
    CHECK(calls == 1);
}

TEST_CASE("ToolExecutor: thrown exception becomes failure envelope", "[mcp][executor]") {
    ToolRegistry builtins;
    builtins.Register(ToolDefinition{
        {"Throws", "", nullptr, nullptr},
        {},
        [](const nlohmann::json&) -> nlohmann::json {
            throw std::runtime_error("disk on fire");
        },
        {}});
    ExternalToolMap externals;
    ToolExecutor executor(builtins, externals);

    auto r = executor.Execute("Throws", {});
    CHECK_FALSE(r.success);
    CHECK(r.error == std::optional<std::string>("disk on fire"));
}

TEST_CASE("ToolExecutor: non-standard exception becomes Unknown error", "[mcp][executor]") {
    ToolRegistry builtins;
    builtins.Register(ToolDefinition{
        {"ThrowsInt", "", nullptr, nullptr},
        {},
        [](const nlohmann::json&) -> nlohmann::json {
            throw 42;
        },
        {}});
    ExternalToolMap externals;
    ToolExecutor executor(builtins, externals);

    auto r = executor.Execute("ThrowsInt", {});
    CHECK_FALSE(r.success);
    CHECK(r.data.is_null());
    CHECK(r.error == std::optional<std::string>("Unknown error"));
}

TEST_CASE("ToolExecutor: formatter runs only on success", "[mcp][executor]") {
    std::atomic<int> formats{0};
    auto fmt = [&formats](const nlohmann::json& raw, const nlohmann::json& args) {
        ++formats;
        return nlohmann::json{{"raw", raw}, {"arg", args.value("n", 0)}};
    };

    ToolRegistry builtins;
    builtins.Register(ToolDefinition{
        {"Good", "", nullptr, nullptr}, {},
        [](const nlohmann::json&) -> nlohmann::json { return 7; }, fmt});
    builtins.Register(ToolDefinition{
        {"Bad", "", nullptr, nullptr}, {},
        [](const nlohmann::json&) -> nlohmann::json { return false; }, fmt});
    ExternalToolMap externals;
    ToolExecutor executor(builtins, externals);

    auto good = executor.Execute("Good", {{"n", 2}});
    CHECK(good.success);
    CHECK(good.data == nlohmann::json{{"raw", 7}, {"arg", 2}});
    CHECK(formats == 1);

    auto bad = executor.Execute("Bad", {{"n", 2}});
    CHECK_FALSE(bad.success);
    CHECK(formats == 1);
}

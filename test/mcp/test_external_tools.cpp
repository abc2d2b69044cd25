#include <catch2/catch_test_macros.hpp>

#include <pulsar_mcp/mcp/external_tools.hpp>

#include <memory>

using namespace pulsar_mcp;

namespace {

std::shared_ptr<const ITool> Tool(const std::string& name, nlohmann::json result = true) {
    return std::make_shared<DefinedTool>(ToolDefinition{
        {name, "External " + name, nullptr, nullptr},
        {},
        [result](const nlohmann::json&) { return result; },
        {}});
}

} // anonymous namespace

TEST_CASE("ExternalToolMap: Add registers in insertion order", "[mcp][external]") {
    ExternalToolMap map;
    auto reg = map.Add({Tool("Lint"), Tool("Format")});

    CHECK(map.Size() == 2);
    auto infos = map.List();
    REQUIRE(infos.size() == 2);
    CHECK(infos[0].name == "Lint");
    CHECK(infos[1].name == "Format");
    CHECK(reg.Names() == std::vector<std::string>{"Lint", "Format"});
}

TEST_CASE("ExternalToolMap: invalid entries are skipped", "[mcp][external]") {
    ExternalToolMap map;
    auto reg = map.Add({nullptr, Tool(""), Tool("Valid")});

    CHECK(map.Size() == 1);
    CHECK(map.Lookup("Valid") != nullptr);
    CHECK(reg.Names() == std::vector<std::string>{"Valid"});
}

TEST_CASE("ExternalToolMap: Dispose removes only its own batch", "[mcp][external]") {
    ExternalToolMap map;
    auto first = map.Add({Tool("A"), Tool("B")});
    auto second = map.Add({Tool("C")});
    REQUIRE(map.Size() == 3);

    first.Dispose();
    CHECK(map.Size() == 1);
    CHECK(map.Lookup("A") == nullptr);
    CHECK(map.Lookup("C") != nullptr);

    // Disposing twice is a no-op.
    first.Dispose();
    CHECK(map.Size() == 1);
}

TEST_CASE("ExternalToolMap: registration disposes on destruction", "[mcp][external]") {
    ExternalToolMap map;
    {
        auto reg = map.Add({Tool("Scoped")});
        CHECK(map.Size() == 1);
    }
    CHECK(map.Size() == 0);
}

TEST_CASE("ExternalToolMap: moved registration keeps ownership", "[mcp][external]") {
    ExternalToolMap map;
    ToolRegistration outer;
    {
        auto reg = map.Add({Tool("Moved")});
        outer = std::move(reg);
    }
    CHECK(map.Size() == 1);
    outer.Dispose();
    CHECK(map.Size() == 0);
}

TEST_CASE("ExternalToolMap: registration may outlive the map", "[mcp][external]") {
    ToolRegistration reg;
    {
        ExternalToolMap map;
        reg = map.Add({Tool("Orphan")});
    }
    reg.Dispose();
    CHECK(reg.Names().empty());
}

TEST_CASE("ExternalToolMap: same name replaces the earlier tool", "[mcp][external]") {
    ExternalToolMap map;
    auto first = map.Add({Tool("Dup", 1)});
    auto second = map.Add({Tool("Dup", 2)});

    CHECK(map.Size() == 1);
    CHECK(map.Lookup("Dup")->Invoke({}) == 2);
}


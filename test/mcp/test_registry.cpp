#include <catch2/catch_test_macros.hpp>

#include <mcp_base/mcp/registry.hpp>

#include <stdexcept>
#include <string>

using namespace mcp_base;

namespace {

ToolHandler Constant(nlohmann::json value) {
    return [value](const nlohmann::json&) { return value; };
}

ResourceHandler TextResource(const std::string& text) {
    return [text](const std::string& uri) {
        ResourceContents contents;
        contents.uri = uri;
        contents.text = text;
        return contents;
    };
}

PromptHandler SingleMessage(const std::string& text) {
    return [text](const nlohmann::json&) {
        return std::vector<PromptMessage>{PromptMessage::Text(Role::User, text)};
    };
}

} // anonymous namespace

// ===========================================================================
// Tools
// ===========================================================================

TEST_CASE("Registry: registered tool is listed and found", "[mcp][registry]") {
    Registry registry;
    registry.RegisterTool({"echo", "Echo the input", {{"type", "object"}}},
                          Constant({{"ok", true}}));

    auto tools = registry.ListTools();
    REQUIRE(tools.size() == 1);
    CHECK(tools[0].name == "echo");
    CHECK(tools[0].input_schema["type"] == "object");

    const auto* entry = registry.FindTool("echo");
    REQUIRE(entry != nullptr);
    CHECK(entry->handler(nlohmann::json::object())["ok"] == true);
}

TEST_CASE("Registry: unknown names return nullptr", "[mcp][registry]") {
    Registry registry;
    CHECK(registry.FindTool("nope") == nullptr);
    CHECK(registry.FindResource("file:///nope") == nullptr);
    CHECK(registry.FindPrompt("nope") == nullptr);
}

TEST_CASE("Registry: re-registering a name overwrites in place", "[mcp][registry]") {
    Registry registry;
    registry.RegisterTool({"a", "first", {}}, Constant(1));
    registry.RegisterTool({"b", "second", {}}, Constant(2));
    registry.RegisterTool({"a", "replaced", {}}, Constant(3));

    auto tools = registry.ListTools();
    REQUIRE(tools.size() == 2);
    CHECK(tools[0].name == "a");
    CHECK(tools[0].description == "replaced");
    CHECK(tools[1].name == "b");
    CHECK(registry.FindTool("a")->handler({}) == 3);
}

TEST_CASE("Registry: listing preserves registration order", "[mcp][registry]") {
    Registry registry;
    for (const char* name : {"zeta", "alpha", "mid"}) {
        registry.RegisterTool({name, "", {}}, Constant(nullptr));
    }
    auto tools = registry.ListTools();
    REQUIRE(tools.size() == 3);
    CHECK(tools[0].name == "zeta");
    CHECK(tools[1].name == "alpha");
    CHECK(tools[2].name == "mid");
}

TEST_CASE("Registry: remove keeps the remaining order and index", "[mcp][registry]") {
    Registry registry;
    registry.RegisterTool({"a", "", {}}, Constant(1));
    registry.RegisterTool({"b", "", {}}, Constant(2));
    registry.RegisterTool({"c", "", {}}, Constant(3));

    CHECK(registry.RemoveTool("a"));
    CHECK_FALSE(registry.RemoveTool("a"));
    CHECK(registry.ToolCount() == 2);

    REQUIRE(registry.FindTool("c") != nullptr);
    CHECK(registry.FindTool("c")->handler({}) == 3);
    CHECK(registry.ListTools()[0].name == "b");
}

// ===========================================================================
// Resources and prompts
// ===========================================================================

TEST_CASE("Registry: resources keyed by URI", "[mcp][registry]") {
    Registry registry;
    ResourceDefinition definition;
    definition.uri = "file:///readme";
    definition.name = "Readme";
    definition.mime_type = "text/plain";
    registry.RegisterResource(definition, TextResource("hello"));

    REQUIRE(registry.ResourceCount() == 1);
    const auto* entry = registry.FindResource("file:///readme");
    REQUIRE(entry != nullptr);
    CHECK(entry->handler("file:///readme").text == std::optional<std::string>("hello"));
    CHECK(registry.RemoveResource("file:///readme"));
    CHECK(registry.ResourceCount() == 0);
}

TEST_CASE("Registry: prompts keyed by name", "[mcp][registry]") {
    Registry registry;
    registry.RegisterPrompt({"greet", std::string("Say hello"), {}}, SingleMessage("hi"));

    auto prompts = registry.ListPrompts();
    REQUIRE(prompts.size() == 1);
    CHECK(prompts[0].description == std::optional<std::string>("Say hello"));

    auto messages = registry.FindPrompt("greet")->handler(nlohmann::json::object());
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content["text"] == "hi");
}

// ===========================================================================
// Freeze
// ===========================================================================

TEST_CASE("Registry: frozen registry rejects mutation", "[mcp][registry]") {
    Registry registry;
    registry.RegisterTool({"echo", "", {}}, Constant(nullptr));
    registry.Freeze();

    CHECK(registry.IsFrozen());
    CHECK_THROWS_AS(registry.RegisterTool({"other", "", {}}, Constant(nullptr)),
                    std::logic_error);
    CHECK_THROWS_AS(registry.RemoveTool("echo"), std::logic_error);
    CHECK_THROWS_AS(registry.RegisterPrompt({"p", std::nullopt, {}}, SingleMessage("x")),
                    std::logic_error);

    // Reads still work.
    CHECK(registry.FindTool("echo") != nullptr);
    CHECK(registry.ToolCount() == 1);
}

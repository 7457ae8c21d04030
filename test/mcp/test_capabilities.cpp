#include <catch2/catch_test_macros.hpp>

#include <mcp_base/mcp/capabilities.hpp>

using namespace mcp_base;

namespace {

void AddTool(Registry& registry) {
    registry.RegisterTool({"echo", "", {{"type", "object"}}},
                          [](const nlohmann::json& args) { return args; });
}

void AddResource(Registry& registry) {
    registry.RegisterResource({"server://info", "Info", std::nullopt, std::nullopt},
                              [](const std::string& uri) {
                                  ResourceContents contents;
                                  contents.uri = uri;
                                  contents.text = "{}";
                                  return contents;
                              });
}

void AddPrompt(Registry& registry) {
    registry.RegisterPrompt({"summarize", std::nullopt, {}},
                            [](const nlohmann::json&) {
                                return std::vector<PromptMessage>{};
                            });
}

} // anonymous namespace

TEST_CASE("Capabilities: empty registry announces nothing", "[mcp][capabilities]") {
    Registry registry;
    auto j = ToJson(ComputeCapabilities(registry));
    CHECK(j.is_object());
    CHECK(j.empty());
}

TEST_CASE("Capabilities: categories follow registry contents", "[mcp][capabilities]") {
    Registry registry;
    AddTool(registry);

    auto j = ToJson(ComputeCapabilities(registry));
    CHECK(j.contains("tools"));
    CHECK_FALSE(j.contains("resources"));
    CHECK_FALSE(j.contains("prompts"));
    CHECK(j["tools"] == nlohmann::json::object());

    AddResource(registry);
    AddPrompt(registry);
    j = ToJson(ComputeCapabilities(registry));
    CHECK(j.contains("resources"));
    CHECK(j.contains("prompts"));
}

TEST_CASE("Capabilities: removal drops the category", "[mcp][capabilities]") {
    Registry registry;
    AddTool(registry);
    REQUIRE(ComputeCapabilities(registry).tools);

    registry.RemoveTool("echo");
    CHECK_FALSE(ComputeCapabilities(registry).tools);
}

TEST_CASE("Capabilities: flags only appear inside present categories", "[mcp][capabilities]") {
    Registry registry;
    AddTool(registry);

    CapabilityOptions options;
    options.tools_list_changed = true;
    options.resources_subscribe = true;
    options.prompts_list_changed = true;

    auto j = ToJson(ComputeCapabilities(registry, options));
    CHECK(j["tools"]["listChanged"] == true);
    CHECK_FALSE(j.contains("resources"));
    CHECK_FALSE(j.contains("prompts"));
}

TEST_CASE("Capabilities: logging is announced when enabled", "[mcp][capabilities]") {
    Registry registry;
    CapabilityOptions options;
    options.logging = true;

    auto j = ToJson(ComputeCapabilities(registry, options));
    REQUIRE(j.contains("logging"));
    CHECK(j["logging"] == nlohmann::json::object());
}

#include <catch2/catch_test_macros.hpp>

#include <mcp_base/demo/demo_handlers.hpp>
#include <mcp_base/mcp/dispatcher.hpp>

#include <memory>
#include <string>

using namespace mcp_base;

namespace {

// Registry, validator and dispatcher wired the way McpServer wires them.
struct DemoFixture {
    DemoFixture() {
        RegisterDemoHandlers(*registry, validator, info);
        registry->Freeze();
    }

    Response Call(const std::string& tool, nlohmann::json arguments) {
        return dispatcher.HandleRequest(Request{
            1, "tools/call", {{"name", tool}, {"arguments", std::move(arguments)}}});
    }

    ServerInfo info{"demo", "1.0.0", "2024-11-05", std::nullopt};
    std::shared_ptr<Registry> registry = std::make_shared<Registry>();
    SchemaValidator validator;
    Dispatcher dispatcher{registry, info};
};

} // anonymous namespace

TEST_CASE("Demo: registers tools, resource and prompt", "[demo]") {
    DemoFixture fixture;
    CHECK(fixture.registry->FindTool("echo") != nullptr);
    CHECK(fixture.registry->FindTool("calculate") != nullptr);
    CHECK(fixture.registry->FindResource("server://info") != nullptr);
    CHECK(fixture.registry->FindPrompt("summarize") != nullptr);
    CHECK(fixture.validator.Has("calculate"));
}

TEST_CASE("Demo: echo returns its arguments", "[demo]") {
    DemoFixture fixture;
    auto response = fixture.Call("echo", {{"x", 1}, {"y", "two"}});
    REQUIRE_FALSE(response.IsError());
    CHECK(response.ResultValue() == nlohmann::json{{"x", 1}, {"y", "two"}});
}

TEST_CASE("Demo: calculate applies the operation left to right", "[demo]") {
    DemoFixture fixture;

    auto sum = fixture.Call("calculate", {{"operation", "add"}, {"numbers", {1, 2, 3.5}}});
    REQUIRE_FALSE(sum.IsError());
    CHECK(sum.ResultValue()["structuredContent"]["result"] == 6.5);

    auto quotient = fixture.Call("calculate", {{"operation", "divide"}, {"numbers", {20, 2, 5}}});
    REQUIRE_FALSE(quotient.IsError());
    CHECK(quotient.ResultValue()["structuredContent"]["result"] == 2.0);
    CHECK(quotient.ResultValue()["content"][0]["type"] == "text");
}

TEST_CASE("Demo: calculate rejects arguments that fail the schema", "[demo]") {
    DemoFixture fixture;
    auto response = fixture.Call("calculate", {{"operation", "modulo"}, {"numbers", nlohmann::json::array({1})}});

    REQUIRE(response.IsError());
    CHECK(response.ErrorValue().code == ErrorCode::InvalidParams);
    const auto& violations = response.ErrorValue().data["violations"];
    REQUIRE(violations.is_array());
    CHECK(violations.size() == 2);  // enum and minItems
}

TEST_CASE("Demo: division by zero is a tool execution error", "[demo]") {
    DemoFixture fixture;
    auto response = fixture.Call("calculate", {{"operation", "divide"}, {"numbers", {1, 0}}});

    REQUIRE(response.IsError());
    CHECK(response.ErrorValue().code == ErrorCode::ToolExecutionError);
    CHECK(response.ErrorValue().data["reason"] == "division by zero");
}

TEST_CASE("Demo: server://info describes the registry", "[demo]") {
    DemoFixture fixture;
    auto response = fixture.dispatcher.HandleRequest(
        Request{2, "resources/read", {{"uri", "server://info"}}});

    REQUIRE_FALSE(response.IsError());
    const auto& contents = response.ResultValue()["contents"][0];
    CHECK(contents["mimeType"] == "application/json");

    auto body = nlohmann::json::parse(contents["text"].get<std::string>());
    CHECK(body["name"] == "demo");
    CHECK(body["tools"] == nlohmann::json::array({"echo", "calculate"}));
    CHECK(body["prompts"] == nlohmann::json::array({"summarize"}));
}

TEST_CASE("Demo: summarize prompt embeds the text", "[demo]") {
    DemoFixture fixture;

    auto ok = fixture.dispatcher.HandleRequest(Request{
        3, "prompts/get", {{"name", "summarize"}, {"arguments", {{"text", "Long story."}}}}});
    REQUIRE_FALSE(ok.IsError());
    auto text = ok.ResultValue()["messages"][0]["content"]["text"].get<std::string>();
    CHECK(text.find("Long story.") != std::string::npos);

    auto missing = fixture.dispatcher.HandleRequest(Request{
        4, "prompts/get", {{"name", "summarize"}}});
    REQUIRE(missing.IsError());
    CHECK(missing.ErrorValue().code == ErrorCode::InvalidParams);
}

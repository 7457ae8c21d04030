#include <catch2/catch_test_macros.hpp>

#include <mcp_base/mcp/server.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace mcp_base;

namespace {

ServerOptions TestOptions() {
    ServerOptions options;
    options.info = ServerInfo{"test-server", "0.0.1", "2024-11-05", std::nullopt};
    options.drain_timeout = std::chrono::milliseconds(2000);
    return options;
}

void RegisterEcho(Registry& registry, SchemaValidator& /*validator*/) {
    registry.RegisterTool({"echo", "Echo the arguments", {{"type", "object"}}},
                          [](const nlohmann::json& args) { return args; });
}

std::vector<nlohmann::json> ParseLines(const std::string& output) {
    std::vector<nlohmann::json> messages;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        messages.push_back(nlohmann::json::parse(line));
    }
    return messages;
}

// Responses may arrive in any order; index them by id dump.
std::map<std::string, nlohmann::json> IndexById(const std::vector<nlohmann::json>& messages) {
    std::map<std::string, nlohmann::json> out;
    for (const auto& message : messages) {
        out[message["id"].dump()] = message;
    }
    return out;
}

std::string Lines(std::initializer_list<nlohmann::json> messages) {
    std::string out;
    for (const auto& message : messages) {
        out += message.dump() + "\n";
    }
    return out;
}

} // anonymous namespace

// ===========================================================================
// Start / serve loop
// ===========================================================================

TEST_CASE("McpServer: serves requests until EOF", "[mcp][server]") {
    std::istringstream in(Lines({
        {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
         {"params", {{"protocolVersion", "2024-11-05"}}}},
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}},
        {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}},
        {{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"},
         {"params", {{"name", "echo"}, {"arguments", {{"x", 1}}}}}},
    }));
    std::ostringstream out;

    McpServer server(TestOptions(), RegisterEcho, in, out);
    auto result = server.Start();
    REQUIRE(result.IsOk());

    auto messages = ParseLines(out.str());
    REQUIRE(messages.size() == 3);  // the notification is never answered

    auto by_id = IndexById(messages);
    REQUIRE(by_id.count("1") == 1);
    CHECK(by_id["1"]["result"]["serverInfo"]["name"] == "test-server");
    CHECK(by_id["2"]["result"]["tools"][0]["name"] == "echo");
    CHECK(by_id["3"] == nlohmann::json{{"jsonrpc", "2.0"}, {"id", 3}, {"result", {{"x", 1}}}});
    CHECK(server.GetDispatcher().Session().initialized);
    CHECK_FALSE(server.IsRunning());
}

TEST_CASE("McpServer: malformed line gets a parse error, serving continues", "[mcp][server]") {
    std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\n" +
                          Lines({{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}}}));
    std::ostringstream out;

    McpServer server(TestOptions(), RegisterEcho, in, out);
    REQUIRE(server.Start().IsOk());

    auto by_id = IndexById(ParseLines(out.str()));
    REQUIRE(by_id.count("null") == 1);
    CHECK(by_id["null"]["error"]["code"] == -32700);
    REQUIRE(by_id.count("2") == 1);
    CHECK(by_id["2"].contains("result"));
}

TEST_CASE("McpServer: deeply nested line is rejected, serving continues", "[mcp][server]") {
    std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"a":)" +
                          std::string(100000, '[') + std::string(100000, ']') + "}}\n" +
                          Lines({{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}}}));
    std::ostringstream out;

    McpServer server(TestOptions(), RegisterEcho, in, out);
    REQUIRE(server.Start().IsOk());

    auto by_id = IndexById(ParseLines(out.str()));
    REQUIRE(by_id.size() == 2);
    CHECK(by_id["null"]["error"]["code"] == -32700);
    CHECK(by_id["2"]["result"]["tools"][0]["name"] == "echo");
}

TEST_CASE("McpServer: blank lines are skipped", "[mcp][server]") {
    std::istringstream in("\n   \n" +
                          Lines({{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}}}) +
                          "\n");
    std::ostringstream out;

    McpServer server(TestOptions(), RegisterEcho, in, out);
    REQUIRE(server.Start().IsOk());
    CHECK(ParseLines(out.str()).size() == 1);
}

TEST_CASE("McpServer: unknown method and bad id", "[mcp][server]") {
    std::istringstream in(Lines({
        {{"jsonrpc", "2.0"}, {"id", "a"}, {"method", "sampling/createMessage"}},
        {{"jsonrpc", "2.0"}, {"id", 1.5}, {"method", "tools/list"}},
    }));
    std::ostringstream out;

    McpServer server(TestOptions(), RegisterEcho, in, out);
    REQUIRE(server.Start().IsOk());

    auto by_id = IndexById(ParseLines(out.str()));
    CHECK(by_id["\"a\""]["error"]["code"] == -32601);
    CHECK(by_id["null"]["error"]["code"] == -32600);
}

TEST_CASE("McpServer: slow handler does not block other requests", "[mcp][server]") {
    std::atomic<bool> release{false};
    auto setup = [&release](Registry& registry, SchemaValidator&) {
        registry.RegisterTool({"slow", "", {}}, [&release](const nlohmann::json&) {
            while (!release) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return nlohmann::json{{"done", true}};
        });
        registry.RegisterTool({"fast", "", {}}, [&release](const nlohmann::json&) {
            release = true;
            return nlohmann::json{{"done", true}};
        });
    };

    // "fast" can only complete if it runs while "slow" is still blocked.
    std::istringstream in(Lines({
        {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"}, {"params", {{"name", "slow"}}}},
        {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/call"}, {"params", {{"name", "fast"}}}},
    }));
    std::ostringstream out;

    McpServer server(TestOptions(), setup, in, out);
    REQUIRE(server.Start().IsOk());

    auto by_id = IndexById(ParseLines(out.str()));
    CHECK(by_id["1"]["result"]["done"] == true);
    CHECK(by_id["2"]["result"]["done"] == true);
}

TEST_CASE("McpServer: start returns after the drain timeout", "[mcp][server]") {
    std::atomic<bool> release{false};
    auto setup = [&release](Registry& registry, SchemaValidator&) {
        registry.RegisterTool({"stuck", "", {}}, [&release](const nlohmann::json&) {
            while (!release) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return nlohmann::json{{"done", true}};
        });
    };

    std::istringstream in(Lines({
        {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"}, {"params", {{"name", "stuck"}}}},
    }));
    std::ostringstream out;

    auto options = TestOptions();
    options.drain_timeout = std::chrono::milliseconds(50);
    McpServer server(std::move(options), setup, in, out);
    REQUIRE(server.Start().IsOk());

    // The request outlived the drain; the caller must see it still in flight.
    CHECK_FALSE(server.IsRunning());
    CHECK_FALSE(server.WaitForIdle(std::chrono::milliseconds(0)));

    release = true;
    REQUIRE(server.WaitForIdle(std::chrono::milliseconds(2000)));
    CHECK(out.str().empty());  // the late response was dropped
}

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_CASE("McpServer: setup failure aborts start", "[mcp][server]") {
    std::istringstream in(Lines({{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}}}));
    std::ostringstream out;

    McpServer server(TestOptions(),
                     [](Registry&, SchemaValidator&) {
                         throw std::runtime_error("cannot open database");
                     },
                     in, out);
    auto result = server.Start();

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Startup);
    CHECK(result.Error().message == "cannot open database");
    CHECK(out.str().empty());
    CHECK_FALSE(server.IsRunning());
    CHECK_FALSE(server.GetTransport().IsConnected());
}

TEST_CASE("McpServer: second start is rejected", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;

    McpServer server(TestOptions(), RegisterEcho, in, out);
    REQUIRE(server.Start().IsOk());
    CHECK(server.Start().IsErr());
}

TEST_CASE("McpServer: registry is frozen once serving", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;

    McpServer server(TestOptions(), RegisterEcho, in, out);
    REQUIRE(server.Start().IsOk());
    CHECK(server.GetRegistry().IsFrozen());
    CHECK(server.GetRegistry().ToolCount() == 1);
}

TEST_CASE("McpServer: stop is idempotent and closes the transport", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;

    McpServer server(TestOptions(), RegisterEcho, in, out);
    server.Stop();
    CHECK_NOTHROW(server.Stop());
    CHECK_FALSE(server.GetTransport().IsConnected());
    CHECK_FALSE(server.IsRunning());
}

TEST_CASE("McpServer: responses after stop are dropped", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;

    McpServer server(TestOptions(), RegisterEcho, in, out);
    server.Stop();
    server.ProcessLine(Lines({{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}}}));
    CHECK(server.WaitForIdle(std::chrono::milliseconds(2000)));
    CHECK(out.str().empty());
}

TEST_CASE("McpServer: Describe reports identity and capabilities", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;

    McpServer server(TestOptions(), RegisterEcho, in, out);
    REQUIRE(server.Start().IsOk());

    auto description = server.Describe();
    CHECK(description["name"] == "test-server");
    CHECK(description["version"] == "0.0.1");
    CHECK(description["transport"] == "stdio");
    CHECK(description["capabilities"].contains("tools"));
}

#include <mcp_base/demo/demo_handlers.hpp>

#include <mcp_base/mcp/rpc_error.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace mcp_base {

namespace {

constexpr const char* kCalculateSchema = "calculate";

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

nlohmann::json CalculateSchema() {
    auto schema = MakeSchema(
        {{"operation", {{"type", "string"},
                        {"description", "Arithmetic operation to apply"},
                        {"enum", {"add", "subtract", "multiply", "divide"}}}},
         {"numbers", {{"type", "array"},
                      {"description", "Operands, applied left to right"},
                      {"items", {{"type", "number"}}},
                      {"minItems", 2}}}},
        nlohmann::json::array({"operation", "numbers"}));
    schema["additionalProperties"] = false;
    return schema;
}

nlohmann::json TextContent(const std::string& text) {
    return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// calculate
nlohmann::json HandleCalculate(const SchemaValidator& validator,
                               const nlohmann::json& arguments) {
    auto checked = validator.Validate(kCalculateSchema, arguments);
    if (checked.IsErr()) {
        auto error = InvalidParams("calculate arguments do not match schema");
        error.data = SchemaValidator::ToErrorData(checked.Error());
        throw RpcException(std::move(error));
    }

    const auto operation = arguments["operation"].get<std::string>();
    const auto& numbers = arguments["numbers"];

    double value = numbers[0].get<double>();
    for (std::size_t i = 1; i < numbers.size(); ++i) {
        const double operand = numbers[i].get<double>();
        if (operation == "add") {
            value += operand;
        } else if (operation == "subtract") {
            value -= operand;
        } else if (operation == "multiply") {
            value *= operand;
        } else {
            if (operand == 0.0) {
                throw std::runtime_error("division by zero");
            }
            value /= operand;
        }
    }

    nlohmann::json result = {{"content", TextContent(nlohmann::json(value).dump())}};
    result["structuredContent"] = {{"operation", operation}, {"result", value}};
    return result;
}

} // anonymous namespace

void RegisterDemoHandlers(Registry& registry,
                          SchemaValidator& validator,
                          const ServerInfo& info) {
    auto compiled = validator.Compile(kCalculateSchema, CalculateSchema());
    if (compiled.IsErr()) {
        throw std::logic_error(compiled.Error().ToString());
    }

    registry.RegisterTool(
        ToolDefinition{"echo", "Return the call arguments unchanged",
                       {{"type", "object"}}},
        [](const nlohmann::json& arguments) { return arguments; });

    registry.RegisterTool(
        ToolDefinition{"calculate", "Apply an arithmetic operation to a list of numbers",
                       CalculateSchema()},
        [&validator](const nlohmann::json& arguments) {
            return HandleCalculate(validator, arguments);
        });

    const Registry* view = &registry;
    registry.RegisterResource(
        ResourceDefinition{"server://info", "Server information",
                           std::string("Name, version and registered features"),
                           std::string("application/json")},
        [view, info](const std::string& uri) {
            auto names = [](const auto& definitions, auto key) {
                auto out = nlohmann::json::array();
                for (const auto& definition : definitions) {
                    out.push_back(key(definition));
                }
                return out;
            };
            nlohmann::json body = {
                {"name", info.name},
                {"version", info.version},
                {"protocolVersion", info.protocol_version},
                {"tools", names(view->ListTools(),
                                [](const ToolDefinition& d) { return d.name; })},
                {"resources", names(view->ListResources(),
                                    [](const ResourceDefinition& d) { return d.uri; })},
                {"prompts", names(view->ListPrompts(),
                                  [](const PromptDefinition& d) { return d.name; })}
            };
            ResourceContents contents;
            contents.uri = uri;
            contents.mime_type = "application/json";
            contents.text = body.dump();
            return contents;
        });

    registry.RegisterPrompt(
        PromptDefinition{"summarize", std::string("Ask the model to summarize a text"),
                         {PromptArgument{"text", std::string("Text to summarize"), true}}},
        [](const nlohmann::json& arguments) {
            auto it = arguments.find("text");
            if (it == arguments.end() || !it->is_string()) {
                throw RpcException(InvalidParams("summarize requires a string 'text'"));
            }
            return std::vector<PromptMessage>{PromptMessage::Text(
                Role::User,
                "Summarize the following text in a few sentences:\n\n" +
                    it->get<std::string>())};
        });
}

} // namespace mcp_base

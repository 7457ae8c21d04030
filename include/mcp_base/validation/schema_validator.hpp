#pragma once

#include <mcp_base/core/result.hpp>

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_base {

// One failed constraint. `path` is a JSON pointer into the validated value
// ("" for the root).
struct Violation {
    std::string path;
    std::string message;

    bool operator==(const Violation& other) const {
        return path == other.path && message == other.message;
    }
};

// ---------------------------------------------------------------------------
// SchemaValidator: named JSON Schema subset for handler arguments.
//
// Supported keywords: type (string or array of strings), properties,
// required, additionalProperties (false only), items, enum, minLength,
// maxLength, minimum, maximum, minItems, maxItems. Other keywords are ignored.
// Compile() checks the schema once so Validate() can assume a sane shape.
// ---------------------------------------------------------------------------
class SchemaValidator {
public:
    Result<void, Error> Compile(const std::string& name, nlohmann::json schema);

    [[nodiscard]] bool Has(const std::string& name) const;

    // The value itself on success, every violation found otherwise.
    [[nodiscard]] Result<nlohmann::json, std::vector<Violation>> Validate(
        const std::string& name, const nlohmann::json& value) const;

    // {"violations": [{"path": ..., "message": ...}, ...]} for error data.
    [[nodiscard]] static nlohmann::json ToErrorData(
        const std::vector<Violation>& violations);

private:
    std::map<std::string, nlohmann::json> schemas_;
};

} // namespace mcp_base

#include <mcp_base/validation/schema_validator.hpp>

#include <mcp_base/core/log.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace mcp_base {

namespace {

constexpr const char* kComponent = "validator";

constexpr std::array<std::string_view, 7> kKnownTypes = {
    "object", "array", "string", "number", "integer", "boolean", "null"};

Error MakeSchemaError(const std::string& name, const std::string& message) {
    return Error{"SchemaValidator", "schema '" + name + "': " + message,
                 ErrorCategory::Schema};
}

bool IsKnownType(const nlohmann::json& type) {
    if (!type.is_string()) return false;
    const auto name = type.get<std::string>();
    for (auto known : kKnownTypes) {
        if (known == name) return true;
    }
    return false;
}

// Check keyword shapes recursively. Returns an empty string when valid.
std::string CheckSchema(const nlohmann::json& schema, const std::string& where) {
    if (!schema.is_object()) {
        return where + " is not an object";
    }
    if (auto it = schema.find("type"); it != schema.end()) {
        if (it->is_array()) {
            for (const auto& t : *it) {
                if (!IsKnownType(t)) return where + " has an unknown type " + t.dump();
            }
        } else if (!IsKnownType(*it)) {
            return where + " has an unknown type " + it->dump();
        }
    }
    if (auto it = schema.find("properties"); it != schema.end()) {
        if (!it->is_object()) return where + ".properties is not an object";
        for (const auto& [key, sub] : it->items()) {
            auto problem = CheckSchema(sub, where + ".properties." + key);
            if (!problem.empty()) return problem;
        }
    }
    if (auto it = schema.find("required"); it != schema.end()) {
        if (!it->is_array()) return where + ".required is not an array";
        for (const auto& key : *it) {
            if (!key.is_string()) return where + ".required has a non-string entry";
        }
    }
    if (auto it = schema.find("items"); it != schema.end()) {
        auto problem = CheckSchema(*it, where + ".items");
        if (!problem.empty()) return problem;
    }
    if (auto it = schema.find("enum"); it != schema.end() && !it->is_array()) {
        return where + ".enum is not an array";
    }
    return {};
}

bool MatchesType(const nlohmann::json& value, const std::string& type) {
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "string")  return value.is_string();
    if (type == "number")  return value.is_number();
    if (type == "integer") return value.is_number_integer();
    if (type == "boolean") return value.is_boolean();
    if (type == "null")    return value.is_null();
    return false;
}

// Non-negative integer keyword (minLength, maxItems, ...), if present.
std::optional<std::size_t> Limit(const nlohmann::json& schema, const char* key) {
    auto it = schema.find(key);
    if (it == schema.end() || !it->is_number_integer() || it->get<long long>() < 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it->get<long long>());
}

std::string ChildPath(const std::string& path, const std::string& key) {
    return path + "/" + key;
}

class Walker {
public:
    void Check(const nlohmann::json& schema, const nlohmann::json& value,
               const std::string& path) {
        if (!CheckType(schema, value, path)) {
            return;  // nested keywords are meaningless on the wrong type
        }
        CheckEnum(schema, value, path);

        if (value.is_string()) CheckString(schema, value, path);
        if (value.is_number()) CheckNumber(schema, value, path);
        if (value.is_array())  CheckArray(schema, value, path);
        if (value.is_object()) CheckObject(schema, value, path);
    }

    std::vector<Violation> violations;

private:
    void Add(const std::string& path, std::string message) {
        violations.push_back({path, std::move(message)});
    }

    bool CheckType(const nlohmann::json& schema, const nlohmann::json& value,
                   const std::string& path) {
        auto it = schema.find("type");
        if (it == schema.end()) return true;

        if (it->is_string()) {
            if (MatchesType(value, it->get<std::string>())) return true;
            Add(path, "expected " + it->get<std::string>());
            return false;
        }
        for (const auto& t : *it) {
            if (MatchesType(value, t.get<std::string>())) return true;
        }
        Add(path, "expected one of " + it->dump());
        return false;
    }

    void CheckEnum(const nlohmann::json& schema, const nlohmann::json& value,
                   const std::string& path) {
        auto it = schema.find("enum");
        if (it == schema.end()) return;
        for (const auto& allowed : *it) {
            if (allowed == value) return;
        }
        Add(path, "must be one of " + it->dump());
    }

    void CheckString(const nlohmann::json& schema, const nlohmann::json& value,
                     const std::string& path) {
        const auto length = value.get<std::string>().size();
        if (auto min = Limit(schema, "minLength"); min && length < *min) {
            Add(path, "shorter than " + std::to_string(*min) + " characters");
        }
        if (auto max = Limit(schema, "maxLength"); max && length > *max) {
            Add(path, "longer than " + std::to_string(*max) + " characters");
        }
    }

    void CheckNumber(const nlohmann::json& schema, const nlohmann::json& value,
                     const std::string& path) {
        const auto number = value.get<double>();
        if (auto it = schema.find("minimum"); it != schema.end() &&
            it->is_number() && number < it->get<double>()) {
            Add(path, "less than minimum " + it->dump());
        }
        if (auto it = schema.find("maximum"); it != schema.end() &&
            it->is_number() && number > it->get<double>()) {
            Add(path, "greater than maximum " + it->dump());
        }
    }

    void CheckArray(const nlohmann::json& schema, const nlohmann::json& value,
                    const std::string& path) {
        if (auto min = Limit(schema, "minItems"); min && value.size() < *min) {
            Add(path, "fewer than " + std::to_string(*min) + " items");
        }
        if (auto max = Limit(schema, "maxItems"); max && value.size() > *max) {
            Add(path, "more than " + std::to_string(*max) + " items");
        }
        if (auto it = schema.find("items"); it != schema.end()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                Check(*it, value[i], ChildPath(path, std::to_string(i)));
            }
        }
    }

    void CheckObject(const nlohmann::json& schema, const nlohmann::json& value,
                     const std::string& path) {
        if (auto it = schema.find("required"); it != schema.end()) {
            for (const auto& key : *it) {
                const auto name = key.get<std::string>();
                if (!value.contains(name)) {
                    Add(ChildPath(path, name), "is required");
                }
            }
        }

        const auto properties = schema.find("properties");
        const bool closed = schema.contains("additionalProperties") &&
                            schema["additionalProperties"] == false;

        for (const auto& [key, member] : value.items()) {
            if (properties != schema.end() && properties->contains(key)) {
                Check((*properties)[key], member, ChildPath(path, key));
            } else if (closed) {
                Add(ChildPath(path, key), "is not allowed");
            }
        }
    }
};

} // anonymous namespace

Result<void, Error> SchemaValidator::Compile(const std::string& name,
                                             nlohmann::json schema) {
    auto problem = CheckSchema(schema, "schema");
    if (!problem.empty()) {
        return Result<void, Error>::Err(MakeSchemaError(name, problem));
    }
    schemas_[name] = std::move(schema);
    LogDebug(kComponent, "Schema compiled", {{"schema", name}});
    return Result<void, Error>::Ok();
}

bool SchemaValidator::Has(const std::string& name) const {
    return schemas_.count(name) > 0;
}

Result<nlohmann::json, std::vector<Violation>> SchemaValidator::Validate(
    const std::string& name, const nlohmann::json& value) const {
    using R = Result<nlohmann::json, std::vector<Violation>>;

    auto it = schemas_.find(name);
    if (it == schemas_.end()) {
        return R::Err({Violation{"", "unknown schema '" + name + "'"}});
    }

    Walker walker;
    walker.Check(it->second, value, "");
    if (!walker.violations.empty()) {
        return R::Err(std::move(walker.violations));
    }
    return R::Ok(value);
}

nlohmann::json SchemaValidator::ToErrorData(const std::vector<Violation>& violations) {
    auto list = nlohmann::json::array();
    for (const auto& v : violations) {
        list.push_back({{"path", v.path}, {"message", v.message}});
    }
    return {{"violations", std::move(list)}};
}

} // namespace mcp_base

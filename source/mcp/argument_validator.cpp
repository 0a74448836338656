#include "mcp/argument_validator.hpp"

namespace argument_validator {

static bool matches_type(const json &value, mcp_tools::ParameterType type) {
    switch (type) {
    case mcp_tools::ParameterType::String:
        return value.is_string();
    case mcp_tools::ParameterType::Integer:
        return value.is_number_integer();
    case mcp_tools::ParameterType::Boolean:
        return value.is_boolean();
    }
    return false;
}

std::string json_type_name(const json &value) {
    if (value.is_number_integer()) {
        return "integer";
    }
    if (value.is_number()) {
        return "number";
    }
    return value.type_name();
}

json validate(const std::vector<mcp_tools::ParameterSpec> &spec, const json &arguments) {
    if (!arguments.is_object()) {
        throw mcp_tools::TypeMismatchError("arguments", "object", json_type_name(arguments));
    }

    json normalized = json::object();
    for (const auto &parameter : spec) {
        auto iterator = arguments.find(parameter.name);

        if (iterator == arguments.end()) {
            if (parameter.required) {
                throw mcp_tools::MissingArgumentError(parameter.name);
            }
            // Optional without a default stays absent.
            if (parameter.default_value.has_value()) {
                normalized[parameter.name] = *parameter.default_value;
            }
            continue;
        }

        if (!matches_type(*iterator, parameter.type)) {
            throw mcp_tools::TypeMismatchError(parameter.name, mcp_tools::parameter_type_name(parameter.type),
                                               json_type_name(*iterator));
        }
        normalized[parameter.name] = *iterator;
    }

    return normalized;
}

} // namespace argument_validator

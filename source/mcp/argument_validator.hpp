#ifndef TMCPS_ARGUMENT_VALIDATOR_HPP
#define TMCPS_ARGUMENT_VALIDATOR_HPP

// Checks a raw tools/call arguments object against a tool's declared parameters.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "mcp/mcp_tools.hpp"

namespace argument_validator {

using json = nlohmann::json;

// Returns a new object holding every declared parameter: the supplied value, or the
// declared default when an optional parameter is absent (an optional parameter
// without a default is left out). Keys not declared in the parameter list
// are dropped. Values are never coerced (a numeric string is not an integer).
// Throws mcp_tools::MissingArgumentError or mcp_tools::TypeMismatchError.
// Throws TypeMismatchError with parameter "arguments" if arguments is not an object.
json validate(const std::vector<mcp_tools::ParameterSpec> &spec, const json &arguments);

// JSON type name of a value as reported in TypeMismatchError ("string", "integer",
// "number", "boolean", "null", "object", "array").
std::string json_type_name(const json &value);

} // namespace argument_validator

#endif // TMCPS_ARGUMENT_VALIDATOR_HPP

// Tests for argument validation against declared parameters: required keys,
// strict type checks, defaults and unknown keys.

#include "mcp/argument_validator.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;
using mcp_tools::ParameterSpec;
using mcp_tools::ParameterType;

namespace test_argument_validator {

static bool report(bool success, const std::string &description) {
    std::cout << (success ? "  OK: " : "  FAIL: ") << description << std::endl;
    return success;
}

static std::vector<ParameterSpec> truncate_like_spec() {
    return {
        {"text", ParameterType::String, true, std::nullopt, ""},
        {"max_length", ParameterType::Integer, false, json(100), ""},
        {"suffix", ParameterType::String, false, json("..."), ""},
        {"strict", ParameterType::Boolean, false, json(false), ""},
    };
}

// Test: a missing required key fails with MissingArgumentError naming that key.
static bool test_missing_required_argument() {
    try {
        argument_validator::validate(truncate_like_spec(), json{{"max_length", 5}});
    } catch (const mcp_tools::MissingArgumentError &error) {
        bool success = error.parameter() == "text" &&
                       std::string(error.what()) == "missing required argument 'text'";
        return report(success, "missing required key raises MissingArgumentError naming it");
    }
    return report(false, "missing required key should raise MissingArgumentError");
}

// Test: omitted optional keys take their declared defaults.
static bool test_defaults_applied() {
    json normalized = argument_validator::validate(truncate_like_spec(), json{{"text", "hello"}});
    bool success = normalized == json{{"text", "hello"}, {"max_length", 100}, {"suffix", "..."}, {"strict", false}};
    if (!success) {
        std::cout << "  normalized was: " << normalized.dump() << std::endl;
    }
    return report(success, "omitted optional keys receive declared defaults");
}

// Test: explicit values win over defaults.
static bool test_explicit_values_kept() {
    json normalized = argument_validator::validate(truncate_like_spec(),
                                                   json{{"text", "x"}, {"max_length", 7}, {"suffix", ""}});
    bool success = normalized["max_length"] == 7 && normalized["suffix"] == "" && normalized["strict"] == false;
    return report(success, "explicit values are kept over defaults");
}

// Test: validating an already-normalized mapping yields the same mapping.
static bool test_validation_is_idempotent() {
    json once = argument_validator::validate(truncate_like_spec(), json{{"text", "abc"}, {"strict", true}});
    json twice = argument_validator::validate(truncate_like_spec(), once);
    return report(once == twice, "validate(validate(x)) == validate(x)");
}

// Test: keys not declared as parameters are ignored and dropped.
static bool test_unknown_keys_ignored() {
    json normalized = argument_validator::validate(truncate_like_spec(),
                                                   json{{"text", "abc"}, {"colour", "blue"}});
    bool success = !normalized.contains("colour") && normalized["text"] == "abc";
    return report(success, "unknown keys are ignored, not an error");
}

// Test: a numeric string is not coerced into an integer.
static bool test_numeric_string_not_coerced() {
    try {
        argument_validator::validate(truncate_like_spec(), json{{"text", "abc"}, {"max_length", "10"}});
    } catch (const mcp_tools::TypeMismatchError &error) {
        bool success = error.parameter() == "max_length" && error.expected() == "integer" &&
                       error.actual() == "string" &&
                       std::string(error.what()) == "argument 'max_length' must be integer, got string";
        return report(success, "numeric string for integer raises TypeMismatchError");
    }
    return report(false, "numeric string for integer should raise TypeMismatchError");
}

// Test: floating point numbers are not integers, booleans are not integers.
static bool test_number_kinds_are_strict() {
    bool float_rejected = false;
    try {
        argument_validator::validate(truncate_like_spec(), json{{"text", "abc"}, {"max_length", 10.0}});
    } catch (const mcp_tools::TypeMismatchError &error) {
        float_rejected = error.actual() == "number";
    }

    bool boolean_rejected = false;
    try {
        argument_validator::validate(truncate_like_spec(), json{{"text", "abc"}, {"max_length", true}});
    } catch (const mcp_tools::TypeMismatchError &error) {
        boolean_rejected = error.actual() == "boolean";
    }

    bool integer_for_boolean_rejected = false;
    try {
        argument_validator::validate(truncate_like_spec(), json{{"text", "abc"}, {"strict", 1}});
    } catch (const mcp_tools::TypeMismatchError &error) {
        integer_for_boolean_rejected = error.parameter() == "strict" && error.actual() == "integer";
    }

    return report(float_rejected && boolean_rejected && integer_for_boolean_rejected,
                  "floats and booleans are not integers, integers are not booleans");
}

// Test: null for a required string is a type mismatch, not a missing argument.
static bool test_null_is_type_mismatch() {
    try {
        argument_validator::validate(truncate_like_spec(), json{{"text", nullptr}});
    } catch (const mcp_tools::TypeMismatchError &error) {
        return report(error.actual() == "null", "explicit null raises TypeMismatchError (actual null)");
    } catch (const mcp_tools::MissingArgumentError &) {
        return report(false, "explicit null should not count as missing");
    }
    return report(false, "explicit null should raise TypeMismatchError");
}

// Test: the input mapping is never modified.
static bool test_input_not_mutated() {
    const json arguments = {{"text", "abc"}, {"extra", 1}};
    json copy = arguments;
    argument_validator::validate(truncate_like_spec(), arguments);
    return report(arguments == copy, "validate leaves the incoming arguments untouched");
}

// Test: an optional parameter without a default stays absent.
static bool test_optional_without_default_absent() {
    std::vector<ParameterSpec> spec = {{"note", ParameterType::String, false, std::nullopt, ""}};
    json normalized = argument_validator::validate(spec, json::object());
    return report(normalized == json::object(), "optional parameter without default is left out");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_missing_required_argument();
    all_passed &= test_defaults_applied();
    all_passed &= test_explicit_values_kept();
    all_passed &= test_validation_is_idempotent();
    all_passed &= test_unknown_keys_ignored();
    all_passed &= test_numeric_string_not_coerced();
    all_passed &= test_number_kinds_are_strict();
    all_passed &= test_null_is_type_mismatch();
    all_passed &= test_input_not_mutated();
    all_passed &= test_optional_without_default_absent();
    return all_passed;
}

} // namespace test_argument_validator

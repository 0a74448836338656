#ifndef TMCPS_TOOL_ERRORS_HPP
#define TMCPS_TOOL_ERRORS_HPP

// Failures raised by the tool registry, the argument validator and tool handlers.
// The dispatcher converts every one of them into a CallResult; none of these
// types reach the transport.

#include <stdexcept>
#include <string>

namespace mcp_tools {

// register_tool() called twice with the same name.
class DuplicateToolError : public std::runtime_error {
public:
    explicit DuplicateToolError(const std::string &tool_name)
        : std::runtime_error("tool '" + tool_name + "' is already registered"), tool_name_(tool_name) {}

    const std::string &tool_name() const { return tool_name_; }

private:
    std::string tool_name_;
};

// lookup() of a name that was never registered.
class UnknownToolError : public std::runtime_error {
public:
    explicit UnknownToolError(const std::string &tool_name)
        : std::runtime_error("tool '" + tool_name + "' not found"), tool_name_(tool_name) {}

    const std::string &tool_name() const { return tool_name_; }

private:
    std::string tool_name_;
};

// Base of every argument validation failure.
class ArgumentError : public std::runtime_error {
public:
    ArgumentError(const std::string &parameter, const std::string &message)
        : std::runtime_error(message), parameter_(parameter) {}

    const std::string &parameter() const { return parameter_; }

private:
    std::string parameter_;
};

class MissingArgumentError : public ArgumentError {
public:
    explicit MissingArgumentError(const std::string &parameter)
        : ArgumentError(parameter, "missing required argument '" + parameter + "'") {}
};

class TypeMismatchError : public ArgumentError {
public:
    TypeMismatchError(const std::string &parameter, const std::string &expected, const std::string &actual)
        : ArgumentError(parameter, "argument '" + parameter + "' must be " + expected + ", got " + actual),
          expected_(expected), actual_(actual) {}

    const std::string &expected() const { return expected_; }
    const std::string &actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

// Thrown by a handler that rejects its (already validated) input for domain reasons.
// The message is returned to the caller verbatim.
class ToolExecutionError : public std::runtime_error {
public:
    explicit ToolExecutionError(const std::string &message) : std::runtime_error(message) {}
};

} // namespace mcp_tools

#endif // TMCPS_TOOL_ERRORS_HPP

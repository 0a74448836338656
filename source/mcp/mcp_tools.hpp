#ifndef TMCPS_MCP_TOOLS_HPP
#define TMCPS_MCP_TOOLS_HPP

// MCP tool registry: tool descriptors, registration, lookup and listing.
// Filled once at startup, then only read; lookups need no locking.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

#include "mcp/tool_errors.hpp"

namespace mcp_tools {

using json = nlohmann::json;

// A tool handler function: receives the normalized arguments object and returns
// the tool's value. May throw ToolExecutionError.
using ToolHandler = std::function<json(const json &arguments)>;

enum class ParameterType {
    String,
    Integer,
    Boolean
};

// JSON schema name of a parameter type ("string", "integer", "boolean").
const char *parameter_type_name(ParameterType type);

struct ParameterSpec {
    std::string name;
    ParameterType type = ParameterType::String;
    bool required = true;
    std::optional<json> default_value; // used when the argument is absent and not required
    std::string description;
};

// Description of a registered tool.
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;
    ToolHandler handler;
};

class ToolRegistry {
public:
    // Throws DuplicateToolError if a tool with the same name is already registered.
    void register_tool(ToolDescriptor descriptor);

    // Throws UnknownToolError if no tool has this name.
    const ToolDescriptor &lookup(const std::string &tool_name) const;

    bool contains(const std::string &tool_name) const;

    // All tools, in registration order.
    const std::vector<ToolDescriptor> &list() const { return tools_; }

private:
    std::vector<ToolDescriptor> tools_;
    std::unordered_map<std::string, size_t> index_by_name_;
};

// MCP inputSchema (JSON schema object) for a tool's parameters.
json build_input_schema(const ToolDescriptor &descriptor);

// Build the response payload for tools/list.
json build_tools_list_response(const ToolRegistry &registry);

// Build the discovery document served over HTTP: name, description, parameters.
json build_discovery_response(const ToolRegistry &registry);

} // namespace mcp_tools

#endif // TMCPS_MCP_TOOLS_HPP

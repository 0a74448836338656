#include "mcp/mcp_tools.hpp"

#include <utility>

namespace mcp_tools {

const char *parameter_type_name(ParameterType type) {
    switch (type) {
    case ParameterType::String:
        return "string";
    case ParameterType::Integer:
        return "integer";
    case ParameterType::Boolean:
        return "boolean";
    }
    return "string";
}

void ToolRegistry::register_tool(ToolDescriptor descriptor) {
    if (index_by_name_.count(descriptor.name) != 0) {
        throw DuplicateToolError(descriptor.name);
    }
    index_by_name_.emplace(descriptor.name, tools_.size());
    tools_.push_back(std::move(descriptor));
}

const ToolDescriptor &ToolRegistry::lookup(const std::string &tool_name) const {
    auto iterator = index_by_name_.find(tool_name);
    if (iterator == index_by_name_.end()) {
        throw UnknownToolError(tool_name);
    }
    return tools_[iterator->second];
}

bool ToolRegistry::contains(const std::string &tool_name) const {
    return index_by_name_.count(tool_name) != 0;
}

json build_input_schema(const ToolDescriptor &descriptor) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    json required = json::array();
    for (const auto &parameter : descriptor.parameters) {
        json property;
        property["type"] = parameter_type_name(parameter.type);
        if (!parameter.description.empty()) {
            property["description"] = parameter.description;
        }
        if (parameter.default_value.has_value()) {
            property["default"] = *parameter.default_value;
        }
        input_schema["properties"][parameter.name] = property;

        if (parameter.required) {
            required.push_back(parameter.name);
        }
    }
    input_schema["required"] = required;
    return input_schema;
}

json build_tools_list_response(const ToolRegistry &registry) {
    json tools_array = json::array();
    for (const auto &tool : registry.list()) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = build_input_schema(tool);
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json build_discovery_response(const ToolRegistry &registry) {
    json tools_array = json::array();
    for (const auto &tool : registry.list()) {
        json parameters = json::array();
        for (const auto &parameter : tool.parameters) {
            json parameter_entry;
            parameter_entry["name"] = parameter.name;
            parameter_entry["type"] = parameter_type_name(parameter.type);
            parameter_entry["required"] = parameter.required;
            if (parameter.default_value.has_value()) {
                parameter_entry["default"] = *parameter.default_value;
            }
            parameters.push_back(parameter_entry);
        }

        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["parameters"] = parameters;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

} // namespace mcp_tools

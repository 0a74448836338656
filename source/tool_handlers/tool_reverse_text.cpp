#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "text/text_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "reverse_text".
// Returns the characters of the text in reverse order.

static json handle_reverse_text(const json &arguments) {
    return text_tools::reverse_text(arguments["text"].get<std::string>());
}

namespace tool_reverse_text {

void register_tool(mcp_tools::ToolRegistry &registry) {
    mcp_tools::ParameterSpec text;
    text.name = "text";
    text.type = mcp_tools::ParameterType::String;
    text.required = true;
    text.description = "The text to reverse";

    registry.register_tool({
        "reverse_text",
        "Reverse the characters in a text string.",
        {text},
        handle_reverse_text
    });
}

} // namespace tool_reverse_text

#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "text/text_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "slugify".

static json handle_slugify(const json &arguments) {
    return text_tools::slugify(arguments["text"].get<std::string>());
}

namespace tool_slugify {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "slugify",
        "Convert text into a URL-safe slug.",
        {{"text", mcp_tools::ParameterType::String, true, std::nullopt, "The text to slugify"}},
        handle_slugify
    });
}

} // namespace tool_slugify

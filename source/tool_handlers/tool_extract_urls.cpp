#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "text/text_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "extract_urls".
// Lists http(s) URLs found in a block of text.

static json handle_extract_urls(const json &arguments) {
    std::string text = arguments["text"].get<std::string>();
    std::vector<std::string> urls = text_tools::extract_urls(text);

    json result;
    result["text"] = text;
    result["urls"] = urls;
    result["count"] = urls.size();
    return result;
}

namespace tool_extract_urls {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "extract_urls",
        "Extract all URLs from a block of text.",
        {{"text", mcp_tools::ParameterType::String, true, std::nullopt, "The text to search for URLs"}},
        handle_extract_urls
    });
}

} // namespace tool_extract_urls

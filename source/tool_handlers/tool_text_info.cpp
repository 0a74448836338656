#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "text/text_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "text_info".
// Character, word and line statistics of a text.

static json handle_text_info(const json &arguments) {
    std::string text = arguments["text"].get<std::string>();
    text_tools::TextInfo info = text_tools::text_info(text);

    json result;
    result["text"] = text;
    result["length"] = info.length;
    result["word_count"] = info.word_count;
    result["char_count_no_spaces"] = info.char_count_no_spaces;
    result["uppercase_count"] = info.uppercase_count;
    result["lowercase_count"] = info.lowercase_count;
    result["digit_count"] = info.digit_count;
    result["line_count"] = info.line_count;
    return result;
}

namespace tool_text_info {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "text_info",
        "Analyze a text string: word count, character breakdown, line count.",
        {{"text", mcp_tools::ParameterType::String, true, std::nullopt, "The text to analyze"}},
        handle_text_info
    });
}

} // namespace tool_text_info

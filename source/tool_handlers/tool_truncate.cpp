#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "text/text_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

using json = nlohmann::json;

// Tool handler for "truncate".
// Shortens text to max_length characters (suffix included), breaking at a word boundary.

static json handle_truncate(const json &arguments) {
    std::string text = arguments["text"].get<std::string>();
    const json &max_length_value = arguments["max_length"];
    // Unsigned values past INT64_MAX would wrap negative; any of them exceeds every text.
    int64_t max_length = max_length_value.is_number_unsigned() &&
                                 max_length_value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
                             ? std::numeric_limits<int64_t>::max()
                             : max_length_value.get<int64_t>();
    std::string suffix = arguments["suffix"].get<std::string>();

    text_tools::TruncateResult truncate_result = text_tools::truncate(text, max_length, suffix);
    if (!truncate_result.success) {
        throw mcp_tools::ToolExecutionError(truncate_result.error_text);
    }

    debug_log::log(std::string("truncate was_truncated=") + (truncate_result.was_truncated ? "true" : "false"));
    return truncate_result.text;
}

namespace tool_truncate {

void register_tool(mcp_tools::ToolRegistry &registry) {
    mcp_tools::ParameterSpec text{"text", mcp_tools::ParameterType::String, true, std::nullopt,
                                  "The text to truncate"};
    mcp_tools::ParameterSpec max_length{"max_length", mcp_tools::ParameterType::Integer, false, json(100),
                                        "Maximum length of the result, suffix included"};
    mcp_tools::ParameterSpec suffix{"suffix", mcp_tools::ParameterType::String, false, json("..."),
                                    "Appended when the text is cut"};

    registry.register_tool({
        "truncate",
        "Truncate text at a word boundary with a configurable suffix.",
        {text, max_length, suffix},
        handle_truncate
    });
}

} // namespace tool_truncate

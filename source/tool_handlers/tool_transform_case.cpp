#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "text/text_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "transform_case".
// Converts text between snake_case, SCREAMING_SNAKE_CASE, camelCase, PascalCase,
// kebab-case and Title Case.

static json handle_transform_case(const json &arguments) {
    std::string text = arguments["text"].get<std::string>();
    std::string target = arguments["target_case"].get<std::string>();

    text_tools::CaseResult case_result = text_tools::transform_case(text, target);
    if (!case_result.success) {
        throw mcp_tools::ToolExecutionError(case_result.error_text);
    }

    debug_log::log("transform_case " + case_result.detected_format + " -> " + target);
    return case_result.text;
}

namespace tool_transform_case {

void register_tool(mcp_tools::ToolRegistry &registry) {
    std::string styles;
    for (const auto &style : text_tools::supported_case_styles()) {
        styles += styles.empty() ? style : ", " + style;
    }

    registry.register_tool({
        "transform_case",
        "Convert text between case formats. Supported targets: " + styles + ".",
        {
            {"text", mcp_tools::ParameterType::String, true, std::nullopt, "The text to convert"},
            {"target_case", mcp_tools::ParameterType::String, true, std::nullopt,
             "Target case format, one of: " + styles},
        },
        handle_transform_case
    });
}

} // namespace tool_transform_case

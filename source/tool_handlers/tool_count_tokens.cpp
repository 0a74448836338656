#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "text/text_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "count_tokens".
// Word-based estimate (words * 1.3, rounded up); not tied to any real tokenizer.

static json handle_count_tokens(const json &arguments) {
    std::string text = arguments["text"].get<std::string>();
    text_tools::TokenEstimate estimate = text_tools::count_tokens(text);

    json result;
    result["text"] = text;
    result["estimated_tokens"] = estimate.estimated_tokens;
    result["word_count"] = estimate.word_count;
    result["char_count"] = estimate.char_count;
    result["method"] = text_tools::TOKEN_ESTIMATION_METHOD;
    return result;
}

namespace tool_count_tokens {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "count_tokens",
        "Estimate the token count for a text string. Uses a word-based heuristic "
        "(words * 1.3) which approximates most LLM tokenizers; useful for checking "
        "whether text fits within a context window.",
        {{"text", mcp_tools::ParameterType::String, true, std::nullopt, "The text to measure"}},
        handle_count_tokens
    });
}

} // namespace tool_count_tokens

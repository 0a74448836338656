#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_reverse_text { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_text_info { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_transform_case { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_slugify { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_extract_urls { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_truncate { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_count_tokens { void register_tool(mcp_tools::ToolRegistry &registry); }

namespace tool_handlers {

void register_all_tools(mcp_tools::ToolRegistry &registry) {
    tool_reverse_text::register_tool(registry);
    tool_text_info::register_tool(registry);
    tool_transform_case::register_tool(registry);
    tool_slugify::register_tool(registry);
    tool_extract_urls::register_tool(registry);
    tool_truncate::register_tool(registry);
    tool_count_tokens::register_tool(registry);
}

mcp_tools::ToolRegistry build_registry() {
    mcp_tools::ToolRegistry registry;
    register_all_tools(registry);
    return registry;
}

} // namespace tool_handlers

#ifndef TMCPS_TOOL_HANDLERS_HPP
#define TMCPS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "mcp/mcp_tools.hpp"

namespace tool_handlers {

// Register all available tool handlers with the given registry.
void register_all_tools(mcp_tools::ToolRegistry &registry);

// Registry holding every tool, built once at startup and read-only afterwards.
mcp_tools::ToolRegistry build_registry();

} // namespace tool_handlers

#endif // TMCPS_TOOL_HANDLERS_HPP

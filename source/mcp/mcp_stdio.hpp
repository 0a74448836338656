#ifndef TMCPS_MCP_STDIO_HPP
#define TMCPS_MCP_STDIO_HPP

// MCP stdio transport: JSON-RPC messages on stdin/stdout, logs on stderr.

#include <atomic>
#include <iosfwd>
#include <string>

#include "mcp/mcp_tools.hpp"

namespace mcp_stdio {

// Read a single complete JSON object from the stream.
// Returns the raw JSON string, or empty string on EOF / error.
std::string read_message(std::istream &input);

// Write a JSON message followed by a newline, then flush.
void write_message(std::ostream &output, const std::string &json_string);

// Write a log message to stderr (MCP spec allows this for logging).
void log_message(const std::string &message);

// Message loop: read, dispatch, write until EOF or shutdown_requested is set.
void serve(const mcp_tools::ToolRegistry &registry, std::istream &input, std::ostream &output,
           const std::atomic<bool> &shutdown_requested);

} // namespace mcp_stdio

#endif // TMCPS_MCP_STDIO_HPP

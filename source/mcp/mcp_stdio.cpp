#include "mcp/mcp_stdio.hpp"

#include <iostream>
#include <string>

#include "mcp/mcp_dispatch.hpp"
#include "utils/debug_log.hpp"

// MCP stdio transport: reading JSON messages from stdin and writing to stdout.
// Uses brace-counting with string/escape awareness for framing,
// so it works both with newline-delimited and streamed JSON.

namespace mcp_stdio {

// Tracks { } depth, respecting strings and escapes.
std::string read_message(std::istream &input) {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool started = false;

    char character;
    while (input.get(character)) {
        if (!started) {
            if (character == '{') {
                started = true;
                brace_depth = 1;
                buffer += character;
            }
            // Ignore anything before the first '{' (whitespace, newlines, etc.)
            continue;
        }

        buffer += character;

        if (escape_next) {
            escape_next = false;
            continue;
        }

        if (character == '\\' && inside_string) {
            escape_next = true;
            continue;
        }

        if (character == '"') {
            inside_string = !inside_string;
            continue;
        }

        if (inside_string) {
            continue;
        }

        if (character == '{') {
            brace_depth++;
        } else if (character == '}') {
            brace_depth--;
            if (brace_depth == 0) {
                return buffer;
            }
        }
    }

    // EOF reached without a complete message.
    return "";
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

void log_message(const std::string &message) {
    std::cerr << "[tmcps] " << message << std::endl;
}

void serve(const mcp_tools::ToolRegistry &registry, std::istream &input, std::ostream &output,
           const std::atomic<bool> &shutdown_requested) {
    while (!shutdown_requested) {
        std::string raw_message = read_message(input);

        if (raw_message.empty()) {
            // EOF on stdin means the client disconnected.
            log_message("EOF on stdin. Shutting down.");
            break;
        }

        debug_log::log("Received " + std::to_string(raw_message.size()) + " bytes");
        std::string response = mcp_dispatch::handle_raw_message(registry, raw_message);
        if (!response.empty()) {
            write_message(output, response);
        }
    }
}

} // namespace mcp_stdio

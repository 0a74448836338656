// TMCPS - Text utilities Model Context Protocol Server
// Entry point: stdio or HTTP MCP server.
//
// stdio: reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// http:  serves POST /mcp, GET /health and GET /tools.
// Logs go to stderr (permitted by MCP spec).

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "config/server_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_http.hpp"
#include "mcp/mcp_stdio.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

// Global flag for graceful shutdown.
static std::atomic<bool> shutdown_requested(false);

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = true;
}

int main(int argc, char *argv[]) {
    std::vector<std::string> arguments(argv + 1, argv + argc);
    server_config::ParseResult parsed = server_config::parse(arguments);

    switch (parsed.action) {
    case server_config::Action::ShowHelp:
        std::cout << server_config::usage(argv[0]);
        return 0;
    case server_config::Action::ShowVersion:
        std::cout << mcp_dispatch::SERVER_NAME << " " << mcp_dispatch::SERVER_VERSION << std::endl;
        return 0;
    case server_config::Action::Fail:
        std::cerr << "[tmcps] " << parsed.error_message << std::endl;
        std::cerr << server_config::usage(argv[0]);
        return 2;
    case server_config::Action::Serve:
        break;
    }

    const server_config::ServerConfig &config = parsed.config;
    std::cerr << "[tmcps] tmcps - Text MCP Server " << mcp_dispatch::SERVER_VERSION << ", build " << __DATE__
              << " " << __TIME__ << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const mcp_tools::ToolRegistry registry = tool_handlers::build_registry();
    debug_log::log("Registered " + std::to_string(registry.list().size()) + " tools, transport=" +
                   server_config::transport_name(config.transport));

    if (config.transport == server_config::Transport::Http) {
        if (!mcp_http::serve(registry, config, shutdown_requested)) {
            return 1;
        }
    } else {
        mcp_stdio::log_message("TMCPS started. Waiting for MCP messages on stdin.");
        mcp_stdio::serve(registry, std::cin, std::cout, shutdown_requested);
    }

    mcp_stdio::log_message("TMCPS shut down.");
    return 0;
}

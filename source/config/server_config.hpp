#ifndef TMCPS_SERVER_CONFIG_HPP
#define TMCPS_SERVER_CONFIG_HPP

// Startup configuration: command-line flags override TMCPS_* environment variables,
// which override the defaults below.

#include <cstddef>
#include <string>
#include <vector>

namespace server_config {

enum class Transport {
    Stdio,
    Http
};

struct ServerConfig {
    Transport transport = Transport::Stdio;
    std::string host = "0.0.0.0";
    int port = 8000;
    size_t max_body_bytes = 1024 * 1024;
};

// What the process should do after parsing its arguments.
enum class Action {
    Serve,
    ShowHelp,
    ShowVersion,
    Fail
};

struct ParseResult {
    Action action = Action::Serve;
    ServerConfig config;
    std::string error_message; // set when action == Fail
};

// Look up an environment variable; returns empty string if unset.
using EnvironmentLookup = std::string (*)(const char *name);

std::string process_environment(const char *name);

// Resolve the configuration from arguments (without the program name) and environment.
ParseResult parse(const std::vector<std::string> &arguments, EnvironmentLookup environment = process_environment);

// Usage text for --help.
std::string usage(const std::string &program_name);

const char *transport_name(Transport transport);

} // namespace server_config

#endif // TMCPS_SERVER_CONFIG_HPP

#include "config/server_config.hpp"

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace server_config {

namespace {

bool parse_transport(const std::string &value, Transport &transport) {
    if (value == "stdio") {
        transport = Transport::Stdio;
        return true;
    }
    if (value == "http") {
        transport = Transport::Http;
        return true;
    }
    return false;
}

// Parses a whole decimal string into [minimum, maximum].
bool parse_number(const std::string &value, long long minimum, long long maximum, long long &output) {
    if (value.empty()) {
        return false;
    }
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed, 10);
    } catch (const std::invalid_argument &) {
        return false;
    } catch (const std::out_of_range &) {
        return false;
    }
    if (consumed != value.size() || parsed < minimum || parsed > maximum) {
        return false;
    }
    output = parsed;
    return true;
}

// Applies one named setting; on failure fills error_message.
bool apply_setting(ServerConfig &config, const std::string &name, const std::string &value,
                   std::string &error_message) {
    if (name == "transport") {
        if (!parse_transport(value, config.transport)) {
            error_message = "invalid transport '" + value + "' (expected stdio or http)";
            return false;
        }
        return true;
    }
    if (name == "host") {
        if (value.empty()) {
            error_message = "host must not be empty";
            return false;
        }
        config.host = value;
        return true;
    }
    if (name == "port") {
        long long port = 0;
        if (!parse_number(value, 1, 65535, port)) {
            error_message = "invalid port '" + value + "' (expected 1-65535)";
            return false;
        }
        config.port = static_cast<int>(port);
        return true;
    }
    if (name == "max-body-bytes") {
        long long bytes = 0;
        if (!parse_number(value, 1, std::numeric_limits<int32_t>::max(), bytes)) {
            error_message = "invalid max-body-bytes '" + value + "'";
            return false;
        }
        config.max_body_bytes = static_cast<size_t>(bytes);
        return true;
    }
    error_message = "unknown option '--" + name + "'";
    return false;
}

struct EnvironmentSetting {
    const char *variable;
    const char *name;
};

const EnvironmentSetting kEnvironmentSettings[] = {
    {"TMCPS_TRANSPORT", "transport"},
    {"TMCPS_HOST", "host"},
    {"TMCPS_PORT", "port"},
    {"TMCPS_MAX_BODY_BYTES", "max-body-bytes"},
};

} // namespace

std::string process_environment(const char *name) {
    const char *value = std::getenv(name);
    return value == nullptr ? std::string() : std::string(value);
}

ParseResult parse(const std::vector<std::string> &arguments, EnvironmentLookup environment) {
    ParseResult result;

    for (const auto &setting : kEnvironmentSettings) {
        std::string value = environment(setting.variable);
        if (value.empty()) {
            continue;
        }
        if (!apply_setting(result.config, setting.name, value, result.error_message)) {
            result.error_message = std::string(setting.variable) + ": " + result.error_message;
            result.action = Action::Fail;
            return result;
        }
    }

    for (size_t index = 0; index < arguments.size(); ++index) {
        const std::string &argument = arguments[index];

        if (argument == "--help" || argument == "-h") {
            result.action = Action::ShowHelp;
            return result;
        }
        if (argument == "--version") {
            result.action = Action::ShowVersion;
            return result;
        }
        if (argument.compare(0, 2, "--") != 0) {
            result.error_message = "unexpected argument '" + argument + "'";
            result.action = Action::Fail;
            return result;
        }

        // Accept both "--name value" and "--name=value".
        std::string name = argument.substr(2);
        std::string value;
        auto equals_position = name.find('=');
        if (equals_position != std::string::npos) {
            value = name.substr(equals_position + 1);
            name = name.substr(0, equals_position);
        } else if (index + 1 < arguments.size()) {
            value = arguments[++index];
        } else {
            result.error_message = "missing value for '--" + name + "'";
            result.action = Action::Fail;
            return result;
        }

        if (!apply_setting(result.config, name, value, result.error_message)) {
            result.action = Action::Fail;
            return result;
        }
    }

    return result;
}

std::string usage(const std::string &program_name) {
    return "Usage: " + program_name + " [options]\n"
           "\n"
           "Text utilities MCP server (JSON-RPC 2.0 over stdio or HTTP).\n"
           "\n"
           "Options:\n"
           "  --transport stdio|http   Transport to serve on (env TMCPS_TRANSPORT, default stdio)\n"
           "  --host ADDRESS           HTTP listen address (env TMCPS_HOST, default 0.0.0.0)\n"
           "  --port PORT              HTTP listen port (env TMCPS_PORT, default 8000)\n"
           "  --max-body-bytes N       Largest accepted HTTP request body (env TMCPS_MAX_BODY_BYTES, default 1048576)\n"
           "  --version                Print the version and exit\n"
           "  -h, --help               Print this help and exit\n"
           "\n"
           "Set TMCPS_DEBUG=1 for debug logging on stderr.\n";
}

const char *transport_name(Transport transport) {
    return transport == Transport::Http ? "http" : "stdio";
}

} // namespace server_config

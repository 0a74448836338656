#include "mcp/mcp_dispatch.hpp"

#include <exception>
#include <utility>

#include "mcp/argument_validator.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

const char *const PROTOCOL_VERSION = "2024-11-05";

const char *const SERVER_NAME = "tmcps";
const char *const SERVER_VERSION = "0.1.0";
// Description so that MCP clients can tell what this server is for.
static const char *const SERVER_DESCRIPTION =
    "Text utilities MCP server: pure text-manipulation tools. Use it to reverse "
    "text, analyze text statistics, convert between case styles, build URL slugs, "
    "extract URLs, truncate text on a word boundary, or estimate token counts.";

int error_code(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MethodNotFound:
        return json_rpc::METHOD_NOT_FOUND;
    case ErrorKind::InvalidParams:
        return json_rpc::INVALID_PARAMS;
    case ErrorKind::ToolExecutionError:
        return json_rpc::TOOL_EXECUTION_ERROR;
    case ErrorKind::InternalError:
        return json_rpc::INTERNAL_ERROR;
    }
    return json_rpc::INTERNAL_ERROR;
}

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MethodNotFound:
        return "MethodNotFound";
    case ErrorKind::InvalidParams:
        return "InvalidParams";
    case ErrorKind::ToolExecutionError:
        return "ToolExecutionError";
    case ErrorKind::InternalError:
        return "InternalError";
    }
    return "InternalError";
}

CallResult CallResult::make_success(json value) {
    CallResult result;
    result.success = true;
    result.value = std::move(value);
    return result;
}

CallResult CallResult::make_failure(ErrorKind kind, const std::string &message) {
    CallResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

static CallResult unexpected_failure(const std::string &tool_name, const std::string &detail) {
    debug_log::log("tool '" + tool_name + "' failed unexpectedly: " + detail);
    return CallResult::make_failure(ErrorKind::InternalError, "unexpected error");
}

CallResult dispatch(const mcp_tools::ToolRegistry &registry, const CallRequest &request) {
    // Received -> Resolved
    const mcp_tools::ToolDescriptor *descriptor = nullptr;
    try {
        descriptor = &registry.lookup(request.tool_name);
    } catch (const mcp_tools::UnknownToolError &error) {
        return CallResult::make_failure(ErrorKind::MethodNotFound, error.what());
    } catch (const std::exception &error) {
        return unexpected_failure(request.tool_name, error.what());
    }

    // Resolved -> Validated
    json normalized_arguments;
    try {
        normalized_arguments = argument_validator::validate(descriptor->parameters, request.arguments);
    } catch (const mcp_tools::ArgumentError &error) {
        return CallResult::make_failure(ErrorKind::InvalidParams, error.what());
    } catch (const std::exception &error) {
        return unexpected_failure(request.tool_name, error.what());
    }

    // Validated -> Invoked
    try {
        return CallResult::make_success(descriptor->handler(normalized_arguments));
    } catch (const mcp_tools::ToolExecutionError &error) {
        return CallResult::make_failure(ErrorKind::ToolExecutionError, error.what());
    } catch (const std::exception &error) {
        return unexpected_failure(request.tool_name, error.what());
    } catch (...) {
        return unexpected_failure(request.tool_name, "non-standard exception");
    }
}

json build_tool_result(const json &value) {
    json text_content;
    text_content["type"] = "text";

    json result;
    if (value.is_object()) {
        text_content["text"] = value.dump();
        result["structuredContent"] = value;
    } else {
        text_content["text"] = value.is_string() ? value.get<std::string>() : value.dump();
        result["structuredContent"] = {{"result", value}};
    }
    result["content"] = json::array({text_content});
    result["isError"] = false;
    return result;
}

// Handle the "initialize" request.
static json handle_initialize(const json &request_id, const json &params) {
    (void)params; // Client capabilities do not change what we offer.

    json capabilities;
    capabilities["tools"] = json::object(); // We expose tools.

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/list" request.
static json handle_tools_list(const mcp_tools::ToolRegistry &registry, const json &request_id) {
    return json_rpc::build_response(request_id, mcp_tools::build_tools_list_response(registry));
}

// Handle the "tools/call" request.
static json handle_tools_call(const mcp_tools::ToolRegistry &registry, const json &request_id,
                              const json &params) {
    CallRequest call;
    call.id = request_id;

    if (params.contains("name") && params["name"].is_string()) {
        call.tool_name = params["name"].get<std::string>();
    } else {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Missing or invalid 'name' in tools/call");
    }

    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                   "'arguments' in tools/call must be an object");
        }
        call.arguments = params["arguments"];
    }

    CallResult outcome = dispatch(registry, call);
    if (!outcome.success) {
        debug_log::log("tools/call " + call.tool_name + " -> " + error_kind_name(outcome.error_kind) + ": " +
                       outcome.error_message);
        return json_rpc::build_error_response(call.id, error_code(outcome.error_kind), outcome.error_message);
    }

    debug_log::log("tools/call " + call.tool_name + " -> ok");
    return json_rpc::build_response(call.id, build_tool_result(outcome.value));
}

json dispatch_message(const mcp_tools::ToolRegistry &registry, const json &message) {
    std::string invalid_reason;
    if (!json_rpc::is_valid_request(message, invalid_reason)) {
        debug_log::log("Invalid JSON-RPC request: " + invalid_reason);
        json request_id = json_rpc::get_id(message);
        if (!request_id.is_string() && !request_id.is_number()) {
            request_id = nullptr;
        }
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Invalid Request",
                                               invalid_reason);
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Handle notifications (no response expected).
    if (json_rpc::is_notification(message)) {
        debug_log::log("Notification received: " + method);
        return nullptr;
    }

    // Route to the appropriate handler.
    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return handle_tools_list(registry, request_id);
    }
    if (method == "tools/call") {
        return handle_tools_call(registry, request_id, params);
    }

    // Unknown method.
    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                           "Unknown method: " + method);
}

std::string handle_raw_message(const mcp_tools::ToolRegistry &registry, const std::string &raw_message) {
    json parsed_message;
    try {
        parsed_message = json::parse(raw_message);
    } catch (const json::exception &error) {
        // parse_error for malformed text, out_of_range for number literals that overflow.
        debug_log::log("Failed to parse incoming JSON: " + std::string(error.what()));
        // No request id is available.
        return json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error").dump();
    }

    json response = dispatch_message(registry, parsed_message);

    // Notifications return null (no response needed).
    if (response.is_null()) {
        return "";
    }

    // Invalid UTF-8 echoed from the input is replaced rather than failing the whole response.
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace mcp_dispatch

#ifndef TMCPS_MCP_DISPATCH_HPP
#define TMCPS_MCP_DISPATCH_HPP

// Tool call dispatch and MCP JSON-RPC method routing.

#include <nlohmann/json.hpp>
#include <string>

#include "mcp/mcp_tools.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we support.
extern const char *const PROTOCOL_VERSION;

// Server info.
extern const char *const SERVER_NAME;
extern const char *const SERVER_VERSION;

enum class ErrorKind {
    MethodNotFound,
    InvalidParams,
    ToolExecutionError,
    InternalError
};

// JSON-RPC error code for an error kind.
int error_code(ErrorKind kind);

// Short name of an error kind, for logs.
const char *error_kind_name(ErrorKind kind);

struct CallRequest {
    json id;
    std::string tool_name;
    json arguments = json::object();
};

// Outcome of one tool call: a value on success, an error kind and message otherwise.
struct CallResult {
    bool success = false;
    json value;
    ErrorKind error_kind = ErrorKind::InternalError;
    std::string error_message;

    static CallResult make_success(json value);
    static CallResult make_failure(ErrorKind kind, const std::string &message);
};

// Resolve, validate and invoke one tool call. Never throws: every failure is
// reported as one of the four error kinds. Unexpected exceptions are reported as
// InternalError "unexpected error" and their text is only written to the debug log.
CallResult dispatch(const mcp_tools::ToolRegistry &registry, const CallRequest &request);

// Wrap a successful tool value as an MCP tools/call result
// (content + structuredContent + isError).
json build_tool_result(const json &value);

// Dispatch a single decoded JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(const mcp_tools::ToolRegistry &registry, const json &message);

// Parse one raw JSON-RPC message and produce the serialized response, or an empty
// string when no response is due (notification). Malformed JSON yields a -32700
// envelope with a null id.
std::string handle_raw_message(const mcp_tools::ToolRegistry &registry, const std::string &raw_message);

} // namespace mcp_dispatch

#endif // TMCPS_MCP_DISPATCH_HPP

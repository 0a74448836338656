#ifndef TMCPS_MCP_HTTP_HPP
#define TMCPS_MCP_HTTP_HPP

// MCP HTTP transport on libwebsockets.
//   POST /mcp     one JSON-RPC message per request body
//   GET  /health  liveness
//   GET  /tools   tool discovery (name, description, parameters)

#include <atomic>
#include <string>

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"

namespace mcp_http {

// Status codes the router produces.
constexpr int STATUS_OK = 200;
constexpr int STATUS_ACCEPTED = 202;
constexpr int STATUS_NOT_FOUND = 404;
constexpr int STATUS_METHOD_NOT_ALLOWED = 405;
constexpr int STATUS_PAYLOAD_TOO_LARGE = 413;

struct HttpResponse {
    int status = STATUS_OK;
    std::string content_type = "application/json";
    std::string body;
};

// How the body of an incoming request is read before routing.
enum class BodyPlan {
    None,     // route immediately with an empty body
    Await,    // collect the body first (declared length or chunked)
    TooLarge  // declared length exceeds the limit; answer 413 unread
};

// Decide from the raw Content-Length and Transfer-Encoding header values ("" when absent).
BodyPlan plan_body(const std::string &method, const std::string &content_length,
                   const std::string &transfer_encoding, size_t max_body_bytes);

// Route one HTTP request. method is "GET", "POST" or anything else; path may carry a
// query string, which is ignored.
HttpResponse handle_request(const mcp_tools::ToolRegistry &registry, const std::string &method,
                            const std::string &path, const std::string &body, size_t max_body_bytes);

// Listen on config.host:config.port and serve until shutdown_requested is set.
// Returns false if the listener could not be created.
bool serve(const mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config,
           const std::atomic<bool> &shutdown_requested);

} // namespace mcp_http

#endif // TMCPS_MCP_HTTP_HPP

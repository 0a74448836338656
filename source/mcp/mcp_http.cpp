#include "mcp/mcp_http.hpp"

#include <libwebsockets.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <new>
#include <string>
#include <vector>

#include "mcp/mcp_dispatch.hpp"
#include "utils/debug_log.hpp"

namespace mcp_http {

using json = nlohmann::json;

namespace {

// Shared, read-only state handed to the callback through the context user pointer.
struct ServerContext {
    const mcp_tools::ToolRegistry *registry = nullptr;
    size_t max_body_bytes = 0;
};

// One request/response exchange on a connection.
struct HttpExchange {
    std::string method;
    std::string path;
    std::string body;
    bool body_too_large = false;
    bool close_after_response = false;
    bool response_started = false;
    HttpResponse response;
};

// Per-session storage. libwebsockets allocates it raw, so it is constructed on
// LWS_CALLBACK_HTTP_BIND_PROTOCOL and destroyed on LWS_CALLBACK_HTTP_DROP_PROTOCOL.
struct HttpSession {
    std::unique_ptr<HttpExchange> exchange;
};

HttpResponse json_response(int status, const json &payload) {
    HttpResponse response;
    response.status = status;
    response.body = payload.dump();
    return response;
}

std::string normalize_path(const std::string &path) {
    std::string normalized = path.substr(0, path.find('?'));
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized.empty() ? "/" : normalized;
}

std::string header_value(struct lws *connection, enum lws_token_indexes token) {
    int length = lws_hdr_total_length(connection, token);
    if (length <= 0) {
        return "";
    }
    std::vector<char> buffer(static_cast<size_t>(length) + 1, '\0');
    if (lws_hdr_copy(connection, buffer.data(), static_cast<int>(buffer.size()), token) < 0) {
        return "";
    }
    return std::string(buffer.data());
}

void forward_lws_log(int level, const char *line) {
    std::string message = line != nullptr ? line : "";
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    debug_log::log(std::string(level == LLL_ERR ? "lws error: " : "lws: ") + message);
}

// Sends the status line and headers; the body follows on LWS_CALLBACK_HTTP_WRITEABLE.
int begin_response(struct lws *connection, HttpExchange &exchange) {
    unsigned char header_buffer[LWS_PRE + 1024];
    unsigned char *start = &header_buffer[LWS_PRE];
    unsigned char *position = start;
    unsigned char *end = &header_buffer[sizeof(header_buffer) - 1];

    exchange.response_started = true;
    const HttpResponse &response = exchange.response;
    debug_log::log("HTTP " + exchange.method + " " + exchange.path + " -> " + std::to_string(response.status));

    if (lws_add_http_common_headers(connection, static_cast<unsigned int>(response.status),
                                    response.content_type.c_str(),
                                    static_cast<lws_filepos_t>(response.body.size()), &position, end)) {
        return 1;
    }
    if (lws_finalize_write_http_header(connection, start, &position, end)) {
        return 1;
    }

    lws_callback_on_writable(connection);
    return 0;
}

int finish_exchange(struct lws *connection, HttpSession *session) {
    bool close_connection = session->exchange->close_after_response;
    session->exchange.reset();

    if (close_connection) {
        return -1;
    }
    // Keep-alive: ready for the next request on this connection.
    if (lws_http_transaction_completed(connection)) {
        return -1;
    }
    return 0;
}

int http_callback(struct lws *connection, enum lws_callback_reasons reason, void *user_data,
                  void *incoming_data, size_t incoming_length) {
    HttpSession *session = static_cast<HttpSession *>(user_data);

    switch (reason) {
    case LWS_CALLBACK_HTTP_BIND_PROTOCOL:
        if (session != nullptr) {
            new (session) HttpSession();
        }
        return 0;

    case LWS_CALLBACK_HTTP_DROP_PROTOCOL:
        if (session != nullptr) {
            session->~HttpSession();
        }
        return 0;

    case LWS_CALLBACK_HTTP: {
        const ServerContext *server = static_cast<const ServerContext *>(lws_context_user(lws_get_context(connection)));

        session->exchange = std::make_unique<HttpExchange>();
        HttpExchange &exchange = *session->exchange;

        exchange.path = incoming_data != nullptr ? std::string(static_cast<const char *>(incoming_data), incoming_length)
                                                 : std::string("/");
        if (lws_hdr_total_length(connection, WSI_TOKEN_POST_URI) > 0) {
            exchange.method = "POST";
        } else if (lws_hdr_total_length(connection, WSI_TOKEN_GET_URI) > 0) {
            exchange.method = "GET";
        } else {
            exchange.method = "OTHER";
        }

        switch (plan_body(exchange.method, header_value(connection, WSI_TOKEN_HTTP_CONTENT_LENGTH),
                          header_value(connection, WSI_TOKEN_HTTP_TRANSFER_ENCODING), server->max_body_bytes)) {
        case BodyPlan::TooLarge:
            // Answer without reading the body; the connection cannot be reused.
            exchange.close_after_response = true;
            exchange.response = json_response(STATUS_PAYLOAD_TOO_LARGE, {{"error", "request body too large"}});
            return begin_response(connection, exchange);
        case BodyPlan::Await:
            // Wait for LWS_CALLBACK_HTTP_BODY / LWS_CALLBACK_HTTP_BODY_COMPLETION.
            return 0;
        case BodyPlan::None:
            break;
        }

        exchange.response = handle_request(*server->registry, exchange.method, exchange.path, exchange.body,
                                           server->max_body_bytes);
        return begin_response(connection, exchange);
    }

    case LWS_CALLBACK_HTTP_BODY: {
        if (session->exchange == nullptr) {
            return -1;
        }
        if (session->exchange->response_started) {
            return 0;
        }
        const ServerContext *server = static_cast<const ServerContext *>(lws_context_user(lws_get_context(connection)));
        HttpExchange &exchange = *session->exchange;
        if (exchange.body.size() + incoming_length > server->max_body_bytes) {
            exchange.body_too_large = true;
        } else {
            exchange.body.append(static_cast<const char *>(incoming_data), incoming_length);
        }
        return 0;
    }

    case LWS_CALLBACK_HTTP_BODY_COMPLETION: {
        if (session->exchange == nullptr) {
            return -1;
        }
        if (session->exchange->response_started) {
            return 0;
        }
        const ServerContext *server = static_cast<const ServerContext *>(lws_context_user(lws_get_context(connection)));
        HttpExchange &exchange = *session->exchange;
        if (exchange.body_too_large) {
            exchange.response = json_response(STATUS_PAYLOAD_TOO_LARGE, {{"error", "request body too large"}});
        } else {
            exchange.response = handle_request(*server->registry, exchange.method, exchange.path, exchange.body,
                                               server->max_body_bytes);
        }
        return begin_response(connection, exchange);
    }

    case LWS_CALLBACK_HTTP_WRITEABLE: {
        if (session->exchange == nullptr) {
            return 0;
        }
        const std::string &body = session->exchange->response.body;

        // libwebsockets requires LWS_PRE bytes of padding before the data.
        std::vector<unsigned char> send_buffer(LWS_PRE + body.size());
        if (!body.empty()) {
            std::memcpy(send_buffer.data() + LWS_PRE, body.data(), body.size());
        }
        int bytes_written = lws_write(connection, send_buffer.data() + LWS_PRE, body.size(), LWS_WRITE_HTTP_FINAL);
        if (bytes_written < 0) {
            debug_log::log("HTTP write failed for " + session->exchange->path);
            return -1;
        }
        return finish_exchange(connection, session);
    }

    case LWS_CALLBACK_CLOSED_HTTP:
        if (session != nullptr) {
            session->exchange.reset();
        }
        return 0;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
}

const struct lws_protocols http_protocols[] = {
    {
        "http",
        http_callback,
        sizeof(HttpSession), // per-session data size
        0                    // rx buffer size (default)
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

} // namespace

BodyPlan plan_body(const std::string &method, const std::string &content_length,
                   const std::string &transfer_encoding, size_t max_body_bytes) {
    if (method != "POST") {
        return BodyPlan::None;
    }
    // A chunked body has no declared size; its length is checked as it arrives.
    if (!transfer_encoding.empty()) {
        return BodyPlan::Await;
    }
    unsigned long long declared = std::strtoull(content_length.c_str(), nullptr, 10);
    if (declared > max_body_bytes) {
        return BodyPlan::TooLarge;
    }
    return declared > 0 ? BodyPlan::Await : BodyPlan::None;
}

HttpResponse handle_request(const mcp_tools::ToolRegistry &registry, const std::string &method,
                            const std::string &path, const std::string &body, size_t max_body_bytes) {
    std::string route = normalize_path(path);

    if (route == "/health") {
        if (method != "GET") {
            return json_response(STATUS_METHOD_NOT_ALLOWED, {{"error", "method not allowed"}});
        }
        return json_response(STATUS_OK, {{"status", "healthy"}});
    }

    if (route == "/tools") {
        if (method != "GET") {
            return json_response(STATUS_METHOD_NOT_ALLOWED, {{"error", "method not allowed"}});
        }
        return json_response(STATUS_OK, mcp_tools::build_discovery_response(registry));
    }

    if (route == "/mcp") {
        if (method != "POST") {
            return json_response(STATUS_METHOD_NOT_ALLOWED, {{"error", "method not allowed"}});
        }
        if (body.size() > max_body_bytes) {
            return json_response(STATUS_PAYLOAD_TOO_LARGE, {{"error", "request body too large"}});
        }

        HttpResponse response;
        response.body = mcp_dispatch::handle_raw_message(registry, body);
        // A notification gets no envelope.
        response.status = response.body.empty() ? STATUS_ACCEPTED : STATUS_OK;
        return response;
    }

    return json_response(STATUS_NOT_FOUND, {{"error", "not found"}});
}

bool serve(const mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config,
           const std::atomic<bool> &shutdown_requested) {
    lws_set_log_level(LLL_ERR | LLL_WARN, forward_lws_log);

    ServerContext server_context;
    server_context.registry = &registry;
    server_context.max_body_bytes = config.max_body_bytes;

    struct lws_context_creation_info context_info;
    std::memset(&context_info, 0, sizeof(context_info));
    context_info.port = config.port;
    // A null interface binds every address.
    context_info.iface = (config.host == "0.0.0.0") ? nullptr : config.host.c_str();
    context_info.protocols = http_protocols;
    context_info.user = &server_context;
    context_info.gid = -1;
    context_info.uid = -1;

    struct lws_context *context = lws_create_context(&context_info);
    if (context == nullptr) {
        std::cerr << "[tmcps] Failed to create HTTP listener on " << config.host << ":" << config.port << std::endl;
        return false;
    }

    std::cerr << "[tmcps] Listening on http://" << config.host << ":" << config.port
              << " (POST /mcp, GET /health, GET /tools)" << std::endl;

    while (!shutdown_requested) {
        if (lws_service(context, 100) < 0) {
            debug_log::log("lws_service reported an error, stopping.");
            break;
        }
    }

    lws_context_destroy(context);
    return true;
}

} // namespace mcp_http

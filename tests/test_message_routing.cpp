// Tests for the JSON-RPC envelope layer: method routing, tools/call wrapping,
// protocol errors, stdio framing and the HTTP routes.
// No sockets are opened; the HTTP router is exercised directly.

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_http.hpp"
#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "tool_handlers/tool_handlers.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <iostream>
#include <sstream>
#include <string>

using json = nlohmann::json;

namespace test_message_routing {

static bool report(bool success, const std::string &description) {
    std::cout << (success ? "  OK: " : "  FAIL: ") << description << std::endl;
    return success;
}

static const mcp_tools::ToolRegistry &registry() {
    static const mcp_tools::ToolRegistry instance = tool_handlers::build_registry();
    return instance;
}

static json tools_call(const json &id, const std::string &name, const json &arguments) {
    json message;
    message["jsonrpc"] = "2.0";
    message["id"] = id;
    message["method"] = "tools/call";
    message["params"]["name"] = name;
    message["params"]["arguments"] = arguments;
    return mcp_dispatch::dispatch_message(registry(), message);
}

static bool test_initialize() {
    json response = mcp_dispatch::dispatch_message(registry(), json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                                                                    {"params", json::object()}});
    bool success = response["id"] == 1 && response["result"]["protocolVersion"] == "2024-11-05" &&
                   response["result"]["serverInfo"]["name"] == "tmcps" &&
                   response["result"]["capabilities"].contains("tools");
    return report(success, "initialize returns protocolVersion, serverInfo and tools capability");
}

static bool test_ping() {
    json response = mcp_dispatch::dispatch_message(registry(), json{{"jsonrpc", "2.0"}, {"id", "p"}, {"method", "ping"}});
    return report(response["id"] == "p" && response["result"] == json::object(), "ping returns an empty result");
}

static bool test_tools_list() {
    json response = mcp_dispatch::dispatch_message(registry(), json{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    bool success = response["result"]["tools"].size() == 7 && response["result"]["tools"][0]["name"] == "reverse_text";
    return report(success, "tools/list enumerates the registry");
}

static bool test_notification_gets_no_response() {
    json response = mcp_dispatch::dispatch_message(registry(), json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    return report(response.is_null(), "notifications produce no response");
}

// Test: the success envelope echoes the id and wraps the value.
static bool test_tools_call_success_envelope() {
    json response = tools_call("req-7", "reverse_text", json{{"text", "Hello World"}});
    bool success = response["jsonrpc"] == "2.0" && response["id"] == "req-7" && !response.contains("error") &&
                   response["result"]["content"][0]["text"] == "dlroW olleH" &&
                   response["result"]["structuredContent"]["result"] == "dlroW olleH" &&
                   response["result"]["isError"] == false;
    return report(success, "tools/call success carries the same id and the wrapped value");
}

static bool test_tools_call_record_value() {
    json response = tools_call(3, "text_info", json{{"text", "Hello World 123"}});
    const json &info = response["result"]["structuredContent"];
    bool success = info["length"] == 15 && info["word_count"] == 3 && info["char_count_no_spaces"] == 13 &&
                   info["uppercase_count"] == 2 && info["lowercase_count"] == 8 && info["digit_count"] == 3 &&
                   info["line_count"] == 1;
    return report(success, "text_info record is returned as structuredContent");
}

static bool test_tools_call_error_envelopes() {
    json unknown = tools_call(4, "nonexistent_tool", json::object());
    json invalid = tools_call(5, "truncate", json{{"text", "abc"}, {"max_length", "10"}});
    json domain = tools_call(6, "transform_case", json{{"text", "abc"}, {"target_case", "Sentence case"}});

    bool success = unknown["id"] == 4 && unknown["error"]["code"] == -32601 &&
                   unknown["error"]["message"] == "tool 'nonexistent_tool' not found" && !unknown.contains("result") &&
                   invalid["id"] == 5 && invalid["error"]["code"] == -32602 &&
                   invalid["error"]["message"] == "argument 'max_length' must be integer, got string" &&
                   domain["id"] == 6 && domain["error"]["code"] == -32000;
    return report(success, "tools/call failures become error envelopes with the request id");
}

static bool test_tools_call_without_name() {
    json message = {{"jsonrpc", "2.0"}, {"id", 8}, {"method", "tools/call"}, {"params", {{"arguments", json::object()}}}};
    json response = mcp_dispatch::dispatch_message(registry(), message);
    return report(response["error"]["code"] == -32602, "tools/call without a name is InvalidParams");
}

static bool test_tools_call_non_object_arguments() {
    json message = {{"jsonrpc", "2.0"}, {"id", 9}, {"method", "tools/call"},
                    {"params", {{"name", "reverse_text"}, {"arguments", json::array({"x"})}}}};
    json response = mcp_dispatch::dispatch_message(registry(), message);
    return report(response["error"]["code"] == -32602, "tools/call with array arguments is InvalidParams");
}

static bool test_tools_call_missing_arguments_object() {
    json message = {{"jsonrpc", "2.0"}, {"id", 10}, {"method", "tools/call"}, {"params", {{"name", "reverse_text"}}}};
    json response = mcp_dispatch::dispatch_message(registry(), message);
    bool success = response["error"]["code"] == -32602 &&
                   response["error"]["message"] == "missing required argument 'text'";
    return report(success, "tools/call without arguments validates an empty mapping");
}

static bool test_unknown_method() {
    json response = mcp_dispatch::dispatch_message(registry(), json{{"jsonrpc", "2.0"}, {"id", 11}, {"method", "resources/list"}});
    bool success = response["error"]["code"] == -32601 && response["error"]["message"] == "Unknown method: resources/list";
    return report(success, "unknown JSON-RPC method is -32601");
}

static bool test_invalid_requests() {
    json wrong_version = mcp_dispatch::dispatch_message(registry(), json{{"jsonrpc", "1.0"}, {"id", 12}, {"method", "ping"}});
    json not_object = mcp_dispatch::dispatch_message(registry(), json::array({1, 2}));
    json no_method = mcp_dispatch::dispatch_message(registry(), json{{"jsonrpc", "2.0"}, {"id", 13}});

    bool success = wrong_version["error"]["code"] == -32600 && wrong_version["id"] == 12 &&
                   not_object["error"]["code"] == -32600 && not_object["id"].is_null() &&
                   no_method["error"]["code"] == -32600;
    return report(success, "malformed envelopes are -32600 Invalid Request");
}

static bool test_raw_parse_error() {
    json response = json::parse(mcp_dispatch::handle_raw_message(registry(), "{\"jsonrpc\": \"2.0\", \"id\": 1,"));
    bool success = response["error"]["code"] == -32700 && response["error"]["message"] == "Parse error" &&
                   response["id"].is_null();
    return report(success, "malformed JSON yields -32700 with a null id");
}

// Test: a number literal too large for a double is answered as a parse error, and the
// stdio loop keeps serving afterwards.
static bool test_overflowing_number_is_parse_error() {
    json response = json::parse(mcp_dispatch::handle_raw_message(
        registry(), "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\","
                    "\"params\":{\"name\":\"reverse_text\",\"arguments\":{\"text\":\"hi\",\"x\":1e400}}}"));

    std::istringstream input("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\",\"params\":{\"n\":-1e999}}\n"
                             "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n");
    std::ostringstream output;
    std::atomic<bool> shutdown_requested(false);
    mcp_stdio::serve(registry(), input, output, shutdown_requested);

    std::istringstream lines(output.str());
    std::string first_line;
    std::string second_line;
    std::getline(lines, first_line);
    std::getline(lines, second_line);

    bool success = response["error"]["code"] == -32700 && response["id"].is_null() &&
                   json::parse(first_line)["error"]["code"] == -32700 &&
                   json::parse(second_line)["id"] == 2 && json::parse(second_line).contains("result");
    return report(success, "overflowing number literal yields -32700 and the loop continues");
}

// Test: brace framing handles nested objects, braces in strings and escapes.
static bool test_stdio_framing() {
    std::istringstream input(
        "  {\"a\": {\"b\": \"}{\"}, \"c\": \"say \\\"{hi}\\\"\"}\n"
        "{\"second\": 2}{\"third\": 3}");
    std::string first = mcp_stdio::read_message(input);
    std::string second = mcp_stdio::read_message(input);
    std::string third = mcp_stdio::read_message(input);
    std::string end = mcp_stdio::read_message(input);

    bool success = json::parse(first)["a"]["b"] == "}{" && json::parse(first)["c"] == "say \"{hi}\"" &&
                   json::parse(second)["second"] == 2 && json::parse(third)["third"] == 3 && end.empty();
    return report(success, "stdio framing splits nested and streamed JSON objects");
}

// Test: the stdio loop answers requests in order and skips notifications.
static bool test_stdio_serve_loop() {
    std::istringstream input(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\","
        "\"params\":{\"name\":\"slugify\",\"arguments\":{\"text\":\"Hello, World!\"}}}\n");
    std::ostringstream output;
    std::atomic<bool> shutdown_requested(false);

    mcp_stdio::serve(registry(), input, output, shutdown_requested);

    std::istringstream lines(output.str());
    std::string first_line;
    std::string second_line;
    std::string extra_line;
    std::getline(lines, first_line);
    std::getline(lines, second_line);
    bool has_extra = static_cast<bool>(std::getline(lines, extra_line));

    bool success = !has_extra && json::parse(first_line)["id"] == 1 &&
                   json::parse(second_line)["id"] == 2 &&
                   json::parse(second_line)["result"]["content"][0]["text"] == "hello-world";
    return report(success, "stdio loop writes one line per request, none for notifications");
}

static bool test_http_health_and_discovery() {
    mcp_http::HttpResponse health = mcp_http::handle_request(registry(), "GET", "/health", "", 1024);
    mcp_http::HttpResponse tools = mcp_http::handle_request(registry(), "GET", "/tools/?verbose=1", "", 1024);

    bool success = health.status == 200 && json::parse(health.body) == json{{"status", "healthy"}} &&
                   tools.status == 200 && json::parse(tools.body)["tools"].size() == 7 &&
                   json::parse(tools.body)["tools"][0].contains("parameters");
    return report(success, "GET /health and GET /tools answer 200");
}

static bool test_http_mcp_endpoint() {
    std::string request = "{\"jsonrpc\":\"2.0\",\"id\":\"h1\",\"method\":\"tools/call\","
                          "\"params\":{\"name\":\"count_tokens\",\"arguments\":{\"text\":\"Hello world this is a test\"}}}";
    mcp_http::HttpResponse call = mcp_http::handle_request(registry(), "POST", "/mcp", request, 4096);
    mcp_http::HttpResponse notification = mcp_http::handle_request(
        registry(), "POST", "/mcp", "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}", 4096);
    mcp_http::HttpResponse empty = mcp_http::handle_request(registry(), "POST", "/mcp", "", 4096);

    json call_body = json::parse(call.body);
    bool success = call.status == 200 && call_body["id"] == "h1" &&
                   call_body["result"]["structuredContent"]["word_count"] == 6 &&
                   call_body["result"]["structuredContent"]["estimated_tokens"] == 8 &&
                   notification.status == 202 && notification.body.empty() &&
                   empty.status == 200 && json::parse(empty.body)["error"]["code"] == -32700;
    return report(success, "POST /mcp dispatches JSON-RPC, 202 for notifications, -32700 for empty body");
}

static bool test_http_errors() {
    mcp_http::HttpResponse not_found = mcp_http::handle_request(registry(), "GET", "/nope", "", 1024);
    mcp_http::HttpResponse wrong_method = mcp_http::handle_request(registry(), "GET", "/mcp", "", 1024);
    mcp_http::HttpResponse too_large = mcp_http::handle_request(registry(), "POST", "/mcp", std::string(64, 'x'), 16);

    bool success = not_found.status == 404 && wrong_method.status == 405 && too_large.status == 413;
    return report(success, "unknown path 404, wrong method 405, oversized body 413");
}

// Test: request bodies are awaited for a declared length or chunked transfer,
// rejected unread when the declared length is over the limit.
static bool test_http_body_plan() {
    using mcp_http::BodyPlan;
    bool success = mcp_http::plan_body("POST", "", "chunked", 16) == BodyPlan::Await &&
                   mcp_http::plan_body("POST", "12", "", 16) == BodyPlan::Await &&
                   mcp_http::plan_body("POST", "17", "", 16) == BodyPlan::TooLarge &&
                   mcp_http::plan_body("POST", "0", "", 16) == BodyPlan::None &&
                   mcp_http::plan_body("POST", "", "", 16) == BodyPlan::None &&
                   mcp_http::plan_body("GET", "", "", 16) == BodyPlan::None;
    return report(success, "POST bodies are awaited when sized or chunked, 413 when declared too large");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_initialize();
    all_passed &= test_ping();
    all_passed &= test_tools_list();
    all_passed &= test_notification_gets_no_response();
    all_passed &= test_tools_call_success_envelope();
    all_passed &= test_tools_call_record_value();
    all_passed &= test_tools_call_error_envelopes();
    all_passed &= test_tools_call_without_name();
    all_passed &= test_tools_call_non_object_arguments();
    all_passed &= test_tools_call_missing_arguments_object();
    all_passed &= test_unknown_method();
    all_passed &= test_invalid_requests();
    all_passed &= test_raw_parse_error();
    all_passed &= test_overflowing_number_is_parse_error();
    all_passed &= test_stdio_framing();
    all_passed &= test_stdio_serve_loop();
    all_passed &= test_http_health_and_discovery();
    all_passed &= test_http_mcp_endpoint();
    all_passed &= test_http_errors();
    all_passed &= test_http_body_plan();
    return all_passed;
}

} // namespace test_message_routing

#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    response["error"]["data"] = error_data;
    return response;
}

bool is_valid_request(const json &message, std::string &reason) {
    if (!message.is_object()) {
        reason = "request must be a JSON object";
        return false;
    }

    auto version_iterator = message.find("jsonrpc");
    if (version_iterator == message.end() || !version_iterator->is_string() ||
        version_iterator->get<std::string>() != "2.0") {
        reason = "jsonrpc must be \"2.0\"";
        return false;
    }

    auto method_iterator = message.find("method");
    if (method_iterator == message.end() || !method_iterator->is_string()) {
        reason = "method must be a string";
        return false;
    }

    auto id_iterator = message.find("id");
    if (id_iterator != message.end() && !id_iterator->is_null() && !id_iterator->is_string() &&
        !id_iterator->is_number()) {
        reason = "id must be a string, number or null";
        return false;
    }

    return true;
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.is_object() && message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

} // namespace json_rpc

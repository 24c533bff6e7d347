#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_request(int64_t request_id, const std::string &method, const json &params) {
    json request;
    request["jsonrpc"] = PROTOCOL_TAG;
    request["id"] = request_id;
    request["method"] = method;
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

json build_notification(const std::string &method, const json &params) {
    json notification;
    notification["jsonrpc"] = PROTOCOL_TAG;
    notification["method"] = method;
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = PROTOCOL_TAG;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = PROTOCOL_TAG;
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

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
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
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return message.is_object() && !message.contains("id");
}

ResponseKind classify_response(const json &message) {
    if (!message.is_object()) {
        return ResponseKind::Invalid;
    }
    if (message.contains("result")) {
        return ResponseKind::Result;
    }
    if (message.contains("error")) {
        return ResponseKind::Error;
    }
    return ResponseKind::Invalid;
}

} // namespace json_rpc

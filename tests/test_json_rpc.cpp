// Tests for JSON-RPC envelope construction and response classification.

#include "protocol/json_rpc.hpp"
#include "test_support.hpp"

#include <string>

using json = nlohmann::json;
using test_support::check;

namespace test_json_rpc {

// Test: request envelope has the exact wire members.
static bool test_build_request_fields() {
    json params;
    params["name"] = "ping";
    params["arguments"] = json::object();
    json request = json_rpc::build_request(7, "tools/call", params);

    bool success = request["jsonrpc"] == "2.0" && request["id"] == 7 && request["method"] == "tools/call" &&
                   request["params"] == params && request.size() == 4;
    return check(success, "Request envelope carries jsonrpc, id, method and params");
}

// Test: tools/list goes out without params.
static bool test_build_request_omits_null_params() {
    json request = json_rpc::build_request(1, "tools/list");
    bool success = !request.contains("params") && request.size() == 3;
    return check(success, "Request without params omits the params member");
}

// Test: the serialized request is a single line.
static bool test_request_serializes_to_one_line() {
    json params;
    params["text"] = "line one\nline two";
    std::string serialized = json_rpc::build_request(3, "tools/call", params).dump();
    return check(serialized.find('\n') == std::string::npos, "Serialized request contains no raw newline");
}

// Test: notifications have no id.
static bool test_build_notification() {
    json notification = json_rpc::build_notification("notifications/initialized");
    bool success = notification["jsonrpc"] == "2.0" && notification["method"] == "notifications/initialized" &&
                   !notification.contains("id") && json_rpc::is_notification(notification);
    return check(success, "Notification carries no id and is recognized as one");
}

// Test: error responses keep code, message and data.
static bool test_build_error_response_with_data() {
    json data;
    data["hint"] = "check the tool name";
    json response = json_rpc::build_error_response(4, json_rpc::METHOD_NOT_FOUND, "Method not found", data);
    bool success = response["error"]["code"] == -32601 && response["error"]["message"] == "Method not found" &&
                   response["error"]["data"] == data && response["id"] == 4;
    return check(success, "Error response keeps code, message and data");
}

// Test: classify_response distinguishes result, error and junk.
static bool test_classify_response() {
    bool all_passed = true;

    json result_response = json::parse(R"({"jsonrpc":"2.0","id":1,"result":{"pong":true}})");
    all_passed &= check(json_rpc::classify_response(result_response) == json_rpc::ResponseKind::Result,
                        "Response with result is classified as Result");

    json error_response = json::parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found"}})");
    all_passed &= check(json_rpc::classify_response(error_response) == json_rpc::ResponseKind::Error,
                        "Response with error is classified as Error");

    json both = json::parse(R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"message":"x"}})");
    all_passed &= check(json_rpc::classify_response(both) == json_rpc::ResponseKind::Result,
                        "Result wins when both result and error are present");

    json result_null = json::parse(R"({"jsonrpc":"2.0","id":1,"result":null})");
    all_passed &= check(json_rpc::classify_response(result_null) == json_rpc::ResponseKind::Result,
                        "A null result still counts as a result");

    json neither = json::parse(R"({"jsonrpc":"2.0","id":1})");
    all_passed &= check(json_rpc::classify_response(neither) == json_rpc::ResponseKind::Invalid,
                        "Response with neither result nor error is Invalid");

    all_passed &= check(json_rpc::classify_response(json::array({1, 2})) == json_rpc::ResponseKind::Invalid,
                        "Non-object message is Invalid");
    return all_passed;
}

// Test: accessors fall back sensibly.
static bool test_accessors_on_missing_members() {
    json message = json::parse(R"({"jsonrpc":"2.0","params":[1,2]})");
    bool success = json_rpc::get_method(message).empty() && json_rpc::get_id(message).is_null() &&
                   json_rpc::get_params(message) == json::object() && json_rpc::is_notification(message) &&
                   !json_rpc::is_notification(json("not an object"));
    return check(success, "Accessors return empty method, null id and empty params when missing");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_build_request_fields();
    all_passed &= test_build_request_omits_null_params();
    all_passed &= test_request_serializes_to_one_line();
    all_passed &= test_build_notification();
    all_passed &= test_build_error_response_with_data();
    all_passed &= test_classify_response();
    all_passed &= test_accessors_on_missing_members();
    return all_passed;
}

} // namespace test_json_rpc

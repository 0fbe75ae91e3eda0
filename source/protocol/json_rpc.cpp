#include "protocol/json_rpc.hpp"

namespace json_rpc {

static json envelope(const json &request_id) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    return response;
}

json build_response(const json &request_id, const json &result_payload) {
    json response = envelope(request_id);
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data) {
    json response = envelope(request_id);
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    if (!error_data.is_null()) {
        response["error"]["data"] = error_data;
    }
    return response;
}

json build_parse_error(const std::string &detail) {
    return build_error_response(nullptr, PARSE_ERROR, "Parse error", detail);
}

std::string get_method(const json &message) {
    auto method = message.find("method");
    if (method != message.end() && method->is_string()) {
        return method->get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    auto id = message.find("id");
    return id != message.end() ? *id : json(nullptr);
}

json get_params(const json &message) {
    auto params = message.find("params");
    if (params != message.end() && params->is_object()) {
        return *params;
    }
    return json::object();
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

} // namespace json_rpc

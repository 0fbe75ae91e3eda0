#ifndef CLAWMCPS_JSON_RPC_HPP
#define CLAWMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication.

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Thrown by method handlers to answer with a JSON-RPC error instead of a result.
class RequestError : public std::runtime_error {
public:
    RequestError(int error_code, const std::string &message) : std::runtime_error(message), code_(error_code) {}
    int code() const { return code_; }

private:
    int code_;
};

// Success response carrying result_payload.
json build_response(const json &request_id, const json &result_payload);

// Error response; error_data is attached as "data" unless it is null.
json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data = nullptr);

// Response for input that is not valid JSON (the id is unknown, so null).
json build_parse_error(const std::string &detail);

// Method name, or empty if missing or not a string.
std::string get_method(const json &message);

// The id, or null json for notifications.
json get_id(const json &message);

// The params object, or an empty object if missing or not an object.
json get_params(const json &message);

// A message without an id is a notification.
bool is_notification(const json &message);

} // namespace json_rpc

#endif // CLAWMCPS_JSON_RPC_HPP

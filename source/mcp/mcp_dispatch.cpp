#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <functional>
#include <exception>
#include <map>
#include <string>
#include <utility>

namespace mcp_dispatch {

const char *const LATEST_PROTOCOL_VERSION = "2025-06-18";

namespace {

// Newest first. Tool results are shaped the same way in all of them.
const char *const SUPPORTED_PROTOCOL_VERSIONS[] = {"2025-06-18", "2025-03-26", "2024-11-05"};

const char *const SERVER_NAME = "clawmcps";
const char *const SERVER_VERSION = "0.1.0";
const char *const SERVER_DESCRIPTION =
    "BareClaw development harness: builds and tests the bareclaw runtime, runs "
    "its CLI (status, agent, cron, doctor, config, mcp), inspects its sources, "
    "config, workspace, audit log and memory entries, and manages the MCP "
    "server registry in its config file.";

using MethodHandler = std::function<json(const json &params)>;

std::string negotiate_version(const json &params) {
    auto requested = params.find("protocolVersion");
    if (requested != params.end() && requested->is_string()) {
        std::string version = requested->get<std::string>();
        for (const char *supported : SUPPORTED_PROTOCOL_VERSIONS) {
            if (version == supported) {
                return version;
            }
        }
        debug_log::log("client asked for protocol " + version + ", answering " + LATEST_PROTOCOL_VERSION);
    }
    return LATEST_PROTOCOL_VERSION;
}

// clientInfo is informational; fields of the wrong type read as "?".
std::string client_field(const json &client_info, const char *field) {
    auto value = client_info.find(field);
    return (value != client_info.end() && value->is_string()) ? value->get<std::string>() : "?";
}

json handle_initialize(const json &params) {
    auto client_info = params.find("clientInfo");
    if (client_info != params.end() && client_info->is_object()) {
        debug_log::log("client: " + client_field(*client_info, "name") + " " +
                       client_field(*client_info, "version"));
    }

    return {
        {"protocolVersion", negotiate_version(params)},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", SERVER_NAME}, {"version", SERVER_VERSION}, {"description", SERVER_DESCRIPTION}}},
    };
}

json handle_tools_call(const json &params) {
    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        throw json_rpc::RequestError(json_rpc::INVALID_PARAMS, "Missing or invalid 'name' in tools/call");
    }
    auto arguments = params.find("arguments");
    bool has_arguments = arguments != params.end() && !arguments->is_null();
    return mcp_tools::dispatch_tool_call(name->get<std::string>(), has_arguments ? *arguments : json::object());
}

const std::map<std::string, MethodHandler> &method_table() {
    static const std::map<std::string, MethodHandler> methods = {
        {"initialize", handle_initialize},
        {"ping", [](const json &) { return json::object(); }},
        {"tools/list", [](const json &) { return mcp_tools::build_tools_list_response(); }},
        {"tools/call", handle_tools_call},
    };
    return methods;
}

json dispatch_single(const json &message) {
    if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
        return json_rpc::build_error_response(json_rpc::get_id(message), json_rpc::INVALID_REQUEST,
                                              "Invalid Request");
    }

    std::string method = json_rpc::get_method(message);
    if (json_rpc::is_notification(message)) {
        // notifications/initialized, notifications/cancelled: nothing to answer.
        debug_log::log("notification " + method);
        return nullptr;
    }

    json request_id = json_rpc::get_id(message);
    const auto &methods = method_table();
    auto handler = methods.find(method);
    if (handler == methods.end()) {
        return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND, "Unknown method: " + method);
    }

    try {
        return json_rpc::build_response(request_id, handler->second(json_rpc::get_params(message)));
    } catch (const json_rpc::RequestError &error) {
        return json_rpc::build_error_response(request_id, error.code(), error.what());
    } catch (const std::exception &error) {
        debug_log::log("method " + method + " failed: " + error.what());
        return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                              std::string("Internal error: ") + error.what());
    }
}

} // namespace

json dispatch_message(const json &message) {
    if (!message.is_array()) {
        return dispatch_single(message);
    }
    if (message.empty()) {
        return json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST, "Invalid Request: empty batch");
    }

    json responses = json::array();
    for (const auto &entry : message) {
        json response = dispatch_single(entry);
        if (!response.is_null()) {
            responses.push_back(std::move(response));
        }
    }
    return responses.empty() ? json(nullptr) : responses;
}

} // namespace mcp_dispatch

#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <algorithm>
#include <exception>

namespace mcp_tools {

// Global tool registry (module-level, not class-based).
static std::vector<ToolDefinition> registered_tools;

void register_tool(const ToolDefinition &definition) {
    for (auto &tool : registered_tools) {
        if (tool.name == definition.name) {
            tool = definition;
            return;
        }
    }
    registered_tools.push_back(definition);
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

static bool matches_type(const json &value, const std::string &type_name) {
    if (type_name == "string") {
        return value.is_string();
    }
    if (type_name == "boolean") {
        return value.is_boolean();
    }
    if (type_name == "integer") {
        return value.is_number_integer();
    }
    if (type_name == "number") {
        return value.is_number();
    }
    if (type_name == "object") {
        return value.is_object();
    }
    if (type_name == "array") {
        return value.is_array();
    }
    return true;
}

std::string validate_arguments(const json &input_schema, const json &arguments) {
    if (!arguments.is_object()) {
        return "Arguments must be a JSON object.";
    }

    if (input_schema.contains("required") && input_schema["required"].is_array()) {
        for (const auto &required_name : input_schema["required"]) {
            if (required_name.is_string() && !arguments.contains(required_name.get<std::string>())) {
                return "Missing required parameter '" + required_name.get<std::string>() + "'.";
            }
        }
    }

    if (!input_schema.contains("properties") || !input_schema["properties"].is_object()) {
        return "";
    }
    const json &properties = input_schema["properties"];
    for (auto argument = arguments.begin(); argument != arguments.end(); ++argument) {
        if (!properties.contains(argument.key())) {
            continue;
        }
        const json &property = properties[argument.key()];
        if (!property.contains("type") || !property["type"].is_string()) {
            continue;
        }
        std::string type_name = property["type"].get<std::string>();
        if (!matches_type(argument.value(), type_name)) {
            return "Parameter '" + argument.key() + "' must be of type " + type_name + ".";
        }
    }
    return "";
}

json make_text_result(const std::string &text, bool is_error) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = utf8_sanitize::sanitize(text);

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = is_error;
    return result;
}

json dispatch_tool_call(const std::string &tool_name, const json &arguments) {
    auto tool = std::find_if(registered_tools.begin(), registered_tools.end(),
                             [&tool_name](const ToolDefinition &definition) {
                                 return definition.name == tool_name;
                             });
    if (tool == registered_tools.end()) {
        return make_text_result("Unknown tool: " + tool_name, true);
    }

    std::string validation_error = validate_arguments(tool->input_schema, arguments);
    if (!validation_error.empty()) {
        debug_log::log("tool " + tool_name + " rejected: " + validation_error);
        return make_text_result(validation_error, true);
    }

    debug_log::ScopedTimer timer("tool " + tool_name);
    try {
        return make_text_result(tool->handler(arguments), false);
    } catch (const std::exception &error) {
        debug_log::log("tool " + tool_name + " threw: " + error.what());
        return make_text_result("Tool '" + tool_name + "' failed: " + error.what(), true);
    }
}

const std::vector<ToolDefinition> &get_registered_tools() {
    return registered_tools;
}

} // namespace mcp_tools

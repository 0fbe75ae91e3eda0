#ifndef CLAWMCPS_MCP_TOOLS_HPP
#define CLAWMCPS_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and dispatch of tool calls.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// A tool handler function: receives arguments that already passed schema
// validation and returns the text shown to the caller.
using ToolHandler = std::function<std::string(const json &arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object: "properties" and "required"
    ToolHandler handler;
};

// Register a tool. Call this during initialization for each tool.
// Registering a name twice replaces the earlier definition.
void register_tool(const ToolDefinition &definition);

// Build the response payload for tools/list.
json build_tools_list_response();

// Check arguments against a tool's input schema: required properties must be
// present and declared properties must have the declared JSON type.
// Returns an empty string when valid, otherwise a message naming the argument.
std::string validate_arguments(const json &input_schema, const json &arguments);

// Dispatch a tools/call request. Returns the result payload (content + isError).
// Never throws: validation failures, unknown tools and handler exceptions all
// come back as isError results.
json dispatch_tool_call(const std::string &tool_name, const json &arguments);

// Wrap text as an MCP tool result.
json make_text_result(const std::string &text, bool is_error);

// Get all registered tool definitions (for testing or introspection).
const std::vector<ToolDefinition> &get_registered_tools();

} // namespace mcp_tools

#endif // CLAWMCPS_MCP_TOOLS_HPP

#include "tool_handlers/tool_support.hpp"
#include "harness/harness_settings.hpp"
#include "mcp/mcp_tools.hpp"
#include "store/config_store.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handlers for the external MCP servers BareClaw connects to.
// Listing and calling go through `bareclaw mcp ...`; the registry itself
// (mcp_servers in config.toml) is edited here directly.

static std::string not_initialized_message(const std::string &config_path) {
    return "Config file not found at " + config_path +
           ". Run `bareclaw onboard` or `bareclaw status` to initialize.";
}

// Empty when name is usable as a registry key.
static std::string check_server_name(const std::string &name) {
    if (name.empty()) {
        return "Server name must not be empty.";
    }
    if (name.find_first_of("=|\"\n\r") != std::string::npos) {
        return "Server name must not contain '=', '|', '\"' or line breaks: " + name;
    }
    return "";
}

static std::string check_server_command(const std::string &command) {
    if (command.empty()) {
        return "Server command must not be empty.";
    }
    if (command.find_first_of("|\"\n\r") != std::string::npos) {
        return "Server command must not contain '|', '\"' or line breaks.";
    }
    return "";
}

static std::string handle_mcp_list_servers(const json &arguments) {
    (void)arguments;
    return tool_support::run_binary({"mcp", "list-servers"});
}

static std::string handle_mcp_list_tools(const json &arguments) {
    std::vector<std::string> command_line = {"mcp", "list-tools"};
    std::string server = arguments.value("server", std::string());
    if (!server.empty()) {
        command_line.push_back(server);
    }
    return tool_support::run_binary(command_line);
}

static std::string handle_mcp_call(const json &arguments) {
    std::string server = arguments["server"].get<std::string>();
    std::string tool = arguments["tool"].get<std::string>();
    // Forwarded as-is: bareclaw reports malformed JSON itself.
    std::string args_json = arguments.value("args_json", std::string("{}"));
    return tool_support::run_binary({"mcp", "call", server, tool, args_json});
}

static std::string handle_mcp_add_server(const json &arguments) {
    std::string name = arguments["name"].get<std::string>();
    std::string command = arguments["command"].get<std::string>();

    std::string problem = check_server_name(name);
    if (problem.empty()) {
        problem = check_server_command(command);
    }
    if (!problem.empty()) {
        return problem;
    }

    config_store::ConfigFile config_file(harness_settings::get().config_path);
    config_store::ConfigUpdateResult result = config_file.upsert_server(name, command);
    switch (result.status) {
    case config_store::ConfigStatus::not_initialized:
        return not_initialized_message(config_file.path());
    case config_store::ConfigStatus::io_error:
        return "Failed to update " + config_file.path() + ": " + result.error_message;
    case config_store::ConfigStatus::ok:
        break;
    }

    if (!result.changed) {
        return "MCP server '" + name + "' is already registered as: " + command + "\n  Config unchanged.";
    }
    return "MCP server '" + name + "' saved: " + name + "=" + command + "\n  Saved to " + config_file.path();
}

static std::string handle_mcp_remove_server(const json &arguments) {
    std::string name = arguments["name"].get<std::string>();

    config_store::ConfigFile config_file(harness_settings::get().config_path);
    config_store::ConfigUpdateResult result = config_file.remove_server(name);
    switch (result.status) {
    case config_store::ConfigStatus::not_initialized:
        return not_initialized_message(config_file.path());
    case config_store::ConfigStatus::io_error:
        return "Failed to update " + config_file.path() + ": " + result.error_message;
    case config_store::ConfigStatus::ok:
        break;
    }

    if (result.removed_count == 0) {
        return "No MCP server named '" + name + "' in " + config_file.path();
    }
    return "Removed MCP server '" + name + "' (" +
           tool_support::count_noun(result.removed_count, "entry", "entries") + ") from " + config_file.path();
}

namespace tool_mcp_servers {

void register_tools() {
    mcp_tools::register_tool({
        "mcp_list_servers",
        "List the external MCP servers configured for BareClaw (`bareclaw mcp list-servers`).",
        tool_support::empty_schema(),
        handle_mcp_list_servers
    });

    mcp_tools::register_tool({
        "mcp_list_tools",
        "List the tools offered by the configured MCP servers (`bareclaw mcp list-tools [server]`).",
        tool_support::object_schema({
            {"server", tool_support::property("string", "Only list tools of this server. Defaults to all servers.")},
        }),
        handle_mcp_list_tools
    });

    mcp_tools::register_tool({
        "mcp_call",
        "Call one tool on one configured MCP server (`bareclaw mcp call <server> <tool> <args_json>`).",
        tool_support::object_schema({
            {"server", tool_support::property("string", "Server name as listed by mcp_list_servers.")},
            {"tool", tool_support::property("string", "Tool name on that server.")},
            {"args_json", tool_support::property("string", "Tool arguments as a JSON-encoded object. Defaults to \"{}\".")},
        }, {"server", "tool"}),
        handle_mcp_call
    });

    mcp_tools::register_tool({
        "mcp_add_server",
        "Add or update an MCP server in the BareClaw config (mcp_servers = \"name=command|...\"). "
        "An existing entry with the same name is replaced.",
        tool_support::object_schema({
            {"name", tool_support::property("string", "Server name (no '=', '|' or quotes).")},
            {"command", tool_support::property("string", "Command line that starts the server (no '|' or quotes).")},
        }, {"name", "command"}),
        handle_mcp_add_server
    });

    mcp_tools::register_tool({
        "mcp_remove_server",
        "Remove an MCP server from the BareClaw config by name.",
        tool_support::object_schema({
            {"name", tool_support::property("string", "Server name to remove.")},
        }, {"name"}),
        handle_mcp_remove_server
    });
}

} // namespace tool_mcp_servers

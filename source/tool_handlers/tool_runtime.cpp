#include "tool_handlers/tool_support.hpp"
#include "harness/harness_settings.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handlers that run one bareclaw CLI command and return its formatted
// output. The binary's own exit code and messages are passed through.

static std::string handle_status(const json &arguments) {
    (void)arguments;
    return tool_support::run_binary({"status"});
}

static std::string handle_run_agent(const json &arguments) {
    std::string prompt = arguments["prompt"].get<std::string>();
    return tool_support::run_binary({"agent", prompt}, harness_settings::get().agent_timeout);
}

static std::string handle_run_cron(const json &arguments) {
    (void)arguments;
    return tool_support::run_binary({"cron"});
}

static std::string handle_list_peripherals(const json &arguments) {
    (void)arguments;
    return tool_support::run_binary({"peripheral"});
}

static std::string handle_help(const json &arguments) {
    (void)arguments;
    return tool_support::run_binary({});
}

static std::string handle_doctor(const json &arguments) {
    (void)arguments;
    return tool_support::run_binary({"doctor"});
}

static std::string handle_config_set(const json &arguments) {
    std::string key = arguments["key"].get<std::string>();
    std::string value = arguments["value"].get<std::string>();
    return tool_support::run_binary({"config", "set", key, value});
}

static std::string handle_config_get(const json &arguments) {
    (void)arguments;
    return tool_support::run_binary({"config", "get"});
}

namespace tool_runtime {

void register_tools() {
    mcp_tools::register_tool({
        "status",
        "Run `bareclaw status` to inspect the current runtime configuration: "
        "workspace path, config path, provider, model, memory backend, cron tasks.",
        tool_support::empty_schema(),
        handle_status
    });

    mcp_tools::register_tool({
        "run_agent",
        "Send a prompt to the BareClaw agent as a single-turn interaction "
        "(`bareclaw agent \"<prompt>\"`) and return its response. Limited to 30 seconds.",
        tool_support::object_schema({
            {"prompt", tool_support::property("string", "The input to send to the agent.")},
        }, {"prompt"}),
        handle_run_agent
    });

    mcp_tools::register_tool({
        "run_cron",
        "Run `bareclaw cron` to execute any scheduled tasks once.",
        tool_support::empty_schema(),
        handle_run_cron
    });

    mcp_tools::register_tool({
        "list_peripherals",
        "Run `bareclaw peripheral` to list configured hardware peripherals.",
        tool_support::empty_schema(),
        handle_list_peripherals
    });

    mcp_tools::register_tool({
        "help",
        "Run `bareclaw` with no arguments to show the CLI usage/help text.",
        tool_support::empty_schema(),
        handle_help
    });

    mcp_tools::register_tool({
        "doctor",
        "Run `bareclaw doctor`: health check of workspace, config file, API key, "
        "audit log and cron tasks.",
        tool_support::empty_schema(),
        handle_doctor
    });

    mcp_tools::register_tool({
        "config_set",
        "Set a config value and persist it (`bareclaw config set <key> <value>`). "
        "Keys include default_provider, default_model, memory_backend, "
        "fallback_providers, api_key, discord_token, discord_webhook, telegram_token.",
        tool_support::object_schema({
            {"key", tool_support::property("string", "Config key to set.")},
            {"value", tool_support::property("string", "The value to set.")},
        }, {"key", "value"}),
        handle_config_set
    });

    mcp_tools::register_tool({
        "config_get",
        "Show all current config values (`bareclaw config get`); secrets are masked by bareclaw.",
        tool_support::empty_schema(),
        handle_config_get
    });
}

} // namespace tool_runtime

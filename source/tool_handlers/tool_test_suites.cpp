#include "tool_handlers/tool_support.hpp"
#include "harness/harness_settings.hpp"
#include "harness/integration_env.hpp"
#include "mcp/mcp_tools.hpp"
#include "process/result_format.hpp"
#include "store/config_store.hpp"
#include "utils/debug_log.hpp"
#include "utils/dotenv.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>

using json = nlohmann::json;

// Tool handlers for the shell test suites shipped in the BareClaw repository.

static const char *const DEFAULT_DISCORD_CHANNEL_ID = "1473381266047893596";

static std::string script_path(const std::string &name) {
    return (std::filesystem::path(harness_settings::get().repo_root) / "tests" / name).string();
}

static std::string handle_run_smoke_tests(const json &arguments) {
    (void)arguments;
    platform::ExecutionResult result =
        tool_support::run_command({"bash", script_path("smoke.sh")}, harness_settings::get().default_timeout);
    return result_format::format(result);
}

static std::string handle_run_integration_test_discord(const json &arguments) {
    std::string channel_id = arguments.value("channel_id", std::string(DEFAULT_DISCORD_CHANNEL_ID));
    harness_settings::HarnessSettings settings = harness_settings::get();

    std::optional<config_store::ConfigDocument> config;
    config_store::ConfigLoadResult loaded = config_store::ConfigFile(settings.config_path).load();
    if (loaded.status == config_store::ConfigStatus::ok) {
        config = loaded.document;
    }

    integration_env::Environment test_file_values = dotenv::load_file(settings.test_env_path);
    debug_log::log("integration test: " + std::to_string(test_file_values.size()) +
                   " value(s) from " + settings.test_env_path);

    integration_env::Environment environment = integration_env::build(
        platform::current_environment(), test_file_values, config, channel_id, settings.binary_path);

    platform::ExecutionResult result = tool_support::run_command(
        {"bash", script_path("integration_discord.sh")}, settings.integration_timeout, environment);
    return result_format::format(result);
}

namespace tool_test_suites {

void register_tools() {
    mcp_tools::register_tool({
        "run_smoke_tests",
        "Run the BareClaw smoke test suite (tests/smoke.sh, no Discord needed). "
        "Checks: binary exists, status works, zig unit tests pass, Ollama is "
        "reachable, agent round-trip responds.",
        tool_support::empty_schema(),
        handle_run_smoke_tests
    });

    mcp_tools::register_tool({
        "run_integration_test_discord",
        "Run the full Discord integration test (tests/integration_discord.sh): starts "
        "the bot, sends a real message, waits for the reply. Credentials come from "
        "tests/.env.test first, then the environment, then the BareClaw config.",
        tool_support::object_schema({
            {"channel_id", tool_support::property("string", "Discord channel ID to use for the test.")},
        }),
        handle_run_integration_test_discord
    });
}

} // namespace tool_test_suites

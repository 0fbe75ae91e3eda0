#include "tool_handlers/tool_support.hpp"
#include "harness/harness_settings.hpp"
#include "mcp/mcp_tools.hpp"
#include "process/result_format.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "agent_status".
// Asks the runtime for its status through the structured `bareclaw status`
// command. When that fails, retries once as a free-form agent request and
// labels the answer as a fallback: the two paths have different success
// criteria and the caller should know which one produced the text.

static const char *const FALLBACK_PROMPT =
    "Call the agent_status tool and report its output verbatim.";

static std::string handle_agent_status(const json &arguments) {
    (void)arguments;
    harness_settings::HarnessSettings settings = harness_settings::get();

    platform::ExecutionResult structured =
        tool_support::run_command({settings.binary_path, "status"}, settings.default_timeout);
    if (structured.succeeded) {
        return result_format::format(structured);
    }

    platform::ExecutionResult fallback =
        tool_support::run_command({settings.binary_path, "agent", FALLBACK_PROMPT}, settings.agent_timeout);

    return "Structured status call failed:\n" + result_format::format(structured) +
           "\n\nFallback (agent request):\n" + result_format::format(fallback);
}

namespace tool_agent_status {

void register_tools() {
    mcp_tools::register_tool({
        "agent_status",
        "Report the BareClaw agent runtime status. Uses `bareclaw status`; if that "
        "fails, falls back to asking the agent itself and marks the answer as a fallback.",
        tool_support::empty_schema(),
        handle_agent_status
    });
}

} // namespace tool_agent_status

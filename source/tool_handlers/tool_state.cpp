#include "tool_handlers/tool_support.hpp"
#include "harness/harness_settings.hpp"
#include "mcp/mcp_tools.hpp"
#include "store/config_store.hpp"
#include "store/log_reader.hpp"
#include "store/memory_store.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handlers that read BareClaw's per-user state: the config file, the
// workspace tree, the audit log and the memory entries. None of them create
// missing state; they explain how it gets created instead.

static const int DEFAULT_AUDIT_LINES = 20;

static std::string join_lines(const std::vector<std::string> &lines) {
    std::string joined;
    for (const auto &line : lines) {
        if (!joined.empty()) {
            joined += "\n";
        }
        joined += line;
    }
    return joined;
}

static std::string handle_read_config(const json &arguments) {
    (void)arguments;
    config_store::ConfigFile config_file(harness_settings::get().config_path);
    config_store::ConfigLoadResult loaded = config_file.load();

    switch (loaded.status) {
    case config_store::ConfigStatus::ok:
        return loaded.document.serialize();
    case config_store::ConfigStatus::not_initialized:
        return "Config file not found at " + config_file.path() +
               ". Run `bareclaw onboard` or `bareclaw status` to initialize.";
    case config_store::ConfigStatus::io_error:
        break;
    }
    return "Cannot read config file " + config_file.path() + ": " + loaded.error_message;
}

static std::string handle_workspace_contents(const json &arguments) {
    (void)arguments;
    memory_store::Listing listing = memory_store::list_files_recursive(harness_settings::get().workspace_dir);

    if (!listing.directory_exists) {
        return "Workspace directory does not exist yet.";
    }
    if (listing.items.empty()) {
        return listing.error_message.empty() ? "Workspace exists but is empty."
                                             : "Cannot list workspace: " + listing.error_message;
    }
    std::string text = join_lines(listing.items);
    if (!listing.error_message.empty()) {
        text += "\n(listing incomplete: " + listing.error_message + ")";
    }
    return text;
}

static std::string handle_audit_log_read(const json &arguments) {
    long long requested = arguments.value("lines", static_cast<long long>(DEFAULT_AUDIT_LINES));
    size_t line_count = requested < 1 ? 1 : static_cast<size_t>(requested);
    const std::string audit_log_path = harness_settings::get().audit_log_path;

    log_reader::TailResult tail = log_reader::tail(audit_log_path, line_count);
    switch (tail.status) {
    case log_reader::TailStatus::not_found:
        return "Audit log does not exist yet (" + audit_log_path +
               "). It is created when the agent runs its first tool.";
    case log_reader::TailStatus::empty:
        return "Audit log is empty.";
    case log_reader::TailStatus::io_error:
        return "Cannot read audit log " + audit_log_path + ": " + tail.error_message;
    case log_reader::TailStatus::ok:
        break;
    }

    return "Last " + std::to_string(tail.lines.size()) + " of " +
           tool_support::count_noun(tail.total_lines, "audit log line", "audit log lines") + ":\n" +
           join_lines(tail.lines);
}

static std::string handle_memory_list_keys(const json &arguments) {
    (void)arguments;
    const std::string memory_dir = harness_settings::get().memory_dir;
    memory_store::Listing listing = memory_store::list_keys(memory_dir);

    if (!listing.directory_exists) {
        return "Memory directory does not exist yet (" + memory_dir +
               "). The agent creates it on first memory_store.";
    }
    if (listing.items.empty()) {
        return listing.error_message.empty() ? "No memory entries."
                                             : "Cannot list memory: " + listing.error_message;
    }
    return tool_support::count_noun(listing.items.size(), "memory key", "memory keys") + ":\n" +
           join_lines(listing.items);
}

static std::string handle_memory_delete_prefix(const json &arguments) {
    std::string prefix = arguments["prefix"].get<std::string>();
    if (prefix.empty()) {
        return "Refusing to delete with an empty prefix (it would match every memory entry).";
    }

    const std::string memory_dir = harness_settings::get().memory_dir;
    memory_store::DeleteResult result = memory_store::delete_by_prefix(memory_dir, prefix);

    if (!result.directory_exists) {
        return "Memory directory does not exist yet (" + memory_dir + "). Nothing deleted.";
    }
    std::string text = "Deleted " + tool_support::count_noun(result.deleted_count, "memory entry", "memory entries") +
                       " with prefix '" + prefix + "'.";
    if (result.failed_count > 0) {
        text += "\nFailed to delete " + tool_support::count_noun(result.failed_count, "entry", "entries") +
                ": " + result.error_message;
    }
    return text;
}

namespace tool_state {

void register_tools() {
    mcp_tools::register_tool({
        "read_config",
        "Read the current BareClaw config file (~/.bareclaw/config.toml) verbatim.",
        tool_support::empty_schema(),
        handle_read_config
    });

    mcp_tools::register_tool({
        "workspace_contents",
        "List files in the BareClaw workspace directory (~/.bareclaw/workspace/), recursively.",
        tool_support::empty_schema(),
        handle_workspace_contents
    });

    mcp_tools::register_tool({
        "audit_log_read",
        "Read the last N lines of the agent's audit log (<workspace>/audit.log).",
        tool_support::object_schema({
            {"lines", tool_support::property("integer", "Number of lines to return. Defaults to 20.")},
        }),
        handle_audit_log_read
    });

    mcp_tools::register_tool({
        "memory_list_keys",
        "List the keys of all agent memory entries (<workspace>/memory/<key>.md).",
        tool_support::empty_schema(),
        handle_memory_list_keys
    });

    mcp_tools::register_tool({
        "memory_delete_prefix",
        "Delete every agent memory entry whose key starts with the given prefix "
        "(plain string prefix, e.g. \"cron/\" or \"session/\").",
        tool_support::object_schema({
            {"prefix", tool_support::property("string", "Key prefix to match. Must not be empty.")},
        }, {"prefix"}),
        handle_memory_delete_prefix
    });
}

} // namespace tool_state

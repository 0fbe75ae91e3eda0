// clawmcps: BareClaw development harness exposed as an MCP server over stdio.
// stdout carries JSON-RPC responses only; everything else goes to stderr.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <csignal>

#include "harness/harness_settings.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

// Invalid UTF-8 that slipped past the tool layer is replaced rather than thrown on.
static void write_response(const json &response) {
    mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
}

int main(int argc, char **argv) {
    std::vector<std::string> arguments(argv + 1, argv + argc);
    if (!arguments.empty() && (arguments[0] == "--help" || arguments[0] == "-h")) {
        std::cerr << harness_settings::usage();
        return 0;
    }

    std::string settings_error;
    auto settings = harness_settings::resolve(arguments, settings_error);
    if (!settings) {
        std::cerr << "[clawmcps] " << settings_error << "\n" << harness_settings::usage();
        return 2;
    }
    harness_settings::set(*settings);

    mcp_stdio::log_message("clawmcps 0.1.0 for BareClaw at " + settings->repo_root);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    tool_handlers::register_all_tools();

    debug_log::log("binary:     " + settings->binary_path + "\n" +
                   "state dir:  " + settings->state_dir + "\n" +
                   "timeout:    " + std::to_string(settings->default_timeout.count()) + "s\n" +
                   "tools:      " + std::to_string(mcp_tools::get_registered_tools().size()));
    mcp_stdio::log_message("Server started. Waiting for MCP messages on stdin.");

    while (!shutdown_requested) {
        mcp_stdio::Frame frame = mcp_stdio::read_frame();

        if (frame.status == mcp_stdio::FrameStatus::end_of_input) {
            // EOF on stdin means the client disconnected.
            mcp_stdio::log_message("EOF on stdin. Shutting down.");
            break;
        }
        if (frame.status == mcp_stdio::FrameStatus::oversized) {
            mcp_stdio::log_message("Dropped a message larger than " + std::to_string(mcp_stdio::MAX_FRAME_BYTES) +
                                   " bytes.");
            write_response(json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST, "Message too large"));
            continue;
        }

        json parsed_message;
        try {
            parsed_message = json::parse(frame.text);
        } catch (const json::parse_error &error) {
            mcp_stdio::log_message("Failed to parse incoming JSON: " + std::string(error.what()));
            write_response(json_rpc::build_parse_error(error.what()));
            continue;
        }

        json response = mcp_dispatch::dispatch_message(parsed_message);

        // Notifications return null (no response needed).
        if (!response.is_null()) {
            write_response(response);
        }
    }

    mcp_stdio::log_message("Server shut down.");
    return 0;
}

#include "tool_handlers/tool_support.hpp"
#include "harness/harness_settings.hpp"
#include "mcp/mcp_tools.hpp"
#include "process/result_format.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;

// Tool handlers for building and unit-testing the BareClaw binary with the
// zig build system.

static std::string handle_build(const json &arguments) {
    bool release = arguments.value("release", false);
    harness_settings::HarnessSettings settings = harness_settings::get();

    std::vector<std::string> command_line = settings.build_command;
    if (release) {
        command_line.push_back("-Doptimize=ReleaseSafe");
    }

    platform::ExecutionResult result = tool_support::run_command(command_line, settings.default_timeout);
    if (result.succeeded) {
        return "Build succeeded. Binary at: " + settings.binary_path + "\n" + result_format::format(result);
    }
    return "Build FAILED.\n" + result_format::format(result);
}

static std::string handle_run_tests(const json &arguments) {
    (void)arguments;
    harness_settings::HarnessSettings settings = harness_settings::get();

    std::vector<std::string> command_line = settings.build_command;
    command_line.push_back("test");

    platform::ExecutionResult result = tool_support::run_command(command_line, settings.default_timeout);
    if (result.succeeded) {
        return "All tests passed.\n" + result_format::format(result);
    }
    return "Tests FAILED.\n" + result_format::format(result);
}

static std::string handle_binary_exists(const json &arguments) {
    (void)arguments;
    const std::string binary_path = harness_settings::get().binary_path;

    std::error_code error;
    if (std::filesystem::is_regular_file(binary_path, error)) {
        std::uintmax_t size = std::filesystem::file_size(binary_path, error);
        if (!error) {
            return "Binary exists: " + binary_path + " (" + tool_support::format_with_thousands(size) + " bytes)";
        }
    }
    return "Binary NOT found at: " + binary_path + "\nRun build() first.";
}

namespace tool_build {

void register_tools() {
    mcp_tools::register_tool({
        "build",
        "Build the BareClaw Zig binary (zig build). Set release to build with "
        "ReleaseSafe optimization; the default is a debug build.",
        tool_support::object_schema({
            {"release", tool_support::property("boolean", "Build with -Doptimize=ReleaseSafe. Defaults to false.")},
        }),
        handle_build
    });

    mcp_tools::register_tool({
        "run_tests",
        "Run all BareClaw Zig unit tests via `zig build test`.",
        tool_support::empty_schema(),
        handle_run_tests
    });

    mcp_tools::register_tool({
        "binary_exists",
        "Check whether the bareclaw binary has been built and exists on disk.",
        tool_support::empty_schema(),
        handle_binary_exists
    });
}

} // namespace tool_build

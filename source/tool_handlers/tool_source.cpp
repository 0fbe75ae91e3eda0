#include "tool_handlers/tool_support.hpp"
#include "harness/harness_settings.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

// Tool handlers for inspecting the BareClaw source tree.

static const char *const SOURCE_EXTENSION = ".zig";

// Build output directories left out of repo_structure.
static const std::vector<std::string> BUILD_ARTIFACT_DIRECTORIES = {"zig-out", ".zig-cache", "zig-cache"};

// Sorted entries of a directory; an unreadable directory yields what was read.
static std::vector<fs::directory_entry> sorted_entries(const fs::path &directory) {
    std::vector<fs::directory_entry> entries;
    std::error_code error;
    fs::directory_iterator iterator(directory, error);
    fs::directory_iterator end;
    while (!error && iterator != end) {
        entries.push_back(*iterator);
        iterator.increment(error);
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry &left, const fs::directory_entry &right) {
                  return left.path().filename() < right.path().filename();
              });
    return entries;
}

static std::string handle_list_source_files(const json &arguments) {
    (void)arguments;
    fs::path source_directory = fs::path(harness_settings::get().repo_root) / "src";

    std::error_code error;
    if (!fs::is_directory(source_directory, error)) {
        return "src/ directory not found.";
    }

    std::ostringstream listing;
    bool any = false;
    for (const auto &entry : sorted_entries(source_directory)) {
        std::error_code entry_error;
        if (!entry.is_regular_file(entry_error) || entry.path().extension() != SOURCE_EXTENSION) {
            continue;
        }
        std::uintmax_t size = entry.file_size(entry_error);
        if (any) {
            listing << "\n";
        }
        listing << std::left << std::setw(30) << entry.path().filename().string() << " "
                << std::right << std::setw(6) << tool_support::format_with_thousands(entry_error ? 0 : size)
                << " bytes";
        any = true;
    }
    return any ? listing.str() : "No .zig files found in src/";
}

static std::string handle_read_source_file(const json &arguments) {
    std::string filename = arguments["filename"].get<std::string>();

    // Only plain file names directly inside src/.
    if (filename.empty() || filename.find('/') != std::string::npos ||
        filename.find('\\') != std::string::npos || filename == "." || filename == "..") {
        return "Invalid filename: " + filename + " (expected a file name inside src/, e.g. \"agent.zig\").";
    }

    fs::path path = fs::path(harness_settings::get().repo_root) / "src" / filename;
    std::error_code error;
    if (!fs::exists(path, error)) {
        return "File not found: src/" + filename;
    }
    if (path.extension() != SOURCE_EXTENSION) {
        return "Only .zig files are supported.";
    }

    std::string contents;
    if (!platform::read_file_contents(path.string(), contents)) {
        return "Cannot read src/" + filename;
    }
    return contents;
}

static bool is_hidden(const fs::path &path) {
    std::string name = path.filename().string();
    return !name.empty() && name[0] == '.';
}

static std::string handle_repo_structure(const json &arguments) {
    (void)arguments;
    fs::path repo_root = harness_settings::get().repo_root;

    std::error_code error;
    if (!fs::is_directory(repo_root, error)) {
        return "Repository root not found: " + repo_root.string();
    }

    std::vector<std::string> lines;
    for (const auto &item : sorted_entries(repo_root)) {
        std::string name = item.path().filename().string();
        if (is_hidden(item.path()) ||
            std::find(BUILD_ARTIFACT_DIRECTORIES.begin(), BUILD_ARTIFACT_DIRECTORIES.end(), name) !=
                BUILD_ARTIFACT_DIRECTORIES.end()) {
            continue;
        }

        std::error_code item_error;
        if (!item.is_directory(item_error)) {
            lines.push_back(name);
            continue;
        }
        lines.push_back(name + "/");
        for (const auto &child : sorted_entries(item.path())) {
            if (!is_hidden(child.path())) {
                lines.push_back("  " + child.path().filename().string());
            }
        }
    }

    std::string structure;
    for (const auto &line : lines) {
        if (!structure.empty()) {
            structure += "\n";
        }
        structure += line;
    }
    return structure.empty() ? "(empty repository)" : structure;
}

namespace tool_source {

void register_tools() {
    mcp_tools::register_tool({
        "list_source_files",
        "List all Zig source files in the BareClaw src/ directory with their sizes.",
        tool_support::empty_schema(),
        handle_list_source_files
    });

    mcp_tools::register_tool({
        "read_source_file",
        "Read the contents of a Zig source file from src/. Only .zig files directly "
        "inside src/ can be read.",
        tool_support::object_schema({
            {"filename", tool_support::property("string", "The filename within src/ (e.g. \"agent.zig\", \"main.zig\").")},
        }, {"filename"}),
        handle_read_source_file
    });

    mcp_tools::register_tool({
        "repo_structure",
        "Show the top-level directory structure of the BareClaw repository "
        "(hidden entries and zig build output excluded).",
        tool_support::empty_schema(),
        handle_repo_structure
    });
}

} // namespace tool_source

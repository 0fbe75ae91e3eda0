#ifndef CLAWMCPS_PLATFORM_ABI_HPP
#define CLAWMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace platform {

// Exit status reported when the child never ran (launch failure) or was
// killed after its timeout elapsed. Real exit codes are 0..255, signals -1..-64
// are reported as -signal, so -1 is only ambiguous with SIGHUP.
constexpr int EXIT_STATUS_SENTINEL = -1;

// Longest timeout execute() honours; longer requests are clamped to it.
constexpr std::chrono::seconds MAX_EXECUTION_TIMEOUT{86400};

// Everything needed to run one external command.
struct ExecutionRequest {
    // argv[0] is the program; bare names are looked up on PATH.
    std::vector<std::string> arguments;
    // Empty means the caller's working directory.
    std::string working_directory;
    std::chrono::seconds timeout{60};
    // When set, this is the child's complete environment (no merge with ours).
    std::optional<std::map<std::string, std::string>> environment;
};

// Captured outcome of one execution. Exactly one of normal completion,
// timeout or launch failure produced it.
struct ExecutionResult {
    std::string stdout_text; // trailing whitespace trimmed
    std::string stderr_text; // trailing whitespace trimmed
    int exit_status = EXIT_STATUS_SENTINEL;
    bool succeeded = false;  // exit_status == 0
    bool timed_out = false;
    bool launch_failed = false;
};

// Run a command to completion (or timeout) and capture its output.
// Never throws; every failure mode is described by the returned value.
// Safe to call concurrently from several threads.
ExecutionResult execute(const ExecutionRequest &request);

// Snapshot of the current process environment as a mutable map.
std::map<std::string, std::string> current_environment();

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Like read_file_contents, under a shared lock on "<file>.lock" when it exists.
// Never observes a half-written update from update_file_locked.
bool read_file_locked(const std::string &file_path, std::string &output_contents);

enum class FileUpdateStatus {
    updated,
    unchanged,
    not_found,
    io_error,
};

struct FileUpdateResult {
    FileUpdateStatus status = FileUpdateStatus::io_error;
    std::string error_message;
};

// Receives the current file contents and returns the replacement, or
// std::nullopt to leave the file untouched.
using FileTransform = std::function<std::optional<std::string>(const std::string &current_contents)>;

// Read-modify-write of an existing file. Writers, in this process or another,
// are serialized by an exclusive flock on "<file>.lock" for the whole
// read-transform-write sequence. The new contents go to a temporary file that
// is fsynced and renamed over the original, so a failed write leaves the old
// file intact. The file itself is never created; its permission bits are kept.
FileUpdateResult update_file_locked(const std::string &file_path, const FileTransform &transform);

} // namespace platform

#endif // CLAWMCPS_PLATFORM_ABI_HPP

#ifndef CLAWMCPS_HARNESS_SETTINGS_HPP
#define CLAWMCPS_HARNESS_SETTINGS_HPP

// Runtime settings: where the BareClaw checkout, binary and per-user state
// live, and how long child processes may run. Resolved once at startup from
// the command line and environment; tests replace them with set().

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace harness_settings {

struct HarnessSettings {
    std::string repo_root;
    std::string binary_path;
    std::string state_dir;

    // Derived from state_dir / repo_root by derive_paths().
    std::string config_path;
    std::string workspace_dir;
    std::string memory_dir;
    std::string audit_log_path;
    std::string test_env_path;

    std::chrono::seconds default_timeout{60};
    std::chrono::seconds agent_timeout{30};
    std::chrono::seconds integration_timeout{120};

    std::vector<std::string> build_command{"zig", "build"};
};

// Fill the derived paths from repo_root and state_dir. binary_path is only
// filled when empty.
void derive_paths(HarnessSettings &settings);

// Settings for a repository and state directory, with every default applied.
HarnessSettings make_settings(const std::string &repo_root, const std::string &state_dir);

// Resolve settings from command-line arguments (argv without the program
// name) and the environment. Flags win over CLAWMCPS_* variables, which win
// over defaults. Returns std::nullopt and sets error_message on a bad flag.
std::optional<HarnessSettings> resolve(const std::vector<std::string> &arguments, std::string &error_message);

// Usage text for the command-line flags.
std::string usage();

// Process-wide settings used by the tool handlers.
void set(const HarnessSettings &settings);
HarnessSettings get();

} // namespace harness_settings

#endif // CLAWMCPS_HARNESS_SETTINGS_HPP

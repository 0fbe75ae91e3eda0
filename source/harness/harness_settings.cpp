#include "harness/harness_settings.hpp"
#include "platform/platform_abi.hpp"

#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace harness_settings {

static std::mutex settings_mutex;
static HarnessSettings current_settings = make_settings(".", ".bareclaw");

static std::string environment_value(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return "";
    }
    return value;
}

static std::string join_path(const std::string &directory, const std::string &child) {
    return (fs::path(directory) / child).string();
}

void derive_paths(HarnessSettings &settings) {
    if (settings.binary_path.empty()) {
        settings.binary_path = join_path(settings.repo_root, "zig-out/bin/bareclaw");
    }
    settings.config_path = join_path(settings.state_dir, "config.toml");
    settings.workspace_dir = join_path(settings.state_dir, "workspace");
    settings.memory_dir = join_path(settings.workspace_dir, "memory");
    settings.audit_log_path = join_path(settings.workspace_dir, "audit.log");
    settings.test_env_path = join_path(settings.repo_root, "tests/.env.test");
}

HarnessSettings make_settings(const std::string &repo_root, const std::string &state_dir) {
    HarnessSettings settings;
    settings.repo_root = repo_root;
    settings.state_dir = state_dir;
    derive_paths(settings);
    return settings;
}

std::optional<HarnessSettings> resolve(const std::vector<std::string> &arguments, std::string &error_message) {
    std::string repo_root = environment_value("CLAWMCPS_REPO_ROOT");
    std::string binary_path = environment_value("CLAWMCPS_BINARY");
    std::string state_dir = environment_value("CLAWMCPS_STATE_DIR");
    std::string timeout_text = environment_value("CLAWMCPS_TIMEOUT_SECONDS");

    for (size_t index = 0; index < arguments.size(); ++index) {
        const std::string &flag = arguments[index];
        std::string *target = nullptr;
        if (flag == "--repo-root") {
            target = &repo_root;
        } else if (flag == "--binary") {
            target = &binary_path;
        } else if (flag == "--state-dir") {
            target = &state_dir;
        } else if (flag == "--timeout") {
            target = &timeout_text;
        } else {
            error_message = "Unknown argument: " + flag;
            return std::nullopt;
        }
        if (index + 1 >= arguments.size()) {
            error_message = "Missing value for " + flag;
            return std::nullopt;
        }
        *target = arguments[++index];
    }

    if (repo_root.empty()) {
        std::error_code error;
        fs::path working_directory = fs::current_path(error);
        repo_root = error ? "." : working_directory.string();
    }
    if (state_dir.empty()) {
        std::string home = environment_value("HOME");
        if (home.empty()) {
            error_message = "HOME is not set; pass --state-dir or set CLAWMCPS_STATE_DIR";
            return std::nullopt;
        }
        state_dir = join_path(home, ".bareclaw");
    }

    HarnessSettings settings;
    settings.repo_root = repo_root;
    settings.binary_path = binary_path;
    settings.state_dir = state_dir;
    derive_paths(settings);

    if (!timeout_text.empty()) {
        char *end = nullptr;
        long seconds = std::strtol(timeout_text.c_str(), &end, 10);
        if (end == timeout_text.c_str() || *end != '\0' || seconds <= 0 ||
            seconds > platform::MAX_EXECUTION_TIMEOUT.count()) {
            error_message = "Invalid timeout (seconds): " + timeout_text;
            return std::nullopt;
        }
        settings.default_timeout = std::chrono::seconds(seconds);
    }
    return settings;
}

std::string usage() {
    return "Usage: clawmcps [--repo-root <dir>] [--binary <path>] [--state-dir <dir>] [--timeout <seconds>]\n"
           "Environment: CLAWMCPS_REPO_ROOT, CLAWMCPS_BINARY, CLAWMCPS_STATE_DIR,\n"
           "             CLAWMCPS_TIMEOUT_SECONDS, CLAWMCPS_DEBUG=1\n";
}

void set(const HarnessSettings &settings) {
    std::lock_guard<std::mutex> lock(settings_mutex);
    current_settings = settings;
}

HarnessSettings get() {
    std::lock_guard<std::mutex> lock(settings_mutex);
    return current_settings;
}

} // namespace harness_settings

#ifndef CLAWMCPS_INTEGRATION_ENV_HPP
#define CLAWMCPS_INTEGRATION_ENV_HPP

// Environment for the Discord integration test script.
//
// Credentials are resolved in a fixed order so automated runs prefer a
// dedicated test credential over the operator's real one:
//   1. the test-environment file (tests/.env.test),
//   2. the process environment,
//   3. the persisted BareClaw config.

#include "store/config_store.hpp"

#include <map>
#include <optional>
#include <string>

namespace integration_env {

using Environment = std::map<std::string, std::string>;

struct CredentialSource {
    const char *test_file_key;   // key in the test-environment file
    const char *environment_key; // exported name, also read from the environment
    const char *config_key;      // scalar key in config.toml
};

extern const CredentialSource BOT_TOKEN;
extern const CredentialSource WEBHOOK_URL;

// First non-empty value in resolution order, or std::nullopt.
std::optional<std::string> resolve_credential(const CredentialSource &source,
                                              const Environment &test_file_values,
                                              const Environment &inherited,
                                              const std::optional<config_store::ConfigDocument> &config);

// The child's complete environment: inherited variables, plus test-file
// variables that are not already set, plus the resolved credentials,
// CHANNEL_ID and BINARY.
Environment build(const Environment &inherited,
                  const Environment &test_file_values,
                  const std::optional<config_store::ConfigDocument> &config,
                  const std::string &channel_id,
                  const std::string &binary_path);

} // namespace integration_env

#endif // CLAWMCPS_INTEGRATION_ENV_HPP

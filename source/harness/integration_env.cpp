#include "harness/integration_env.hpp"

namespace integration_env {

const CredentialSource BOT_TOKEN = {"DISCORD_TEST_BOT_TOKEN", "DISCORD_BOT_TOKEN", "discord_token"};
const CredentialSource WEBHOOK_URL = {"DISCORD_TEST_WEBHOOK_URL", "DISCORD_WEBHOOK_URL", "discord_webhook"};

static std::optional<std::string> non_empty_value(const Environment &values, const std::string &key) {
    auto found = values.find(key);
    if (found == values.end() || found->second.empty()) {
        return std::nullopt;
    }
    return found->second;
}

std::optional<std::string> resolve_credential(const CredentialSource &source,
                                              const Environment &test_file_values,
                                              const Environment &inherited,
                                              const std::optional<config_store::ConfigDocument> &config) {
    if (auto value = non_empty_value(test_file_values, source.test_file_key)) {
        return value;
    }
    if (auto value = non_empty_value(inherited, source.environment_key)) {
        return value;
    }
    if (config) {
        std::optional<std::string> value = config->scalar_value(source.config_key);
        if (value && !value->empty()) {
            return value;
        }
    }
    return std::nullopt;
}

Environment build(const Environment &inherited,
                  const Environment &test_file_values,
                  const std::optional<config_store::ConfigDocument> &config,
                  const std::string &channel_id,
                  const std::string &binary_path) {
    Environment environment = inherited;

    // Test-file values fill gaps only; they never override the caller.
    for (const auto &entry : test_file_values) {
        environment.insert(entry);
    }

    for (const CredentialSource *source : {&BOT_TOKEN, &WEBHOOK_URL}) {
        std::optional<std::string> value = resolve_credential(*source, test_file_values, inherited, config);
        if (value) {
            environment[source->environment_key] = *value;
        }
    }

    if (!channel_id.empty()) {
        environment["CHANNEL_ID"] = channel_id;
    }
    environment["BINARY"] = binary_path;
    return environment;
}

} // namespace integration_env

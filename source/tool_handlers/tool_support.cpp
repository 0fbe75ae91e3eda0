#include "tool_handlers/tool_support.hpp"
#include "harness/harness_settings.hpp"
#include "process/result_format.hpp"

namespace tool_support {

platform::ExecutionResult run_command(const std::vector<std::string> &arguments,
                                      std::chrono::seconds timeout,
                                      const std::optional<std::map<std::string, std::string>> &environment) {
    platform::ExecutionRequest request;
    request.arguments = arguments;
    request.working_directory = harness_settings::get().repo_root;
    request.timeout = timeout;
    request.environment = environment;
    return platform::execute(request);
}

std::string run_binary(const std::vector<std::string> &arguments) {
    return run_binary(arguments, harness_settings::get().default_timeout);
}

std::string run_binary(const std::vector<std::string> &arguments, std::chrono::seconds timeout) {
    std::vector<std::string> command_line = {harness_settings::get().binary_path};
    command_line.insert(command_line.end(), arguments.begin(), arguments.end());
    return result_format::format(run_command(command_line, timeout));
}

json empty_schema() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    return input_schema;
}

json object_schema(const json &properties, const std::vector<std::string> &required) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = properties;
    if (!required.empty()) {
        input_schema["required"] = required;
    }
    return input_schema;
}

json property(const std::string &type, const std::string &description) {
    return {{"type", type}, {"description", description}};
}

std::string format_with_thousands(std::uintmax_t value) {
    std::string digits = std::to_string(value);
    std::string grouped;
    size_t leading = digits.size() % 3;
    for (size_t index = 0; index < digits.size(); ++index) {
        if (index != 0 && index >= leading && (index - leading) % 3 == 0) {
            grouped += ',';
        }
        grouped += digits[index];
    }
    return grouped;
}

std::string count_noun(size_t count, const std::string &singular, const std::string &plural) {
    return std::to_string(count) + " " + (count == 1 ? singular : plural);
}

} // namespace tool_support

#ifndef CLAWMCPS_TOOL_SUPPORT_HPP
#define CLAWMCPS_TOOL_SUPPORT_HPP

// Helpers shared by the tool handlers: running the BareClaw binary and other
// commands from the repository root, and building input schemas.

#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tool_support {

using json = nlohmann::json;

// Run a command with the repository root as working directory.
platform::ExecutionResult run_command(const std::vector<std::string> &arguments,
                                      std::chrono::seconds timeout,
                                      const std::optional<std::map<std::string, std::string>> &environment =
                                          std::nullopt);

// Run `<binary> <arguments...>` with the default timeout and format the result.
std::string run_binary(const std::vector<std::string> &arguments);

// Same, with an explicit timeout.
std::string run_binary(const std::vector<std::string> &arguments, std::chrono::seconds timeout);

// Input schema for a tool without parameters.
json empty_schema();

// Input schema with the given properties and required names.
json object_schema(const json &properties, const std::vector<std::string> &required = {});

// Property description for object_schema().
json property(const std::string &type, const std::string &description);

// 1234567 -> "1,234,567"
std::string format_with_thousands(std::uintmax_t value);

// "1 entry" / "2 entries" style counts.
std::string count_noun(size_t count, const std::string &singular, const std::string &plural);

} // namespace tool_support

#endif // CLAWMCPS_TOOL_SUPPORT_HPP

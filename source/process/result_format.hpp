#ifndef CLAWMCPS_RESULT_FORMAT_HPP
#define CLAWMCPS_RESULT_FORMAT_HPP

// Rendering of captured process output into the single string a tool returns.

#include "platform/platform_abi.hpp"

#include <string>

namespace result_format {

// Placeholder returned when there is nothing else to show.
extern const char *const NO_OUTPUT;

// Joins, with '\n' and in this order: stdout (if non-empty), "[stderr]\n<stderr>"
// (if stderr is non-empty), "[exit code: <n>]" (if the run did not succeed).
// Callers parse this output heuristically; the layout must not change.
std::string format(const platform::ExecutionResult &result);

} // namespace result_format

#endif // CLAWMCPS_RESULT_FORMAT_HPP

#include "process/result_format.hpp"

#include <vector>

namespace result_format {

const char *const NO_OUTPUT = "(no output)";

std::string format(const platform::ExecutionResult &result) {
    std::vector<std::string> parts;
    if (!result.stdout_text.empty()) {
        parts.push_back(result.stdout_text);
    }
    if (!result.stderr_text.empty()) {
        parts.push_back("[stderr]\n" + result.stderr_text);
    }
    if (!result.succeeded) {
        parts.push_back("[exit code: " + std::to_string(result.exit_status) + "]");
    }

    if (parts.empty()) {
        return NO_OUTPUT;
    }

    std::string formatted = parts.front();
    for (size_t index = 1; index < parts.size(); ++index) {
        formatted += "\n";
        formatted += parts[index];
    }
    return formatted;
}

} // namespace result_format

#include "utils/debug_log.hpp"

#include <cstdlib>
#include <utility>
#include <iostream>
#include <mutex>
#include <sstream>
#include <strings.h>

namespace debug_log {

static std::mutex output_mutex;

static bool read_debug_flag() {
    const char *value = std::getenv("CLAWMCPS_DEBUG");
    if (value == nullptr) {
        return false;
    }
    for (const char *accepted : {"1", "true", "yes"}) {
        if (::strcasecmp(value, accepted) == 0) {
            return true;
        }
    }
    return false;
}

bool is_debug_enabled() {
    static const bool enabled = read_debug_flag();
    return enabled;
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }

    std::ostringstream block;
    std::istringstream lines(message);
    std::string line;
    while (std::getline(lines, line)) {
        block << "[clawmcps] " << line << '\n';
    }

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << block.str();
    std::cerr.flush();
}

ScopedTimer::ScopedTimer(std::string label)
    : label_(std::move(label)), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    if (!is_debug_enabled()) {
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_);
    log(label_ + " took " + std::to_string(elapsed.count()) + " ms");
}

} // namespace debug_log

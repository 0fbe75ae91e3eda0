#ifndef CLAWMCPS_DEBUG_LOG_HPP
#define CLAWMCPS_DEBUG_LOG_HPP

// Opt-in diagnostics on stderr, enabled by CLAWMCPS_DEBUG=1|true|yes.
// stdout carries MCP messages and is never written here.

#include <chrono>
#include <string>

namespace debug_log {

// CLAWMCPS_DEBUG is read on first use; later changes are ignored.
bool is_debug_enabled();

// One "[clawmcps] " prefixed line per line of message. Lines from
// concurrent callers are never interleaved.
void log(const std::string &message);

// Logs "<label> took N ms" when it goes out of scope.
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer &) = delete;
    ScopedTimer &operator=(const ScopedTimer &) = delete;

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace debug_log

#endif // CLAWMCPS_DEBUG_LOG_HPP

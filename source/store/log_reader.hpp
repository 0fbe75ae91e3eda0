#ifndef CLAWMCPS_LOG_READER_HPP
#define CLAWMCPS_LOG_READER_HPP

// Reader for the agent's append-only audit log. Lines are returned raw.

#include <cstddef>
#include <string>
#include <vector>

namespace log_reader {

enum class TailStatus {
    ok,
    not_found, // the log has not been created yet
    empty,     // the log exists but holds no lines
    io_error,
};

struct TailResult {
    TailStatus status = TailStatus::io_error;
    std::vector<std::string> lines; // oldest first
    size_t total_lines = 0;
    std::string error_message;
};

// The last min(line_count, total) lines of file_path, in file order.
TailResult tail(const std::string &file_path, size_t line_count);

} // namespace log_reader

#endif // CLAWMCPS_LOG_READER_HPP

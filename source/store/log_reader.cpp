#include "store/log_reader.hpp"

#include <deque>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace log_reader {

TailResult tail(const std::string &file_path, size_t line_count) {
    TailResult result;

    std::error_code error;
    if (!std::filesystem::exists(file_path, error)) {
        result.status = error ? TailStatus::io_error : TailStatus::not_found;
        result.error_message = error ? error.message() : "";
        return result;
    }

    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        result.status = TailStatus::io_error;
        result.error_message = "cannot open " + file_path;
        return result;
    }

    // Only the window is kept in memory; the log can grow without bound.
    std::deque<std::string> window;
    std::string line;
    while (std::getline(file_stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        result.total_lines++;
        if (line_count == 0) {
            continue;
        }
        window.push_back(line);
        if (window.size() > line_count) {
            window.pop_front();
        }
    }
    if (file_stream.bad()) {
        result.status = TailStatus::io_error;
        result.error_message = "read failed: " + file_path;
        return result;
    }

    if (result.total_lines == 0) {
        result.status = TailStatus::empty;
        return result;
    }

    result.lines.assign(window.begin(), window.end());
    result.status = TailStatus::ok;
    return result;
}

} // namespace log_reader

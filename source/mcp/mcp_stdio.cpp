#include "mcp/mcp_stdio.hpp"

#include <iostream>
#include <mutex>

namespace mcp_stdio {

static std::mutex output_mutex;

namespace {

// Nesting state of the frame being read.
class FrameScanner {
public:
    // Feeds one byte that belongs to the frame. Returns true when it closed
    // the top-level value.
    bool feed(char character) {
        if (escaped_) {
            escaped_ = false;
            return false;
        }
        if (in_string_) {
            if (character == '\\') {
                escaped_ = true;
            } else if (character == '"') {
                in_string_ = false;
            }
            return false;
        }

        switch (character) {
        case '"':
            in_string_ = true;
            break;
        case '{':
        case '[':
            depth_++;
            break;
        case '}':
        case ']':
            depth_--;
            return depth_ == 0;
        default:
            break;
        }
        return false;
    }

private:
    int depth_ = 0;
    bool in_string_ = false;
    bool escaped_ = false;
};

} // namespace

Frame read_frame(std::istream &input, size_t max_bytes) {
    Frame frame;
    FrameScanner scanner;
    bool started = false;
    bool overflowed = false;

    char character;
    while (input.get(character)) {
        if (!started) {
            if (character != '{' && character != '[') {
                continue;
            }
            started = true;
        }

        if (!overflowed) {
            if (frame.text.size() >= max_bytes) {
                overflowed = true;
                frame.text.clear();
                frame.text.shrink_to_fit();
            } else {
                frame.text += character;
            }
        }

        if (scanner.feed(character)) {
            frame.status = overflowed ? FrameStatus::oversized : FrameStatus::complete;
            return frame;
        }
    }

    frame.text.clear();
    frame.status = FrameStatus::end_of_input;
    return frame;
}

Frame read_frame() {
    return read_frame(std::cin);
}

void write_message(const std::string &json_string) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << json_string << '\n';
    std::cout.flush();
}

void log_message(const std::string &message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[clawmcps] " << message << std::endl;
}

} // namespace mcp_stdio

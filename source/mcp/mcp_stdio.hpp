#ifndef CLAWMCPS_MCP_STDIO_HPP
#define CLAWMCPS_MCP_STDIO_HPP

// MCP stdio transport: JSON-RPC messages on stdin/stdout, logs on stderr.
//
// Incoming frames are complete top-level JSON values, either an object (one
// message) or an array (a batch). Framing tracks nesting depth outside string
// literals, so newline-delimited and streamed input both work.

#include <cstddef>
#include <istream>
#include <string>

namespace mcp_stdio {

// Frames larger than this are skipped and reported as oversized.
constexpr size_t MAX_FRAME_BYTES = 16 * 1024 * 1024;

enum class FrameStatus {
    complete,
    oversized,    // text is empty; the frame was consumed and dropped
    end_of_input, // EOF before a frame was completed
};

struct Frame {
    FrameStatus status = FrameStatus::end_of_input;
    std::string text;
};

// Read the next frame. Bytes before the first '{' or '[' are skipped.
Frame read_frame(std::istream &input, size_t max_bytes = MAX_FRAME_BYTES);
Frame read_frame();

// Write one serialized message followed by a newline, and flush.
void write_message(const std::string &json_string);

// Write a log line to stderr.
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // CLAWMCPS_MCP_STDIO_HPP

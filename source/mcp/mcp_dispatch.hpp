#ifndef CLAWMCPS_MCP_DISPATCH_HPP
#define CLAWMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.

#include <nlohmann/json.hpp>

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol revision answered when the client asks for one we do not know.
extern const char *const LATEST_PROTOCOL_VERSION;

// Dispatch one message or a batch (JSON array) of messages. Returns the
// response, an array of responses for a batch, or null when nothing needs
// an answer (notifications, batches made only of notifications).
json dispatch_message(const json &message);

} // namespace mcp_dispatch

#endif // CLAWMCPS_MCP_DISPATCH_HPP

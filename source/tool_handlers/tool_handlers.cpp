#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of the per-area registration functions.
// Each tool_*.cpp defines its own namespace with a register_tools() function.

namespace tool_build { void register_tools(); }
namespace tool_runtime { void register_tools(); }
namespace tool_source { void register_tools(); }
namespace tool_state { void register_tools(); }
namespace tool_test_suites { void register_tools(); }
namespace tool_agent_status { void register_tools(); }
namespace tool_mcp_servers { void register_tools(); }

namespace tool_handlers {

void register_all_tools() {
    tool_build::register_tools();
    tool_runtime::register_tools();
    tool_source::register_tools();
    tool_state::register_tools();
    tool_test_suites::register_tools();
    tool_agent_status::register_tools();
    tool_mcp_servers::register_tools();
}

} // namespace tool_handlers

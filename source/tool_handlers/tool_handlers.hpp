#ifndef CLAWMCPS_TOOL_HANDLERS_HPP
#define CLAWMCPS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

namespace tool_handlers {

// Register all available tool handlers with the MCP tool registry.
// Safe to call more than once; later calls replace the same definitions.
void register_all_tools();

} // namespace tool_handlers

#endif // CLAWMCPS_TOOL_HANDLERS_HPP

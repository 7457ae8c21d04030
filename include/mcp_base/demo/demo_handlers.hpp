#pragma once

#include <mcp_base/mcp/dispatcher.hpp>
#include <mcp_base/mcp/registry.hpp>
#include <mcp_base/validation/schema_validator.hpp>

namespace mcp_base {

// Registers the demonstration set served by the mcp-base executable:
//   tools      echo, calculate
//   resources  server://info
//   prompts    summarize
//
// `registry` and `validator` must outlive the registered handlers; the server
// owns all three together.
void RegisterDemoHandlers(Registry& registry,
                          SchemaValidator& validator,
                          const ServerInfo& info);

} // namespace mcp_base

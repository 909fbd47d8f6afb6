#pragma once

/// @file mcpgate.hpp
/// @brief Main header for mcpgate - includes the commonly used components
///
/// Usage:
/// @code
/// #include <mcpgate.hpp>
///
/// int main() {
///     auto cfg = mcpgate::util::json::parse(config_text).get<mcpgate::client::ManagerConfig>();
///     mcpgate::client::ConnectorManager manager(cfg);
///     manager.initialize();
///
///     for (auto& [server, tools] : manager.list_all_tools())
///         for (auto& tool : tools)
///             std::cout << tool["fullName"] << "\n";
///
///     auto out = manager.call_tool_by_name("files__read", {{"path", "/tmp/x"}});
/// }
/// @endcode

// Core types and exceptions
#include "mcpgate/exceptions.hpp"
#include "mcpgate/jsonrpc.hpp"
#include "mcpgate/settings.hpp"
#include "mcpgate/types.hpp"

// Utilities
#include "mcpgate/util/json.hpp"
#include "mcpgate/util/log.hpp"

// Outbound: remote servers
#include "mcpgate/client/config.hpp"
#include "mcpgate/client/connector.hpp"
#include "mcpgate/client/manager.hpp"
#include "mcpgate/client/transports.hpp"
#include "mcpgate/container/transport.hpp"

// Inbound: protocol gateway
#include "mcpgate/gateway/handler.hpp"
#include "mcpgate/gateway/http_server.hpp"
#include "mcpgate/gateway/stdio_server.hpp"

#pragma once
/// @file gateway/handler.hpp
/// @brief Inbound MCP JSON-RPC dispatch over a procedure registry

#include "mcpgate/gateway/procedure.hpp"
#include "mcpgate/gateway/tasks.hpp"
#include "mcpgate/types.hpp"

#include <functional>
#include <memory>
#include <string>

namespace mcpgate::gateway
{

/// Answers initialize, ping, tools/list, tools/call, notifications/cancelled
/// and notifications/initialized. Every outcome, including dispatch failures,
/// is returned as a JSON-RPC envelope; handle() does not throw.
///
/// Procedures must be registered before the gateway starts serving.
class Gateway
{
  public:
    Gateway(std::string server_name, std::string version,
            std::shared_ptr<ProcedureRegistry> procedures,
            std::shared_ptr<TaskRegistry> tasks = std::make_shared<TaskRegistry>());

    Json handle(const Json& message, const AuthContext& auth = {}) const;

    /// Add listRunningTasks, getTaskProgress and cancelTask under "tasks.*".
    void register_task_tools();

    ProcedureRegistry& procedures()
    {
        return *procedures_;
    }
    TaskRegistry& tasks()
    {
        return *tasks_;
    }

  private:
    Json list_tools() const;
    Json call_tool(const Json& id, const Json& params, const AuthContext& auth) const;

    std::string server_name_;
    std::string version_;
    std::shared_ptr<ProcedureRegistry> procedures_;
    std::shared_ptr<TaskRegistry> tasks_;
};

/// Turn an executor's return value into MCP content: strings become one text
/// block; objects and arrays become pretty JSON, preceded by a "key: value"
/// summary for objects with at most five primitive entries; other scalars
/// become their JSON text. Values that already carry a content array pass
/// through unchanged.
Json normalize_tool_result(const Json& value);

/// Adapter in the shape of an MCP handler function.
std::function<Json(const Json&)> make_gateway_handler(std::shared_ptr<Gateway> gateway,
                                                      AuthContext auth = {});

} // namespace mcpgate::gateway

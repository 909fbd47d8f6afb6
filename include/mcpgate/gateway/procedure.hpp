#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "mcpgate/exceptions.hpp"
#include "mcpgate/types.hpp"

namespace mcpgate::gateway {

class TaskRegistry;

// Identity of the inbound caller, as established by the host's auth layer.
struct AuthContext {
  std::optional<std::string> user;
  std::optional<std::string> api_key;
};

// Handed to every executor. task_id is fresh for each invocation. tasks is
// only set for procedures that support cancellation; notifications/cancelled
// for the caller's request id then reaches the task registered as task_id.
struct CallContext {
  AuthContext auth;
  std::string task_id;
  TaskRegistry* tasks{nullptr};
};

using Executor = std::function<Json(const Json& arguments, CallContext& ctx)>;

// Marks a procedure as an MCP tool. An empty name falls back to the last
// dotted segment of the procedure path.
struct ToolMeta {
  std::string name;
  std::string description;
};

struct Procedure {
  std::string path;  // "tasks.longRunning"
  std::optional<ToolMeta> tool;
  Json input_schema = Json{{"type", "object"}, {"properties", Json::object()}, {"additionalProperties", false}};
  Executor executor;
  bool supports_cancellation{false};  // executor gets ctx.tasks and may be cancelled

  std::string tool_name() const;
  std::string tool_description() const;  // "Execute <name>" when empty
};

class ProcedureRegistry {
 public:
  // Throws ValidationError for an empty path, a missing executor or a
  // duplicate path.
  void add(Procedure p);

  // Procedure whose tool name is `name`; nullptr when none.
  const Procedure* find_tool(const std::string& name) const;

  // Procedures carrying tool metadata, in path order.
  std::vector<const Procedure*> tools() const;

  size_t size() const { return procedures_.size(); }

 private:
  std::map<std::string, Procedure> procedures_;
};

} // namespace mcpgate::gateway

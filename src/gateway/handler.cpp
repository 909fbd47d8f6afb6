#include "mcpgate/gateway/handler.hpp"

#include "mcpgate/exceptions.hpp"
#include "mcpgate/jsonrpc.hpp"
#include "mcpgate/util/json.hpp"
#include "mcpgate/util/json_schema.hpp"
#include "mcpgate/util/log.hpp"
#include "mcpgate/util/redact.hpp"

#include <optional>

namespace mcpgate::gateway
{

namespace
{
constexpr size_t kMaxSummaryEntries = 5;

Json text_block(const std::string& text)
{
    return Json{{"type", "text"}, {"text", text}};
}

bool is_primitive(const Json& v)
{
    return !v.is_object() && !v.is_array();
}

Json make_tool_entry(const Procedure& p)
{
    Json schema = p.input_schema.is_object() ? p.input_schema : Json::object();
    return Json{{"name", p.tool_name()},
                {"description", util::sanitize_description(p.tool_description())},
                {"inputSchema", schema}};
}

// Callers pick request ids freely, so they only identify a call within the
// caller's own identity.
std::string request_key(const AuthContext& auth, const Json& id)
{
    std::string scope;
    if (auth.user)
        scope = "user:" + *auth.user;
    else if (auth.api_key)
        scope = "key:" + *auth.api_key;
    return scope + "\n" + util::json::id_key(id);
}

// Keeps notifications/cancelled for a request pointed at its task while it runs
class RequestBinding
{
  public:
    RequestBinding(TaskRegistry& tasks, std::string key, std::string task_id)
        : tasks_(tasks), key_(std::move(key)), task_id_(std::move(task_id))
    {
        tasks_.bind_request(key_, task_id_);
    }
    ~RequestBinding()
    {
        tasks_.unbind_request(key_, task_id_);
    }

    RequestBinding(const RequestBinding&) = delete;
    RequestBinding& operator=(const RequestBinding&) = delete;

  private:
    TaskRegistry& tasks_;
    std::string key_;
    std::string task_id_;
};

Json task_id_schema(const std::string& description)
{
    return Json{{"type", "object"},
                {"properties",
                 {{"taskId", {{"type", "string"}, {"minLength", 1}, {"description", description}}}}},
                {"required", Json::array({"taskId"})},
                {"additionalProperties", false}};
}
} // namespace

Json normalize_tool_result(const Json& value)
{
    if (value.is_object() && value.contains("content") && value["content"].is_array())
        return value;

    Json content = Json::array();
    if (value.is_string())
    {
        content.push_back(text_block(value.get<std::string>()));
    }
    else if (value.is_object() || value.is_array())
    {
        if (value.is_object() && !value.empty() && value.size() <= kMaxSummaryEntries)
        {
            bool flat = true;
            for (const auto& [key, v] : value.items())
                flat = flat && is_primitive(v);
            if (flat)
            {
                std::string summary;
                for (const auto& [key, v] : value.items())
                {
                    if (!summary.empty())
                        summary += "\n";
                    summary += key + ": " + (v.is_string() ? v.get<std::string>() : v.dump());
                }
                content.push_back(text_block(summary));
            }
        }
        content.push_back(text_block(util::json::dump_pretty(value)));
    }
    else
    {
        content.push_back(text_block(value.dump()));
    }
    return Json{{"content", content}};
}

Gateway::Gateway(std::string server_name, std::string version,
                 std::shared_ptr<ProcedureRegistry> procedures, std::shared_ptr<TaskRegistry> tasks)
    : server_name_(std::move(server_name)), version_(std::move(version)),
      procedures_(procedures ? std::move(procedures) : std::make_shared<ProcedureRegistry>()),
      tasks_(tasks ? std::move(tasks) : std::make_shared<TaskRegistry>())
{
}

Json Gateway::handle(const Json& message, const AuthContext& auth) const
{
    const Json id = message.is_object() && message.contains("id") ? message["id"] : Json();
    try
    {
        if (!message.is_object() || !message.contains("method") || !message["method"].is_string())
            return jsonrpc::error(id, jsonrpc::INVALID_REQUEST, "Invalid Request");

        const std::string method = message["method"].get<std::string>();
        const Json params = message.contains("params") && message["params"].is_object()
                                ? message["params"]
                                : Json::object();

        if (method == "initialize")
        {
            return jsonrpc::result(
                id, Json{{"protocolVersion", PROTOCOL_VERSION},
                         {"capabilities", Json{{"tools", Json::object()}}},
                         {"serverInfo", Json{{"name", server_name_}, {"version", version_}}}});
        }

        if (method == "ping" || method == "notifications/initialized")
            return jsonrpc::result(id, Json::object());

        if (method == "tools/list")
            return jsonrpc::result(id, list_tools());

        if (method == "tools/call")
            return call_tool(id, params, auth);

        if (method == "notifications/cancelled")
        {
            const Json request_id = params.value("requestId", Json());
            const Json task_id = params.value("taskId", Json());
            if (!request_id.is_null())
            {
                const std::string shown = util::json::id_key(request_id);
                if (tasks_->cancel_request(request_key(auth, request_id)) > 0)
                    log::info("[Gateway] Cancellation requested for request " + shown);
                else
                    log::debug("[Gateway] Cancellation for unknown request " + shown);
            }
            else if (task_id.is_string())
            {
                const std::string key = task_id.get<std::string>();
                if (tasks_->cancel(key))
                    log::info("[Gateway] Cancellation requested for task " + key);
                else
                    log::debug("[Gateway] Cancellation for unknown task " + key);
            }
            return jsonrpc::result(id, Json::object());
        }

        return jsonrpc::error(id, jsonrpc::METHOD_NOT_FOUND, "Method '" + method + "' not found");
    }
    catch (const std::exception& e)
    {
        log::error(std::string("[Gateway] Dispatch failed: ") + e.what());
        return jsonrpc::error(id, jsonrpc::INTERNAL_ERROR, "Internal error", e.what());
    }
}

Json Gateway::list_tools() const
{
    Json tools = Json::array();
    for (const Procedure* p : procedures_->tools())
        tools.push_back(make_tool_entry(*p));
    return Json{{"tools", tools}};
}

Json Gateway::call_tool(const Json& id, const Json& params, const AuthContext& auth) const
{
    const std::string name = params.value("name", "");
    if (name.empty())
        return jsonrpc::error(id, jsonrpc::INVALID_PARAMS, "Missing tool name");

    const Procedure* p = procedures_->find_tool(name);
    if (!p)
        return jsonrpc::error(id, jsonrpc::INTERNAL_ERROR, "Tool not found: " + name,
                              Json{{"tool", name}});

    Json args = params.contains("arguments") && !params["arguments"].is_null()
                    ? params["arguments"]
                    : Json::object();
    try
    {
        util::schema::validate(p->input_schema, args);
        args = util::schema::apply_defaults(p->input_schema, args);
    }
    catch (const ValidationError& e)
    {
        return jsonrpc::error(id, jsonrpc::INTERNAL_ERROR, "Invalid arguments for " + name,
                              e.what());
    }

    CallContext ctx;
    ctx.auth = auth;
    ctx.task_id = tasks_->next_id();
    std::optional<RequestBinding> binding;
    if (p->supports_cancellation)
    {
        ctx.tasks = tasks_.get();
        if (!id.is_null())
            binding.emplace(*tasks_, request_key(auth, id), ctx.task_id);
    }

    try
    {
        Json out = p->executor(args, ctx);
        return jsonrpc::result(id, normalize_tool_result(out));
    }
    catch (const std::exception& e)
    {
        log::warn("[Gateway] Tool " + name + " failed: " + util::error_for_logging(e.what()));
        return jsonrpc::error(id, jsonrpc::INTERNAL_ERROR, "Tool execution failed", e.what());
    }
}

void Gateway::register_task_tools()
{
    auto tasks = tasks_;

    Procedure list;
    list.path = "tasks.listRunningTasks";
    list.tool = ToolMeta{"listRunningTasks", "List all currently running tasks"};
    list.input_schema = Json{{"type", "object"},
                             {"properties",
                              {{"includeCompleted",
                                {{"type", "boolean"},
                                 {"default", false},
                                 {"description", "Include completed tasks in the list"}}}}},
                             {"additionalProperties", false}};
    list.executor = [tasks](const Json&, CallContext&)
    {
        Json running = Json::array();
        for (const auto& t : tasks->snapshot())
            running.push_back(to_json(t));
        return Json{{"tasks", running},
                    {"totalRunning", running.size()},
                    {"registrySize", tasks->size()}};
    };
    procedures_->add(std::move(list));

    Procedure progress;
    progress.path = "tasks.getTaskProgress";
    progress.tool = ToolMeta{"getTaskProgress", "Get real-time progress for a specific task"};
    progress.input_schema = task_id_schema("ID of the task to check progress for");
    progress.executor = [tasks](const Json& args, CallContext&)
    {
        const std::string task_id = args.value("taskId", "");
        auto t = tasks->get(task_id);
        if (!t)
            return Json{{"taskId", task_id}, {"found", false}, {"error", "Task not found or completed"}};
        Json info = to_json(*t);
        return Json{{"taskId", task_id},
                    {"found", true},
                    {"name", t->name},
                    {"status", info["status"]},
                    {"progress",
                     {{"current", t->current_step},
                      {"total", t->total_steps},
                      {"percentage", info["progressPercentage"]},
                      {"message", "Step " + std::to_string(t->current_step) + " of " +
                                      std::to_string(t->total_steps)}}},
                    {"elapsedSeconds", info["elapsedTime"]},
                    {"cancelled", t->cancelled}};
    };
    procedures_->add(std::move(progress));

    Procedure cancel;
    cancel.path = "tasks.cancelTask";
    cancel.tool = ToolMeta{"cancelTask", "Cancel a running task by its task ID"};
    cancel.input_schema = task_id_schema("ID of the task to cancel");
    cancel.executor = [tasks](const Json& args, CallContext&)
    {
        const std::string task_id = args.value("taskId", "");
        if (!tasks->cancel(task_id))
            return Json{{"taskId", task_id},
                        {"cancelled", false},
                        {"message", "Task " + task_id + " not found or already completed"}};
        return Json{{"taskId", task_id},
                    {"cancelled", true},
                    {"message", "Task " + task_id + " has been cancelled"}};
    };
    procedures_->add(std::move(cancel));
}

std::function<Json(const Json&)> make_gateway_handler(std::shared_ptr<Gateway> gateway,
                                                      AuthContext auth)
{
    return [gateway, auth](const Json& message) { return gateway->handle(message, auth); };
}

} // namespace mcpgate::gateway

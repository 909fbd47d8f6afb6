// HTTP gateway that re-exports the tools of configured remote servers next to
// a local cancellable task.
//
// Usage: mcpgate_gateway_server [servers.json] [port]
//
// servers.json holds a manager config:
//   {"servers": [{"name": "files", "transport": "process-node",
//                 "command": "@modelcontextprotocol/server-filesystem", "args": ["/tmp"]}]}
#include "mcpgate.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace
{
std::atomic<bool> g_stop{false};

void on_signal(int)
{
    g_stop = true;
}
} // namespace

int main(int argc, char** argv)
{
    using mcpgate::Json;
    namespace gw = mcpgate::gateway;
    namespace client = mcpgate::client;

    mcpgate::Settings::from_env().apply();

    client::ManagerConfig manager_cfg;
    if (argc > 1)
    {
        std::ifstream in(argv[1]);
        if (!in)
        {
            std::cerr << "cannot read " << argv[1] << std::endl;
            return 1;
        }
        std::stringstream buf;
        buf << in.rdbuf();
        try
        {
            manager_cfg = mcpgate::util::json::parse(buf.str()).get<client::ManagerConfig>();
        }
        catch (const std::exception& e)
        {
            std::cerr << "invalid config: " << e.what() << std::endl;
            return 1;
        }
    }
    const int port = argc > 2 ? std::atoi(argv[2]) : 18080;

    client::ConnectorManager manager(manager_cfg);
    manager.initialize();
    while (auto ev = manager.events().try_pop())
        if (ev->kind == client::ManagerEvent::Kind::ServerError)
            std::cerr << "server " << ev->server << ": " << ev->message << std::endl;

    auto registry = std::make_shared<gw::ProcedureRegistry>();

    gw::Procedure task;
    task.path = "tasks.longRunningTask";
    task.tool = gw::ToolMeta{"longRunningTask", "A task that can be cancelled mid-execution"};
    task.supports_cancellation = true;
    task.input_schema = Json{
        {"type", "object"},
        {"properties",
         Json{{"steps", Json{{"type", "integer"}, {"minimum", 1}, {"maximum", 100}, {"default", 10}}},
              {"stepMs", Json{{"type", "integer"}, {"minimum", 0}, {"default", 500}}}}},
        {"additionalProperties", false}};
    task.executor = [](const Json& args, gw::CallContext& ctx)
    {
        const int steps = args.value("steps", 10);
        gw::TaskScope scope(*ctx.tasks, ctx.task_id, "longRunningTask", steps);
        int done = 0;
        for (; done < steps; ++done)
        {
            if (scope.cancelled())
                return Json{{"cancelled", true}, {"steps", done}};
            std::this_thread::sleep_for(std::chrono::milliseconds(args.value("stepMs", 500)));
            scope.advance();
        }
        return Json{{"cancelled", false}, {"steps", done}};
    };
    registry->add(std::move(task));

    // Remote tools, under their prefixed names
    for (const auto& [server, tools] : manager.list_all_tools())
    {
        for (const auto& tool : tools)
        {
            gw::Procedure p;
            const std::string full_name = tool["fullName"].get<std::string>();
            p.path = "remote." + full_name;
            p.tool = gw::ToolMeta{tool["displayName"].get<std::string>(), tool.value("description", "")};
            if (tool.contains("inputSchema") && tool["inputSchema"].is_object())
                p.input_schema = tool["inputSchema"];
            p.executor = [&manager, full_name](const Json& args, gw::CallContext&)
            { return manager.call_tool_by_name(full_name, args); };
            registry->add(std::move(p));
        }
    }

    auto gateway = std::make_shared<gw::Gateway>("mcpgate", mcpgate::VERSION, registry);
    gateway->register_task_tools();

    gw::GatewayHttpServer server(gateway, "127.0.0.1", port);
    if (!server.start())
        return 1;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!g_stop)
    {
        while (auto ev = manager.events().pop_for(std::chrono::milliseconds(200)))
        {
            if (ev->kind == client::ManagerEvent::Kind::ServerError)
                std::cerr << "server " << ev->server << ": " << ev->message << std::endl;
        }
        if (manager.events().closed())
            break;
    }

    server.stop();
    manager.shutdown();
    return 0;
}

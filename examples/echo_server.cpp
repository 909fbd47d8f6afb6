// Minimal stdio MCP server used by the process transport tests.
//
//   echo  {message}      -> message
//   add   {a, b}         -> a + b
//   exit  {code = 3}     -> terminates the process without replying
//   notify {}            -> emits a server notification before replying
#include "mcpgate/gateway/handler.hpp"
#include "mcpgate/gateway/stdio_server.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

int main()
{
    using mcpgate::Json;
    namespace gw = mcpgate::gateway;

    auto registry = std::make_shared<gw::ProcedureRegistry>();

    gw::Procedure echo;
    echo.path = "demo.echo";
    echo.tool = gw::ToolMeta{"echo", "Echo the input message"};
    echo.input_schema = Json{{"type", "object"},
                             {"properties", Json{{"message", Json{{"type", "string"}}}}},
                             {"required", Json::array({"message"})}};
    echo.executor = [](const Json& args, gw::CallContext&) { return args.at("message"); };
    registry->add(std::move(echo));

    gw::Procedure add;
    add.path = "demo.add";
    add.tool = gw::ToolMeta{"add", "Add two numbers"};
    add.input_schema = Json{{"type", "object"},
                            {"properties", Json{{"a", Json{{"type", "number"}}},
                                                {"b", Json{{"type", "number"}}}}},
                            {"required", Json::array({"a", "b"})}};
    add.executor = [](const Json& args, gw::CallContext&)
    { return Json(args.at("a").get<double>() + args.at("b").get<double>()); };
    registry->add(std::move(add));

    gw::Procedure quit;
    quit.path = "demo.exit";
    quit.tool = gw::ToolMeta{"exit", "Terminate the server"};
    quit.input_schema = Json{{"type", "object"},
                             {"properties", Json{{"code", Json{{"type", "integer"}, {"default", 3}}}}}};
    quit.executor = [](const Json& args, gw::CallContext&) -> Json
    {
        std::cout.flush();
        std::exit(args.value("code", 3));
    };
    registry->add(std::move(quit));

    gw::Procedure notify;
    notify.path = "demo.notify";
    notify.tool = gw::ToolMeta{"notify", "Send a log notification, then reply"};
    notify.executor = [](const Json&, gw::CallContext&)
    {
        std::cout << Json{{"jsonrpc", "2.0"},
                          {"method", "notifications/message"},
                          {"params", {{"level", "info"}, {"data", "hello"}}}}
                         .dump()
                  << std::endl;
        return Json("notified");
    };
    registry->add(std::move(notify));

    // Diagnostics go to stderr and must not disturb the protocol stream
    std::cerr << "echo server ready" << std::endl;

    auto gateway = std::make_shared<gw::Gateway>("echo", "1.0.0", registry);
    gw::StdioServer server(gw::make_gateway_handler(gateway));
    server.run();
    return 0;
}

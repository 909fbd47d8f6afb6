#include "mcpgate/client/manager.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/gateway/http_server.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

int main()
{
    using namespace mcpgate;
    namespace gw = mcpgate::gateway;
    using namespace mcpgate::client;

    // uvx stand-in that runs the echo server binary directly
    const std::string bin = "/tmp/mcpgate_integration_" + std::to_string(getpid());
    mkdir(bin.c_str(), 0755);
    {
        std::ofstream f(bin + "/uvx");
        f << "#!/bin/sh\nexec \"$@\"\n";
    }
    chmod((bin + "/uvx").c_str(), 0755);
    const char* path_env = std::getenv("PATH");
    setenv("PATH", (bin + ":" + (path_env ? path_env : "/usr/bin:/bin")).c_str(), 1);

    // In-process HTTP gateway standing in for a remote server
    auto registry = std::make_shared<gw::ProcedureRegistry>();
    gw::Procedure echo;
    echo.path = "remote.echo";
    echo.tool = gw::ToolMeta{"echo", "Echo over HTTP"};
    echo.input_schema = Json{{"type", "object"},
                             {"properties", Json{{"message", Json{{"type", "string"}}}}},
                             {"required", Json::array({"message"})}};
    echo.executor = [](const Json& args, gw::CallContext&)
    { return Json("http:" + args.at("message").get<std::string>()); };
    registry->add(std::move(echo));
    auto gateway = std::make_shared<gw::Gateway>("remote", "1.0", registry);
    gw::GatewayHttpServer http(gateway);
    assert(http.start());

    Json cfg_json = {
        {"retryDelay", 100},
        {"servers",
         Json::array({Json{{"name", "serverA"},
                           {"transport", "process-python"},
                           {"command", MCPGATE_ECHO_SERVER},
                           {"timeout", 10000}},
                      Json{{"name", "serverB"},
                           {"transport", "http"},
                           {"url", "http://127.0.0.1:" + std::to_string(http.port()) + "/mcp"},
                           {"timeout", 5000}}})}};

    std::cout << "Test: manager spans a child process and an HTTP server...\n";
    {
        ConnectorManager manager(cfg_json.get<ManagerConfig>());
        manager.initialize();
        assert(manager.is_server_connected("serverA"));
        assert(manager.is_server_connected("serverB"));
        assert(manager.get_connected_servers().size() == 2);

        auto catalogue = manager.list_all_tools();
        auto has = [&](const std::string& server, const std::string& full_name)
        {
            for (const auto& t : catalogue[server])
                if (t["fullName"] == full_name)
                    return true;
            return false;
        };
        assert(catalogue["serverA"].size() == 4);
        assert(catalogue["serverB"].size() == 1);
        assert(has("serverA", "serverA__echo"));
        assert(has("serverA", "serverA__add"));
        assert(has("serverB", "serverB__echo"));

        Json a = manager.call_tool_by_name("serverA__echo", Json{{"message", "one"}});
        assert(a["content"][0]["text"] == "one");
        Json b = manager.call_tool_by_name("serverB__echo", Json{{"message", "two"}});
        assert(b["content"][0]["text"] == "http:two");

        bool invalid = false;
        try
        {
            manager.call_tool_by_name("serverB__echo", Json::object());
        }
        catch (const RemoteError& e)
        {
            invalid = std::string(e.what()).find("Invalid arguments") != std::string::npos;
        }
        assert(invalid);

        bool unknown = false;
        try
        {
            manager.call_tool_by_name("serverC__echo", Json::object());
        }
        catch (const Error&)
        {
            unknown = true;
        }
        assert(unknown);

        manager.shutdown();
        assert(manager.get_connected_servers().empty());
    }
    std::cout << "  [PASS] integration\n";

    http.stop();
    return 0;
}

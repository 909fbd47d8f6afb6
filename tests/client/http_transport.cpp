#include "mcpgate/client/transports.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/jsonrpc.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <httplib.h>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace mcpgate;
using namespace mcpgate::client;

static std::string header_value(const std::vector<std::pair<std::string, std::string>>& headers,
                                const std::string& key)
{
    for (const auto& [k, v] : headers)
        if (k == key)
            return v;
    return "";
}

static void test_sse_parsing()
{
    std::cout << "Test: SSE bodies split into JSON messages...\n";
    const std::string body = "event: message\n"
                             "data: {\"a\":1}\n\n"
                             ": keep-alive\n\n"
                             "data: not json\n\n"
                             "data: {\"b\":\n"
                             "data: 2}\r\n\r\n"
                             "data:{\"c\":3}";
    auto messages = parse_sse_messages(body);
    assert(messages.size() == 3);
    assert(messages[0]["a"] == 1);
    assert(messages[1]["b"] == 2);
    assert(messages[2]["c"] == 3);
    assert(parse_sse_messages("").empty());
    std::cout << "  [PASS] parse_sse_messages\n";
}

static void test_request_headers()
{
    std::cout << "Test: request headers carry auth and extras...\n";
    RemoteServerConfig cfg;
    cfg.name = "web";
    cfg.url = "http://127.0.0.1/mcp";
    cfg.headers = {{"X-Team", "infra"}};
    cfg.auth.type = AuthConfig::Type::Bearer;
    cfg.auth.token = "t0k";
    auto headers = http_request_headers(cfg);
    assert(header_value(headers, "Accept") == "application/json, text/event-stream");
    assert(header_value(headers, "X-Team") == "infra");
    assert(header_value(headers, "Authorization") == "Bearer t0k");

    cfg.auth.type = AuthConfig::Type::Basic;
    cfg.auth.username = "u";
    cfg.auth.password = "p";
    assert(header_value(http_request_headers(cfg), "Authorization") == "Basic dTpw");

    cfg.auth.type = AuthConfig::Type::None;
    assert(header_value(http_request_headers(cfg), "Authorization").empty());
    std::cout << "  [PASS] http_request_headers\n";
}

static void test_url_ports()
{
    std::cout << "Test: URL ports outside 1..65535 are configuration errors...\n";
    for (const char* url : {"http://127.0.0.1:99999/mcp", "http://127.0.0.1:99999999999/mcp",
                            "http://127.0.0.1:0/mcp"})
    {
        RemoteServerConfig cfg;
        cfg.name = "ports";
        cfg.transport = TransportKind::Http;
        cfg.url = url;

        bool rejected = false;
        try
        {
            HttpTransport(cfg).start({});
        }
        catch (const ConfigError&)
        {
            rejected = true;
        }
        assert(rejected);

        cfg.transport = TransportKind::StreamingHttp;
        rejected = false;
        try
        {
            StreamableHttpTransport(cfg).start({});
        }
        catch (const ConfigError&)
        {
            rejected = true;
        }
        assert(rejected);
    }

    RemoteServerConfig ok;
    ok.name = "ports";
    ok.transport = TransportKind::Http;
    ok.url = "http://127.0.0.1:65535/mcp";
    HttpTransport(ok).start({});
    std::cout << "  [PASS] url ports\n";
}

int main()
{
    test_url_ports();
    test_sse_parsing();
    test_request_headers();

    httplib::Server svr;
    std::mutex seen_mutex;
    std::vector<std::string> seen_sessions;
    std::atomic<bool> session_deleted{false};

    // One-shot JSON endpoint echoing the method and Authorization header
    svr.Post("/json",
             [](const httplib::Request& req, httplib::Response& res)
             {
                 Json msg = Json::parse(req.body);
                 if (!msg.contains("id"))
                 {
                     res.status = 202;
                     return;
                 }
                 res.set_content(jsonrpc::result(msg["id"],
                                                 Json{{"method", msg["method"]},
                                                      {"auth", req.get_header_value("Authorization")}})
                                     .dump(),
                                 "application/json");
             });

    // SSE reply: a server notification first, then the response
    svr.Post("/sse",
             [](const httplib::Request& req, httplib::Response& res)
             {
                 Json msg = Json::parse(req.body);
                 std::string body =
                     "data: " + jsonrpc::notification("notifications/progress", Json{{"progress", 1}}).dump() +
                     "\n\n" + "data: " + jsonrpc::result(msg["id"], Json{{"ok", true}}).dump() + "\n\n";
                 res.set_content(body, "text/event-stream");
             });

    svr.Post("/broken",
             [](const httplib::Request&, httplib::Response& res)
             {
                 res.status = 500;
                 res.set_content("<html><body>Internal Server Error</body></html>", "text/html");
             });

    // Streamable HTTP session endpoint
    svr.Post("/stream",
             [&](const httplib::Request& req, httplib::Response& res)
             {
                 Json msg = Json::parse(req.body);
                 const std::string sid = req.get_header_value("Mcp-Session-Id");
                 {
                     std::lock_guard<std::mutex> lock(seen_mutex);
                     seen_sessions.push_back(sid);
                 }
                 if (msg.value("method", "") == "initialize")
                     res.set_header("Mcp-Session-Id", "sess-1");
                 else if (sid != "sess-1")
                 {
                     res.status = 400;
                     return;
                 }
                 if (!msg.contains("id"))
                 {
                     res.status = 202;
                     return;
                 }
                 std::string body =
                     "data: " + jsonrpc::notification("notifications/message", Json{{"data", "hi"}}).dump() +
                     "\n\n" + "data: " + jsonrpc::result(msg["id"], Json{{"method", msg["method"]}}).dump() +
                     "\n\n";
                 res.set_content(body, "text/event-stream");
             });
    svr.Delete("/stream",
               [&](const httplib::Request& req, httplib::Response& res)
               {
                   session_deleted = req.get_header_value("Mcp-Session-Id") == "sess-1";
                   res.status = 204;
               });

    const int port = svr.bind_to_any_port("127.0.0.1");
    if (port <= 0)
    {
        std::cerr << "Failed to bind server\n";
        return 1;
    }
    std::thread th([&]() { svr.listen_after_bind(); });
    svr.wait_until_ready();
    const std::string base = "http://127.0.0.1:" + std::to_string(port);

    std::cout << "Test: one-shot HTTP transport...\n";
    {
        RemoteServerConfig cfg;
        cfg.name = "json";
        cfg.transport = TransportKind::Http;
        cfg.url = base + "/json";
        cfg.auth.type = AuthConfig::Type::Bearer;
        cfg.auth.token = "abc";
        HttpTransport t(cfg);
        t.start({});
        auto reply = t.send(jsonrpc::request(1, "tools/list", Json::object()));
        assert(reply && (*reply)["id"] == 1);
        assert((*reply)["result"]["method"] == "tools/list");
        assert((*reply)["result"]["auth"] == "Bearer abc");
        assert(!t.send(jsonrpc::notification("notifications/initialized", Json::object())));
        t.close();
        bool closed = false;
        try
        {
            t.send(jsonrpc::request(2, "ping", Json::object()));
        }
        catch (const TransportError&)
        {
            closed = true;
        }
        assert(closed);
    }
    std::cout << "  [PASS] json replies\n";

    std::cout << "Test: SSE replies deliver notifications first...\n";
    {
        RemoteServerConfig cfg;
        cfg.name = "sse";
        cfg.transport = TransportKind::Http;
        cfg.url = base + "/sse";
        HttpTransport t(cfg);
        std::vector<Json> pushed;
        TransportCallbacks cb;
        cb.on_message = [&](const Json& m) { pushed.push_back(m); };
        t.start(cb);
        auto reply = t.send(jsonrpc::request("r1", "tools/call", Json::object()));
        assert(reply && (*reply)["result"]["ok"] == true);
        assert(pushed.size() == 1);
        assert(pushed[0]["method"] == "notifications/progress");
    }
    std::cout << "  [PASS] sse replies\n";

    std::cout << "Test: HTTP errors are reported without the HTML body...\n";
    {
        RemoteServerConfig cfg;
        cfg.name = "broken";
        cfg.transport = TransportKind::Http;
        cfg.url = base + "/broken";
        HttpTransport t(cfg);
        t.start({});
        std::string what;
        try
        {
            t.send(jsonrpc::request(1, "ping", Json::object()));
        }
        catch (const TransportError& e)
        {
            what = e.what();
        }
        assert(what.find("500") != std::string::npos);
        assert(what.find("<body>") == std::string::npos);
    }
    std::cout << "  [PASS] http errors\n";

    std::cout << "Test: streamable HTTP keeps its session...\n";
    {
        RemoteServerConfig cfg;
        cfg.name = "stream";
        cfg.transport = TransportKind::StreamingHttp;
        cfg.url = base + "/stream";
        StreamableHttpTransport t(cfg);
        std::vector<Json> pushed;
        TransportCallbacks cb;
        cb.on_message = [&](const Json& m) { pushed.push_back(m); };
        t.start(cb);
        assert(!t.has_session());

        auto init = t.send(jsonrpc::request(1, "initialize", Json::object()));
        assert(init && (*init)["result"]["method"] == "initialize");
        assert(t.session_id() == "sess-1");
        assert(!t.send(jsonrpc::notification("notifications/initialized", Json::object())));
        auto listed = t.send(jsonrpc::request(2, "tools/list", Json::object()));
        assert(listed && (*listed)["result"]["method"] == "tools/list");
        assert(pushed.size() == 2);
        assert(pushed[0]["method"] == "notifications/message");

        {
            std::lock_guard<std::mutex> lock(seen_mutex);
            assert(seen_sessions.size() == 3);
            assert(seen_sessions[0].empty());
            assert(seen_sessions[1] == "sess-1");
            assert(seen_sessions[2] == "sess-1");
        }

        t.close();
        assert(session_deleted);
        assert(!t.is_open());
    }
    std::cout << "  [PASS] streamable session\n";

    std::cout << "Test: unreachable servers fail with TransportError...\n";
    {
        RemoteServerConfig cfg;
        cfg.name = "down";
        cfg.transport = TransportKind::StreamingHttp;
        cfg.url = "http://127.0.0.1:1/mcp";
        cfg.timeout = std::chrono::milliseconds(500);
        StreamableHttpTransport t(cfg);
        t.start({});
        bool failed = false;
        try
        {
            t.send(jsonrpc::request(1, "initialize", Json::object()));
        }
        catch (const TransportError&)
        {
            failed = true;
        }
        assert(failed);
    }
    std::cout << "  [PASS] unreachable\n";

    svr.stop();
    th.join();
    return 0;
}

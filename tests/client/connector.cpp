#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include "mcpgate/client/connector.hpp"
#include "test_helpers.hpp"

using namespace mcpgate;
using namespace mcpgate::client;
using namespace std::chrono_literals;

static void wait_pending(Connector& c, size_t n) {
  for (int i = 0; i < 200 && c.pending_count() != n; ++i) std::this_thread::sleep_for(5ms);
  assert(c.pending_count() == n);
}

static void test_handshake() {
  std::cout << "Test: connect performs the MCP handshake...\n";
  test::FakeFactory factory;
  Connector c(test::process_config("alpha"), factory.make());
  assert(c.state() == ConnectorState::Disconnected);
  c.connect();
  assert(c.is_connected());
  assert(to_string(c.state()) == "connected");

  auto server = factory.last();
  auto methods = server->methods();
  assert(methods.size() == 3);
  assert(methods[0] == "initialize");
  assert(methods[1] == "notifications/initialized");
  assert(methods[2] == "tools/list");

  Json init = server->sent_copy()[0]["params"];
  assert(init["protocolVersion"] == PROTOCOL_VERSION);
  assert(init["clientInfo"]["name"] == "mcpgate");
  assert(init["capabilities"].is_object());

  assert(c.cached_tools().size() == 2);
  assert(c.server_info()["serverInfo"]["name"] == "fake");

  auto ev = c.events().try_pop();
  assert(ev && ev->kind == ConnectorEvent::Kind::Connected && ev->server == "alpha");

  // Connecting again is a no-op
  c.connect();
  assert(factory.calls() == 1);
  std::cout << "  [PASS] handshake\n";
}

static void test_timeout_then_success() {
  std::cout << "Test: a timed out request does not poison the connector...\n";
  test::FakeFactory factory;
  auto cfg = test::process_config("slowpoke");
  cfg.timeout = 50ms;
  Connector c(cfg, factory.make());
  c.connect();

  auto t0 = std::chrono::steady_clock::now();
  bool timed_out = false;
  try { c.request("slow"); }
  catch (const RequestTimeoutError& e) { timed_out = std::string(e.what()) == "Request timeout"; }
  assert(timed_out);
  assert(std::chrono::steady_clock::now() - t0 >= 50ms);
  assert(c.pending_count() == 0);

  Json out = c.call_tool("echo", Json{{"message", "hi"}});
  assert(out["content"][0]["text"] == "hi");
  Json call = factory.last()->sent_copy().back();
  assert(call["method"] == "tools/call");
  assert(call["params"]["name"] == "echo");
  assert(call["params"]["arguments"]["message"] == "hi");
  std::cout << "  [PASS] timeout\n";
}

static void test_remote_error() {
  std::cout << "Test: JSON-RPC errors become RemoteError...\n";
  test::FakeFactory factory;
  Connector c(test::process_config("beta"), factory.make());
  c.connect();
  bool remote = false;
  try { c.request("fail"); }
  catch (const RemoteError& e) { remote = e.code() == -32000 && std::string(e.what()) == "nope"; }
  assert(remote);
  assert(c.is_connected());
  std::cout << "  [PASS] remote error\n";
}

static void test_disconnect_rejects_pending() {
  std::cout << "Test: disconnect fails each pending request once...\n";
  test::FakeFactory factory;
  auto cfg = test::process_config("gamma");
  cfg.timeout = 5s;
  Connector c(cfg, factory.make());
  c.connect();
  c.events().try_pop();

  std::string first_error, second_error;
  std::thread a([&] {
    try { c.request("slow"); } catch (const ConnectionClosedError& e) { first_error = e.what(); }
  });
  std::thread b([&] {
    try { c.request("slow"); } catch (const ConnectionClosedError& e) { second_error = e.what(); }
  });
  wait_pending(c, 2);
  auto old = factory.last();
  c.disconnect();
  a.join();
  b.join();
  assert(first_error == "Connection closed");
  assert(second_error == "Connection closed");
  assert(c.pending_count() == 0);
  assert(old->closed);
  assert(c.state() == ConnectorState::Disconnected);

  auto ev = c.events().try_pop();
  assert(ev && ev->kind == ConnectorEvent::Kind::Disconnected && ev->intentional);

  // A late reply for a rejected request is dropped
  old->cb.on_message(jsonrpc::result(Json(2), Json::object()));
  assert(c.pending_count() == 0);

  c.disconnect();
  assert(!c.events().try_pop());

  bool refused = false;
  try { c.request("ping"); } catch (const ConnectionError&) { refused = true; }
  assert(refused);

  // Reconnect starts from a clean slate
  c.connect();
  assert(c.is_connected());
  assert(c.pending_count() == 0);
  assert(factory.calls() == 2);
  assert(c.call_tool("echo", Json{{"message", "again"}})["content"][0]["text"] == "again");
  std::cout << "  [PASS] disconnect\n";
}

static void test_process_exit() {
  std::cout << "Test: transport exit rejects pending requests...\n";
  test::FakeFactory factory;
  auto cfg = test::process_config("delta");
  cfg.timeout = 5s;
  Connector c(cfg, factory.make());
  c.connect();
  c.events().try_pop();

  std::string error;
  std::thread waiter([&] {
    try { c.request("slow"); } catch (const ConnectionClosedError& e) { error = e.what(); }
  });
  wait_pending(c, 1);
  auto first = factory.last();
  first->cb.on_exit(3);
  waiter.join();
  assert(error == "Process exited with code 3");
  assert(c.state() == ConnectorState::Disconnected);

  auto ev = c.events().try_pop();
  assert(ev && ev->kind == ConnectorEvent::Kind::Disconnected);
  assert(ev->exit_code == 3 && !ev->intentional);

  // Callbacks of a replaced transport are ignored
  c.connect();
  c.events().try_pop();
  first->cb.on_exit(9);
  assert(c.is_connected());
  assert(!c.events().try_pop());
  std::cout << "  [PASS] exit\n";
}

static void test_server_requests() {
  std::cout << "Test: server-initiated traffic...\n";
  test::FakeFactory factory;
  Connector c(test::process_config("eps"), factory.make());
  c.connect();
  c.events().try_pop();
  auto server = factory.last();

  server->cb.on_message(Json{{"jsonrpc", "2.0"}, {"id", "s1"}, {"method", "ping"}});
  server->cb.on_message(Json{{"jsonrpc", "2.0"}, {"id", "s2"}, {"method", "sampling/createMessage"}});
  server->cb.on_message(Json{{"jsonrpc", "2.0"}, {"method", "notifications/tools/list_changed"}});

  auto sent = server->sent_copy();
  Json pong = sent[sent.size() - 2];
  Json refused = sent.back();
  assert(pong["id"] == "s1" && pong["result"].is_object());
  assert(refused["id"] == "s2" && refused["error"]["code"] == jsonrpc::METHOD_NOT_FOUND);

  for (const char* method : {"ping", "sampling/createMessage", "notifications/tools/list_changed"}) {
    auto ev = c.events().try_pop();
    assert(ev && ev->kind == ConnectorEvent::Kind::Notification);
    assert(ev->payload["method"] == method);
  }
  std::cout << "  [PASS] server requests\n";
}

static void test_malformed_envelopes() {
  std::cout << "Test: wrongly typed fields from the server are tolerated...\n";
  test::FakeFactory factory;
  factory.respond = [](const Json& req) -> std::optional<Json> {
    if (req.value("method", "") == "bad-error")
      return Json{{"jsonrpc", "2.0"}, {"id", req["id"]}, {"error", {{"code", "x"}, {"message", 5}}}};
    return test::default_reply(req);
  };
  Connector c(test::process_config("zeta"), factory.make());
  c.connect();
  c.events().try_pop();

  bool remote = false;
  try { c.request("bad-error"); }
  catch (const RemoteError& e) {
    remote = e.code() == jsonrpc::INTERNAL_ERROR && std::string(e.what()) == "Unknown error";
  }
  assert(remote);
  assert(c.is_connected());

  // Delivered from another thread, as a transport reader would
  auto server = factory.last();
  std::thread reader([&] { server->cb.on_message(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", 7}}); });
  reader.join();
  Json refused = server->sent_copy().back();
  assert(refused["id"] == 1 && refused["error"]["code"] == jsonrpc::METHOD_NOT_FOUND);
  auto ev = c.events().try_pop();
  assert(ev && ev->kind == ConnectorEvent::Kind::Notification && ev->payload["method"] == 7);

  // A throwing handler is contained by the framed delivery path
  TransportCallbacks cb;
  cb.on_message = [](const Json& m) { (void)m.at("method").get<std::string>(); };
  FrameEvent frame;
  frame.message = Json{{"method", 7}};
  deliver_frame(cb, frame, "[Test]");

  assert(c.call_tool("echo", Json{{"message", "still here"}})["content"][0]["text"] == "still here");
  std::cout << "  [PASS] malformed envelopes\n";
}

static void test_event_backlog() {
  std::cout << "Test: an undrained connector keeps a bounded event backlog...\n";
  test::FakeFactory factory;
  Connector c(test::process_config("kappa"), factory.make());
  c.connect();
  auto server = factory.last();
  const size_t extra = 10;
  for (size_t i = 0; i < Connector::MAX_EVENT_BACKLOG + extra; ++i)
    server->cb.on_message(Json{{"jsonrpc", "2.0"}, {"method", "notifications/progress"}, {"params", {{"n", i}}}});
  assert(c.events().size() == Connector::MAX_EVENT_BACKLOG);
  // The Connected event and the oldest notifications went first
  assert(c.events().dropped() == extra + 1);
  auto oldest = c.events().try_pop();
  assert(oldest && oldest->payload["params"]["n"] == extra);
  std::cout << "  [PASS] event backlog\n";
}

static void test_failed_connects() {
  std::cout << "Test: failed connects leave the connector disconnected...\n";
  test::FakeFactory factory;
  factory.respond = [](const Json& req) -> std::optional<Json> {
    if (req["method"] == "initialize") return jsonrpc::error(req["id"], -32603, "init broke");
    return test::default_reply(req);
  };
  Connector c(test::process_config("zeta"), factory.make());
  bool failed = false;
  try { c.connect(); }
  catch (const ConnectionError& e) { failed = std::string(e.what()).find("Handshake failed") != std::string::npos; }
  assert(failed);
  assert(c.state() == ConnectorState::Disconnected);
  assert(factory.last()->closed);
  assert(!c.events().try_pop());

  test::FakeFactory spawn;
  spawn.failures_left = 1;
  Connector d(test::process_config("eta"), spawn.make());
  bool spawn_failed = false;
  try { d.connect(); } catch (const ConnectionError&) { spawn_failed = true; }
  assert(spawn_failed);
  d.connect();
  assert(d.is_connected());

  auto bad_cfg = test::process_config("theta");
  bad_cfg.command.clear();
  Connector e(bad_cfg, spawn.make());
  bool config = false;
  try { e.connect(); } catch (const ConfigError&) { config = true; }
  assert(config);

  TransportFactory throwing = [](const RemoteServerConfig&) -> std::unique_ptr<Transport> {
    throw std::out_of_range("stoi");
  };
  Connector f(test::process_config("iota"), throwing);
  bool wrapped = false;
  try { f.connect(); } catch (const ConnectionError& err) { wrapped = std::string(err.what()).find("stoi") != std::string::npos; }
  assert(wrapped);
  assert(f.state() == ConnectorState::Disconnected);
  std::cout << "  [PASS] failed connects\n";
}

static void test_http_kinds() {
  std::cout << "Test: request-style and session transports...\n";
  test::FakeFactory factory;
  factory.kind = TransportKind::Http;
  factory.respond = [](const Json& req) -> std::optional<Json> {
    if (req["method"] == "initialize") return jsonrpc::error(req["id"], -32601, "no handshake here");
    if (req["method"] == "silent") return std::nullopt;
    return test::default_reply(req);
  };
  RemoteServerConfig cfg;
  cfg.name = "web";
  cfg.transport = TransportKind::Http;
  cfg.url = "http://127.0.0.1:1/mcp";
  Connector c(cfg, factory.make());
  c.connect();  // initialize errors are tolerated
  assert(c.is_connected());
  assert(c.list_tools().size() == 2);

  bool no_response = false;
  try { c.request("silent"); } catch (const TransportError&) { no_response = true; }
  assert(no_response);
  assert(c.pending_count() == 0);

  test::FakeFactory streaming;
  streaming.kind = TransportKind::StreamingHttp;
  cfg.name = "stream";
  cfg.transport = TransportKind::StreamingHttp;
  Connector s(cfg, streaming.make());
  s.connect();
  const size_t sent_after_connect = streaming.last()->sent_copy().size();
  assert(s.list_tools().size() == 2);
  assert(streaming.last()->sent_copy().size() == sent_after_connect);
  s.disconnect();
  bool not_connected = false;
  try { s.list_tools(); } catch (const ConnectionError&) { not_connected = true; }
  assert(not_connected);
  std::cout << "  [PASS] http kinds\n";
}

int main() {
  test_handshake();
  test_timeout_then_success();
  test_remote_error();
  test_disconnect_rejects_pending();
  test_process_exit();
  test_server_requests();
  test_malformed_envelopes();
  test_event_backlog();
  test_failed_connects();
  test_http_kinds();
  return 0;
}

#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "mcpgate/client/framer.hpp"

using namespace mcpgate;
using client::FrameEvent;
using client::MessageFramer;

// Outcome of a framer run, flattened for comparison
static std::vector<std::string> run(const std::string& bytes, size_t chunk) {
  MessageFramer framer;
  std::vector<std::string> out;
  for (size_t pos = 0; pos < bytes.size(); pos += chunk) {
    for (auto& ev : framer.feed(bytes.substr(pos, chunk))) {
      if (ev.kind == FrameEvent::Kind::Message) out.push_back("msg:" + ev.message.dump());
      else out.push_back("err:" + ev.line);
    }
  }
  return out;
}

int main() {
  std::cout << "Test: framing does not depend on chunk boundaries...\n";
  const std::string stream =
      "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"text\":\"caf\xc3\xa9\"}}\n"
      "\n"
      "   \n"
      "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\"}\r\n"
      "not json\n"
      "{\"jsonrpc\":\"2.0\",\"id\":\"a\",\"result\":{}}\n"
      "{\"partial\":";

  auto whole = run(stream, stream.size());
  assert(whole.size() == 4);
  assert(whole[0].rfind("msg:", 0) == 0);
  assert(whole[1] == "msg:{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\"}");
  assert(whole[2] == "err:not json");
  assert(whole[3] == "msg:{\"id\":\"a\",\"jsonrpc\":\"2.0\",\"result\":{}}");

  for (size_t chunk : {1u, 2u, 3u, 7u, 16u, 64u})
    assert(run(stream, chunk) == whole);
  std::cout << "  [PASS] chunk invariance\n";

  std::cout << "Test: incomplete lines stay buffered...\n";
  MessageFramer framer;
  assert(framer.feed("{\"id\":1,").empty());
  assert(framer.buffered() == 8);
  auto events = framer.feed("\"result\":true}\n");
  assert(events.size() == 1);
  assert(events[0].kind == FrameEvent::Kind::Message);
  assert(events[0].message["result"] == true);
  assert(framer.buffered() == 0);

  framer.feed("{\"dangling\"");
  framer.reset();
  assert(framer.buffered() == 0);
  std::cout << "  [PASS] buffering\n";

  std::cout << "Test: parse errors carry a diagnostic...\n";
  auto bad = framer.feed("{oops}\n");
  assert(bad.size() == 1);
  assert(bad[0].kind == FrameEvent::Kind::ParseError);
  assert(bad[0].line == "{oops}");
  assert(!bad[0].error.empty());
  std::cout << "  [PASS] parse errors\n";

  std::cout << "Test: serialize writes one compact line...\n";
  auto line = MessageFramer::serialize(Json{{"a", Json{{"b", "multi\nline"}}}});
  assert(line.back() == '\n');
  assert(line.find('\n') == line.size() - 1);
  auto round = MessageFramer().feed(line);
  assert(round.size() == 1 && round[0].message["a"]["b"] == "multi\nline");
  std::cout << "  [PASS] serialize\n";
  return 0;
}

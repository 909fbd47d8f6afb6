#pragma once
#include "mcpgate/types.hpp"

#include <atomic>
#include <functional>
#include <iosfwd>

namespace mcpgate::gateway
{

/**
 * Line-delimited JSON-RPC over a pair of streams (stdin/stdout by default).
 *
 * Each input line is passed to the handler; the reply is written as one line.
 * Notifications (no id) get no reply. Malformed lines are answered with a
 * parse error.
 *
 * Usage:
 *   auto gateway = std::make_shared<mcpgate::gateway::Gateway>("echo", "1.0.0", registry);
 *   StdioServer server(make_gateway_handler(gateway));
 *   server.run();  // until EOF or stop()
 */
class StdioServer
{
  public:
    using Handler = std::function<Json(const Json&)>;

    explicit StdioServer(Handler handler);
    StdioServer(Handler handler, std::istream& in, std::ostream& out);

    /// Blocking; returns when the input ends or stop() was called.
    void run();

    void stop()
    {
        stop_requested_ = true;
    }

  private:
    Handler handler_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace mcpgate::gateway

#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "mcpgate/client/config.hpp"
#include "mcpgate/client/framer.hpp"
#include "mcpgate/types.hpp"

namespace mcpgate::process { class Process; }

namespace mcpgate::client {

// Hooks a transport calls from its own I/O thread (stream transports) or from
// inside send() (request-style transports).
struct TransportCallbacks {
  std::function<void(const Json&)> on_message;
  std::function<void(const std::string& line, const std::string& error)> on_parse_error;
  std::function<void(const std::string&)> on_stderr;
  // Unexpected end of the underlying process/container/session. Not called
  // after close().
  std::function<void(int exit_code)> on_exit;
};

// Hand a framed event to the callbacks. A handler that throws is logged under
// `label` and never unwinds into the transport's reader thread.
void deliver_frame(const TransportCallbacks& callbacks, const FrameEvent& ev,
                   const std::string& label);

class Transport {
 public:
  virtual ~Transport() = default;

  virtual TransportKind kind() const = 0;

  // Open the underlying resource. Throws ConnectionError (or ConfigError).
  virtual void start(TransportCallbacks callbacks) = 0;

  // Write one envelope. Stream transports return nullopt and deliver the
  // response through on_message; request-style transports return the
  // response envelope directly (nullopt for notifications).
  virtual std::optional<Json> send(const Json& envelope) = 0;

  // Release the resource. Idempotent.
  virtual void close() = 0;

  virtual bool is_open() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>(const RemoteServerConfig&)>;

// Default factory: process, container, http and streaming-http transports.
std::unique_ptr<Transport> make_transport(const RemoteServerConfig& cfg);

// Child process speaking newline-delimited JSON-RPC on stdio.
// process-python runs `uvx <command> <args...>`; process-node runs
// `npx <runnerArgs...> <command> <args...>` or `npm exec`.
class ProcessTransport : public Transport {
 public:
  explicit ProcessTransport(RemoteServerConfig cfg);
  ~ProcessTransport() override;

  TransportKind kind() const override { return cfg_.transport; }
  void start(TransportCallbacks callbacks) override;
  std::optional<Json> send(const Json& envelope) override;
  void close() override;
  bool is_open() const override { return open_.load(); }

  struct Launch {
    std::string program;
    std::vector<std::string> args;
  };
  // Resolve launcher and argument vector; throws ConnectionError when no
  // launcher is installed.
  static Launch resolve_launch(const RemoteServerConfig& cfg);

  int pid() const;

 private:
  void reader_loop();
  std::string label() const;

  RemoteServerConfig cfg_;
  TransportCallbacks callbacks_;
  std::unique_ptr<process::Process> process_;
  MessageFramer framer_;
  std::thread reader_;
  std::mutex write_mutex_;
  std::atomic<bool> open_{false};
  std::atomic<bool> closing_{false};
  std::atomic<long long> close_requested_ms_{0};
};

// One JSON-RPC POST per envelope (httplib). Replies may be plain JSON or a
// short SSE stream.
class HttpTransport : public Transport {
 public:
  explicit HttpTransport(RemoteServerConfig cfg);

  TransportKind kind() const override { return TransportKind::Http; }
  void start(TransportCallbacks callbacks) override;
  std::optional<Json> send(const Json& envelope) override;
  void close() override { open_ = false; }
  bool is_open() const override { return open_.load(); }

 private:
  RemoteServerConfig cfg_;
  TransportCallbacks callbacks_;
  std::atomic<bool> open_{false};
};

// Streamable HTTP session: POSTs carry Mcp-Session-Id once the server has
// assigned one; SSE replies are parsed incrementally (libcurl) so server
// notifications are delivered before the final response.
class StreamableHttpTransport : public Transport {
 public:
  explicit StreamableHttpTransport(RemoteServerConfig cfg);
  ~StreamableHttpTransport() override;

  TransportKind kind() const override { return TransportKind::StreamingHttp; }
  void start(TransportCallbacks callbacks) override;
  std::optional<Json> send(const Json& envelope) override;
  void close() override;
  bool is_open() const override { return open_.load(); }

  std::string session_id() const;
  bool has_session() const;

 private:
  void set_session_id(const std::string& value);

  RemoteServerConfig cfg_;
  TransportCallbacks callbacks_;
  mutable std::mutex session_mutex_;
  std::string session_id_;
  std::atomic<bool> open_{false};
};

// Split an SSE body into the JSON payloads of its "data:" fields (one per
// event, multi-line data joined). Non-JSON payloads are skipped.
std::vector<Json> parse_sse_messages(const std::string& body);

// Authorization/Content-Type/Accept plus configured headers.
std::vector<std::pair<std::string, std::string>> http_request_headers(const RemoteServerConfig& cfg);

} // namespace mcpgate::client

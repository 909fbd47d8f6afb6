#pragma once
/// @file client/connector.hpp
/// @brief One remote server: transport ownership, handshake and request correlation

#include "mcpgate/client/config.hpp"
#include "mcpgate/client/transports.hpp"
#include "mcpgate/util/channel.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpgate::client
{

enum class ConnectorState
{
    Disconnected,
    Connecting,
    Connected
};

std::string to_string(ConnectorState state);

/// Lifecycle and inbound traffic of one connector.
struct ConnectorEvent
{
    enum class Kind
    {
        Connected,
        Disconnected,
        Notification ///< server notification or server-initiated request
    };

    Kind kind{Kind::Connected};
    std::string server;
    int exit_code{0};         ///< Disconnected
    bool intentional{false};  ///< Disconnected by disconnect()
    Json payload;             ///< Notification
};

/// Owns at most one live transport to a remote server.
///
/// Requests are multiplexed over the transport by correlation id; each waits
/// on its own future with the server's configured timeout. When the transport
/// ends unexpectedly every outstanding request is failed with
/// ConnectionClosedError and a Disconnected event is published.
class Connector
{
  public:
    explicit Connector(RemoteServerConfig cfg, TransportFactory factory = make_transport);
    ~Connector();

    Connector(const Connector&) = delete;
    Connector& operator=(const Connector&) = delete;

    const RemoteServerConfig& config() const
    {
        return cfg_;
    }
    const std::string& name() const
    {
        return cfg_.name;
    }

    ConnectorState state() const;
    bool is_connected() const;

    /// No-op when already connected. Throws ConfigError for a bad config and
    /// ConnectionError when the transport or the handshake fails.
    void connect();

    /// Close the transport and fail pending requests with "Connection closed".
    /// Idempotent; never triggers a reconnect.
    void disconnect();

    /// Send a request and wait for its result. Throws ConnectionError when not
    /// connected, RequestTimeoutError, RemoteError or ConnectionClosedError.
    Json request(const std::string& method, const Json& params = Json::object());

    void notify(const std::string& method, const Json& params = Json::object());

    Json call_tool(const std::string& tool, const Json& arguments);

    /// Cached catalogue for streaming-http, a fresh tools/list otherwise.
    std::vector<Json> list_tools();

    /// Catalogue from the last handshake or tools/list.
    std::vector<Json> cached_tools() const;

    /// Result of the last successful initialize.
    Json server_info() const;

    size_t pending_count() const;

    /// Lifecycle and server-notification events. Holds at most
    /// MAX_EVENT_BACKLOG undrained events; older ones are discarded first.
    util::Channel<ConnectorEvent>& events()
    {
        return events_;
    }

    static constexpr size_t MAX_EVENT_BACKLOG = 1024;

  private:
    using PendingMap = std::unordered_map<std::string, std::shared_ptr<std::promise<Json>>>;

    Json send_request(const std::shared_ptr<Transport>& transport, const std::string& method,
                      const Json& params);
    void handshake(const std::shared_ptr<Transport>& transport);
    void handle_message(uint64_t generation, const Json& message);
    void handle_exit(uint64_t generation, int exit_code);
    void reject_all(const std::string& reason);
    std::shared_ptr<Transport> current_transport() const;
    std::string label() const;

    RemoteServerConfig cfg_;
    TransportFactory factory_;

    std::mutex connect_mutex_;
    mutable std::mutex state_mutex_;
    ConnectorState state_{ConnectorState::Disconnected};
    std::shared_ptr<Transport> transport_;
    uint64_t generation_{0};
    Json server_info_;
    std::vector<Json> tools_;

    mutable std::mutex pending_mutex_;
    PendingMap pending_;
    std::atomic<int64_t> next_id_{0};

    util::Channel<ConnectorEvent> events_;
};

} // namespace mcpgate::client

#pragma once
/// @file client/manager.hpp
/// @brief Named connectors, auto-connect, reconnect backoff and the merged tool catalogue

#include "mcpgate/client/config.hpp"
#include "mcpgate/client/connector.hpp"
#include "mcpgate/util/channel.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpgate::client
{

/// Separator between server and tool name in a prefixed tool name.
constexpr const char* TOOL_NAME_SEPARATOR = "__";

struct ServerStatus
{
    std::string name;
    TransportKind transport{TransportKind::Http};
    bool connected{false};
    std::optional<std::string> last_error;
    std::vector<Json> tools;
    std::chrono::system_clock::time_point last_check{};
};

struct ManagerEvent
{
    enum class Kind
    {
        ServerConnected,
        ServerDisconnected,
        ServerError,
        ServerRemoved,
        Notification,
        Shutdown
    };

    Kind kind{Kind::ServerError};
    std::string server;
    std::string message;  ///< ServerError / ServerDisconnected
    int exit_code{0};     ///< ServerDisconnected
    Json payload;         ///< Notification
};

/// Keeps one Connector per configured server.
///
/// A dedicated event-loop thread drains every connector's event channel and
/// runs due reconnects. Status is kept per server and handed out by value.
class ConnectorManager
{
  public:
    explicit ConnectorManager(ManagerConfig cfg, TransportFactory factory = make_transport);
    ~ConnectorManager();

    ConnectorManager(const ConnectorManager&) = delete;
    ConnectorManager& operator=(const ConnectorManager&) = delete;

    /// Add every configured server. Failures are published as ServerError
    /// events and do not stop the remaining servers.
    void initialize();

    /// Throws ConfigError for a duplicate name or invalid config. A failed
    /// connect is rethrown after scheduling a reconnect when retries apply.
    void add_server(RemoteServerConfig cfg);

    /// Disconnect and forget a server. Throws NotFoundError for unknown names.
    void remove_server(const std::string& name);

    std::optional<ServerStatus> get_server_status(const std::string& name) const;
    std::vector<ServerStatus> get_all_status() const;
    std::vector<std::string> get_connected_servers() const;
    bool is_server_connected(const std::string& name) const;

    /// Decorated tools per connected server. A server whose listing fails
    /// maps to an empty list and produces a ServerError event.
    std::map<std::string, std::vector<Json>> list_all_tools();

    Json call_tool(const std::string& server, const std::string& tool, const Json& arguments);

    /// Resolve "server__tool" and forward. Throws NotFoundError when the name
    /// has no server prefix.
    Json call_tool_by_name(const std::string& full_name, const Json& arguments);

    /// Failed reconnect attempts since the last healthy period.
    int retry_attempts(const std::string& name) const;

    /// Disconnect everything and stop the event loop. Idempotent.
    void shutdown();

    util::Channel<ManagerEvent>& events()
    {
        return events_;
    }

    const ManagerConfig& config() const
    {
        return cfg_;
    }

  private:
    using Clock = std::chrono::steady_clock;

    struct Entry
    {
        RemoteServerConfig cfg;
        std::shared_ptr<Connector> connector;
        ServerStatus status;
        int attempts{0};
        std::optional<Clock::time_point> reconnect_at;
        std::optional<Clock::time_point> healthy_since;
    };

    void event_loop();
    void drain_connector_events();
    void handle_connector_event(const ConnectorEvent& ev);
    void run_due_reconnects();
    void attempt_reconnect(const std::string& name);
    void record_failure(const std::string& name, const std::string& message, bool retry);

    /// Callers hold mutex_.
    void schedule_reconnect_locked(Entry& entry);
    bool retry_eligible(const RemoteServerConfig& cfg) const;
    bool should_connect(const RemoteServerConfig& cfg) const;
    int max_retries_for(const RemoteServerConfig& cfg) const;
    bool prefix_for(const RemoteServerConfig& cfg) const;
    std::shared_ptr<Connector> connector_for(const std::string& name) const;

    void publish(ManagerEvent ev);
    void publish_error(const std::string& server, const std::string& message);

    ManagerConfig cfg_;
    TransportFactory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> servers_;

    std::shared_ptr<util::ChannelNotifier> notifier_;
    util::Channel<ManagerEvent> events_;
    std::thread loop_;
    std::atomic<bool> stopping_{false};
    std::mutex shutdown_mutex_;
};

} // namespace mcpgate::client

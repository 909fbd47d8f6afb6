#include "mcpgate/client/manager.hpp"

#include "mcpgate/exceptions.hpp"
#include "mcpgate/util/log.hpp"
#include "mcpgate/util/redact.hpp"

#include <algorithm>

namespace mcpgate::client
{

namespace
{
constexpr auto kIdleWait = std::chrono::seconds(1);
}

ConnectorManager::ConnectorManager(ManagerConfig cfg, TransportFactory factory)
    : cfg_(std::move(cfg)), factory_(factory ? std::move(factory) : TransportFactory(make_transport)),
      notifier_(std::make_shared<util::ChannelNotifier>())
{
    loop_ = std::thread([this] { event_loop(); });
}

ConnectorManager::~ConnectorManager()
{
    shutdown();
}

void ConnectorManager::initialize()
{
    for (const auto& server : cfg_.servers)
    {
        try
        {
            add_server(server);
        }
        catch (const Error& e)
        {
            publish_error(server.name, e.what());
        }
    }
}

bool ConnectorManager::should_connect(const RemoteServerConfig& cfg) const
{
    return cfg_.auto_connect && (is_http_family(cfg.transport) || cfg.auto_start.value_or(true));
}

bool ConnectorManager::retry_eligible(const RemoteServerConfig& cfg) const
{
    return cfg_.retry_on_failure && cfg.auto_start.value_or(true) &&
           cfg.transport != TransportKind::Http && max_retries_for(cfg) > 0;
}

int ConnectorManager::max_retries_for(const RemoteServerConfig& cfg) const
{
    return cfg.retries.value_or(cfg_.max_retries);
}

bool ConnectorManager::prefix_for(const RemoteServerConfig& cfg) const
{
    return cfg.prefix_tool_names.value_or(cfg_.prefix_tool_names);
}

std::shared_ptr<Connector> ConnectorManager::connector_for(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(name);
    return it == servers_.end() ? nullptr : it->second.connector;
}

void ConnectorManager::add_server(RemoteServerConfig cfg)
{
    if (stopping_)
        throw Error("Manager is shut down");
    cfg.validate();

    auto connector = std::make_shared<Connector>(cfg, factory_);
    connector->events().set_notifier(notifier_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (servers_.count(cfg.name))
            throw ConfigError("Server " + cfg.name + " already exists");
        Entry entry;
        entry.cfg = cfg;
        entry.connector = connector;
        entry.status.name = cfg.name;
        entry.status.transport = cfg.transport;
        entry.status.last_check = std::chrono::system_clock::now();
        servers_.emplace(cfg.name, std::move(entry));
    }
    log::info("Added server " + cfg.name + " (" + to_string(cfg.transport) + ")");

    if (!should_connect(cfg))
    {
        log::info("Server " + cfg.name + " registered without connecting");
        return;
    }

    try
    {
        connector->connect();
    }
    catch (const ConfigError&)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        servers_.erase(cfg.name);
        throw;
    }
    catch (const Error& e)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = servers_.find(cfg.name);
            if (it != servers_.end())
            {
                auto& entry = it->second;
                entry.status.connected = false;
                entry.status.last_error = e.what();
                entry.status.last_check = std::chrono::system_clock::now();
                if (retry_eligible(entry.cfg))
                    schedule_reconnect_locked(entry);
            }
        }
        notifier_->notify();
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(cfg.name);
    if (it != servers_.end())
    {
        auto& entry = it->second;
        entry.status.connected = connector->is_connected();
        entry.status.last_error.reset();
        entry.status.tools = connector->cached_tools();
        entry.status.last_check = std::chrono::system_clock::now();
        entry.healthy_since = Clock::now();
    }
}

void ConnectorManager::remove_server(const std::string& name)
{
    std::shared_ptr<Connector> connector;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end())
            throw NotFoundError("Server " + name + " not found");
        connector = std::move(it->second.connector);
        servers_.erase(it);
    }

    connector->disconnect();
    log::info("Removed server " + name);

    ManagerEvent ev;
    ev.kind = ManagerEvent::Kind::ServerRemoved;
    ev.server = name;
    publish(std::move(ev));
}

std::optional<ServerStatus> ConnectorManager::get_server_status(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(name);
    if (it == servers_.end())
        return std::nullopt;
    return it->second.status;
}

std::vector<ServerStatus> ConnectorManager::get_all_status() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerStatus> out;
    for (const auto& [name, entry] : servers_)
        out.push_back(entry.status);
    return out;
}

std::vector<std::string> ConnectorManager::get_connected_servers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [name, entry] : servers_)
        if (entry.connector->is_connected())
            out.push_back(name);
    return out;
}

bool ConnectorManager::is_server_connected(const std::string& name) const
{
    auto connector = connector_for(name);
    return connector && connector->is_connected();
}

int ConnectorManager::retry_attempts(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(name);
    return it == servers_.end() ? 0 : it->second.attempts;
}

std::map<std::string, std::vector<Json>> ConnectorManager::list_all_tools()
{
    std::vector<std::pair<std::shared_ptr<Connector>, bool>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, entry] : servers_)
            if (entry.connector->is_connected())
                targets.emplace_back(entry.connector, prefix_for(entry.cfg));
    }

    std::map<std::string, std::vector<Json>> result;
    for (const auto& [connector, prefix] : targets)
    {
        const std::string& name = connector->name();
        try
        {
            std::vector<Json> tools = connector->list_tools();
            std::vector<Json> decorated;
            decorated.reserve(tools.size());
            for (const auto& tool : tools)
            {
                if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string())
                    continue;
                const std::string original = tool["name"].get<std::string>();
                const std::string full_name = name + TOOL_NAME_SEPARATOR + original;
                Json t = tool;
                t["prefixToolNames"] = prefix;
                t["fullName"] = full_name;
                t["originalName"] = original;
                t["displayName"] = prefix ? full_name : original;
                decorated.push_back(std::move(t));
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = servers_.find(name);
                if (it != servers_.end())
                {
                    it->second.status.tools = tools;
                    it->second.status.last_check = std::chrono::system_clock::now();
                }
            }
            result[name] = std::move(decorated);
        }
        catch (const Error& e)
        {
            result[name] = {};
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = servers_.find(name);
                if (it != servers_.end())
                {
                    it->second.status.last_error = e.what();
                    it->second.status.last_check = std::chrono::system_clock::now();
                }
            }
            publish_error(name, std::string("Failed to list tools: ") + e.what());
        }
    }
    return result;
}

Json ConnectorManager::call_tool(const std::string& server, const std::string& tool,
                                 const Json& arguments)
{
    auto connector = connector_for(server);
    if (!connector)
        throw NotFoundError("Server " + server + " not found");
    if (!connector->is_connected())
        throw ConnectionError("Server " + server + " is not connected");
    return connector->call_tool(tool, arguments);
}

Json ConnectorManager::call_tool_by_name(const std::string& full_name, const Json& arguments)
{
    std::string server;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, entry] : servers_)
        {
            const std::string prefix = name + TOOL_NAME_SEPARATOR;
            if (full_name.size() > prefix.size() && full_name.compare(0, prefix.size(), prefix) == 0 &&
                name.size() > server.size())
                server = name;
        }
    }
    if (server.empty())
        throw NotFoundError("No server owns tool " + full_name);
    return call_tool(server, full_name.substr(server.size() + 2), arguments);
}

void ConnectorManager::shutdown()
{
    std::lock_guard<std::mutex> shutdown_lock(shutdown_mutex_);
    if (stopping_.exchange(true))
        return;

    notifier_->notify();
    if (loop_.joinable())
    {
        if (loop_.get_id() == std::this_thread::get_id())
            loop_.detach();
        else
            loop_.join();
    }

    std::vector<std::shared_ptr<Connector>> connectors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, entry] : servers_)
        {
            connectors.push_back(entry.connector);
            entry.reconnect_at.reset();
            entry.status.connected = false;
        }
    }
    for (auto& connector : connectors)
        connector->disconnect();

    log::info("Connector manager shut down");
    ManagerEvent ev;
    ev.kind = ManagerEvent::Kind::Shutdown;
    publish(std::move(ev));
    events_.close();
}

// =============================================================================
// Event loop
// =============================================================================

void ConnectorManager::event_loop()
{
    while (!stopping_)
    {
        const uint64_t seen = notifier_->generation();
        drain_connector_events();
        run_due_reconnects();

        auto deadline = Clock::now() + kIdleWait;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [name, entry] : servers_)
                if (entry.reconnect_at && *entry.reconnect_at < deadline)
                    deadline = *entry.reconnect_at;
        }
        if (stopping_)
            break;
        notifier_->wait_until(deadline, seen);
    }
}

void ConnectorManager::drain_connector_events()
{
    std::vector<std::shared_ptr<Connector>> connectors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, entry] : servers_)
            connectors.push_back(entry.connector);
    }
    for (auto& connector : connectors)
        while (auto ev = connector->events().try_pop())
            handle_connector_event(*ev);
}

void ConnectorManager::handle_connector_event(const ConnectorEvent& ev)
{
    ManagerEvent out;
    out.server = ev.server;

    switch (ev.kind)
    {
    case ConnectorEvent::Kind::Connected:
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(ev.server);
        if (it == servers_.end())
            return;
        auto& entry = it->second;
        entry.status.connected = true;
        entry.status.last_error.reset();
        entry.status.tools = entry.connector->cached_tools();
        entry.status.last_check = std::chrono::system_clock::now();
        entry.healthy_since = Clock::now();
        entry.reconnect_at.reset();
        out.kind = ManagerEvent::Kind::ServerConnected;
        break;
    }
    case ConnectorEvent::Kind::Disconnected:
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(ev.server);
        if (it == servers_.end())
            return;
        auto& entry = it->second;
        entry.status.connected = false;
        entry.status.last_check = std::chrono::system_clock::now();
        out.kind = ManagerEvent::Kind::ServerDisconnected;
        out.exit_code = ev.exit_code;

        if (ev.intentional)
        {
            out.message = "Disconnected";
            break;
        }

        out.message = "Process exited with code " + std::to_string(ev.exit_code);
        entry.status.last_error = out.message;
        if (retry_eligible(entry.cfg) && !stopping_)
        {
            if (entry.healthy_since && Clock::now() - *entry.healthy_since >= cfg_.retry_reset_after)
                entry.attempts = 0;
            entry.healthy_since.reset();
            schedule_reconnect_locked(entry);
        }
        break;
    }
    case ConnectorEvent::Kind::Notification:
        out.kind = ManagerEvent::Kind::Notification;
        out.payload = ev.payload;
        break;
    }
    publish(std::move(out));
}

void ConnectorManager::schedule_reconnect_locked(Entry& entry)
{
    const int max_retries = max_retries_for(entry.cfg);
    if (entry.attempts >= max_retries)
    {
        entry.reconnect_at.reset();
        const std::string message =
            "Max retries (" + std::to_string(max_retries) + ") exceeded for " + entry.cfg.name;
        log::error(message);
        ManagerEvent ev;
        ev.kind = ManagerEvent::Kind::ServerError;
        ev.server = entry.cfg.name;
        ev.message = message;
        events_.push(std::move(ev));
        return;
    }

    const auto delay = cfg_.retry_delay * std::max(1, entry.attempts);
    entry.reconnect_at = Clock::now() + delay;
    log::info("Reconnecting " + entry.cfg.name + " in " + std::to_string(delay.count()) + "ms (attempt " +
              std::to_string(entry.attempts + 1) + "/" + std::to_string(max_retries) + ")");
}

void ConnectorManager::run_due_reconnects()
{
    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();
        for (auto& [name, entry] : servers_)
        {
            if (entry.reconnect_at && *entry.reconnect_at <= now)
            {
                entry.reconnect_at.reset();
                due.push_back(name);
            }
        }
    }
    for (const auto& name : due)
    {
        if (stopping_)
            return;
        attempt_reconnect(name);
    }
}

void ConnectorManager::attempt_reconnect(const std::string& name)
{
    auto connector = connector_for(name);
    if (!connector || connector->is_connected())
        return;

    try
    {
        connector->connect();
        log::info("Reconnected " + name);
    }
    catch (const ConfigError& e)
    {
        record_failure(name, e.what(), false);
    }
    catch (const Error& e)
    {
        record_failure(name, e.what(), true);
    }
}

void ConnectorManager::record_failure(const std::string& name, const std::string& message,
                                      bool retry)
{
    publish_error(name, message);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(name);
    if (it == servers_.end())
        return;
    auto& entry = it->second;
    ++entry.attempts;
    entry.status.connected = false;
    entry.status.last_error = message;
    entry.status.last_check = std::chrono::system_clock::now();
    if (retry && !stopping_)
        schedule_reconnect_locked(entry);
}

void ConnectorManager::publish(ManagerEvent ev)
{
    events_.push(std::move(ev));
}

void ConnectorManager::publish_error(const std::string& server, const std::string& message)
{
    log::warn("[" + server + "] " + util::error_for_logging(message));
    ManagerEvent ev;
    ev.kind = ManagerEvent::Kind::ServerError;
    ev.server = server;
    ev.message = message;
    publish(std::move(ev));
}

} // namespace mcpgate::client

#include "mcpgate/client/connector.hpp"

#include "mcpgate/exceptions.hpp"
#include "mcpgate/jsonrpc.hpp"
#include "mcpgate/util/json.hpp"
#include "mcpgate/util/log.hpp"
#include "mcpgate/util/redact.hpp"

#include <chrono>

namespace mcpgate::client
{

std::string to_string(ConnectorState state)
{
    switch (state)
    {
    case ConnectorState::Disconnected:
        return "disconnected";
    case ConnectorState::Connecting:
        return "connecting";
    case ConnectorState::Connected:
        return "connected";
    }
    return "disconnected";
}

Connector::Connector(RemoteServerConfig cfg, TransportFactory factory)
    : cfg_(std::move(cfg)), factory_(factory ? std::move(factory) : TransportFactory(make_transport))
{
    events_.set_capacity(MAX_EVENT_BACKLOG);
}

Connector::~Connector()
{
    disconnect();
}

std::string Connector::label() const
{
    return "[" + cfg_.name + "]";
}

ConnectorState Connector::state() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool Connector::is_connected() const
{
    return state() == ConnectorState::Connected;
}

std::shared_ptr<Transport> Connector::current_transport() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return transport_;
}

void Connector::connect()
{
    std::lock_guard<std::mutex> connect_lock(connect_mutex_);

    std::shared_ptr<Transport> stale;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectorState::Connected)
            return;
        stale = std::move(transport_);
        state_ = ConnectorState::Connecting;
        generation = ++generation_;
    }
    if (stale)
        stale->close();

    if (is_http_family(cfg_.transport))
        log::info(label() + " Connecting to " + util::url_for_logging(cfg_.url));
    else
        log::info(label() + " Connecting via " + to_string(cfg_.transport));

    auto fail = [&](const std::shared_ptr<Transport>& transport)
    {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (generation_ == generation)
            {
                transport_.reset();
                state_ = ConnectorState::Disconnected;
            }
        }
        if (transport)
            transport->close();
        reject_all("Connection closed");
    };

    std::shared_ptr<Transport> transport;
    try
    {
        cfg_.validate();
        transport = factory_(cfg_);

        TransportCallbacks callbacks;
        callbacks.on_message = [this, generation](const Json& msg) { handle_message(generation, msg); };
        callbacks.on_parse_error = [this](const std::string& line, const std::string& error)
        { log::warn(label() + " Ignoring malformed message (" + error + "): " + line.substr(0, 200)); };
        callbacks.on_exit = [this, generation](int code) { handle_exit(generation, code); };

        transport->start(std::move(callbacks));
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            transport_ = transport;
        }
        handshake(transport);
    }
    catch (const ConfigError&)
    {
        fail(transport);
        throw;
    }
    catch (const ConnectionError& e)
    {
        fail(transport);
        log::warn(label() + " " + util::error_for_logging(e.what()));
        throw;
    }
    catch (const Error& e)
    {
        fail(transport);
        log::warn(label() + " Handshake failed: " + util::error_for_logging(e.what()));
        throw ConnectionError(label() + " Handshake failed: " + e.what());
    }
    catch (const std::exception& e)
    {
        fail(transport);
        log::warn(label() + " Connect failed: " + util::error_for_logging(e.what()));
        throw ConnectionError(label() + " Connect failed: " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation_ != generation || !transport_)
            throw ConnectionError(label() + " Connection closed during handshake");
        state_ = ConnectorState::Connected;
    }
    log::info(label() + " Connected");
    ConnectorEvent ev;
    ev.kind = ConnectorEvent::Kind::Connected;
    ev.server = cfg_.name;
    events_.push(std::move(ev));
}

void Connector::handshake(const std::shared_ptr<Transport>& transport)
{
    const Json init_params = {{"protocolVersion", PROTOCOL_VERSION},
                              {"capabilities", Json::object()},
                              {"clientInfo", {{"name", NAME}, {"version", VERSION}}}};

    if (cfg_.transport == TransportKind::Http)
    {
        // One-shot servers often skip the handshake; nothing depends on it
        try
        {
            Json info = send_request(transport, "initialize", init_params);
            transport->send(jsonrpc::notification("notifications/initialized", Json::object()));
            std::lock_guard<std::mutex> lock(state_mutex_);
            server_info_ = std::move(info);
        }
        catch (const Error& e)
        {
            log::debug(label() + " initialize ignored: " + util::error_for_logging(e.what()));
        }
        return;
    }

    Json info = send_request(transport, "initialize", init_params);
    transport->send(jsonrpc::notification("notifications/initialized", Json::object()));
    Json listed = send_request(transport, "tools/list", Json::object());

    std::vector<Json> tools;
    if (listed.is_object() && listed.contains("tools") && listed["tools"].is_array())
        tools.assign(listed["tools"].begin(), listed["tools"].end());

    log::debug(label() + " " + std::to_string(tools.size()) + " tool(s) available");
    std::lock_guard<std::mutex> lock(state_mutex_);
    server_info_ = std::move(info);
    tools_ = std::move(tools);
}

void Connector::disconnect()
{
    std::shared_ptr<Transport> transport;
    bool was_connected = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        transport = std::move(transport_);
        was_connected = state_ == ConnectorState::Connected;
        state_ = ConnectorState::Disconnected;
        ++generation_;
    }
    if (!transport)
        return;

    transport->close();
    reject_all("Connection closed");

    if (was_connected)
    {
        log::info(label() + " Disconnected");
        ConnectorEvent ev;
        ev.kind = ConnectorEvent::Kind::Disconnected;
        ev.server = cfg_.name;
        ev.intentional = true;
        events_.push(std::move(ev));
    }
}

Json Connector::request(const std::string& method, const Json& params)
{
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ConnectorState::Connected || !transport_)
            throw ConnectionError("Server " + cfg_.name + " is not connected");
        transport = transport_;
    }
    return send_request(transport, method, params);
}

void Connector::notify(const std::string& method, const Json& params)
{
    auto transport = current_transport();
    if (!transport || !is_connected())
        throw ConnectionError("Server " + cfg_.name + " is not connected");
    transport->send(jsonrpc::notification(method, params));
}

Json Connector::send_request(const std::shared_ptr<Transport>& transport, const std::string& method,
                             const Json& params)
{
    const Json id = ++next_id_;
    const std::string key = util::json::id_key(id);

    auto promise = std::make_shared<std::promise<Json>>();
    auto future = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_[key] = promise;
    }

    auto forget = [&]
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(key);
    };

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        generation = generation_;
    }

    try
    {
        auto reply = transport->send(jsonrpc::request(id, method, params));
        if (reply)
            handle_message(generation, *reply);
    }
    catch (const Error&)
    {
        forget();
        throw;
    }

    // Request-style transports answer inside send(); nothing else will come
    if (!is_stream_kind(transport->kind()) &&
        future.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
    {
        forget();
        throw TransportError(label() + " No response to " + method);
    }

    if (future.wait_for(cfg_.timeout) == std::future_status::timeout)
    {
        forget();
        log::warn(label() + " Request " + method + " timed out after " +
                  std::to_string(cfg_.timeout.count()) + "ms");
        throw RequestTimeoutError("Request timeout");
    }
    return future.get();
}

void Connector::handle_message(uint64_t generation, const Json& message)
{
    if (jsonrpc::is_response(message))
    {
        std::shared_ptr<std::promise<Json>> promise;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(util::json::id_key(message["id"]));
            if (it == pending_.end())
            {
                log::debug(label() + " Dropping response with unknown id " + message["id"].dump());
                return;
            }
            promise = std::move(it->second);
            pending_.erase(it);
        }

        if (message.contains("error"))
        {
            const Json& err = message["error"];
            int code = jsonrpc::INTERNAL_ERROR;
            std::string text = "Unknown error";
            if (err.is_object())
            {
                // Either field may be missing or mistyped
                auto c = err.find("code");
                if (c != err.end() && c->is_number_integer())
                    code = c->get<int>();
                auto m = err.find("message");
                if (m != err.end() && m->is_string())
                    text = m->get<std::string>();
            }
            promise->set_exception(std::make_exception_ptr(RemoteError(code, text)));
            return;
        }
        promise->set_value(message.contains("result") ? message["result"] : Json::object());
        return;
    }

    if (jsonrpc::is_request(message) || jsonrpc::is_notification(message))
    {
        if (jsonrpc::is_request(message))
        {
            const Json& method_field = message["method"];
            const std::string method =
                method_field.is_string() ? method_field.get<std::string>() : method_field.dump();
            Json reply = method == "ping"
                             ? jsonrpc::result(message["id"], Json::object())
                             : jsonrpc::error(message["id"], jsonrpc::METHOD_NOT_FOUND,
                                              "Method not found: " + method);
            std::shared_ptr<Transport> transport;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (generation_ == generation)
                    transport = transport_;
            }
            if (transport)
            {
                try
                {
                    transport->send(reply);
                }
                catch (const Error& e)
                {
                    log::warn(label() + " Failed to answer " + method + ": " + e.what());
                }
            }
        }

        ConnectorEvent ev;
        ev.kind = ConnectorEvent::Kind::Notification;
        ev.server = cfg_.name;
        ev.payload = message;
        events_.push(std::move(ev));
        return;
    }

    log::debug(label() + " Ignoring message that is not JSON-RPC: " + message.dump().substr(0, 200));
}

void Connector::handle_exit(uint64_t generation, int exit_code)
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation_ != generation)
            return;
        state_ = ConnectorState::Disconnected;
    }

    log::warn(label() + " Process exited with code " + std::to_string(exit_code));
    reject_all("Process exited with code " + std::to_string(exit_code));

    ConnectorEvent ev;
    ev.kind = ConnectorEvent::Kind::Disconnected;
    ev.server = cfg_.name;
    ev.exit_code = exit_code;
    events_.push(std::move(ev));
}

void Connector::reject_all(const std::string& reason)
{
    PendingMap pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& [key, promise] : pending)
        promise->set_exception(std::make_exception_ptr(ConnectionClosedError(reason)));
}

Json Connector::call_tool(const std::string& tool, const Json& arguments)
{
    return request("tools/call",
                   {{"name", tool}, {"arguments", arguments.is_null() ? Json::object() : arguments}});
}

std::vector<Json> Connector::list_tools()
{
    if (cfg_.transport == TransportKind::StreamingHttp)
    {
        if (!is_connected())
            throw ConnectionError("Server " + cfg_.name + " is not connected");
        return cached_tools();
    }

    Json listed = request("tools/list", Json::object());
    std::vector<Json> tools;
    if (listed.is_object() && listed.contains("tools") && listed["tools"].is_array())
        tools.assign(listed["tools"].begin(), listed["tools"].end());

    std::lock_guard<std::mutex> lock(state_mutex_);
    tools_ = tools;
    return tools;
}

std::vector<Json> Connector::cached_tools() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return tools_;
}

Json Connector::server_info() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

size_t Connector::pending_count() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

} // namespace mcpgate::client

#include "mcpgate/client/config.hpp"

#include "mcpgate/exceptions.hpp"

namespace mcpgate::client
{

namespace
{
template <typename T>
void read_opt(const Json& j, const char* key, T& out)
{
    if (j.contains(key) && !j.at(key).is_null())
        out = j.at(key).get<T>();
}

template <typename T>
void read_opt(const Json& j, const char* key, std::optional<T>& out)
{
    if (j.contains(key) && !j.at(key).is_null())
        out = j.at(key).get<T>();
}

std::string auth_type_name(AuthConfig::Type t)
{
    switch (t)
    {
    case AuthConfig::Type::Bearer:
        return "bearer";
    case AuthConfig::Type::Basic:
        return "basic";
    case AuthConfig::Type::None:
        break;
    }
    return "none";
}
} // namespace

void RemoteServerConfig::validate() const
{
    if (name.empty())
        throw ConfigError("Remote server config requires a name");

    switch (transport)
    {
    case TransportKind::ProcessPython:
    case TransportKind::ProcessNode:
        if (command.empty())
            throw ConfigError(to_string(transport) + " transport requires command (server " + name +
                              ")");
        break;
    case TransportKind::Container:
        if (image.empty())
            throw ConfigError("container transport requires image (server " + name + ")");
        break;
    case TransportKind::Http:
    case TransportKind::StreamingHttp:
        if (url.empty())
            throw ConfigError(to_string(transport) + " transport requires url (server " + name +
                              ")");
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0)
            throw ConfigError("url must use http or https (server " + name + ")");
        break;
    }

    if (timeout.count() <= 0)
        throw ConfigError("timeout must be positive (server " + name + ")");
    if (retries && *retries < 0)
        throw ConfigError("retries must not be negative (server " + name + ")");
    if (auth.type == AuthConfig::Type::Bearer && auth.token.empty())
        throw ConfigError("bearer auth requires token (server " + name + ")");
    if (auth.type == AuthConfig::Type::Basic && auth.username.empty())
        throw ConfigError("basic auth requires username (server " + name + ")");
}

std::optional<std::string> RemoteServerConfig::effective_container_name() const
{
    if (container_name && !container_name->empty())
        return container_name;
    if (reuse_container || remove_on_exit == false)
        return "mcp-" + name;
    return std::nullopt;
}

void from_json(const Json& j, RemoteServerConfig& cfg)
{
    if (!j.is_object())
        throw ConfigError("Remote server config must be an object");

    cfg = RemoteServerConfig{};
    read_opt(j, "name", cfg.name);

    std::string transport;
    read_opt(j, "transport", transport);
    auto kind = transport_kind_from_string(transport);
    if (!kind)
        throw ConfigError("Unsupported transport '" + transport + "' (server " + cfg.name + ")");
    cfg.transport = *kind;
    cfg.prefer_npm_exec = (transport == "npm-exec");

    read_opt(j, "command", cfg.command);
    read_opt(j, "args", cfg.args);
    read_opt(j, "env", cfg.env);
    read_opt(j, "runnerArgs", cfg.runner_args);

    read_opt(j, "image", cfg.image);
    read_opt(j, "containerArgs", cfg.container_args);
    read_opt(j, "containerName", cfg.container_name);
    read_opt(j, "containerCommand", cfg.container_command);
    read_opt(j, "reuseContainer", cfg.reuse_container);
    read_opt(j, "removeOnExit", cfg.remove_on_exit);

    read_opt(j, "url", cfg.url);
    read_opt(j, "headers", cfg.headers);
    if (j.contains("auth") && j.at("auth").is_object())
    {
        const auto& a = j.at("auth");
        std::string type = a.value("type", "none");
        if (type == "bearer")
            cfg.auth.type = AuthConfig::Type::Bearer;
        else if (type == "basic")
            cfg.auth.type = AuthConfig::Type::Basic;
        else if (type == "none")
            cfg.auth.type = AuthConfig::Type::None;
        else
            throw ConfigError("Unsupported auth type '" + type + "' (server " + cfg.name + ")");
        cfg.auth.token = a.value("token", "");
        cfg.auth.username = a.value("username", "");
        cfg.auth.password = a.value("password", "");
    }

    read_opt(j, "autoStart", cfg.auto_start);
    if (j.contains("timeout") && j.at("timeout").is_number())
        cfg.timeout = std::chrono::milliseconds(j.at("timeout").get<long long>());
    read_opt(j, "prefixToolNames", cfg.prefix_tool_names);
    read_opt(j, "retries", cfg.retries);
}

// Secrets (auth token, password, env values) are not serialized.
void to_json(Json& j, const RemoteServerConfig& cfg)
{
    j = Json{{"name", cfg.name},
             {"transport", to_string(cfg.transport)},
             {"timeout", cfg.timeout.count()},
             {"auth", Json{{"type", auth_type_name(cfg.auth.type)}}}};
    if (!cfg.command.empty())
        j["command"] = cfg.command;
    if (!cfg.image.empty())
        j["image"] = cfg.image;
    if (!cfg.url.empty())
        j["url"] = cfg.url;
    if (cfg.auto_start)
        j["autoStart"] = *cfg.auto_start;
    if (cfg.prefix_tool_names)
        j["prefixToolNames"] = *cfg.prefix_tool_names;
}

void from_json(const Json& j, ManagerConfig& cfg)
{
    if (!j.is_object())
        throw ConfigError("Manager config must be an object");

    cfg = ManagerConfig{};
    if (j.contains("servers"))
    {
        if (!j.at("servers").is_array())
            throw ConfigError("servers must be an array");
        for (const auto& s : j.at("servers"))
            cfg.servers.push_back(s.get<RemoteServerConfig>());
    }
    read_opt(j, "autoConnect", cfg.auto_connect);
    read_opt(j, "retryOnFailure", cfg.retry_on_failure);
    read_opt(j, "maxRetries", cfg.max_retries);
    read_opt(j, "prefixToolNames", cfg.prefix_tool_names);
    if (j.contains("retryDelay") && j.at("retryDelay").is_number())
        cfg.retry_delay = std::chrono::milliseconds(j.at("retryDelay").get<long long>());
    if (j.contains("retryResetAfter") && j.at("retryResetAfter").is_number())
        cfg.retry_reset_after = std::chrono::milliseconds(j.at("retryResetAfter").get<long long>());
}

} // namespace mcpgate::client

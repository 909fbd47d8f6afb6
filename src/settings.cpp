#include "mcpgate/settings.hpp"

#include "mcpgate/exceptions.hpp"
#include "mcpgate/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mcpgate
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

// DOCKER_HOST is honoured only in its unix:// form; the engine client speaks
// HTTP over a local socket.
static std::string socket_from_docker_host(const std::string& host, const std::string& defv)
{
    if (host.empty())
        return defv;
    const std::string unix_prefix = "unix://";
    if (host.rfind(unix_prefix, 0) == 0)
        return host.substr(unix_prefix.size());
    if (!host.empty() && host[0] == '/')
        return host;
    throw ConfigError("Unsupported DOCKER_HOST (only unix:// sockets are supported): " + host);
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPGATE_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    s.container_socket = socket_from_docker_host(getenv_str("DOCKER_HOST", ""), s.container_socket);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("container_socket"))
        s.container_socket =
            socket_from_docker_host(j.at("container_socket").get<std::string>(), s.container_socket);
    return s;
}

void Settings::apply() const
{
    log::set_level(log::level_from_string(log_level));
}

} // namespace mcpgate

#pragma once
/// @file client/config.hpp
/// @brief Per-server and manager configuration, parsed from camelCase JSON

#include "mcpgate/types.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate::client
{

struct AuthConfig
{
    enum class Type
    {
        None,
        Bearer,
        Basic
    };

    Type type{Type::None};
    std::string token;
    std::string username;
    std::string password;
};

/// Everything needed to reach one remote server. Immutable once a Connector
/// has been built from it.
struct RemoteServerConfig
{
    std::string name;
    TransportKind transport{TransportKind::Http};
    /// Set when the config asked for "npm-exec": prefer `npm exec` over `npx`
    bool prefer_npm_exec{false};

    // process-python / process-node
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::vector<std::string> runner_args;

    // container
    std::string image;
    std::vector<std::string> container_args;
    std::optional<std::string> container_name;
    std::vector<std::string> container_command;
    bool reuse_container{false};
    std::optional<bool> remove_on_exit;

    // http / streaming-http
    std::string url;
    std::map<std::string, std::string> headers;
    AuthConfig auth;

    std::optional<bool> auto_start;
    std::chrono::milliseconds timeout{30000};
    std::optional<bool> prefix_tool_names;
    std::optional<int> retries;

    /// Throws ConfigError when a field required by the transport is missing.
    void validate() const;

    /// Container name actually used: the configured one, else "mcp-<name>"
    /// when the container must outlive or be found again, else none.
    std::optional<std::string> effective_container_name() const;

    /// removeOnExit defaults to !reuseContainer.
    bool effective_remove_on_exit() const
    {
        return remove_on_exit.value_or(!reuse_container);
    }
};

void from_json(const Json& j, RemoteServerConfig& cfg);
void to_json(Json& j, const RemoteServerConfig& cfg);

struct ManagerConfig
{
    std::vector<RemoteServerConfig> servers;
    bool auto_connect{true};
    bool retry_on_failure{true};
    std::chrono::milliseconds retry_delay{5000};
    int max_retries{3};
    bool prefix_tool_names{true};
    /// A reconnected server that stays up this long gets a fresh retry budget.
    std::chrono::milliseconds retry_reset_after{60000};
};

void from_json(const Json& j, ManagerConfig& cfg);

} // namespace mcpgate::client

#pragma once
/// @file container/create_options.hpp
/// @brief Translation of docker-run style flags into an Engine API create body

#include "mcpgate/client/config.hpp"
#include "mcpgate/types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate::container
{

constexpr const char* LABEL_MANAGED = "mcpgate.managed";
constexpr const char* LABEL_SERVER = "mcpgate.server";
constexpr const char* LABEL_SIGNATURE = "mcpgate.signature";

/// Mutable state a flag handler writes into.
struct FlagTarget
{
    Json& body; ///< ContainerCreate body (Image, Env, Cmd, Labels, ...)
    Json& host; ///< body["HostConfig"]
    std::vector<std::string>& env;
};

/// One entry of the flag table. Handlers return false when the value cannot
/// be parsed; the flag is then reported as unsupported.
struct FlagSpec
{
    bool takes_value;
    std::function<bool(FlagTarget&, const std::string& value)> apply;
};

/// Flag -> effect. Aliases (-e/--env, -v/--volume, ...) map to the same spec.
const std::map<std::string, FlagSpec>& flag_table();

struct CreateOptions
{
    Json body;
    std::optional<std::string> name;
    /// Unknown flags, missing values and unparseable values, in input order
    std::vector<std::string> unsupported;

    bool tty() const
    {
        return body.value("Tty", false);
    }
    bool auto_remove() const;
};

/// Build the create body for cfg. Config env entries come first, then -e /
/// --env-file entries; duplicates are dropped.
CreateOptions build_create_options(const client::RemoteServerConfig& cfg,
                                   const std::optional<std::string>& name, bool remove_on_exit);

/// SHA-1 (hex) over the normalized image, env, mounts, binds, network mode,
/// privileged, user, working dir, entrypoint and cmd.
std::string compute_signature(const Json& body);

/// Stamp ownership and signature labels onto body["Labels"].
void apply_managed_labels(Json& body, const std::string& server, const std::string& signature);

/// "type=bind,source=/a,target=/b,readonly" -> Mount object; nullopt when
/// target is missing or a bind has no source.
std::optional<Json> parse_mount_spec(const std::string& spec);

/// "512m", "1g", "1024", "1.5GB" -> bytes.
std::optional<long long> parse_byte_size(const std::string& value);

/// Non-empty, non-comment lines of an env file. Throws ConfigError when unreadable.
std::vector<std::string> read_env_file(const std::string& path);

} // namespace mcpgate::container

#pragma once
#include "mcpgate/types.hpp"

#include <string>

namespace mcpgate
{

struct Settings
{
    std::string log_level{"INFO"};
    /// Unix socket of the container engine.
    std::string container_socket{"/var/run/docker.sock"};

    static Settings from_env();
    static Settings from_json(const Json& j);

    /// Push log_level into the process-wide logger.
    void apply() const;
};

} // namespace mcpgate

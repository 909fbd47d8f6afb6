#include "mcpgate/types.hpp"

namespace mcpgate
{

std::optional<TransportKind> transport_kind_from_string(const std::string& s)
{
    if (s == "process-python" || s == "uvx")
        return TransportKind::ProcessPython;
    if (s == "process-node" || s == "npx" || s == "npm-exec")
        return TransportKind::ProcessNode;
    if (s == "container" || s == "docker")
        return TransportKind::Container;
    if (s == "http" || s == "https")
        return TransportKind::Http;
    if (s == "streaming-http" || s == "streamableHttp")
        return TransportKind::StreamingHttp;
    return std::nullopt;
}

} // namespace mcpgate

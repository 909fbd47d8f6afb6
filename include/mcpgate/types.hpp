#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate
{

using Json = nlohmann::json;

/// MCP protocol revision spoken on both the inbound and outbound side.
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

/// Library name and version reported in clientInfo / serverInfo.
constexpr const char* NAME = "mcpgate";
constexpr const char* VERSION = "0.1.0";

/// How a Connector reaches its remote server.
enum class TransportKind
{
    ProcessPython, ///< child process launched through uvx
    ProcessNode,   ///< child process launched through npx / npm exec
    Container,     ///< single container driven through the engine API
    Http,          ///< one-shot JSON-RPC POST per request
    StreamingHttp  ///< session-scoped streamable HTTP
};

inline std::string to_string(TransportKind kind)
{
    switch (kind)
    {
    case TransportKind::ProcessPython:
        return "process-python";
    case TransportKind::ProcessNode:
        return "process-node";
    case TransportKind::Container:
        return "container";
    case TransportKind::Http:
        return "http";
    case TransportKind::StreamingHttp:
        return "streaming-http";
    }
    return "http";
}

/// Parse a transport name. Accepts the canonical names and the legacy aliases
/// (uvx, npx, npm-exec, docker, https, streamableHttp).
std::optional<TransportKind> transport_kind_from_string(const std::string& s);

/// True for http and streaming-http: these connect without spawning anything.
inline bool is_http_family(TransportKind kind)
{
    return kind == TransportKind::Http || kind == TransportKind::StreamingHttp;
}

/// True for transports whose responses arrive asynchronously on a byte stream.
inline bool is_stream_kind(TransportKind kind)
{
    return kind == TransportKind::ProcessPython || kind == TransportKind::ProcessNode ||
           kind == TransportKind::Container;
}

} // namespace mcpgate

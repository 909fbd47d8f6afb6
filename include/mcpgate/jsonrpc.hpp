#pragma once
#include "mcpgate/types.hpp"

#include <string>

namespace mcpgate::jsonrpc
{

constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

inline Json request(const Json& id, const std::string& method, const Json& params)
{
    Json j = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null())
        j["params"] = params;
    return j;
}

inline Json notification(const std::string& method, const Json& params = Json())
{
    Json j = {{"jsonrpc", "2.0"}, {"method", method}};
    if (!params.is_null())
        j["params"] = params;
    return j;
}

inline Json result(const Json& id, const Json& value)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", value}};
}

inline Json error(const Json& id, int code, const std::string& message,
                  const Json& data = Json())
{
    Json err = {{"code", code}, {"message", message}};
    if (!data.is_null())
        err["data"] = data;
    return Json{{"jsonrpc", "2.0"}, {"id", id.is_null() ? Json() : id}, {"error", err}};
}

// Envelope classification: id without method is a response, method without
// id a notification, both a request.
inline bool is_response(const Json& j)
{
    return j.is_object() && j.contains("id") && !j.contains("method");
}

inline bool is_notification(const Json& j)
{
    return j.is_object() && j.contains("method") && !j.contains("id");
}

inline bool is_request(const Json& j)
{
    return j.is_object() && j.contains("method") && j.contains("id");
}

} // namespace mcpgate::jsonrpc

#pragma once
#include <stdexcept>
#include <string>

namespace mcpgate
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Missing or invalid configuration. Fatal at addServer time, never retried.
struct ConfigError : public Error
{
    using Error::Error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// Failure to establish a connection (process launch, engine, handshake).
struct ConnectionError : public Error
{
    using Error::Error;
};

/// The container engine socket exists but the current user may not open it.
struct EnginePermissionError : public ConnectionError
{
    using ConnectionError::ConnectionError;
};

/// I/O failure on an established transport.
struct TransportError : public Error
{
    using Error::Error;
};

struct RequestTimeoutError : public Error
{
    using Error::Error;
};

/// The transport went away while the request was outstanding.
struct ConnectionClosedError : public Error
{
    using Error::Error;
};

/// The remote server answered with a JSON-RPC error object.
struct RemoteError : public Error
{
    RemoteError(int code, const std::string& message) : Error(message), code_(code) {}

    int code() const
    {
        return code_;
    }

  private:
    int code_;
};

} // namespace mcpgate

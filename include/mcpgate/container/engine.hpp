#pragma once
/// @file container/engine.hpp
/// @brief The container-engine operations the container transport needs

#include "mcpgate/exceptions.hpp"
#include "mcpgate/types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace mcpgate::container
{

/// Engine API call answered with an error status.
struct EngineError : public ConnectionError
{
    EngineError(int status, const std::string& message) : ConnectionError(message), status_(status)
    {
    }

    int status() const
    {
        return status_;
    }

  private:
    int status_;
};

struct ContainerInfo
{
    std::string id;
    std::string name;
    bool running{false};
    std::map<std::string, std::string> labels;
};

/// Duplex stream from attaching to a container's stdio.
class AttachStream
{
  public:
    virtual ~AttachStream() = default;

    /// Wait up to timeout_ms for bytes. nullopt: nothing yet; 0: end of stream.
    virtual std::optional<size_t> read(char* buffer, size_t size, int timeout_ms) = 0;

    /// Throws TransportError when the stream is gone.
    virtual void write(const std::string& data) = 0;

    virtual void close() = 0;
};

class ContainerEngine
{
  public:
    virtual ~ContainerEngine() = default;

    /// Where the engine lives, for messages (socket path).
    virtual std::string endpoint() const = 0;

    /// Throws EnginePermissionError on EACCES, ConnectionError otherwise.
    virtual void ping() = 0;

    /// nullopt when no container has that name or id.
    virtual std::optional<ContainerInfo> inspect(const std::string& name_or_id) = 0;

    /// Returns the new container id.
    virtual std::string create(const Json& body, const std::optional<std::string>& name) = 0;

    /// Attach stdin/stdout/stderr; call before start() so no output is lost.
    virtual std::unique_ptr<AttachStream> attach(const std::string& id) = 0;

    virtual void start(const std::string& id) = 0;

    /// Already-stopped (304) and missing (404) containers are not errors.
    virtual void stop(const std::string& id, int timeout_s) = 0;

    /// Missing (404) containers are not errors.
    virtual void remove(const std::string& id, bool force) = 0;

    /// Block until the container exits; returns its status code.
    virtual int wait(const std::string& id) = 0;
};

/// Docker Engine API over a local unix socket.
std::shared_ptr<ContainerEngine> make_docker_engine(const std::string& socket_path);

} // namespace mcpgate::container

#pragma once
/// @file container/transport.hpp
/// @brief One long-lived container per server, driven over its attached stdio

#include "mcpgate/client/transports.hpp"
#include "mcpgate/container/demux.hpp"
#include "mcpgate/container/engine.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcpgate::container
{

/// Runs cfg.image with the translated containerArgs and speaks
/// newline-delimited JSON-RPC over the attach stream.
///
/// start(): ping, build create options, look for an existing container of the
/// same name, reuse or recreate it, attach, start. close(): stop (t=0), then
/// remove unless the container is kept or auto-removed by the engine.
class ContainerTransport : public client::Transport
{
  public:
    ContainerTransport(client::RemoteServerConfig cfg, std::shared_ptr<ContainerEngine> engine);
    ~ContainerTransport() override;

    TransportKind kind() const override
    {
        return TransportKind::Container;
    }
    void start(client::TransportCallbacks callbacks) override;
    std::optional<Json> send(const Json& envelope) override;
    void close() override;
    bool is_open() const override
    {
        return open_.load();
    }

    std::string container_id() const;

    /// False when an existing container was reused.
    bool created_new() const
    {
        return created_new_;
    }

  private:
    void prepare_container(const std::optional<std::string>& name, const Json& body,
                           const std::string& signature);
    void reader_loop();
    void dispose();
    std::string label() const;

    client::RemoteServerConfig cfg_;
    std::shared_ptr<ContainerEngine> engine_;
    client::TransportCallbacks callbacks_;
    std::unique_ptr<AttachStream> stream_;
    std::unique_ptr<StreamDemuxer> demuxer_;
    client::MessageFramer framer_;
    std::thread reader_;

    mutable std::mutex mutex_;
    std::string id_;
    bool remove_on_exit_{true};
    bool auto_remove_{false};
    bool created_new_{false};
    bool removed_{false};

    std::mutex write_mutex_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
};

} // namespace mcpgate::container

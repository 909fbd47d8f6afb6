#pragma once
#include "mcpgate/gateway/handler.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace httplib
{
class Server;
}

namespace mcpgate::gateway
{

/// Maps the Authorization header (possibly empty) to a caller identity.
/// Returning nullopt rejects the request with 401.
using Authenticator = std::function<std::optional<AuthContext>(const std::string& authorization)>;

class GatewayHttpServer
{
  public:
    /**
     * Serve a Gateway over HTTP.
     *
     * @param gateway Dispatch target for POSTed JSON-RPC envelopes
     * @param host Address to bind (default: "127.0.0.1")
     * @param port Port to listen on; 0 picks a free port
     * @param path Endpoint path (default: "/mcp")
     * @param authenticator Optional caller identification; empty = anonymous
     */
    GatewayHttpServer(std::shared_ptr<Gateway> gateway, std::string host = "127.0.0.1",
                      int port = 0, std::string path = "/mcp", Authenticator authenticator = {});
    ~GatewayHttpServer();

    /// Bind and start serving. False if already running or the bind failed.
    bool start();
    void stop();
    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }
    const std::string& path() const
    {
        return path_;
    }

  private:
    std::shared_ptr<Gateway> gateway_;
    std::string host_;
    int port_;
    std::string path_;
    Authenticator authenticator_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace mcpgate::gateway

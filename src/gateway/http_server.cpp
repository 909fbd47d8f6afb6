#include "mcpgate/gateway/http_server.hpp"

#include "mcpgate/jsonrpc.hpp"
#include "mcpgate/util/json.hpp"
#include "mcpgate/util/log.hpp"

#include <httplib.h>

namespace mcpgate::gateway
{

namespace
{
void set_cors_headers(httplib::Response& res)
{
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}
} // namespace

GatewayHttpServer::GatewayHttpServer(std::shared_ptr<Gateway> gateway, std::string host, int port,
                                     std::string path, Authenticator authenticator)
    : gateway_(std::move(gateway)), host_(std::move(host)), port_(port), path_(std::move(path)),
      authenticator_(std::move(authenticator))
{
}

GatewayHttpServer::~GatewayHttpServer()
{
    stop();
}

bool GatewayHttpServer::start()
{
    if (running_)
        return false;
    svr_ = std::make_unique<httplib::Server>();

    svr_->set_payload_max_length(10 * 1024 * 1024);
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    svr_->Options(path_,
                  [](const httplib::Request&, httplib::Response& res)
                  {
                      set_cors_headers(res);
                      res.status = 204;
                  });

    svr_->Post(path_,
               [this](const httplib::Request& req, httplib::Response& res)
               {
                   set_cors_headers(res);

                   AuthContext auth;
                   if (authenticator_)
                   {
                       auto identity = authenticator_(req.get_header_value("Authorization"));
                       if (!identity)
                       {
                           res.status = 401;
                           res.set_content(jsonrpc::error(Json(), jsonrpc::INVALID_REQUEST,
                                                          "Unauthorized")
                                               .dump(),
                                           "application/json");
                           return;
                       }
                       auth = std::move(*identity);
                   }

                   Json message = util::json::try_parse(req.body);
                   if (message.is_discarded())
                   {
                       res.status = 400;
                       res.set_content(
                           jsonrpc::error(Json(), jsonrpc::PARSE_ERROR, "Parse error").dump(),
                           "application/json");
                       return;
                   }

                   res.status = 200;
                   res.set_content(gateway_->handle(message, auth).dump(), "application/json");
               });

    if (port_ == 0)
    {
        port_ = svr_->bind_to_any_port(host_);
        if (port_ <= 0)
        {
            log::error("[Gateway] Failed to bind " + host_);
            port_ = 0;
            return false;
        }
    }
    else if (!svr_->bind_to_port(host_, port_))
    {
        log::error("[Gateway] Failed to bind " + host_ + ":" + std::to_string(port_));
        return false;
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });
    log::info("[Gateway] Listening on http://" + host_ + ":" + std::to_string(port_) + path_);
    return true;
}

void GatewayHttpServer::stop()
{
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
    svr_.reset();
}

} // namespace mcpgate::gateway

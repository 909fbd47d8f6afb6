#include "mcpgate/container/engine.hpp"
#include "mcpgate/util/json.hpp"
#include "mcpgate/util/log.hpp"
#include "mcpgate/util/redact.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <httplib.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace mcpgate::container
{

namespace
{
constexpr int kApiTimeoutSeconds = 30;
constexpr size_t kMaxResponseHead = 16 * 1024;

std::string percent_encode(const std::string& s)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0xf]);
        }
    }
    return out;
}

std::string engine_message(const httplib::Result& res)
{
    Json body = util::json::try_parse(res->body);
    if (body.is_object() && body.contains("message") && body["message"].is_string())
        return body["message"].get<std::string>();
    return util::error_for_logging(res->body);
}

/// Connected AF_UNIX socket; throws with errno preserved in the exception type.
int connect_unix(const std::string& path)
{
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path))
        throw ConnectionError("Container engine socket path too long: " + path);
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        throw ConnectionError(std::string("Unable to create socket: ") + std::strerror(errno));

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
    {
        int err = errno;
        ::close(fd);
        if (err == EACCES || err == EPERM)
            throw EnginePermissionError(
                "Permission denied accessing container engine socket (" + path +
                "). Add the current user to the docker group or adjust permissions.");
        throw ConnectionError("Unable to reach container engine at " + path + ": " +
                              std::strerror(err));
    }
    return fd;
}

class UnixAttachStream : public AttachStream
{
  public:
    UnixAttachStream(int fd, std::string pending) : fd_(fd), pending_(std::move(pending)) {}

    ~UnixAttachStream() override
    {
        close();
        ::close(fd_);
    }

    std::optional<size_t> read(char* buffer, size_t size, int timeout_ms) override
    {
        if (!pending_.empty())
        {
            size_t n = std::min(size, pending_.size());
            std::memcpy(buffer, pending_.data(), n);
            pending_.erase(0, n);
            return n;
        }
        if (closed_)
            return 0;

        pollfd p{fd_, POLLIN, 0};
        int rc = ::poll(&p, 1, timeout_ms);
        if (rc == 0)
            return std::nullopt;
        if (rc < 0)
        {
            if (errno == EINTR)
                return std::nullopt;
            throw TransportError(std::string("poll failed: ") + std::strerror(errno));
        }

        ssize_t n = ::recv(fd_, buffer, size, 0);
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                return std::nullopt;
            if (closed_)
                return 0;
            throw TransportError(std::string("Attach read failed: ") + std::strerror(errno));
        }
        return static_cast<size_t>(n);
    }

    void write(const std::string& data) override
    {
        size_t sent = 0;
        while (sent < data.size())
        {
            if (closed_)
                throw TransportError("Attach stream is closed");
            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw TransportError(std::string("Attach write failed: ") + std::strerror(errno));
            }
            sent += static_cast<size_t>(n);
        }
    }

    void close() override
    {
        if (!closed_.exchange(true))
            ::shutdown(fd_, SHUT_RDWR);
    }

  private:
    int fd_;
    std::string pending_;
    std::atomic<bool> closed_{false};
};

class DockerEngine : public ContainerEngine
{
  public:
    explicit DockerEngine(std::string socket_path) : socket_(std::move(socket_path)) {}

    std::string endpoint() const override
    {
        return socket_;
    }

    void ping() override
    {
        // Raw connect first: httplib does not expose errno, and EACCES needs its own error
        ::close(connect_unix(socket_));

        auto res = client(kApiTimeoutSeconds).Get("/_ping", headers());
        if (!res)
            throw ConnectionError("Unable to reach container engine: " +
                                  httplib::to_string(res.error()));
        if (res->status != 200)
            throw ConnectionError("Unable to reach container engine: ping returned " +
                                  std::to_string(res->status));
    }

    std::optional<ContainerInfo> inspect(const std::string& name_or_id) override
    {
        auto res = client(kApiTimeoutSeconds)
                       .Get("/containers/" + percent_encode(name_or_id) + "/json", headers());
        check(res, "inspect " + name_or_id, {200, 404});
        if (res->status == 404)
            return std::nullopt;

        Json j = util::json::try_parse(res->body);
        if (!j.is_object())
            throw ConnectionError("Malformed inspect response for " + name_or_id);

        ContainerInfo info;
        info.id = j.value("Id", "");
        info.name = j.value("Name", "");
        if (!info.name.empty() && info.name[0] == '/')
            info.name.erase(0, 1);
        if (j.contains("State") && j["State"].is_object())
            info.running = j["State"].value("Running", false);
        if (j.contains("Config") && j["Config"].is_object() && j["Config"].contains("Labels") &&
            j["Config"]["Labels"].is_object())
        {
            for (auto& [k, v] : j["Config"]["Labels"].items())
                if (v.is_string())
                    info.labels[k] = v.get<std::string>();
        }
        return info;
    }

    std::string create(const Json& body, const std::optional<std::string>& name) override
    {
        std::string path = "/containers/create";
        if (name)
            path += "?name=" + percent_encode(*name);
        auto res = client(kApiTimeoutSeconds).Post(path, headers(), body.dump(), "application/json");
        check(res, "create container", {201});
        Json j = util::json::try_parse(res->body);
        if (!j.is_object() || !j.contains("Id"))
            throw ConnectionError("Malformed create response from container engine");
        for (const auto& w : j.value("Warnings", Json::array()))
            if (w.is_string())
                log::warn("[Container] " + w.get<std::string>());
        return j["Id"].get<std::string>();
    }

    std::unique_ptr<AttachStream> attach(const std::string& id) override
    {
        int fd = connect_unix(socket_);
        try
        {
            const std::string request =
                "POST /containers/" + percent_encode(id) +
                "/attach?stream=1&stdin=1&stdout=1&stderr=1 HTTP/1.1\r\n"
                "Host: docker\r\n"
                "Content-Type: application/vnd.docker.raw-stream\r\n"
                "Connection: Upgrade\r\n"
                "Upgrade: tcp\r\n"
                "Content-Length: 0\r\n\r\n";
            send_all(fd, request);

            std::string head;
            size_t header_end = std::string::npos;
            char buf[4096];
            while ((header_end = head.find("\r\n\r\n")) == std::string::npos)
            {
                if (head.size() > kMaxResponseHead)
                    throw ConnectionError("Attach response header too large");
                pollfd p{fd, POLLIN, 0};
                int rc = ::poll(&p, 1, kApiTimeoutSeconds * 1000);
                if (rc <= 0)
                    throw ConnectionError("Timed out attaching to container " + id);
                ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
                if (n <= 0)
                    throw ConnectionError("Engine closed the attach connection for " + id);
                head.append(buf, static_cast<size_t>(n));
            }

            int status = 0;
            auto sp = head.find(' ');
            if (sp != std::string::npos)
                status = std::atoi(head.c_str() + sp + 1);
            if (status != 101 && status != 200)
                throw EngineError(status, "Attach to container " + id + " failed with status " +
                                              std::to_string(status));

            return std::make_unique<UnixAttachStream>(fd, head.substr(header_end + 4));
        }
        catch (...)
        {
            ::close(fd);
            throw;
        }
    }

    void start(const std::string& id) override
    {
        auto res = client(kApiTimeoutSeconds)
                       .Post("/containers/" + percent_encode(id) + "/start", headers(), "",
                             "application/json");
        check(res, "start container", {204, 304});
    }

    void stop(const std::string& id, int timeout_s) override
    {
        auto res = client(kApiTimeoutSeconds + timeout_s)
                       .Post("/containers/" + percent_encode(id) + "/stop?t=" +
                                 std::to_string(timeout_s),
                             headers(), "", "application/json");
        check(res, "stop container", {204, 304, 404});
    }

    void remove(const std::string& id, bool force) override
    {
        auto res = client(kApiTimeoutSeconds)
                       .Delete("/containers/" + percent_encode(id) +
                                   (force ? "?force=true" : ""),
                               headers());
        check(res, "remove container", {204, 404});
    }

    int wait(const std::string& id) override
    {
        // The container may run for the lifetime of the process
        auto res = client(24 * 3600).Post("/containers/" + percent_encode(id) + "/wait",
                                          headers(), "", "application/json");
        check(res, "wait for container", {200});
        Json j = util::json::try_parse(res->body);
        if (!j.is_object())
            return -1;
        return j.value("StatusCode", -1);
    }

  private:
    httplib::Client client(int read_timeout_s) const
    {
        httplib::Client cli(socket_, 80);
        cli.set_address_family(AF_UNIX);
        cli.set_connection_timeout(5, 0);
        cli.set_read_timeout(read_timeout_s, 0);
        return cli;
    }

    static httplib::Headers headers()
    {
        return httplib::Headers{{"Host", "docker"}};
    }

    void check(const httplib::Result& res, const std::string& what,
               std::initializer_list<int> accepted) const
    {
        if (!res)
            throw ConnectionError("Container engine request failed (" + what +
                                  "): " + httplib::to_string(res.error()));
        for (int s : accepted)
            if (res->status == s)
                return;
        throw EngineError(res->status, "Container engine rejected " + what + " (" +
                                           std::to_string(res->status) +
                                           "): " + engine_message(res));
    }

    static void send_all(int fd, const std::string& data)
    {
        size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw ConnectionError(std::string("Engine write failed: ") + std::strerror(errno));
            }
            sent += static_cast<size_t>(n);
        }
    }

    std::string socket_;
};
} // namespace

std::shared_ptr<ContainerEngine> make_docker_engine(const std::string& socket_path)
{
    return std::make_shared<DockerEngine>(socket_path);
}

} // namespace mcpgate::container

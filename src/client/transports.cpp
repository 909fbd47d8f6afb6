#include "mcpgate/client/transports.hpp"

#include "mcpgate/container/transport.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/jsonrpc.hpp"
#include "mcpgate/settings.hpp"
#include "mcpgate/util/json.hpp"
#include "mcpgate/util/log.hpp"
#include "mcpgate/util/redact.hpp"

#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <httplib.h>
#include <mutex>

namespace mcpgate::client
{

namespace
{
struct ParsedUrl
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port;
    std::string path; // includes leading '/', query preserved
};

ParsedUrl parse_url(const std::string& url)
{
    ParsedUrl result;
    std::string remaining = url;

    auto scheme_pos = remaining.find("://");
    if (scheme_pos == std::string::npos)
        throw ConfigError("URL must include a scheme: " + util::url_for_logging(url));
    result.scheme = remaining.substr(0, scheme_pos);
    remaining = remaining.substr(scheme_pos + 3);

    if (result.scheme != "http" && result.scheme != "https")
        throw ConfigError("Unsupported URL scheme: " + result.scheme +
                          " (only http and https are allowed)");

    auto slash_pos = remaining.find_first_of("/?");
    std::string authority = remaining.substr(0, slash_pos);
    result.path = slash_pos == std::string::npos ? "/" : remaining.substr(slash_pos);
    if (result.path[0] != '/')
        result.path.insert(result.path.begin(), '/');

    auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority = authority.substr(at + 1);

    const int default_port = result.scheme == "https" ? 443 : 80;
    auto colon_pos = authority.rfind(':');
    if (colon_pos != std::string::npos && authority.find(']', colon_pos) == std::string::npos)
    {
        result.host = authority.substr(0, colon_pos);
        const std::string port_str = authority.substr(colon_pos + 1);
        if (port_str.empty() || port_str.size() > 5 ||
            !std::all_of(port_str.begin(), port_str.end(), [](unsigned char c) { return std::isdigit(c); }))
            throw ConfigError("Invalid port in URL: " + util::url_for_logging(url));
        result.port = std::stoi(port_str);
        if (result.port < 1 || result.port > 65535)
            throw ConfigError("Port out of range in URL: " + util::url_for_logging(url));
    }
    else
    {
        result.host = authority;
        result.port = default_port;
    }
    if (result.host.empty())
        throw ConfigError("URL has no host: " + util::url_for_logging(url));
    return result;
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Incremental text/event-stream decoder yielding the joined data of each event.
class SseDecoder
{
  public:
    std::vector<std::string> feed(const char* data, size_t size)
    {
        std::vector<std::string> out;
        for (size_t i = 0; i < size; ++i)
        {
            char c = data[i];
            if (c == '\r')
                continue;
            if (c != '\n')
            {
                line_.push_back(c);
                continue;
            }
            if (line_.empty())
            {
                if (has_data_)
                    out.push_back(std::move(data_));
                data_.clear();
                has_data_ = false;
                continue;
            }
            if (line_.rfind("data:", 0) == 0)
            {
                std::string part = line_.substr(5);
                if (!part.empty() && part[0] == ' ')
                    part.erase(0, 1);
                if (has_data_)
                    data_.push_back('\n');
                data_ += part;
                has_data_ = true;
            }
            line_.clear();
        }
        return out;
    }

    std::vector<std::string> finish()
    {
        static const char terminator[] = "\n\n";
        return feed(terminator, 2);
    }

  private:
    std::string line_;
    std::string data_;
    bool has_data_{false};
};

} // namespace

void deliver_frame(const TransportCallbacks& callbacks, const FrameEvent& ev,
                   const std::string& label)
{
    try
    {
        if (ev.kind == FrameEvent::Kind::Message)
        {
            if (callbacks.on_message)
                callbacks.on_message(ev.message);
        }
        else if (callbacks.on_parse_error)
        {
            callbacks.on_parse_error(ev.line, ev.error);
        }
    }
    catch (const std::exception& e)
    {
        log::warn(label + " Message handler failed: " + e.what());
    }
}

namespace
{

// Route server-pushed messages to the callbacks and keep the reply to `id`.
void dispatch_payload(const std::string& payload, const Json& id, std::optional<Json>& response,
                      const TransportCallbacks& callbacks)
{
    Json msg = util::json::try_parse(payload);
    if (msg.is_discarded())
    {
        if (callbacks.on_parse_error)
            callbacks.on_parse_error(payload, "malformed JSON in event stream");
        return;
    }
    if (jsonrpc::is_response(msg) && !id.is_null() && msg["id"] == id)
    {
        response = std::move(msg);
        return;
    }
    FrameEvent ev;
    ev.message = std::move(msg);
    deliver_frame(callbacks, ev, "[Session]");
}

void ensure_curl_global_init()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string transport_label(const RemoteServerConfig& cfg)
{
    return (cfg.transport == TransportKind::StreamingHttp ? "[StreamHTTP " : "[HTTP ") + cfg.name +
           "]";
}
} // namespace

std::vector<Json> parse_sse_messages(const std::string& body)
{
    SseDecoder decoder;
    auto payloads = decoder.feed(body.data(), body.size());
    auto rest = decoder.finish();
    payloads.insert(payloads.end(), rest.begin(), rest.end());

    std::vector<Json> messages;
    for (const auto& p : payloads)
    {
        Json msg = util::json::try_parse(p);
        if (!msg.is_discarded())
            messages.push_back(std::move(msg));
    }
    return messages;
}

std::vector<std::pair<std::string, std::string>> http_request_headers(const RemoteServerConfig& cfg)
{
    std::vector<std::pair<std::string, std::string>> headers = {
        {"Accept", "application/json, text/event-stream"}};
    for (const auto& [key, value] : cfg.headers)
        headers.emplace_back(key, value);

    if (cfg.auth.type == AuthConfig::Type::Bearer && !cfg.auth.token.empty())
        headers.push_back(httplib::make_bearer_token_authentication_header(cfg.auth.token));
    else if (cfg.auth.type == AuthConfig::Type::Basic && !cfg.auth.username.empty())
        headers.push_back(
            httplib::make_basic_authentication_header(cfg.auth.username, cfg.auth.password));
    return headers;
}

std::unique_ptr<Transport> make_transport(const RemoteServerConfig& cfg)
{
    switch (cfg.transport)
    {
    case TransportKind::ProcessPython:
    case TransportKind::ProcessNode:
        return std::make_unique<ProcessTransport>(cfg);
    case TransportKind::Container:
        return std::make_unique<container::ContainerTransport>(
            cfg, container::make_docker_engine(Settings::from_env().container_socket));
    case TransportKind::Http:
        return std::make_unique<HttpTransport>(cfg);
    case TransportKind::StreamingHttp:
        return std::make_unique<StreamableHttpTransport>(cfg);
    }
    throw ConfigError("Unsupported transport for server " + cfg.name);
}

// =============================================================================
// HttpTransport
// =============================================================================

HttpTransport::HttpTransport(RemoteServerConfig cfg) : cfg_(std::move(cfg)) {}

void HttpTransport::start(TransportCallbacks callbacks)
{
    parse_url(cfg_.url);
    callbacks_ = std::move(callbacks);
    open_ = true;
    log::debug(transport_label(cfg_) + " Using " + util::url_for_logging(cfg_.url));
}

std::optional<Json> HttpTransport::send(const Json& envelope)
{
    if (!open_)
        throw TransportError("HTTP transport is closed");

    auto url = parse_url(cfg_.url);
    std::string full_url = url.scheme + "://" + url.host + ":" + std::to_string(url.port);
    httplib::Client cli(full_url);

    const auto timeout_ms = cfg_.timeout.count();
    cli.set_connection_timeout(std::chrono::milliseconds(std::min<long long>(timeout_ms, 10000)));
    cli.set_read_timeout(std::chrono::milliseconds(timeout_ms));
    cli.set_write_timeout(std::chrono::milliseconds(timeout_ms));
    // Redirects stay disabled: a 3xx is reported, never followed
    cli.set_follow_location(false);

    httplib::Headers headers;
    for (auto& h : http_request_headers(cfg_))
        headers.emplace(std::move(h.first), std::move(h.second));

    auto res = cli.Post(url.path, headers, envelope.dump(), "application/json");
    if (!res)
        throw TransportError("HTTP request to " + util::url_for_logging(cfg_.url) +
                             " failed: " + httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        throw TransportError("HTTP request failed: " + std::to_string(res->status) + " " +
                             util::error_for_logging(res->body));

    if (!envelope.contains("id"))
        return std::nullopt;

    std::string content_type = lower(res->get_header_value("Content-Type"));
    if (content_type.find("text/event-stream") != std::string::npos)
    {
        std::optional<Json> response;
        SseDecoder decoder;
        auto payloads = decoder.feed(res->body.data(), res->body.size());
        auto rest = decoder.finish();
        payloads.insert(payloads.end(), rest.begin(), rest.end());
        for (const auto& p : payloads)
            dispatch_payload(p, envelope["id"], response, callbacks_);
        if (!response)
            throw TransportError("HTTP event stream ended without a response");
        return response;
    }

    if (res->body.empty())
        throw TransportError("HTTP response body is empty");
    Json parsed = util::json::try_parse(res->body);
    if (parsed.is_discarded())
        throw TransportError("HTTP response is not JSON: " + util::error_for_logging(res->body));
    return parsed;
}

// =============================================================================
// StreamableHttpTransport
// =============================================================================

namespace
{
struct CurlExchange
{
    const TransportCallbacks* callbacks{nullptr};
    Json id;
    std::optional<Json> response;
    std::string content_type;
    std::string session_id;
    std::string body; // non-SSE replies
    SseDecoder decoder;
    bool is_sse() const
    {
        return content_type.find("text/event-stream") != std::string::npos;
    }
};

size_t on_curl_header(char* buffer, size_t size, size_t nitems, void* userdata)
{
    auto* ex = static_cast<CurlExchange*>(userdata);
    std::string line(buffer, size * nitems);
    auto colon = line.find(':');
    if (colon != std::string::npos)
    {
        std::string key = lower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        auto b = value.find_first_not_of(" \t");
        auto e = value.find_last_not_of(" \t\r\n");
        value = (b == std::string::npos) ? "" : value.substr(b, e - b + 1);
        if (key == "content-type")
            ex->content_type = lower(value);
        else if (key == "mcp-session-id")
            ex->session_id = value;
    }
    return size * nitems;
}

size_t on_curl_body(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* ex = static_cast<CurlExchange*>(userdata);
    const size_t n = size * nmemb;
    if (ex->is_sse())
    {
        for (const auto& payload : ex->decoder.feed(ptr, n))
            dispatch_payload(payload, ex->id, ex->response, *ex->callbacks);
    }
    else
    {
        ex->body.append(ptr, n);
    }
    return n;
}

struct CurlHandle
{
    CURL* curl{curl_easy_init()};
    curl_slist* headers{nullptr};
    ~CurlHandle()
    {
        if (headers)
            curl_slist_free_all(headers);
        if (curl)
            curl_easy_cleanup(curl);
    }
    void add_header(const std::string& key, const std::string& value)
    {
        headers = curl_slist_append(headers, (key + ": " + value).c_str());
    }
};
} // namespace

StreamableHttpTransport::StreamableHttpTransport(RemoteServerConfig cfg) : cfg_(std::move(cfg)) {}

StreamableHttpTransport::~StreamableHttpTransport()
{
    close();
}

std::string StreamableHttpTransport::session_id() const
{
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_id_;
}

bool StreamableHttpTransport::has_session() const
{
    std::lock_guard<std::mutex> lock(session_mutex_);
    return !session_id_.empty();
}

void StreamableHttpTransport::set_session_id(const std::string& value)
{
    if (value.empty())
        return;
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_ = value;
}

void StreamableHttpTransport::start(TransportCallbacks callbacks)
{
    parse_url(cfg_.url);
    ensure_curl_global_init();
    callbacks_ = std::move(callbacks);
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_id_.clear();
    }
    open_ = true;
    log::debug(transport_label(cfg_) + " Starting session with " +
               util::url_for_logging(cfg_.url));
}

std::optional<Json> StreamableHttpTransport::send(const Json& envelope)
{
    if (!open_)
        throw TransportError("Streaming HTTP transport is closed");

    CurlHandle h;
    if (!h.curl)
        throw TransportError("libcurl init failed");

    for (const auto& [key, value] : http_request_headers(cfg_))
        h.add_header(key, value);
    h.add_header("Content-Type", "application/json");
    const std::string sid = session_id();
    if (!sid.empty())
        h.add_header("Mcp-Session-Id", sid);

    CurlExchange ex;
    ex.callbacks = &callbacks_;
    ex.id = envelope.contains("id") ? envelope["id"] : Json();

    const std::string body = envelope.dump();
    curl_easy_setopt(h.curl, CURLOPT_URL, cfg_.url.c_str());
    curl_easy_setopt(h.curl, CURLOPT_HTTPHEADER, h.headers);
    curl_easy_setopt(h.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(h.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(h.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(h.curl, CURLOPT_HEADERFUNCTION, &on_curl_header);
    curl_easy_setopt(h.curl, CURLOPT_HEADERDATA, &ex);
    curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION, &on_curl_body);
    curl_easy_setopt(h.curl, CURLOPT_WRITEDATA, &ex);
    curl_easy_setopt(h.curl, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(h.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h.curl, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg_.timeout.count()));

    CURLcode code = curl_easy_perform(h.curl);
    long status = 0;
    curl_easy_getinfo(h.curl, CURLINFO_RESPONSE_CODE, &status);

    if (code != CURLE_OK)
        throw TransportError("Streaming HTTP request to " + util::url_for_logging(cfg_.url) +
                             " failed: " + curl_easy_strerror(code));

    set_session_id(ex.session_id);

    if (status == 404 && !sid.empty())
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_id_.clear();
        throw TransportError("Streaming HTTP session expired");
    }
    if (status < 200 || status >= 300)
        throw TransportError("Streaming HTTP request failed: " + std::to_string(status) + " " +
                             util::error_for_logging(ex.body));

    if (ex.is_sse())
    {
        for (const auto& payload : ex.decoder.finish())
            dispatch_payload(payload, ex.id, ex.response, callbacks_);
    }
    else if (!ex.body.empty())
    {
        dispatch_payload(ex.body, ex.id, ex.response, callbacks_);
    }

    if (ex.id.is_null())
        return std::nullopt;
    if (!ex.response)
        throw TransportError("Streaming HTTP reply carried no response for request " +
                             util::json::id_key(ex.id));
    return ex.response;
}

void StreamableHttpTransport::close()
{
    if (!open_.exchange(false))
        return;

    const std::string sid = session_id();
    if (sid.empty())
        return;

    // Best-effort session termination
    CurlHandle h;
    if (!h.curl)
        return;
    for (const auto& [key, value] : http_request_headers(cfg_))
        h.add_header(key, value);
    h.add_header("Mcp-Session-Id", sid);
    curl_easy_setopt(h.curl, CURLOPT_URL, cfg_.url.c_str());
    curl_easy_setopt(h.curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    curl_easy_setopt(h.curl, CURLOPT_HTTPHEADER, h.headers);
    curl_easy_setopt(h.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.curl, CURLOPT_TIMEOUT_MS, 2000L);
    curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION,
                     +[](char*, size_t size, size_t nmemb, void*) -> size_t { return size * nmemb; });
    CURLcode code = curl_easy_perform(h.curl);
    if (code != CURLE_OK)
        log::debug(transport_label(cfg_) + " Session termination failed: " +
                   curl_easy_strerror(code));

    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_.clear();
}

} // namespace mcpgate::client

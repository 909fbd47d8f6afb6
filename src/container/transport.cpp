#include "mcpgate/container/transport.hpp"

#include "mcpgate/container/create_options.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/util/log.hpp"

namespace mcpgate::container
{

namespace
{
constexpr int kReadPollMs = 100;

std::string join(const std::vector<std::string>& items)
{
    std::string out;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += items[i];
    }
    return out;
}

std::string label_value(const ContainerInfo& info, const char* key)
{
    auto it = info.labels.find(key);
    return it == info.labels.end() ? std::string() : it->second;
}
} // namespace

ContainerTransport::ContainerTransport(client::RemoteServerConfig cfg,
                                       std::shared_ptr<ContainerEngine> engine)
    : cfg_(std::move(cfg)), engine_(std::move(engine))
{
}

ContainerTransport::~ContainerTransport()
{
    close();
}

std::string ContainerTransport::label() const
{
    return "[Docker " + cfg_.name + "]";
}

std::string ContainerTransport::container_id() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}

void ContainerTransport::start(client::TransportCallbacks callbacks)
{
    if (open_)
        return;

    engine_->ping();

    const auto name = cfg_.effective_container_name();
    const bool remove_on_exit = cfg_.effective_remove_on_exit();

    CreateOptions options = build_create_options(cfg_, name, remove_on_exit);
    if (!options.unsupported.empty())
        throw ConfigError("Unsupported container option(s) for " + cfg_.name + ": " +
                          join(options.unsupported));

    const std::string signature = compute_signature(options.body);
    apply_managed_labels(options.body, cfg_.name, signature);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        remove_on_exit_ = remove_on_exit;
        auto_remove_ = options.auto_remove();
        removed_ = false;
        id_.clear();
    }

    prepare_container(options.name, options.body, signature);
    const std::string id = container_id();

    try
    {
        stream_ = engine_->attach(id);
    }
    catch (const Error& e)
    {
        dispose();
        throw ConnectionError(label() + " Failed to attach to container " + id + ": " + e.what());
    }

    try
    {
        engine_->start(id);
    }
    catch (const Error& e)
    {
        stream_->close();
        try
        {
            engine_->stop(id, 0);
        }
        catch (const Error& stop_error)
        {
            log::warn(label() + " " + stop_error.what());
        }
        {
            // The engine only auto-removes containers that ran
            std::lock_guard<std::mutex> lock(mutex_);
            auto_remove_ = false;
        }
        dispose();
        throw ConnectionError(label() + " Failed to start container " +
                              name.value_or(id) + ": " + e.what());
    }

    log::info(label() + " Container " + id.substr(0, 12) +
              (created_new_ ? " created and started" : " reused and started"));

    callbacks_ = std::move(callbacks);
    demuxer_ = std::make_unique<StreamDemuxer>(options.tty());
    framer_.reset();
    closing_ = false;
    open_ = true;
    reader_ = std::thread([this] { reader_loop(); });
}

void ContainerTransport::prepare_container(const std::optional<std::string>& name,
                                           const Json& body, const std::string& signature)
{
    if (name)
    {
        if (auto existing = engine_->inspect(*name))
        {
            const bool managed = label_value(*existing, LABEL_MANAGED) == "true" &&
                                 label_value(*existing, LABEL_SERVER) == cfg_.name;
            if (!managed)
                throw ConnectionError(label() + " Container name " + *name +
                                      " is already in use by a container not managed by this "
                                      "server");

            if (cfg_.reuse_container && label_value(*existing, LABEL_SIGNATURE) == signature)
            {
                if (existing->running)
                {
                    log::debug(label() + " Stopping running container " + *name + " before reuse");
                    engine_->stop(existing->id, 0);
                }
                std::lock_guard<std::mutex> lock(mutex_);
                id_ = existing->id;
                created_new_ = false;
                return;
            }

            log::info(label() + " Configuration changed, recreating container " + *name);
            engine_->remove(existing->id, true);
        }
    }

    std::string id = engine_->create(body, name);
    std::lock_guard<std::mutex> lock(mutex_);
    id_ = std::move(id);
    created_new_ = true;
}

std::optional<Json> ContainerTransport::send(const Json& envelope)
{
    if (!open_)
        throw TransportError(label() + " Container is not running");

    const std::string line = client::MessageFramer::serialize(envelope);
    std::lock_guard<std::mutex> lock(write_mutex_);
    stream_->write(line);
    return std::nullopt;
}

void ContainerTransport::reader_loop()
{
    char buf[8192];

    try
    {
        for (;;)
        {
            auto n = stream_->read(buf, sizeof(buf), kReadPollMs);
            if (!n)
                continue;
            if (*n == 0)
                break;

            for (auto& chunk : demuxer_->feed(buf, *n))
            {
                if (chunk.stream == StreamType::Stderr)
                {
                    log::debug(label() + " stderr: " + chunk.data);
                    if (callbacks_.on_stderr)
                        callbacks_.on_stderr(chunk.data);
                    continue;
                }
                if (chunk.stream != StreamType::Stdout)
                    continue;

                for (auto& ev : framer_.feed(chunk.data))
                {
                    client::deliver_frame(callbacks_, ev, label());
                }
            }
        }
    }
    catch (const TransportError& e)
    {
        if (!closing_)
            log::warn(label() + " Attach stream failed: " + e.what());
    }

    open_ = false;
    if (closing_)
        return;

    int exit_code = -1;
    try
    {
        exit_code = engine_->wait(container_id());
    }
    catch (const Error& e)
    {
        log::warn(label() + " Could not read exit code: " + e.what());
    }

    log::debug(label() + " Container exited with code " + std::to_string(exit_code));
    dispose();
    if (!closing_ && callbacks_.on_exit)
        callbacks_.on_exit(exit_code);
}

void ContainerTransport::dispose()
{
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (removed_ || id_.empty())
            return;
        removed_ = true;
        if (!remove_on_exit_ || auto_remove_)
            return;
        id = id_;
    }

    try
    {
        engine_->remove(id, true);
        log::debug(label() + " Removed container " + id.substr(0, 12));
    }
    catch (const Error& e)
    {
        log::warn(label() + " Failed to remove container " + id.substr(0, 12) + ": " + e.what());
    }
}

void ContainerTransport::close()
{
    if (!stream_)
        return;

    if (!closing_.exchange(true))
    {
        const std::string id = container_id();
        try
        {
            engine_->stop(id, 0);
        }
        catch (const Error& e)
        {
            log::warn(label() + " Failed to stop container " + id.substr(0, 12) + ": " + e.what());
        }
        stream_->close();
    }

    if (reader_.joinable())
    {
        if (reader_.get_id() == std::this_thread::get_id())
            reader_.detach();
        else
            reader_.join();
    }
    open_ = false;
    dispose();
}

} // namespace mcpgate::container

#include "../internal/process.hpp"
#include "mcpgate/client/transports.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/util/log.hpp"
#include "mcpgate/util/redact.hpp"

#include <chrono>
#include <csignal>
#include <mutex>

namespace mcpgate::client
{

namespace
{
// A child that ignores SIGTERM gets SIGKILL after this long.
constexpr long long kTerminateGraceMs = 2000;

long long now_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

void ignore_sigpipe()
{
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}
} // namespace

ProcessTransport::ProcessTransport(RemoteServerConfig cfg) : cfg_(std::move(cfg)) {}

ProcessTransport::~ProcessTransport()
{
    close();
}

std::string ProcessTransport::label() const
{
    return (cfg_.transport == TransportKind::ProcessPython ? "[UVX " : "[NodePkg ") + cfg_.name +
           "]";
}

ProcessTransport::Launch ProcessTransport::resolve_launch(const RemoteServerConfig& cfg)
{
    Launch launch;
    if (cfg.transport == TransportKind::ProcessPython)
    {
        launch.program = "uvx";
        launch.args.push_back(cfg.command);
        launch.args.insert(launch.args.end(), cfg.args.begin(), cfg.args.end());
        return launch;
    }

    if (cfg.transport != TransportKind::ProcessNode)
        throw ConfigError("Not a process transport: " + to_string(cfg.transport));

    const bool have_npx = process::find_executable("npx").has_value();
    const bool have_npm = process::find_executable("npm").has_value();

    if (have_npx && !(cfg.prefer_npm_exec && have_npm))
    {
        launch.program = "npx";
        launch.args = cfg.runner_args;
        launch.args.push_back(cfg.command);
    }
    else if (have_npm)
    {
        launch.program = "npm";
        launch.args.push_back("exec");
        launch.args.insert(launch.args.end(), cfg.runner_args.begin(), cfg.runner_args.end());
        launch.args.push_back("--");
        launch.args.push_back(cfg.command);
    }
    else
    {
        throw ConnectionError("Neither npx nor npm found in PATH (server " + cfg.name + ")");
    }
    launch.args.insert(launch.args.end(), cfg.args.begin(), cfg.args.end());
    return launch;
}

void ProcessTransport::start(TransportCallbacks callbacks)
{
    if (open_)
        return;

    ignore_sigpipe();
    callbacks_ = std::move(callbacks);
    Launch launch = resolve_launch(cfg_);

    log::debug(label() + " Spawning " + util::command_for_logging(launch.program, launch.args));

    process::ProcessOptions options;
    options.environment = cfg_.env;
    options.redirect_stderr = true;

    auto proc = std::make_unique<process::Process>();
    try
    {
        proc->spawn(launch.program, launch.args, options);
    }
    catch (const process::ProcessError& e)
    {
        throw ConnectionError(label() + " Failed to launch: " + e.what());
    }

    log::debug(label() + " Spawned process PID " + std::to_string(proc->pid()));
    process_ = std::move(proc);
    framer_.reset();
    closing_ = false;
    close_requested_ms_ = 0;
    open_ = true;
    reader_ = std::thread([this] { reader_loop(); });
}

std::optional<Json> ProcessTransport::send(const Json& envelope)
{
    if (!open_)
        throw TransportError(label() + " Process is not running");

    const std::string line = MessageFramer::serialize(envelope);
    std::lock_guard<std::mutex> lock(write_mutex_);
    try
    {
        process_->stdin_pipe().write(line);
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError(label() + " Write failed: " + e.what());
    }
    return std::nullopt;
}

void ProcessTransport::reader_loop()
{
    char buf[4096];
    int exit_code = -1;

    try
    {
        for (;;)
        {
            auto& out = *process_;
            bool progressed = false;

            if (out.stdout_pipe_open())
            {
                if (out.stdout_pipe().has_data(20))
                {
                    size_t n = out.stdout_pipe().read(buf, sizeof(buf));
                    if (n == 0)
                    {
                        out.stdout_pipe().close();
                    }
                    else
                    {
                        progressed = true;
                        for (auto& ev : framer_.feed(buf, n))
                        {
                            deliver_frame(callbacks_, ev, label());
                        }
                    }
                }
            }

            if (out.stderr_pipe_open() && out.stderr_pipe().has_data(0))
            {
                size_t n = out.stderr_pipe().read(buf, sizeof(buf));
                if (n == 0)
                {
                    out.stderr_pipe().close();
                }
                else
                {
                    progressed = true;
                    std::string text(buf, n);
                    log::debug(label() + " stderr: " + text);
                    if (callbacks_.on_stderr)
                        callbacks_.on_stderr(text);
                }
            }

            if (!out.stdout_pipe_open())
            {
                if (auto code = out.try_wait())
                {
                    exit_code = *code;
                    break;
                }
                if (!progressed)
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }

            if (closing_)
            {
                auto requested = close_requested_ms_.load();
                if (requested > 0 && now_ms() - requested > kTerminateGraceMs)
                    out.kill();
            }
        }
    }
    catch (const process::ProcessError& e)
    {
        log::warn(label() + " Reader stopped: " + e.what());
        process_->kill();
        try
        {
            exit_code = process_->wait();
        }
        catch (const process::ProcessError& wait_error)
        {
            log::warn(label() + " " + wait_error.what());
        }
    }

    open_ = false;
    log::debug(label() + " Process exited with code " + std::to_string(exit_code));
    if (!closing_ && callbacks_.on_exit)
        callbacks_.on_exit(exit_code);
}

void ProcessTransport::close()
{
    if (!process_)
        return;

    if (!closing_.exchange(true))
    {
        close_requested_ms_ = now_ms();
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            process_->close_stdin();
        }
        process_->terminate();
    }

    if (reader_.joinable())
    {
        if (reader_.get_id() == std::this_thread::get_id())
            reader_.detach();
        else
            reader_.join();
    }
    open_ = false;
}

int ProcessTransport::pid() const
{
    return process_ ? process_->pid() : 0;
}

} // namespace mcpgate::client

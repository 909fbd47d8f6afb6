// POSIX implementation of child-process management

#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <signal.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace mcpgate::process
{

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

namespace
{

std::string errno_message()
{
    return std::strerror(errno);
}

/// Owns both ends of a pipe(2) until they are released to the child or parent.
struct FdPair
{
    int fds[2] = {-1, -1};

    FdPair() = default;
    FdPair(const FdPair&) = delete;
    FdPair& operator=(const FdPair&) = delete;

    ~FdPair()
    {
        close_read();
        close_write();
    }

    void open(const char* what)
    {
        if (::pipe(fds) != 0)
            throw ProcessError(std::string("Failed to create ") + what +
                               " pipe: " + errno_message());
    }

    int read_end() const
    {
        return fds[0];
    }
    int write_end() const
    {
        return fds[1];
    }

    void close_read()
    {
        if (fds[0] >= 0)
        {
            ::close(fds[0]);
            fds[0] = -1;
        }
    }

    void close_write()
    {
        if (fds[1] >= 0)
        {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }

    int release_read()
    {
        int fd = fds[0];
        fds[0] = -1;
        return fd;
    }

    int release_write()
    {
        int fd = fds[1];
        fds[1] = -1;
        return fd;
    }
};

[[noreturn]] void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// =============================================================================
// ReadPipe
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    for (;;)
    {
        ssize_t n = ::read(handle_->fd, buffer, size);
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("Read failed: " + errno_message());
    }
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = ::select(handle_->fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("select failed: " + errno_message());
    }
    return result > 0 && FD_ISSET(handle_->fd, &read_fds);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    size_t total = 0;
    while (total < size)
    {
        ssize_t n = ::write(handle_->fd, data + total, size - total);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + errno_message());
        }
        total += static_cast<size_t>(n);
    }
    return total;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();
    if (stderr_)
        stderr_->close();

    if (handle_ && handle_->running)
    {
        terminate();
        try
        {
            wait();
        }
        catch (const ProcessError&)
        {
            // already reaped elsewhere
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    FdPair in, out, err, error_pipe;
    if (options.redirect_stdin)
        in.open("stdin");
    if (options.redirect_stdout)
        out.open("stdout");
    if (options.redirect_stderr)
        err.open("stderr");
    error_pipe.open("error");
    ::fcntl(error_pipe.write_end(), F_SETFD, FD_CLOEXEC);

    // Only the dup2'd copies survive exec in the child
    for (FdPair* p : {&in, &out, &err})
    {
        for (int fd : p->fds)
            if (fd >= 0)
                ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }

    // Build argv and envp before fork; only async-signal-safe calls follow in the child
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::map<std::string, std::string> env_map;
    if (options.inherit_environment && environ)
    {
        for (char** e = environ; *e; ++e)
        {
            std::string entry(*e);
            auto eq = entry.find('=');
            if (eq == std::string::npos)
                continue;
            env_map[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        env_map[key] = value;

    std::vector<std::string> env_storage;
    env_storage.reserve(env_map.size());
    for (const auto& [key, value] : env_map)
        env_storage.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& entry : env_storage)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::string resolved = executable;
    if (executable.find('/') == std::string::npos)
    {
        if (auto found = find_executable(executable))
            resolved = *found;
    }

    pid_t pid = ::fork();
    if (pid < 0)
        throw ProcessError("Failed to fork process: " + errno_message());

    if (pid == 0)
    {
        int efd = error_pipe.write_end();
        if (options.redirect_stdin && ::dup2(in.read_end(), STDIN_FILENO) < 0)
            child_fail(efd);
        if (options.redirect_stdout && ::dup2(out.write_end(), STDOUT_FILENO) < 0)
            child_fail(efd);
        if (options.redirect_stderr && ::dup2(err.write_end(), STDERR_FILENO) < 0)
            child_fail(efd);

        if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
            child_fail(efd);

        ::execve(resolved.c_str(), argv.data(), envp.data());
        child_fail(efd);
    }

    error_pipe.close_write();
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_pipe.read_end(), &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);

    if (error_bytes > 0)
    {
        ::waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to execute '" + executable + "': " + std::strerror(child_errno));
    }

    if (options.redirect_stdin)
        stdin_->handle_->fd = in.release_write();
    if (options.redirect_stdout)
        stdout_->handle_->fd = out.release_read();
    if (options.redirect_stderr)
        stderr_->handle_->fd = err.release_read();

    handle_->pid = pid;
    handle_->running = true;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_ || !stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

bool Process::stdout_pipe_open() const
{
    return stdout_ && stdout_->is_open();
}

bool Process::stderr_pipe_open() const
{
    return stderr_ && stderr_->is_open();
}

void Process::close_stdin()
{
    if (stdin_)
        stdin_->close();
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    if (::kill(handle_->pid, 0) == 0)
        return true;
    return errno != ESRCH;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result = ::waitpid(handle_->pid, &status, WNOHANG);
    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;

    throw ProcessError("waitpid failed: " + errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result;
    do
    {
        result = ::waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    handle_->running = false;
    throw ProcessError("waitpid failed: " + errno_message());
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// =============================================================================
// Utility functions
// =============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto runnable = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos)
    {
        if (runnable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();
        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (runnable(candidate))
                return candidate.string();
        }
        start = end + 1;
    }
    return std::nullopt;
}

} // namespace mcpgate::process

// POSIX process management for the git subprocesses the helper drives

#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace dokuwiki
{
namespace subprocess
{

// ============================================================================
// Handles
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static void close_pair(int pair[2])
{
    for (int i = 0; i < 2; ++i)
    {
        if (pair[i] >= 0)
        {
            ::close(pair[i]);
            pair[i] = -1;
        }
    }
}

static int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// ============================================================================
// ReadPipe
// ============================================================================

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
        throw std::runtime_error("Pipe is not open");

    for (;;)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno != EINTR)
            throw std::runtime_error("Read failed: " + get_errno_message());
    }
}

std::string ReadPipe::read_line(size_t max_size)
{
    std::string line;
    char ch;
    while (line.size() < max_size)
    {
        if (read(&ch, 1) == 0)
            break;
        line.push_back(ch);
        if (ch == '\n')
            break;
    }
    return line;
}

std::string ReadPipe::read_all()
{
    std::string data;
    char buffer[8192];
    size_t n;
    while ((n = read(buffer, sizeof(buffer))) > 0)
        data.append(buffer, n);
    return data;
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

int ReadPipe::fd() const
{
    return handle_ ? handle_->fd : -1;
}

// ============================================================================
// WritePipe
// ============================================================================

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
        throw std::runtime_error("Pipe is not open");

    for (;;)
    {
        ssize_t bytes_written = ::write(handle_->fd, data, size);
        if (bytes_written >= 0)
            return static_cast<size_t>(bytes_written);
        if (errno == EINTR)
            continue;
        if (errno == EPIPE)
            throw std::runtime_error("Broken pipe (process closed stdin)");
        throw std::runtime_error("Write failed: " + get_errno_message());
    }
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::write_all(const std::string& data)
{
    size_t offset = 0;
    while (offset < data.size())
        offset += write(data.data() + offset, data.size() - offset);
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

int WritePipe::fd() const
{
    return handle_ ? handle_->fd : -1;
}

// ============================================================================
// Process
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        terminate();
        int status;
        waitpid(handle_->pid, &status, 0);
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    auto cleanup = [&]()
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
    };

    if (options.redirect_stdin && pipe(stdin_pipe) != 0)
    {
        cleanup();
        throw std::runtime_error("Failed to create stdin pipe: " + get_errno_message());
    }
    if (options.redirect_stdout && pipe(stdout_pipe) != 0)
    {
        cleanup();
        throw std::runtime_error("Failed to create stdout pipe: " + get_errno_message());
    }
    if (options.redirect_stderr && pipe(stderr_pipe) != 0)
    {
        cleanup();
        throw std::runtime_error("Failed to create stderr pipe: " + get_errno_message());
    }

    // Everything the child needs is prepared before fork
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        cleanup();
        throw std::runtime_error("Failed to fork process: " + get_errno_message());
    }

    if (pid == 0)
    {
        if (options.redirect_stdin)
        {
            ::close(stdin_pipe[1]);
            if (dup2(stdin_pipe[0], STDIN_FILENO) < 0)
                _exit(127);
            ::close(stdin_pipe[0]);
        }
        if (options.redirect_stdout)
        {
            ::close(stdout_pipe[0]);
            if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
                _exit(127);
            ::close(stdout_pipe[1]);
        }
        if (options.redirect_stderr)
        {
            ::close(stderr_pipe[0]);
            if (dup2(stderr_pipe[1], STDERR_FILENO) < 0)
                _exit(127);
            ::close(stderr_pipe[1]);
        }

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            _exit(127);

        if (!options.inherit_environment)
            clearenv();
        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        signal(SIGPIPE, SIG_DFL);
        execvp(executable.c_str(), argv.data());
        _exit(127);
    }

    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]);
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_pipe[1];
    }
    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe[0];
    }
    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]);
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::runtime_error("stderr not redirected");
    return *stderr_;
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
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return handle_ ? handle_->exit_code : -1;

    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);
    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;
    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return handle_ ? handle_->exit_code : -1;

    int status;
    pid_t result;
    do
        result = waitpid(handle_->pid, &status, 0);
    while (result < 0 && errno == EINTR);

    if (result != handle_->pid)
        throw std::runtime_error("waitpid failed: " + get_errno_message());

    handle_->exit_code = decode_status(status);
    handle_->running = false;
    return handle_->exit_code;
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// ============================================================================
// Helpers
// ============================================================================

ProcessResult run(const std::string& executable, const std::vector<std::string>& args,
                  const std::string& input, const ProcessOptions& options)
{
    ProcessOptions effective = options;
    effective.redirect_stdin = true;
    effective.redirect_stdout = true;

    Process proc;
    proc.spawn(executable, args, effective);

    WritePipe& in = proc.stdin_pipe();
    ReadPipe& out = proc.stdout_pipe();
    ReadPipe* err = effective.redirect_stderr ? &proc.stderr_pipe() : nullptr;

    if (input.empty())
        in.close();
    else
        fcntl(in.fd(), F_SETFL, fcntl(in.fd(), F_GETFL, 0) | O_NONBLOCK);

    ProcessResult result;
    size_t written = 0;
    char buffer[8192];

    while (in.is_open() || out.is_open() || (err && err->is_open()))
    {
        std::vector<pollfd> fds;
        if (in.is_open())
            fds.push_back({in.fd(), POLLOUT, 0});
        if (out.is_open())
            fds.push_back({out.fd(), POLLIN, 0});
        if (err && err->is_open())
            fds.push_back({err->fd(), POLLIN, 0});

        if (poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::runtime_error("poll failed: " + get_errno_message());
        }

        for (const auto& p : fds)
        {
            if (p.revents == 0)
                continue;

            if (p.fd == in.fd())
            {
                ssize_t n = ::write(p.fd, input.data() + written, input.size() - written);
                if (n > 0)
                    written += static_cast<size_t>(n);
                // A child that stops reading early is not an error here;
                // its exit status tells the caller what happened.
                if ((n < 0 && errno != EAGAIN && errno != EINTR) || written == input.size())
                    in.close();
            }
            else
            {
                ReadPipe& pipe = (p.fd == out.fd()) ? out : *err;
                std::string& sink = (p.fd == out.fd()) ? result.out : result.err;
                size_t n = pipe.read(buffer, sizeof(buffer));
                if (n == 0)
                    pipe.close();
                else
                    sink.append(buffer, n);
            }
        }
    }

    result.exit_code = proc.wait();
    return result;
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& path)
    {
        std::error_code ec;
        return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
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
        if (!dir.empty() && is_executable(fs::path(dir) / name))
            return (fs::path(dir) / name).string();
        start = end + 1;
    }
    return std::nullopt;
}

} // namespace subprocess
} // namespace dokuwiki

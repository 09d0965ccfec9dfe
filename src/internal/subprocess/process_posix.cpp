// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace toolhost
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

// Both ends close-on-exec so concurrently spawned children never inherit them.
// dup2() onto 0/1/2 in the child clears the flag on the duplicate.
static void make_pipe(int fds[2], const char* what)
{
#if defined(__linux__)
    if (::pipe2(fds, O_CLOEXEC) != 0)
        throw std::runtime_error(std::string("Failed to create ") + what +
                                 " pipe: " + get_errno_message());
#else
    if (::pipe(fds) != 0)
        throw std::runtime_error(std::string("Failed to create ") + what +
                                 " pipe: " + get_errno_message());
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
}

static void close_pipe(int fds[2])
{
    if (fds[0] >= 0)
        ::close(fds[0]);
    if (fds[1] >= 0)
        ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

static int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Writing to a child that exited must surface as EPIPE, not kill this process
static void ignore_sigpipe_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Child-side only: async-signal-safe redirection of one stream
static void redirect_fd(int fd, int target)
{
    if (fd == target)
    {
        ::fcntl(fd, F_SETFD, 0);
        return;
    }
    if (::dup2(fd, target) < 0)
        _exit(127);
}

// ============================================================================
// ReadPipe implementation
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

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw std::runtime_error("Read failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_read);
}

std::string ReadPipe::read_line(size_t max_size)
{
    std::string line;
    line.reserve(256);

    char ch;
    while (line.size() < max_size)
    {
        if (read(&ch, 1) == 0)
            break; // EOF

        line.push_back(ch);
        if (ch == '\n')
            break;
    }

    return line;
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

    int result = select(handle_->fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw std::runtime_error("select failed: " + get_errno_message());
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

// ============================================================================
// WritePipe implementation
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

    size_t total = 0;
    while (total < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total, size - total);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw std::runtime_error("Broken pipe (process closed stdin)");
            throw std::runtime_error("Write failed: " + get_errno_message());
        }
        total += static_cast<size_t>(bytes_written);
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

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (is_running())
    {
        kill();
        wait();
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    ignore_sigpipe_once();

    // Everything the child needs is prepared before fork(); the child only
    // calls async-signal-safe functions.
    std::map<std::string, std::string> env;
    if (options.inherit_environment && environ)
    {
        for (char** entry = environ; *entry != nullptr; ++entry)
        {
            std::string item(*entry);
            auto eq = item.find('=');
            if (eq != std::string::npos && eq > 0)
                env[item.substr(0, eq)] = item.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        env[key] = value;

    std::optional<std::string> search_path;
    if (auto it = env.find("PATH"); it != env.end())
        search_path = it->second;

    auto resolved = find_executable(executable, search_path);
    if (!resolved)
        throw std::runtime_error("Executable not found: " + executable + ": " +
                                 get_errno_message(ENOENT));

    std::vector<std::string> env_strings;
    env_strings.reserve(env.size());
    for (const auto& [key, value] : env)
        env_strings.push_back(key + "=" + value);

    std::vector<char*> envp;
    for (auto& item : env_strings)
        envp.push_back(item.data());
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    try
    {
        if (options.redirect_stdin)
            make_pipe(stdin_pipe, "stdin");
        if (options.redirect_stdout)
            make_pipe(stdout_pipe, "stdout");
        if (options.redirect_stderr)
            make_pipe(stderr_pipe, "stderr");
        make_pipe(status_pipe, "exec status");
    }
    catch (const std::runtime_error&)
    {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        throw;
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        throw std::runtime_error("Failed to fork process: " + get_errno_message(err));
    }

    if (pid == 0)
    {
        // Child process
        ::close(status_pipe[0]);

        if (options.redirect_stdin)
            redirect_fd(stdin_pipe[0], STDIN_FILENO);
        if (options.redirect_stdout)
            redirect_fd(stdout_pipe[1], STDOUT_FILENO);
        if (options.redirect_stderr)
            redirect_fd(stderr_pipe[1], STDERR_FILENO);

        std::signal(SIGPIPE, SIG_DFL);

        if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
        {
            int err = errno;
            (void)!::write(status_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        ::execve(resolved->c_str(), argv.data(), envp.data());

        int err = errno;
        (void)!::write(status_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    // Parent process
    ::close(status_pipe[1]);

    if (options.redirect_stdin)
        ::close(stdin_pipe[0]);
    if (options.redirect_stdout)
        ::close(stdout_pipe[1]);
    if (options.redirect_stderr)
        ::close(stderr_pipe[1]);

    // EOF on the status pipe means exec succeeded
    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        if (options.redirect_stdin)
            ::close(stdin_pipe[1]);
        if (options.redirect_stdout)
            ::close(stdout_pipe[0]);
        if (options.redirect_stderr)
            ::close(stderr_pipe[0]);
        throw std::runtime_error("Failed to execute " + *resolved + ": " +
                                 get_errno_message(child_errno));
    }

    if (options.redirect_stdin)
    {
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (options.redirect_stdout)
    {
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
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

    int status = 0;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);
    if (result == 0)
        return true;

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return false;
    }

    // ECHILD: reaped elsewhere
    if (errno == ECHILD)
    {
        handle_->running = false;
        return false;
    }
    return true;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

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
    if (errno == EINTR)
        return std::nullopt;

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
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

std::optional<int> Process::exit_code() const
{
    if (!handle_ || handle_->pid == 0 || handle_->running)
        return std::nullopt;
    return handle_->exit_code;
}

// ============================================================================
// Helper functions
// ============================================================================

static bool is_executable_file(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> find_executable(const std::string& name,
                                           const std::optional<std::string>& search_path)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    fs::path exe_path(name);
    if (exe_path.is_absolute())
    {
        if (is_executable_file(exe_path))
            return name;
        return std::nullopt;
    }

    // Relative path with a separator
    if (name.find('/') != std::string::npos)
    {
        if (is_executable_file(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    std::string path_str;
    if (search_path)
    {
        path_str = *search_path;
    }
    else if (const char* path_env = std::getenv("PATH"))
    {
        path_str = path_env;
    }
    else
    {
        // No PATH set - try current directory
        if (is_executable_file(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path test_path = fs::path(dir) / name;
            if (is_executable_file(test_path))
                return test_path.string();
        }

        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace toolhost

#ifndef TOOLHOST_SUBPROCESS_PROCESS_HPP
#define TOOLHOST_SUBPROCESS_PROCESS_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolhost
{
namespace subprocess
{

struct ProcessHandle;
struct PipeHandle;

// Pipe for reading from subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Read up to size bytes, returns actual bytes read
    // Returns 0 on EOF, throws on error
    size_t read(char* buffer, size_t size);

    // Read a line (up to newline or max_size)
    std::string read_line(size_t max_size = 4096);

    // Wait up to timeout_ms for data or EOF
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Pipe for writing to subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // Writes all of data; throws on error (EPIPE when the child closed its stdin)
    size_t write(const char* data, size_t size);
    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    // When false the child sees only `environment`
    bool inherit_environment = true;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Spawn a process. Throws std::runtime_error if the executable cannot be found,
    // the working directory is invalid, or exec fails.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Get pipes (only valid if redirected)
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    // Reaps the child if it has exited
    bool is_running() const;
    std::optional<int> try_wait(); // Non-blocking, returns exit code if done
    int wait();                    // Blocking, returns exit code
    void terminate();              // SIGTERM
    void kill();                   // SIGKILL

    int pid() const;

    // 128 + signal number for signalled children
    std::optional<int> exit_code() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// Find an executable. Bare names are searched in `search_path` (colon separated),
// or in this process's PATH when not given.
std::optional<std::string> find_executable(const std::string& name,
                                           const std::optional<std::string>& search_path = {});

} // namespace subprocess
} // namespace toolhost

#endif // TOOLHOST_SUBPROCESS_PROCESS_HPP

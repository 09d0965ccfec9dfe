#include "subprocess_transport.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <toolhost/errors.hpp>

namespace toolhost
{
namespace internal
{

SubprocessTransport::SubprocessTransport(LaunchCommand command, TransportSettings settings)
    : command_(std::move(command)), settings_(std::move(settings)),
      framer_(std::make_unique<protocol::StdioFramer>(settings_.max_message_buffer_size))
{
    framer_->set_diagnostic_callback([this](const std::string& line) { emit_diagnostic(line); });
}

SubprocessTransport::~SubprocessTransport()
{
    close();
}

void SubprocessTransport::connect()
{
    if (closed_)
        throw ConnectionError("Transport already closed");

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (process_ && process_->is_running())
            return; // Already connected
    }

    subprocess::ProcessOptions proc_opts;
    proc_opts.redirect_stdin = true;
    proc_opts.redirect_stdout = true;
    proc_opts.redirect_stderr = true;
    proc_opts.inherit_environment = command_.inherit_environment;
    proc_opts.environment = command_.environment;
    if (command_.working_directory)
        proc_opts.working_directory = *command_.working_directory;

    auto process = std::make_unique<subprocess::Process>();
    try
    {
        process->spawn(command_.executable, command_.args, proc_opts);
    }
    catch (const std::runtime_error& e)
    {
        throw ConnectionError("Failed to start " + command_.executable + " (" +
                              command_.strategy_name + "): " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process_ = std::move(process);
    }

    start_reader();
    start_stderr_reader();

    ready_ = true;
}

void SubprocessTransport::write(const std::string& data)
{
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!ready_ || !process_)
        throw ConnectionError("Transport is not ready for writing");

    if (!process_->stdin_pipe().is_open())
        throw ConnectionError("Cannot write after input was closed");

    try
    {
        process_->stdin_pipe().write(data);
    }
    catch (const std::runtime_error& e)
    {
        throw ConnectionError(std::string("Cannot write to terminated process: ") + e.what());
    }
}

std::vector<json> SubprocessTransport::read_messages()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);

    // Wait for messages with timeout
    queue_cv_.wait_for(lock, std::chrono::milliseconds(100),
                       [this] { return !message_queue_.empty() || queue_stopped_; });

    std::vector<json> messages;
    while (!message_queue_.empty())
    {
        messages.push_back(std::move(message_queue_.front()));
        message_queue_.pop();
    }

    return messages;
}

bool SubprocessTransport::has_messages() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return !message_queue_.empty() || (!queue_stopped_ && running_);
}

void SubprocessTransport::close()
{
    shutdown(true);
}

void SubprocessTransport::kill()
{
    shutdown(false);
}

void SubprocessTransport::shutdown(bool graceful)
{
    if (closed_.exchange(true))
        return;

    ready_ = false;

    stop_reader();
    stop_stderr_reader();

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (process_ && process_->stdin_pipe().is_open())
            process_->stdin_pipe().close();
    }

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (process_)
        {
            try
            {
                if (graceful && !process_->try_wait())
                {
                    process_->terminate();

                    auto deadline = std::chrono::steady_clock::now() +
                                    std::chrono::milliseconds(settings_.termination_grace_ms);
                    while (!process_->try_wait() && std::chrono::steady_clock::now() < deadline)
                        std::this_thread::sleep_for(std::chrono::milliseconds(20));
                }

                if (!process_->try_wait())
                {
                    process_->kill();
                    process_->wait();
                }
            }
            catch (const std::runtime_error& e)
            {
                emit_diagnostic(std::string("Failed to reap child process: ") + e.what());
            }
        }
    }

    remove_staged_files();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::queue<json> empty;
        message_queue_.swap(empty);
        queue_stopped_ = true;
        queue_cv_.notify_all();
    }
}

void SubprocessTransport::remove_staged_files()
{
    for (const auto& file : command_.staged_files)
    {
        std::error_code ec;
        std::filesystem::remove(file, ec);
        if (ec)
            emit_diagnostic("Failed to remove staged file " + file + ": " + ec.message());
    }
    command_.staged_files.clear();
}

bool SubprocessTransport::is_ready() const
{
    return ready_ && is_running();
}

void SubprocessTransport::end_input()
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (process_ && process_->stdin_pipe().is_open())
        process_->stdin_pipe().close();
}

long SubprocessTransport::get_pid() const
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (process_)
        return static_cast<long>(process_->pid());
    return 0;
}

bool SubprocessTransport::is_running() const
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    return process_ && process_->is_running();
}

std::optional<int> SubprocessTransport::exit_code() const
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!process_)
        return std::nullopt;
    process_->is_running(); // reaps an exited child
    return process_->exit_code();
}

void SubprocessTransport::emit_diagnostic(const std::string& line)
{
    if (settings_.diagnostic_callback)
    {
        try
        {
            (*settings_.diagnostic_callback)(line);
        }
        catch (const std::exception& e)
        {
            std::cerr << "[toolhost] diagnostic callback threw: " << e.what() << std::endl;
        }
    }
}

void SubprocessTransport::push_values(std::vector<json>& values)
{
    if (values.empty())
        return;

    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (auto& value : values)
        message_queue_.push(std::move(value));
    queue_cv_.notify_all();
}

void SubprocessTransport::reader_loop()
{
    auto& out = process_->stdout_pipe();
    bool eof = false;

    try
    {
        while (running_)
        {
            // has_data also reports EOF as readable
            if (!out.has_data(100))
                continue;

            char buffer[4096];
            size_t n = out.read(buffer, sizeof(buffer));
            if (n == 0)
            {
                eof = true;
                break;
            }

            std::vector<json> values;
            try
            {
                values = framer_->add_data(std::string(buffer, n));
            }
            catch (const JSONDecodeError& e)
            {
                emit_diagnostic(std::string("Discarded oversized output line: ") + e.what());
            }
            push_values(values);
        }

        if (eof)
        {
            auto tail = framer_->finish();
            push_values(tail);
        }
    }
    catch (const std::exception& e)
    {
        emit_diagnostic(std::string("stdout reader stopped: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_stopped_ = true;
    queue_cv_.notify_all();
}

void SubprocessTransport::start_reader()
{
    running_ = true;
    reader_thread_ = std::thread(&SubprocessTransport::reader_loop, this);
}

void SubprocessTransport::stop_reader()
{
    running_ = false;
    if (reader_thread_.joinable())
        reader_thread_.join();
}

void SubprocessTransport::stderr_reader_loop()
{
    auto& err = process_->stderr_pipe();

    try
    {
        while (stderr_running_)
        {
            if (!err.has_data(100))
                continue;

            // Empty string means EOF
            std::string line = err.read_line();
            if (line.empty())
                break;

            while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
                line.pop_back();
            if (line.empty())
                continue;

            if (settings_.stderr_callback)
            {
                try
                {
                    (*settings_.stderr_callback)(line);
                }
                catch (const std::exception& e)
                {
                    std::cerr << "[toolhost] stderr callback threw: " << e.what() << std::endl;
                }
            }
            else
            {
                emit_diagnostic("[stderr] " + line);
            }
        }
    }
    catch (const std::exception& e)
    {
        emit_diagnostic(std::string("stderr reader stopped: ") + e.what());
    }
}

void SubprocessTransport::start_stderr_reader()
{
    stderr_running_ = true;
    stderr_reader_thread_ = std::thread(&SubprocessTransport::stderr_reader_loop, this);
}

void SubprocessTransport::stop_stderr_reader()
{
    stderr_running_ = false;
    if (stderr_reader_thread_.joinable())
        stderr_reader_thread_.join();
}

} // namespace internal

std::unique_ptr<Transport> create_subprocess_transport(const LaunchCommand& command,
                                                       const TransportSettings& settings)
{
    return std::make_unique<internal::SubprocessTransport>(command, settings);
}

TransportFactory make_subprocess_transport_factory(const TransportSettings& settings)
{
    return [settings](const LaunchCommand& command)
    { return create_subprocess_transport(command, settings); };
}

} // namespace toolhost

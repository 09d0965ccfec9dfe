#ifndef TOOLHOST_INTERNAL_SUBPROCESS_TRANSPORT_HPP
#define TOOLHOST_INTERNAL_SUBPROCESS_TRANSPORT_HPP

#include "../stdio_framer.hpp"
#include "../subprocess/process.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <toolhost/transport.hpp>

namespace toolhost
{
namespace internal
{

/**
 * Transport running one LaunchCommand as a child process.
 *
 * A reader thread frames stdout into JSON values; a second thread forwards
 * stderr lines. Non-JSON stdout lines go to the diagnostic callback.
 */
class SubprocessTransport : public Transport
{
  public:
    SubprocessTransport(LaunchCommand command, TransportSettings settings);
    ~SubprocessTransport() override;

    void connect() override;
    void write(const std::string& data) override;
    std::vector<json> read_messages() override;
    bool has_messages() const override;
    void close() override;
    void kill() override;
    bool is_ready() const override;
    void end_input() override;
    long get_pid() const override;
    bool is_running() const override;
    std::optional<int> exit_code() const override;

    const LaunchCommand& command() const
    {
        return command_;
    }

  private:
    void shutdown(bool graceful);
    void remove_staged_files();
    void emit_diagnostic(const std::string& line);

    // Background reader thread (stdout)
    void reader_loop();
    void start_reader();
    void stop_reader();
    void push_values(std::vector<json>& values);

    // Background stderr reader thread
    void stderr_reader_loop();
    void start_stderr_reader();
    void stop_stderr_reader();

    LaunchCommand command_;
    TransportSettings settings_;

    std::unique_ptr<subprocess::Process> process_;
    // Guards waitpid/signal calls on process_
    mutable std::mutex process_mutex_;

    std::unique_ptr<protocol::StdioFramer> framer_;

    // Thread-safe message queue
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<json> message_queue_;
    bool queue_stopped_ = false;

    // Serialize stdin writes and coordinate with close/end_input
    mutable std::mutex write_mutex_;

    std::thread reader_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> ready_{false};

    std::thread stderr_reader_thread_;
    std::atomic<bool> stderr_running_{false};

    std::atomic<bool> closed_{false};
};

} // namespace internal
} // namespace toolhost

#endif // TOOLHOST_INTERNAL_SUBPROCESS_TRANSPORT_HPP

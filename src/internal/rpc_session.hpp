#ifndef TOOLHOST_INTERNAL_RPC_SESSION_HPP
#define TOOLHOST_INTERNAL_RPC_SESSION_HPP

#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <toolhost/protocol/jsonrpc.hpp>
#include <toolhost/transport.hpp>

namespace toolhost
{
namespace internal
{

struct HandshakeSettings
{
    std::string protocol_version = "2024-11-05";
    std::string client_name = "toolhost";
    std::string client_version;
    std::chrono::milliseconds timeout{30000};
};

// One transport, one correlator and the reader thread between them
class RpcSession
{
  public:
    // Runs once, on the reader thread, when the child exits while the session is open
    using ExitHandler = std::function<void(RpcSession*, std::optional<int>)>;

    RpcSession(std::unique_ptr<Transport> transport, Logger logger);
    ~RpcSession();

    RpcSession(const RpcSession&) = delete;
    RpcSession& operator=(const RpcSession&) = delete;

    // Connect the transport and start reading. Throws ConnectionError.
    void start(ExitHandler on_exit = {});

    std::future<json> request(const std::string& method, const json& params,
                              std::chrono::milliseconds timeout);
    void request(const std::string& method, const json& params, std::chrono::milliseconds timeout,
                 protocol::RpcCorrelator::SuccessCallback on_success,
                 protocol::RpcCorrelator::FailureCallback on_failure);

    void notify(const std::string& method, const json& params = json::object());

    // initialize + notifications/initialized. Returns the initialize result.
    json handshake(const HandshakeSettings& settings);

    // Fail everything pending with `reason`, stop the reader, close the transport gracefully
    void close(std::exception_ptr reason);
    // Same, but force-kill the child
    void kill(std::exception_ptr reason);

    bool is_running() const;
    // True once the child ended on its own, before or after the exit handler ran
    bool has_exited() const
    {
        return exited_;
    }
    std::optional<int> exit_code() const;
    long pid() const;
    size_t pending_count() const;
    json server_info() const;

  private:
    void reader_loop();
    void dispatch(const json& message);
    void reply(const json& id, const json& result);
    void reply_error(const json& id, int code, const std::string& message);
    void handle_end_of_stream();
    void shutdown(bool graceful, std::exception_ptr reason);
    void write_line(const std::string& line);

    std::unique_ptr<Transport> transport_;
    Logger logger_;
    protocol::RpcCorrelator correlator_;
    ExitHandler on_exit_;

    std::thread reader_thread_;
    std::atomic<bool> closing_{false};
    std::atomic<bool> reader_done_{false};
    std::atomic<bool> exited_{false};
    std::once_flag shutdown_once_;

    mutable std::mutex info_mutex_;
    json server_info_;
    std::exception_ptr close_reason_;
};

} // namespace internal
} // namespace toolhost

#endif // TOOLHOST_INTERNAL_RPC_SESSION_HPP

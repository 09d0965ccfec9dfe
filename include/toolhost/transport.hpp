#ifndef TOOLHOST_TRANSPORT_HPP
#define TOOLHOST_TRANSPORT_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <toolhost/environment.hpp>
#include <toolhost/types.hpp>
#include <vector>

namespace toolhost
{

// Fully prepared invocation produced by a launch strategy
struct LaunchCommand
{
    std::string executable;
    std::vector<std::string> args;
    // Complete child environment
    EnvironmentBundle environment;
    bool inherit_environment = false;
    std::optional<std::string> working_directory;
    // Files created for this launch; removed when the transport closes
    std::vector<std::string> staged_files;
    ClientTier tier = ClientTier::None;
    std::string strategy_name;
};

/**
 * Abstract transport to one child process speaking line-delimited JSON.
 *
 * SubprocessTransport is the production implementation. Tests substitute
 * scripted transports through a TransportFactory.
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Start the child process and the background readers.
     * Throws ConnectionError if the process cannot be spawned.
     */
    virtual void connect() = 0;

    /**
     * Write raw data (one serialized JSON line).
     * Throws ConnectionError when the process is gone.
     */
    virtual void write(const std::string& data) = 0;

    /**
     * Wait briefly for output and return every complete JSON value received so far.
     * Returns an empty vector when nothing arrived.
     */
    virtual std::vector<json> read_messages() = 0;

    /**
     * False once the output stream has ended and every queued value was read.
     */
    virtual bool has_messages() const = 0;

    /**
     * Close stdin, request termination, force-kill after the grace window,
     * reap the process and remove staged files. Idempotent.
     */
    virtual void close() = 0;

    /**
     * Force-kill immediately, then clean up like close().
     */
    virtual void kill() = 0;

    virtual bool is_ready() const = 0;

    /**
     * End the input stream (close stdin).
     */
    virtual void end_input() = 0;

    virtual long get_pid() const
    {
        return 0;
    }

    virtual bool is_running() const = 0;

    // Exit status once the process has been reaped
    virtual std::optional<int> exit_code() const
    {
        return std::nullopt;
    }
};

struct TransportSettings
{
    int termination_grace_ms = 5000;
    size_t max_message_buffer_size = 1024 * 1024;
    // Receives each stderr line of the child
    std::optional<StderrCallback> stderr_callback;
    // Receives stdout lines that were not JSON, and other transport diagnostics
    std::optional<StderrCallback> diagnostic_callback;
};

using TransportFactory = std::function<std::unique_ptr<Transport>(const LaunchCommand&)>;

std::unique_ptr<Transport> create_subprocess_transport(const LaunchCommand& command,
                                                       const TransportSettings& settings = {});

// Factory building subprocess transports with fixed settings
TransportFactory make_subprocess_transport_factory(const TransportSettings& settings);

} // namespace toolhost

#endif // TOOLHOST_TRANSPORT_HPP

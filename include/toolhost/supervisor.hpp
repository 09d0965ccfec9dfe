#ifndef TOOLHOST_SUPERVISOR_HPP
#define TOOLHOST_SUPERVISOR_HPP

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <toolhost/options.hpp>
#include <toolhost/transport.hpp>
#include <toolhost/types.hpp>
#include <vector>

namespace toolhost
{

/**
 * Owns one wrapped tool process: launches it through the tier chain, keeps it
 * Ready, routes tool calls to it and tears it down.
 *
 * Every operation returns a future; failures are delivered as exceptions stored
 * in the future. One instance per wrapped tool; instances share no state.
 */
class ToolSupervisor
{
  public:
    explicit ToolSupervisor(SupervisorOptions options = SupervisorOptions{});
    // Test-only/advanced: build transports with a custom factory.
    ToolSupervisor(SupervisorOptions options, TransportFactory factory);
    ~ToolSupervisor();

    // No copy, move only
    ToolSupervisor(const ToolSupervisor&) = delete;
    ToolSupervisor& operator=(const ToolSupervisor&) = delete;
    ToolSupervisor(ToolSupervisor&&) noexcept;
    ToolSupervisor& operator=(ToolSupervisor&&) noexcept;

    // Concurrent calls share one launch and its outcome. Ready immediately when
    // already running. Fails with LaunchError or ConfigurationError.
    std::shared_future<void> start();

    // Fail pending requests with SupervisorStoppingError, terminate the process
    // (graceful, then forced) and return to Idle. No-op when Idle.
    std::future<void> stop();

    // Merge non-empty `credentials` into the configured environment and relaunch
    std::future<void> restart_with_new_credentials(EnvironmentBundle credentials);

    // Served from the cache unless `refresh` is set or nothing is cached yet
    std::future<std::vector<ToolDescriptor>> list_tools(bool refresh = false);

    std::future<ToolResult> call_tool(const std::string& name,
                                      const json& arguments = json::object());

    // Raw JSON-RPC request to the tool process
    std::future<json> send_request(const std::string& method,
                                   const json& params = json::object());

    // Status
    bool is_alive() const;
    bool is_ready() const;
    ClientTier active_tier() const;
    SupervisorState state() const;
    // Returns 0 when no process is running
    long get_pid() const;
    // initialize result of the active process
    std::optional<json> server_info() const;
    size_t pending_requests() const;
    SupervisorOptions options() const;

  private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace toolhost

#endif // TOOLHOST_SUPERVISOR_HPP

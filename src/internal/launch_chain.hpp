#ifndef TOOLHOST_INTERNAL_LAUNCH_CHAIN_HPP
#define TOOLHOST_INTERNAL_LAUNCH_CHAIN_HPP

#include "logger.hpp"
#include "rpc_session.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <toolhost/launch.hpp>
#include <vector>

namespace toolhost
{
namespace internal
{

struct LaunchOutcome
{
    std::unique_ptr<RpcSession> session;
    ClientTier tier = ClientTier::None;
    std::string strategy;
    json server_info;
};

/**
 * Tries each strategy in order until one spawns a process that completes the
 * handshake. Failed attempts are force-killed before the next one starts.
 */
class LaunchChain
{
  public:
    using CancelPredicate = std::function<bool()>;

    LaunchChain(std::vector<std::unique_ptr<LaunchStrategy>> strategies, TransportFactory factory,
                LaunchContext context, HandshakeSettings handshake, Logger logger);

    /**
     * Throws LaunchError listing every attempt when all strategies fail, and
     * SupervisorStoppingError when `cancelled` turns true between attempts or
     * cancel() is called.
     */
    LaunchOutcome run(const EnvironmentBundle& bundle, RpcSession::ExitHandler on_exit = {},
                      const CancelPredicate& cancelled = {});

    // Callable from any thread: kills the attempt in flight so run() returns promptly
    void cancel();

    size_t strategy_count() const
    {
        return strategies_.size();
    }

  private:
    void release_attempt();

    std::vector<std::unique_ptr<LaunchStrategy>> strategies_;
    TransportFactory factory_;
    LaunchContext context_;
    HandshakeSettings handshake_;
    Logger logger_;

    std::atomic<bool> cancelled_{false};
    std::mutex attempt_mutex_;
    RpcSession* attempt_ = nullptr;
};

} // namespace internal
} // namespace toolhost

#endif // TOOLHOST_INTERNAL_LAUNCH_CHAIN_HPP

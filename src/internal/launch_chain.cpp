#include "launch_chain.hpp"

#include <filesystem>
#include <toolhost/errors.hpp>

namespace toolhost
{
namespace internal
{

namespace
{
void remove_files(const std::vector<std::string>& files)
{
    for (const auto& file : files)
    {
        std::error_code ec;
        std::filesystem::remove(file, ec);
    }
}
} // namespace

LaunchChain::LaunchChain(std::vector<std::unique_ptr<LaunchStrategy>> strategies,
                         TransportFactory factory, LaunchContext context,
                         HandshakeSettings handshake, Logger logger)
    : strategies_(std::move(strategies)), factory_(std::move(factory)),
      context_(std::move(context)), handshake_(std::move(handshake)), logger_(std::move(logger))
{
    if (!factory_)
        factory_ = make_subprocess_transport_factory({});
}

LaunchOutcome LaunchChain::run(const EnvironmentBundle& bundle, RpcSession::ExitHandler on_exit,
                               const CancelPredicate& cancelled)
{
    if (strategies_.empty())
        throw LaunchError("No launch strategies configured");

    std::vector<LaunchAttempt> attempts;

    auto is_cancelled = [&] { return cancelled_ || (cancelled && cancelled()); };

    for (const auto& strategy : strategies_)
    {
        if (is_cancelled())
            throw SupervisorStoppingError("Start cancelled: supervisor is stopping");

        const std::string tier = to_string(strategy->tier());
        logger_.info("Trying launch strategy '" + strategy->name() + "' (tier " + tier + ")");

        LaunchCommand command;
        std::unique_ptr<RpcSession> session;
        try
        {
            command = strategy->prepare(bundle, context_);

            auto transport = factory_(command);
            if (!transport)
                throw ConnectionError("Transport factory returned no transport");
            // Staged files now belong to the transport
            command.staged_files.clear();

            session = std::make_unique<RpcSession>(std::move(transport), logger_);
            session->start(on_exit);
            {
                std::lock_guard<std::mutex> lock(attempt_mutex_);
                attempt_ = session.get();
            }
            if (is_cancelled())
                throw SupervisorStoppingError("Start cancelled: supervisor is stopping");
            json server_info = session->handshake(handshake_);
            release_attempt();

            // cancel() may have come after the handshake but before the release
            if (is_cancelled())
                throw SupervisorStoppingError("Start cancelled: supervisor is stopping");

            logger_.info("Launch strategy '" + strategy->name() + "' ready (pid " +
                         std::to_string(session->pid()) + ")");

            LaunchOutcome outcome;
            outcome.session = std::move(session);
            outcome.tier = strategy->tier();
            outcome.strategy = strategy->name();
            outcome.server_info = std::move(server_info);
            return outcome;
        }
        catch (const std::exception& e)
        {
            release_attempt();
            if (is_cancelled())
            {
                if (session)
                    session->kill(std::make_exception_ptr(
                        SupervisorStoppingError("Start cancelled: supervisor is stopping")));
                remove_files(command.staged_files);
                throw SupervisorStoppingError("Start cancelled: supervisor is stopping");
            }

            attempts.push_back(LaunchAttempt{strategy->name(), tier, e.what()});
            logger_.warning("Launch strategy '" + strategy->name() + "' failed: " + e.what());

            if (session)
                session->kill(std::make_exception_ptr(
                    LaunchError("Launch attempt abandoned: " + strategy->name())));
            remove_files(command.staged_files);
        }
    }

    std::string summary = "All launch strategies failed:";
    for (const auto& attempt : attempts)
        summary += " [" + attempt.strategy + " (" + attempt.tier + "): " + attempt.reason + "]";
    throw LaunchError(summary, attempts);
}

void LaunchChain::cancel()
{
    cancelled_ = true;
    std::lock_guard<std::mutex> lock(attempt_mutex_);
    if (attempt_)
        attempt_->kill(std::make_exception_ptr(
            SupervisorStoppingError("Start cancelled: supervisor is stopping")));
}

void LaunchChain::release_attempt()
{
    std::lock_guard<std::mutex> lock(attempt_mutex_);
    attempt_ = nullptr;
}

} // namespace internal
} // namespace toolhost

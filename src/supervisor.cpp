#include "internal/launch_chain.hpp"
#include "internal/logger.hpp"
#include "internal/rpc_session.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>
#include <toolhost/errors.hpp>
#include <toolhost/supervisor.hpp>
#include <toolhost/tools.hpp>

namespace toolhost
{

namespace
{
template <typename T> std::future<T> failed_future(std::exception_ptr error)
{
    std::promise<T> promise;
    promise.set_exception(error);
    return promise.get_future();
}

internal::Logger make_logger(const SupervisorOptions& options)
{
    return internal::Logger(options.log_level, options.log_callback);
}

std::shared_ptr<ToolFacade> make_facade(const SupervisorOptions& options)
{
    SanityChecker checker;
    if (options.detect_echoed_arguments)
        checker.add_check("echoed_arguments", check_echoed_arguments);
    if (options.detect_argument_keywords)
        checker.add_check("argument_keywords", check_argument_keywords);
    for (const auto& [name, check] : options.response_checks)
        checker.add_check(name, check);
    return std::make_shared<ToolFacade>(options.tool_aliases, std::move(checker));
}

TransportSettings make_transport_settings(const SupervisorOptions& options,
                                          const internal::Logger& logger)
{
    TransportSettings settings;
    settings.termination_grace_ms = options.termination_grace_ms;
    settings.max_message_buffer_size = options.max_message_buffer_size;
    if (options.stderr_callback)
        settings.stderr_callback = options.stderr_callback;
    settings.diagnostic_callback = [logger](const std::string& line)
    { logger.debug("Tool process output: " + line); };
    return settings;
}

LaunchContext make_launch_context(const SupervisorOptions& options)
{
    LaunchContext context;
    context.executable = options.executable;
    context.args = options.args;
    context.working_directory = options.working_directory;
    context.allowed_executable_paths = options.allowed_executable_paths;
    context.executable_sha256 = options.executable_sha256;
    context.require_explicit_executable = options.require_explicit_executable;
    return context;
}

internal::HandshakeSettings make_handshake_settings(const SupervisorOptions& options)
{
    internal::HandshakeSettings settings;
    settings.protocol_version = options.protocol_version;
    settings.client_name = options.client_name;
    settings.client_version = options.client_version;
    settings.timeout = std::chrono::milliseconds(options.handshake_timeout_ms);
    return settings;
}

// Variables worth naming in the launch log: sensitive ones and requirements
std::vector<std::string> described_variables(const SupervisorOptions& options)
{
    std::vector<std::string> names(options.sensitive_variables.begin(),
                                   options.sensitive_variables.end());
    for (const auto& rule : options.required_variables)
        if (std::find(names.begin(), names.end(), rule.variable) == names.end())
            names.push_back(rule.variable);
    return names;
}
} // namespace

// ============================================================================
// ToolSupervisor::Impl
// ============================================================================

class ToolSupervisor::Impl : public std::enable_shared_from_this<ToolSupervisor::Impl>
{
  public:
    Impl(SupervisorOptions options, TransportFactory factory)
        : options_(std::move(options)), logger_(make_logger(options_)),
          facade_(make_facade(options_)), factory_(std::move(factory))
    {
        if (!factory_)
            factory_ = make_subprocess_transport_factory(make_transport_settings(options_, logger_));
    }

    ~Impl()
    {
        if (launch_thread_.joinable())
            launch_thread_.join();
    }

    // ------------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------------

    std::shared_future<void> start()
    {
        std::thread previous;
        std::shared_future<void> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            switch (state_)
            {
            case SupervisorState::Ready:
            {
                std::promise<void> ready;
                ready.set_value();
                return ready.get_future().share();
            }
            case SupervisorState::Starting:
            case SupervisorState::Restarting:
                return start_future_;
            case SupervisorState::Stopping:
                return failed_future<void>(std::make_exception_ptr(
                                               SupervisorStoppingError("Supervisor is stopping")))
                    .share();
            case SupervisorState::Idle:
            case SupervisorState::Failed:
                break;
            }

            state_ = SupervisorState::Starting;
            stop_requested_ = false;

            auto promise = std::make_shared<std::promise<void>>();
            start_future_ = promise->get_future().share();
            result = start_future_;

            previous = std::move(launch_thread_);
            launch_thread_ = std::thread([this, promise] { launch_worker(promise); });
        }

        // The previous launch already settled; its thread is at most finishing up
        if (previous.joinable())
            previous.join();
        reap_retired();
        return result;
    }

    void stop_sync()
    {
        // Set before queuing behind a restart so its launch can be cancelled too
        stop_requested_ = true;
        cancel_launch();
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        // A start() may have begun (and cleared the flag) while we waited for the lock
        stop_requested_ = true;
        cancel_launch();

        std::shared_future<void> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == SupervisorState::Starting || state_ == SupervisorState::Restarting)
                pending = start_future_;
        }
        if (pending.valid())
            pending.wait();

        std::shared_ptr<internal::RpcSession> session;
        std::thread launcher;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            session = std::move(session_);
            launcher = std::move(launch_thread_);
            if (session)
                state_ = SupervisorState::Stopping;
        }

        if (launcher.joinable())
            launcher.join();

        facade_->invalidate();

        if (session)
        {
            logger_.info("Stopping tool process (pid " + std::to_string(session->pid()) + ")");
            session->close(
                std::make_exception_ptr(SupervisorStoppingError("Supervisor is stopping")));
        }
        reap_retired();

        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SupervisorState::Idle;
        tier_ = ClientTier::None;
        server_info_.reset();
    }

    void restart_sync(const EnvironmentBundle& credentials)
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        stop_requested_ = false;

        std::shared_future<void> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            merge_non_empty(options_.environment, credentials);
            if (state_ == SupervisorState::Starting || state_ == SupervisorState::Restarting)
                pending = start_future_;
        }
        if (pending.valid())
            pending.wait();

        auto promise = std::make_shared<std::promise<void>>();
        std::shared_future<void> restarted;
        std::shared_ptr<internal::RpcSession> old_session;
        std::thread launcher;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            old_session = std::move(session_);
            launcher = std::move(launch_thread_);
            state_ = SupervisorState::Restarting;
            tier_ = ClientTier::None;
            server_info_.reset();
            start_future_ = promise->get_future().share();
            restarted = start_future_;
        }

        if (launcher.joinable())
            launcher.join();

        facade_->invalidate();

        if (old_session)
        {
            logger_.info("Restarting tool process with new credentials");
            old_session->close(std::make_exception_ptr(
                SupervisorStoppingError("Supervisor is restarting with new credentials")));
        }
        reap_retired();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = SupervisorState::Starting;
        }
        launch_worker(promise);
        restarted.get();
    }

    // ------------------------------------------------------------------------
    // Requests
    // ------------------------------------------------------------------------

    std::future<std::vector<ToolDescriptor>> list_tools(bool refresh)
    {
        if (!refresh)
            if (auto cached = facade_->cached_tools())
            {
                std::promise<std::vector<ToolDescriptor>> promise;
                promise.set_value(std::move(*cached));
                return promise.get_future();
            }

        auto session = ready_session();
        if (!session)
            return failed_future<std::vector<ToolDescriptor>>(not_ready_error());

        auto promise = std::make_shared<std::promise<std::vector<ToolDescriptor>>>();
        auto future = promise->get_future();
        auto facade = facade_;
        auto logger = logger_;

        // A failed refresh falls back to the cache, unless the process is gone
        auto fail = [promise, facade, logger](std::exception_ptr error)
        {
            try
            {
                std::rethrow_exception(error);
            }
            catch (const SupervisorStoppingError&)
            {
                promise->set_exception(error);
                return;
            }
            catch (const ProcessCrashError&)
            {
                promise->set_exception(error);
                return;
            }
            catch (const std::exception& e)
            {
                if (auto cached = facade->cached_tools())
                {
                    logger.warning(std::string("tools/list failed, using cached tools: ") +
                                   e.what());
                    promise->set_value(std::move(*cached));
                    return;
                }
            }
            promise->set_exception(error);
        };

        session->request(
            "tools/list", json::object(), request_timeout(),
            [promise, facade, fail](const json& result)
            {
                std::vector<ToolDescriptor> tools;
                try
                {
                    tools = ToolFacade::parse_tool_list(result);
                }
                catch (const ToolhostError&)
                {
                    fail(std::current_exception());
                    return;
                }
                facade->cache_tools(tools);
                promise->set_value(std::move(tools));
            },
            fail);

        return future;
    }

    std::future<ToolResult> call_tool(const std::string& name, const json& arguments)
    {
        auto session = ready_session();
        if (!session)
            return failed_future<ToolResult>(not_ready_error());

        auto facade = facade_;
        ToolCall call = facade->map_call(name, arguments);
        if (call.target_name != call.requested_name)
            logger_.debug("Tool '" + name + "' mapped to '" + call.target_name + "'");

        auto promise = std::make_shared<std::promise<ToolResult>>();
        auto future = promise->get_future();

        json params = {{"name", call.target_name}, {"arguments", call.arguments}};
        session->request(
            "tools/call", params, request_timeout(),
            [promise, facade, call](const json& result)
            {
                try
                {
                    promise->set_value(facade->interpret_result(call, result));
                }
                catch (const ToolhostError&)
                {
                    promise->set_exception(std::current_exception());
                }
            },
            [promise](std::exception_ptr error) { promise->set_exception(error); });

        return future;
    }

    std::future<json> send_request(const std::string& method, const json& params)
    {
        auto session = ready_session();
        if (!session)
            return failed_future<json>(not_ready_error());
        return session->request(method, params, request_timeout());
    }

    // ------------------------------------------------------------------------
    // Status
    // ------------------------------------------------------------------------

    bool is_alive() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_ && session_->is_running();
    }

    bool is_ready() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_ == SupervisorState::Ready && session_ != nullptr;
    }

    ClientTier active_tier() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return tier_;
    }

    SupervisorState state() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    long get_pid() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_ ? session_->pid() : 0;
    }

    std::optional<json> server_info() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return server_info_;
    }

    size_t pending_requests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_ ? session_->pending_count() : 0;
    }

    SupervisorOptions options() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return options_;
    }

  private:
    void launch_worker(const std::shared_ptr<std::promise<void>>& promise)
    {
        try
        {
            auto outcome = launch();
            std::shared_ptr<internal::RpcSession> session(std::move(outcome.session));
            bool exited = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                // on_process_exit ignores a session that is not published yet
                exited = session->has_exited();
                if (exited)
                {
                    retired_.push_back(session);
                    state_ = SupervisorState::Idle;
                    tier_ = ClientTier::None;
                    server_info_.reset();
                }
                else
                {
                    session_ = session;
                    tier_ = outcome.tier;
                    server_info_ = outcome.server_info;
                    state_ = SupervisorState::Ready;
                }
            }

            if (exited)
            {
                facade_->invalidate();
                auto code = session->exit_code();
                std::string message =
                    "Tool process exited right after the handshake" +
                    (code ? " with code " + std::to_string(*code) : std::string());
                logger_.warning(message + "; supervisor is idle");
                promise->set_exception(std::make_exception_ptr(ProcessCrashError(message, code)));
                return;
            }

            logger_.info("Tool process ready on tier " + to_string(outcome.tier) + " via '" +
                         outcome.strategy + "'");
            promise->set_value();
        }
        catch (const std::exception& e)
        {
            logger_.error(std::string("Failed to start tool process: ") + e.what());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                state_ = SupervisorState::Failed;
                tier_ = ClientTier::None;
            }
            promise->set_exception(std::current_exception());
        }
    }

    internal::LaunchOutcome launch()
    {
        SupervisorOptions snapshot = options();

        if (snapshot.executable.empty())
            throw ConfigurationError(
                "No executable configured: set SupervisorOptions::executable or TOOLHOST_EXECUTABLE");

        EnvironmentBundle bundle = resolve_environment(current_environment(), snapshot.environment,
                                                       make_environment_policy(snapshot));

        logger_.debug("Launch environment: " +
                      describe_environment(bundle, described_variables(snapshot)));
        if (auto it = bundle.find("ACCESS_TOKEN"); it != bundle.end() && !looks_like_jwt(it->second))
            logger_.warning("ACCESS_TOKEN does not look like a JWT; the tool may reject it");

        auto chain = std::make_shared<internal::LaunchChain>(
            make_default_strategies(snapshot.launch_order, snapshot.enhanced_identity), factory_,
            make_launch_context(snapshot), make_handshake_settings(snapshot), logger_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            chain_ = chain;
        }

        std::weak_ptr<Impl> weak = weak_from_this();
        auto release = [this]
        {
            std::lock_guard<std::mutex> lock(mutex_);
            chain_.reset();
        };
        try
        {
            auto outcome = chain->run(
                bundle,
                [weak](internal::RpcSession* session, std::optional<int> exit_code)
                {
                    if (auto self = weak.lock())
                        self->on_process_exit(session, exit_code);
                },
                [this] { return stop_requested_.load(); });
            release();
            return outcome;
        }
        catch (const std::exception&)
        {
            release();
            throw;
        }
    }

    // Interrupts the handshake in flight instead of waiting out its window
    void cancel_launch()
    {
        std::shared_ptr<internal::LaunchChain> chain;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            chain = chain_;
        }
        if (chain)
            chain->cancel();
    }

    // Runs on the session's reader thread; the session is reaped later by another thread
    void on_process_exit(internal::RpcSession* session, std::optional<int> exit_code)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!session_ || session_.get() != session)
                return; // Abandoned launch attempt or already replaced

            retired_.push_back(std::move(session_));
            state_ = SupervisorState::Idle;
            tier_ = ClientTier::None;
            server_info_.reset();
        }

        facade_->invalidate();
        logger_.warning("Tool process exited" +
                        (exit_code ? " with code " + std::to_string(*exit_code) : std::string()) +
                        "; supervisor is idle");
    }

    void reap_retired()
    {
        std::vector<std::shared_ptr<internal::RpcSession>> retired;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            retired.swap(retired_);
        }
        for (auto& session : retired)
            session->close(std::make_exception_ptr(ProcessCrashError("Tool process exited", {})));
    }

    std::shared_ptr<internal::RpcSession> ready_session() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SupervisorState::Ready)
            return nullptr;
        return session_;
    }

    std::exception_ptr not_ready_error() const
    {
        return std::make_exception_ptr(
            ConnectionError("Tool supervisor is not ready (state: " + to_string(state()) + ")"));
    }

    std::chrono::milliseconds request_timeout() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::chrono::milliseconds(options_.request_timeout_ms);
    }

    SupervisorOptions options_;
    internal::Logger logger_;
    std::shared_ptr<ToolFacade> facade_;
    TransportFactory factory_;

    mutable std::mutex mutex_;
    SupervisorState state_ = SupervisorState::Idle;
    ClientTier tier_ = ClientTier::None;
    std::shared_ptr<internal::RpcSession> session_;
    std::vector<std::shared_ptr<internal::RpcSession>> retired_;
    std::optional<json> server_info_;
    std::shared_future<void> start_future_;
    std::thread launch_thread_;
    std::shared_ptr<internal::LaunchChain> chain_;

    // Serializes stop and restart
    std::mutex lifecycle_mutex_;
    std::atomic<bool> stop_requested_{false};
};

// ============================================================================
// ToolSupervisor
// ============================================================================

namespace
{
SupervisorOptions with_environment_overrides(SupervisorOptions options)
{
    apply_environment_overrides(options);
    return options;
}
} // namespace

ToolSupervisor::ToolSupervisor(SupervisorOptions options)
    : impl_(std::make_shared<Impl>(with_environment_overrides(std::move(options)),
                                   TransportFactory{}))
{
}

ToolSupervisor::ToolSupervisor(SupervisorOptions options, TransportFactory factory)
    : impl_(std::make_shared<Impl>(with_environment_overrides(std::move(options)),
                                   std::move(factory)))
{
}

ToolSupervisor::~ToolSupervisor()
{
    if (!impl_)
        return;
    try
    {
        impl_->stop_sync();
    }
    catch (const std::exception& e)
    {
        std::cerr << "[toolhost] error: failed to stop tool process: " << e.what() << std::endl;
    }
}

ToolSupervisor::ToolSupervisor(ToolSupervisor&&) noexcept = default;

ToolSupervisor& ToolSupervisor::operator=(ToolSupervisor&& other) noexcept
{
    if (this != &other)
    {
        if (impl_)
        {
            try
            {
                impl_->stop_sync();
            }
            catch (const std::exception& e)
            {
                std::cerr << "[toolhost] error: failed to stop tool process: " << e.what()
                          << std::endl;
            }
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

std::shared_future<void> ToolSupervisor::start()
{
    return impl_->start();
}

std::future<void> ToolSupervisor::stop()
{
    auto impl = impl_;
    return std::async(std::launch::async, [impl] { impl->stop_sync(); });
}

std::future<void> ToolSupervisor::restart_with_new_credentials(EnvironmentBundle credentials)
{
    auto impl = impl_;
    return std::async(std::launch::async, [impl, credentials = std::move(credentials)]
                      { impl->restart_sync(credentials); });
}

std::future<std::vector<ToolDescriptor>> ToolSupervisor::list_tools(bool refresh)
{
    return impl_->list_tools(refresh);
}

std::future<ToolResult> ToolSupervisor::call_tool(const std::string& name, const json& arguments)
{
    return impl_->call_tool(name, arguments);
}

std::future<json> ToolSupervisor::send_request(const std::string& method, const json& params)
{
    return impl_->send_request(method, params);
}

bool ToolSupervisor::is_alive() const
{
    return impl_->is_alive();
}

bool ToolSupervisor::is_ready() const
{
    return impl_->is_ready();
}

ClientTier ToolSupervisor::active_tier() const
{
    return impl_->active_tier();
}

SupervisorState ToolSupervisor::state() const
{
    return impl_->state();
}

long ToolSupervisor::get_pid() const
{
    return impl_->get_pid();
}

std::optional<json> ToolSupervisor::server_info() const
{
    return impl_->server_info();
}

size_t ToolSupervisor::pending_requests() const
{
    return impl_->pending_requests();
}

SupervisorOptions ToolSupervisor::options() const
{
    return impl_->options();
}

} // namespace toolhost

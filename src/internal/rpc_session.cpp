#include "rpc_session.hpp"

#include <toolhost/errors.hpp>
#include <toolhost/version.hpp>

namespace toolhost
{
namespace internal
{

RpcSession::RpcSession(std::unique_ptr<Transport> transport, Logger logger)
    : transport_(std::move(transport)), logger_(std::move(logger))
{
    if (!transport_)
        throw ConnectionError("RpcSession requires a transport");
}

RpcSession::~RpcSession()
{
    try
    {
        shutdown(true, std::make_exception_ptr(SupervisorStoppingError("Session destroyed")));
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Error while closing session: ") + e.what());
    }
}

void RpcSession::start(ExitHandler on_exit)
{
    on_exit_ = std::move(on_exit);
    transport_->connect();
    reader_thread_ = std::thread(&RpcSession::reader_loop, this);
}

void RpcSession::write_line(const std::string& line)
{
    transport_->write(line);
}

std::future<json> RpcSession::request(const std::string& method, const json& params,
                                      std::chrono::milliseconds timeout)
{
    auto promise = std::make_shared<std::promise<json>>();
    auto future = promise->get_future();

    request(
        method, params, timeout, [promise](const json& result) { promise->set_value(result); },
        [promise](std::exception_ptr error) { promise->set_exception(error); });

    return future;
}

void RpcSession::request(const std::string& method, const json& params,
                         std::chrono::milliseconds timeout,
                         protocol::RpcCorrelator::SuccessCallback on_success,
                         protocol::RpcCorrelator::FailureCallback on_failure)
{
    auto dead_session_error = [this]() -> std::exception_ptr
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        if (close_reason_)
            return close_reason_;
        return std::make_exception_ptr(ConnectionError("Tool process is not running"));
    };

    if (closing_ || reader_done_)
    {
        if (on_failure)
            on_failure(dead_session_error());
        return;
    }

    correlator_.send_request([this](const std::string& line) { write_line(line); }, method,
                             params, timeout, std::move(on_success), std::move(on_failure));

    // The reader may have settled everything just before this request was registered
    if (closing_ || reader_done_)
        correlator_.fail_all(dead_session_error());
}

void RpcSession::notify(const std::string& method, const json& params)
{
    correlator_.send_notification([this](const std::string& line) { write_line(line); }, method,
                                  params);
}

json RpcSession::handshake(const HandshakeSettings& settings)
{
    json params = {
        {"protocolVersion", settings.protocol_version},
        {"capabilities", json::object()},
        {"clientInfo",
         {{"name", settings.client_name},
          {"version", settings.client_version.empty() ? version_string()
                                                      : settings.client_version}}}};

    json result = request("initialize", params, settings.timeout).get();
    if (!result.is_object())
        throw ToolhostError("Invalid initialize result: " + result.dump());

    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        server_info_ = result;
    }

    notify("notifications/initialized");

    if (result.contains("serverInfo") && result["serverInfo"].is_object())
        logger_.debug("Handshake complete with " + result["serverInfo"].value("name", "?") + " " +
                      result["serverInfo"].value("version", ""));
    return result;
}

void RpcSession::close(std::exception_ptr reason)
{
    shutdown(true, std::move(reason));
}

void RpcSession::kill(std::exception_ptr reason)
{
    shutdown(false, std::move(reason));
}

void RpcSession::shutdown(bool graceful, std::exception_ptr reason)
{
    std::call_once(shutdown_once_,
                   [&]
                   {
                       if (!reason)
                           reason = std::make_exception_ptr(
                               SupervisorStoppingError("Session closed"));

                       {
                           std::lock_guard<std::mutex> lock(info_mutex_);
                           close_reason_ = reason;
                       }
                       closing_ = true;

                       correlator_.fail_all(reason);

                       if (reader_thread_.joinable())
                           reader_thread_.join();

                       // Requests that raced the closing flag
                       correlator_.fail_all(reason);

                       try
                       {
                           if (graceful)
                               transport_->close();
                           else
                               transport_->kill();
                       }
                       catch (const std::exception& e)
                       {
                           logger_.warning(std::string("Error while closing transport: ") +
                                           e.what());
                       }
                   });
}

void RpcSession::reader_loop()
{
    bool end_of_stream = false;

    try
    {
        while (!closing_)
        {
            // Waits briefly when nothing is queued, which paces the deadline checks
            auto messages = transport_->read_messages();

            if (messages.empty() && !transport_->has_messages())
            {
                end_of_stream = true;
                break;
            }

            for (const auto& message : messages)
                dispatch(message);

            correlator_.expire_overdue();
        }
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Error in reader loop: ") + e.what());
        end_of_stream = true;
    }

    if (end_of_stream && !closing_)
    {
        handle_end_of_stream();
        return;
    }
    reader_done_ = true;
}

void RpcSession::dispatch(const json& message)
{
    try
    {
        if (correlator_.handle_message(message))
            return;

        auto classified = protocol::classify_message(message);
        if (!classified)
        {
            logger_.debug("Ignoring non-RPC output: " + message.dump());
            return;
        }

        if (auto* request = std::get_if<protocol::RpcRequest>(&*classified))
        {
            if (request->method == "ping")
                reply(request->id, json::object());
            else
                reply_error(request->id, protocol::METHOD_NOT_FOUND,
                            "Method not found: " + request->method);
            return;
        }

        if (auto* notification = std::get_if<protocol::RpcNotification>(&*classified))
        {
            logger_.debug("Notification from tool process: " + notification->method);
            return;
        }

        // Late response: the request already settled by timeout or was never ours
        logger_.debug("Ignoring response for unknown request id " +
                      std::get<protocol::RpcResponse>(*classified).id.dump());
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Failed to dispatch message: ") + e.what());
    }
}

void RpcSession::reply(const json& id, const json& result)
{
    protocol::RpcResponse response;
    response.id = id;
    response.result = result;
    try
    {
        write_line(protocol::serialize_line(protocol::to_json(response)));
    }
    catch (const ConnectionError& e)
    {
        logger_.debug(std::string("Could not answer tool process request: ") + e.what());
    }
}

void RpcSession::reply_error(const json& id, int code, const std::string& message)
{
    protocol::RpcResponse response;
    response.id = id;
    response.error = protocol::RpcError{code, message, nullptr};
    try
    {
        write_line(protocol::serialize_line(protocol::to_json(response)));
    }
    catch (const ConnectionError& e)
    {
        logger_.debug(std::string("Could not answer tool process request: ") + e.what());
    }
}

void RpcSession::handle_end_of_stream()
{
    // stdout can close a moment before the process is reaped
    std::optional<int> code;
    for (int i = 0; i < 20 && !code; ++i)
    {
        code = transport_->exit_code();
        if (!code)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::string message = code ? "Tool process exited unexpectedly with code " +
                                     std::to_string(*code)
                               : "Tool process closed its output stream";
    logger_.warning(message);

    auto crash = std::make_exception_ptr(ProcessCrashError(message, code));
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        if (!close_reason_)
            close_reason_ = crash;
    }
    // Set before failing so a request registered after this point fails on its own
    exited_ = true;
    reader_done_ = true;
    correlator_.fail_all(crash);

    if (!on_exit_)
        return;
    try
    {
        on_exit_(this, code);
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Exit handler failed: ") + e.what());
    }
}

bool RpcSession::is_running() const
{
    return !closing_ && !reader_done_ && transport_->is_running();
}

std::optional<int> RpcSession::exit_code() const
{
    return transport_->exit_code();
}

long RpcSession::pid() const
{
    return transport_->get_pid();
}

size_t RpcSession::pending_count() const
{
    return correlator_.pending_count();
}

json RpcSession::server_info() const
{
    std::lock_guard<std::mutex> lock(info_mutex_);
    return server_info_;
}

} // namespace internal
} // namespace toolhost

#include <toolhost/errors.hpp>
#include <toolhost/protocol/jsonrpc.hpp>
#include <vector>

namespace toolhost
{
namespace protocol
{

namespace
{
bool is_valid_id(const json& id)
{
    return id.is_number_integer() || id.is_string() || id.is_null();
}

RpcError parse_error_object(const json& error)
{
    RpcError out;
    if (!error.is_object())
    {
        out.message = error.is_string() ? error.get<std::string>() : error.dump();
        return out;
    }

    if (error.contains("code") && error["code"].is_number_integer())
        out.code = error["code"].get<int>();
    if (error.contains("message") && error["message"].is_string())
        out.message = error["message"].get<std::string>();
    else
        out.message = "Unknown error";
    if (error.contains("data"))
        out.data = error["data"];
    return out;
}
} // namespace

std::optional<RpcMessage> classify_message(const json& j)
{
    if (!j.is_object())
        return std::nullopt;

    if (j.contains("method") && j["method"].is_string())
    {
        json params = j.contains("params") ? j["params"] : json::object();
        if (j.contains("id") && is_valid_id(j["id"]) && !j["id"].is_null())
            return RpcRequest{j["id"], j["method"].get<std::string>(), params};
        return RpcNotification{j["method"].get<std::string>(), params};
    }

    if (j.contains("id") && (j.contains("result") || j.contains("error")))
    {
        RpcResponse response;
        response.id = j["id"];
        // error takes precedence when a malformed peer sends both
        if (j.contains("error") && !j["error"].is_null())
            response.error = parse_error_object(j["error"]);
        else
            response.result = j.contains("result") ? j["result"] : json(nullptr);
        return response;
    }

    return std::nullopt;
}

json to_json(const RpcRequest& request)
{
    return {{"jsonrpc", JSONRPC_VERSION},
            {"id", request.id},
            {"method", request.method},
            {"params", request.params}};
}

json to_json(const RpcNotification& notification)
{
    return {{"jsonrpc", JSONRPC_VERSION},
            {"method", notification.method},
            {"params", notification.params}};
}

json to_json(const RpcResponse& response)
{
    json j = {{"jsonrpc", JSONRPC_VERSION}, {"id", response.id}};
    if (response.error)
    {
        json error = {{"code", response.error->code}, {"message", response.error->message}};
        if (!response.error->data.is_null())
            error["data"] = response.error->data;
        j["error"] = error;
    }
    else
    {
        j["result"] = response.result.value_or(json::object());
    }
    return j;
}

std::string serialize_line(const json& message)
{
    return message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

// ============================================================================
// RpcCorrelator
// ============================================================================

RpcCorrelator::RpcCorrelator() {}

RpcCorrelator::~RpcCorrelator()
{
    fail_all(std::make_exception_ptr(SupervisorStoppingError("RPC correlator shutting down")));
}

std::int64_t RpcCorrelator::send_request(const WriteFunc& write_func, const std::string& method,
                                         const json& params, std::chrono::milliseconds timeout,
                                         SuccessCallback on_success, FailureCallback on_failure)
{
    std::int64_t id;
    std::exception_ptr write_error;
    {
        std::lock_guard<std::mutex> send_lock(send_mutex_);
        id = ++next_id_;

        // Register BEFORE sending so a fast response always finds its entry
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_[id] = PendingRequest{method, Clock::now() + timeout, timeout,
                                          std::move(on_success), std::move(on_failure)};
        }

        try
        {
            write_func(serialize_line(to_json(RpcRequest{id, method, params})));
        }
        catch (const std::exception& e)
        {
            write_error = std::make_exception_ptr(
                ConnectionError("Failed to send " + method + ": " + e.what()));
        }
    }

    if (write_error)
        if (auto entry = take(id))
            if (entry->on_failure)
                entry->on_failure(write_error);

    return id;
}

std::future<json> RpcCorrelator::send_request(const WriteFunc& write_func,
                                              const std::string& method, const json& params,
                                              std::chrono::milliseconds timeout)
{
    auto promise = std::make_shared<std::promise<json>>();
    auto future = promise->get_future();

    send_request(
        write_func, method, params, timeout,
        [promise](const json& result) { promise->set_value(result); },
        [promise](std::exception_ptr error) { promise->set_exception(error); });

    return future;
}

void RpcCorrelator::send_notification(const WriteFunc& write_func, const std::string& method,
                                      const json& params)
{
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    write_func(serialize_line(to_json(RpcNotification{method, params})));
}

bool RpcCorrelator::handle_message(const json& message)
{
    auto classified = classify_message(message);
    if (!classified)
        return false;

    auto* response = std::get_if<RpcResponse>(&*classified);
    if (!response || !response->id.is_number_integer())
        return false;

    auto entry = take(response->id.get<std::int64_t>());
    if (!entry)
        return false; // Unknown, or already settled by timeout

    if (response->error)
    {
        const auto& error = *response->error;
        auto remote = error.data.is_null()
                          ? RemoteError(error.code, error.message)
                          : RemoteError(error.code, error.message, error.data);
        if (entry->on_failure)
            entry->on_failure(std::make_exception_ptr(remote));
    }
    else if (entry->on_success)
    {
        entry->on_success(*response->result);
    }

    return true;
}

size_t RpcCorrelator::expire_overdue(Clock::time_point now)
{
    std::vector<std::pair<std::int64_t, PendingRequest>> expired;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        for (auto it = pending_.begin(); it != pending_.end();)
        {
            if (it->second.deadline <= now)
            {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (auto& [id, entry] : expired)
    {
        if (!entry.on_failure)
            continue;
        entry.on_failure(std::make_exception_ptr(RequestTimeoutError(
            "Request timed out after " + std::to_string(entry.timeout.count()) + "ms: " +
                entry.method + " (id " + std::to_string(id) + ")",
            entry.method, id)));
    }

    return expired.size();
}

size_t RpcCorrelator::fail_all(std::exception_ptr error)
{
    std::map<std::int64_t, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        failed.swap(pending_);
    }

    for (auto& [id, entry] : failed)
        if (entry.on_failure)
            entry.on_failure(error);

    return failed.size();
}

size_t RpcCorrelator::pending_count() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

std::int64_t RpcCorrelator::last_issued_id() const
{
    return next_id_.load();
}

std::optional<RpcCorrelator::Clock::time_point> RpcCorrelator::next_deadline() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    std::optional<Clock::time_point> earliest;
    for (const auto& [id, entry] : pending_)
        if (!earliest || entry.deadline < *earliest)
            earliest = entry.deadline;
    return earliest;
}

std::optional<RpcCorrelator::PendingRequest> RpcCorrelator::take(std::int64_t id)
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end())
        return std::nullopt;

    PendingRequest entry = std::move(it->second);
    pending_.erase(it);
    return entry;
}

} // namespace protocol
} // namespace toolhost

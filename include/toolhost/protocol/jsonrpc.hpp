#ifndef TOOLHOST_PROTOCOL_JSONRPC_HPP
#define TOOLHOST_PROTOCOL_JSONRPC_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace toolhost
{

using json = nlohmann::json;

namespace protocol
{

constexpr const char* JSONRPC_VERSION = "2.0";

// Standard JSON-RPC error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

struct RpcError
{
    int code = INTERNAL_ERROR;
    std::string message;
    json data; // null when absent
};

// Request carrying an id; from the child the id may be any JSON scalar
struct RpcRequest
{
    json id;
    std::string method;
    json params = json::object();
};

struct RpcNotification
{
    std::string method;
    json params = json::object();
};

struct RpcResponse
{
    json id;
    std::optional<json> result;
    std::optional<RpcError> error;
};

using RpcMessage = std::variant<RpcRequest, RpcNotification, RpcResponse>;

// Classify a framed JSON value; nullopt for values that are not JSON-RPC shaped
std::optional<RpcMessage> classify_message(const json& j);

json to_json(const RpcRequest& request);
json to_json(const RpcNotification& notification);
json to_json(const RpcResponse& response);

// Compact single-line form plus '\n'. Invalid UTF-8 is replaced, never thrown.
std::string serialize_line(const json& message);

// Correlates integer-id requests with responses. Every registered request settles
// exactly once: by response, by deadline expiry, or by fail_all().
class RpcCorrelator
{
  public:
    using Clock = std::chrono::steady_clock;
    using WriteFunc = std::function<void(const std::string&)>;
    using SuccessCallback = std::function<void(const json&)>;
    using FailureCallback = std::function<void(std::exception_ptr)>;

    RpcCorrelator();
    ~RpcCorrelator();

    RpcCorrelator(const RpcCorrelator&) = delete;
    RpcCorrelator& operator=(const RpcCorrelator&) = delete;

    // Assign the next id, register, then write. Requests are written in id order.
    // A failed write settles the request through on_failure. Returns the id.
    std::int64_t send_request(const WriteFunc& write_func, const std::string& method,
                              const json& params, std::chrono::milliseconds timeout,
                              SuccessCallback on_success, FailureCallback on_failure);

    std::future<json> send_request(const WriteFunc& write_func, const std::string& method,
                                   const json& params, std::chrono::milliseconds timeout);

    // Notifications carry no id and are never tracked
    void send_notification(const WriteFunc& write_func, const std::string& method,
                           const json& params = json::object());

    // Settle the pending request matching a response. Returns false for anything else
    // (unknown or absent ids, requests and notifications from the child).
    bool handle_message(const json& message);

    // Fail every request whose deadline is at or before `now`; returns how many
    size_t expire_overdue(Clock::time_point now = Clock::now());

    // Fail every pending request with `error`; returns how many
    size_t fail_all(std::exception_ptr error);

    size_t pending_count() const;
    std::int64_t last_issued_id() const;
    std::optional<Clock::time_point> next_deadline() const;

  private:
    struct PendingRequest
    {
        std::string method;
        Clock::time_point deadline;
        std::chrono::milliseconds timeout;
        SuccessCallback on_success;
        FailureCallback on_failure;
    };

    std::optional<PendingRequest> take(std::int64_t id);

    std::mutex send_mutex_; // id assignment + write
    mutable std::mutex pending_mutex_;
    std::map<std::int64_t, PendingRequest> pending_;
    std::atomic<std::int64_t> next_id_{0};
};

} // namespace protocol
} // namespace toolhost

#endif // TOOLHOST_PROTOCOL_JSONRPC_HPP

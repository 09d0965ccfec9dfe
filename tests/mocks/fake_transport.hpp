#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <toolhost/errors.hpp>
#include <toolhost/transport.hpp>
#include <vector>

namespace toolhost::test
{

// Scripted stand-in for one child process. Requests written to it are answered
// by `responder` unless their method is listed in `silent_methods`.
struct FakeChildState
{
    using Responder = std::function<std::optional<json>(const json& request)>;

    std::mutex mutex;
    std::condition_variable cv;

    std::deque<json> outgoing;
    std::vector<json> written;

    bool fail_connect = false;
    std::set<std::string> silent_methods;
    Responder responder;

    bool connected = false;
    bool input_closed = false;
    bool exited = false;
    std::optional<int> exit_status;
    int close_calls = 0;
    int kill_calls = 0;
    long pid = 4242;

    // Emit a message as if the child wrote it to stdout
    void push(const json& message)
    {
        std::lock_guard<std::mutex> lock(mutex);
        outgoing.push_back(message);
        cv.notify_all();
    }

    void respond(const json& id, const json& result)
    {
        push({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
    }

    void respond_error(const json& id, int code, const std::string& message)
    {
        push({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}});
    }

    // Child exits on its own: stdout ends once queued output is drained
    void exit(int code)
    {
        std::lock_guard<std::mutex> lock(mutex);
        exited = true;
        exit_status = code;
        cv.notify_all();
    }

    std::vector<json> requests(const std::string& method)
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<json> out;
        for (const auto& message : written)
            if (message.value("method", "") == method)
                out.push_back(message);
        return out;
    }

    // Wait until `count` messages with `method` were written
    bool wait_for_requests(const std::string& method, size_t count,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout,
                           [&]
                           {
                               size_t n = 0;
                               for (const auto& message : written)
                                   if (message.value("method", "") == method)
                                       ++n;
                               return n >= count;
                           });
    }
};

inline json fake_initialize_result()
{
    return {{"protocolVersion", "2024-11-05"},
            {"capabilities", {{"tools", json::object()}}},
            {"serverInfo", {{"name", "fake-child"}, {"version", "0.0.1"}}}};
}

inline json fake_tools_list_result()
{
    return {{"tools",
             json::array({{{"name", "echo"},
                           {"description", "Echo text"},
                           {"inputSchema", {{"type", "object"}}}},
                          {{"name", "Lokka-Microsoft"},
                           {"description", "Graph queries"},
                           {"inputSchema", {{"type", "object"}}}}})}};
}

// Answers initialize, tools/list and tools/call; other requests get -32601
inline std::optional<json> standard_response(const json& request)
{
    if (!request.contains("id") || !request.contains("method"))
        return std::nullopt;

    const std::string method = request["method"].get<std::string>();
    json response = {{"jsonrpc", "2.0"}, {"id", request["id"]}};

    if (method == "initialize")
    {
        response["result"] = fake_initialize_result();
    }
    else if (method == "tools/list")
    {
        response["result"] = fake_tools_list_result();
    }
    else if (method == "tools/call")
    {
        std::string name = request["params"].value("name", "");
        response["result"] = {
            {"content", json::array({{{"type", "text"}, {"text", "ok:" + name}}})}};
    }
    else
    {
        response["error"] = {{"code", -32601}, {"message", "Method not found"}};
    }
    return response;
}

class FakeTransport : public Transport
{
  public:
    FakeTransport(std::shared_ptr<FakeChildState> state, LaunchCommand command)
        : state_(std::move(state)), command_(std::move(command))
    {
    }

    ~FakeTransport() override
    {
        remove_staged_files();
    }

    void connect() override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->fail_connect)
            throw ConnectionError("Failed to spawn fake child");
        state_->connected = true;
    }

    void write(const std::string& data) override
    {
        json message = json::parse(data);
        FakeChildState::Responder responder;
        bool answer = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->connected || state_->exited || state_->input_closed)
                throw ConnectionError("Broken pipe");
            state_->written.push_back(message);
            state_->cv.notify_all();

            std::string method = message.value("method", "");
            answer = message.contains("method") && !state_->silent_methods.count(method);
            if (state_->responder)
                responder = state_->responder;
            else
                responder = standard_response;
        }

        if (!answer)
            return;
        if (auto response = responder(message))
            state_->push(*response);
    }

    std::vector<json> read_messages() override
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_for(lock, std::chrono::milliseconds(20),
                            [this] { return !state_->outgoing.empty() || state_->exited; });

        std::vector<json> messages(state_->outgoing.begin(), state_->outgoing.end());
        state_->outgoing.clear();
        return messages;
    }

    bool has_messages() const override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return !state_->outgoing.empty() || !state_->exited;
    }

    void close() override
    {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->close_calls;
            state_->input_closed = true;
            if (!state_->exited)
            {
                state_->exited = true;
                state_->exit_status = 0;
            }
            state_->cv.notify_all();
        }
        remove_staged_files();
    }

    void kill() override
    {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->kill_calls;
            state_->input_closed = true;
            if (!state_->exited)
            {
                state_->exited = true;
                state_->exit_status = -9;
            }
            state_->cv.notify_all();
        }
        remove_staged_files();
    }

    bool is_ready() const override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->connected && !state_->exited;
    }

    void end_input() override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->input_closed = true;
    }

    long get_pid() const override
    {
        return state_->pid;
    }

    bool is_running() const override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->connected && !state_->exited;
    }

    std::optional<int> exit_code() const override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->exited ? state_->exit_status : std::nullopt;
    }

  private:
    void remove_staged_files()
    {
        for (const auto& file : command_.staged_files)
        {
            std::error_code ec;
            std::filesystem::remove(file, ec);
        }
    }

    std::shared_ptr<FakeChildState> state_;
    LaunchCommand command_;
};

// Builds FakeTransports and records every launch; spawn count = commands().size()
class FakeTransportFactory
{
  public:
    // Adjust the scripted child for a given launch (e.g. silence one tier)
    using Configure = std::function<void(FakeChildState&, const LaunchCommand&)>;

    explicit FakeTransportFactory(Configure configure = {}) : data_(std::make_shared<Data>())
    {
        data_->configure = std::move(configure);
    }

    TransportFactory factory() const
    {
        auto data = data_;
        return [data](const LaunchCommand& command) -> std::unique_ptr<Transport>
        {
            auto state = std::make_shared<FakeChildState>();
            if (data->configure)
                data->configure(*state, command);
            {
                std::lock_guard<std::mutex> lock(data->mutex);
                data->commands.push_back(command);
                data->children.push_back(state);
            }
            return std::make_unique<FakeTransport>(state, command);
        };
    }

    size_t spawn_count() const
    {
        std::lock_guard<std::mutex> lock(data_->mutex);
        return data_->commands.size();
    }

    std::vector<LaunchCommand> commands() const
    {
        std::lock_guard<std::mutex> lock(data_->mutex);
        return data_->commands;
    }

    std::shared_ptr<FakeChildState> child(size_t index) const
    {
        std::lock_guard<std::mutex> lock(data_->mutex);
        return index < data_->children.size() ? data_->children[index] : nullptr;
    }

    std::shared_ptr<FakeChildState> last_child() const
    {
        std::lock_guard<std::mutex> lock(data_->mutex);
        return data_->children.empty() ? nullptr : data_->children.back();
    }

  private:
    struct Data
    {
        std::mutex mutex;
        Configure configure;
        std::vector<LaunchCommand> commands;
        std::vector<std::shared_ptr<FakeChildState>> children;
    };

    std::shared_ptr<Data> data_;
};

} // namespace toolhost::test

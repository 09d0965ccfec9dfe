#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <map>
#include <thread>
#include <toolhost/errors.hpp>
#include <toolhost/protocol/jsonrpc.hpp>
#include <vector>

using namespace toolhost::protocol;
using toolhost::json;
using namespace std::chrono_literals;

namespace
{
// Captures written lines so tests can read back the requests
struct WireCapture
{
    std::vector<json> lines;

    RpcCorrelator::WriteFunc writer()
    {
        return [this](const std::string& data)
        {
            EXPECT_EQ(data.back(), '\n');
            lines.push_back(json::parse(data));
        };
    }
};

json response(std::int64_t id, const json& result)
{
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}
} // namespace

// ============================================================================
// Message classification
// ============================================================================

TEST(JsonRpcMessageTest, ClassifiesRequestNotificationAndResponse)
{
    auto request = classify_message(json::parse(R"({"jsonrpc":"2.0","id":"a","method":"ping"})"));
    ASSERT_TRUE(request.has_value());
    ASSERT_TRUE(std::holds_alternative<RpcRequest>(*request));
    EXPECT_EQ(std::get<RpcRequest>(*request).method, "ping");

    auto note = classify_message(json::parse(R"({"jsonrpc":"2.0","method":"notifications/x"})"));
    ASSERT_TRUE(note.has_value());
    EXPECT_TRUE(std::holds_alternative<RpcNotification>(*note));

    auto resp = classify_message(json::parse(R"({"jsonrpc":"2.0","id":4,"result":{"x":1}})"));
    ASSERT_TRUE(resp.has_value());
    ASSERT_TRUE(std::holds_alternative<RpcResponse>(*resp));
    EXPECT_EQ((*std::get<RpcResponse>(*resp).result)["x"], 1);
}

TEST(JsonRpcMessageTest, ErrorTakesPrecedenceOverResult)
{
    auto msg = classify_message(
        json::parse(R"({"id":1,"result":{},"error":{"code":-32000,"message":"boom"}})"));
    ASSERT_TRUE(msg.has_value());
    const auto& resp = std::get<RpcResponse>(*msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32000);
    EXPECT_EQ(resp.error->message, "boom");
}

TEST(JsonRpcMessageTest, NonRpcValuesAreNotClassified)
{
    EXPECT_FALSE(classify_message(json::parse(R"({"log":"hello"})")).has_value());
    EXPECT_FALSE(classify_message(json::parse("[1,2]")).has_value());
    EXPECT_FALSE(classify_message(json::parse("42")).has_value());
}

TEST(JsonRpcMessageTest, SerializeLineIsSingleLine)
{
    json message = to_json(RpcRequest{1, "tools/call", {{"text", "a\nb"}}});
    std::string line = serialize_line(message);

    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);
    EXPECT_EQ(json::parse(line)["jsonrpc"], "2.0");
}

TEST(JsonRpcMessageTest, SerializeReplacesInvalidUtf8)
{
    json message = {{"text", std::string("bad \xff byte")}};
    EXPECT_NO_THROW(serialize_line(message));
}

// ============================================================================
// Correlator
// ============================================================================

TEST(RpcCorrelatorTest, IdsArePositiveAndIncreasing)
{
    RpcCorrelator correlator;
    WireCapture wire;

    auto id1 = correlator.send_request(wire.writer(), "a", json::object(), 1s, {}, {});
    auto id2 = correlator.send_request(wire.writer(), "b", json::object(), 1s, {}, {});

    EXPECT_EQ(id1, 1);
    EXPECT_EQ(id2, 2);
    EXPECT_EQ(correlator.last_issued_id(), 2);
    ASSERT_EQ(wire.lines.size(), 2u);
    EXPECT_EQ(wire.lines[0]["id"], 1);
    EXPECT_EQ(wire.lines[0]["method"], "a");
    EXPECT_EQ(wire.lines[1]["id"], 2);
    EXPECT_EQ(correlator.pending_count(), 2u);
}

// Replies for id 2 resolve its caller while id 1 stays pending
TEST(RpcCorrelatorTest, OutOfOrderResponsesMatchById)
{
    RpcCorrelator correlator;
    WireCapture wire;

    auto first = correlator.send_request(wire.writer(), "slow", json::object(), 5s);
    auto second = correlator.send_request(wire.writer(), "fast", json::object(), 5s);

    EXPECT_TRUE(correlator.handle_message(response(2, {{"answer", "fast"}})));

    ASSERT_EQ(second.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(second.get()["answer"], "fast");
    EXPECT_EQ(first.wait_for(0ms), std::future_status::timeout);

    EXPECT_TRUE(correlator.handle_message(response(1, {{"answer", "slow"}})));
    EXPECT_EQ(first.get()["answer"], "slow");
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST(RpcCorrelatorTest, RemoteErrorCarriesCodeAndMessage)
{
    RpcCorrelator correlator;
    WireCapture wire;

    auto future = correlator.send_request(wire.writer(), "tools/call", json::object(), 5s);
    correlator.handle_message(
        {{"jsonrpc", "2.0"},
         {"id", 1},
         {"error", {{"code", -32602}, {"message", "Unknown tool"}, {"data", {{"name", "x"}}}}}});

    try
    {
        future.get();
        FAIL() << "expected RemoteError";
    }
    catch (const toolhost::RemoteError& e)
    {
        EXPECT_EQ(e.code(), -32602);
        EXPECT_EQ(e.remote_message(), "Unknown tool");
        ASSERT_NE(e.data(), nullptr);
        EXPECT_EQ((*e.data())["name"], "x");
    }
}

TEST(RpcCorrelatorTest, UnknownAndAbsentIdsAreIgnored)
{
    RpcCorrelator correlator;
    WireCapture wire;
    auto future = correlator.send_request(wire.writer(), "a", json::object(), 5s);

    EXPECT_FALSE(correlator.handle_message(response(99, json::object())));
    EXPECT_FALSE(correlator.handle_message({{"jsonrpc", "2.0"}, {"method", "notifications/log"}}));
    EXPECT_FALSE(correlator.handle_message({{"level", "info"}, {"msg", "diagnostic json"}}));
    EXPECT_FALSE(correlator.handle_message({{"jsonrpc", "2.0"}, {"id", "1"}, {"result", 1}}));

    EXPECT_EQ(correlator.pending_count(), 1u);
    EXPECT_EQ(future.wait_for(0ms), std::future_status::timeout);
}

TEST(RpcCorrelatorTest, ExpiredRequestFailsWithTimeoutAndLateResponseIsIgnored)
{
    RpcCorrelator correlator;
    WireCapture wire;

    auto future = correlator.send_request(wire.writer(), "tools/call", json::object(), 10ms);
    auto keep = correlator.send_request(wire.writer(), "other", json::object(), 10s);

    EXPECT_EQ(correlator.expire_overdue(RpcCorrelator::Clock::now() + 50ms), 1u);

    try
    {
        future.get();
        FAIL() << "expected RequestTimeoutError";
    }
    catch (const toolhost::RequestTimeoutError& e)
    {
        EXPECT_EQ(e.method(), "tools/call");
        EXPECT_EQ(e.id(), 1);
    }

    // Late response for the expired id changes nothing
    EXPECT_FALSE(correlator.handle_message(response(1, json::object())));
    EXPECT_EQ(correlator.pending_count(), 1u);
    EXPECT_EQ(keep.wait_for(0ms), std::future_status::timeout);
}

TEST(RpcCorrelatorTest, NextDeadlineTracksEarliestRequest)
{
    RpcCorrelator correlator;
    WireCapture wire;
    EXPECT_FALSE(correlator.next_deadline().has_value());

    auto before = RpcCorrelator::Clock::now();
    correlator.send_request(wire.writer(), "a", json::object(), 10s, {}, {});
    correlator.send_request(wire.writer(), "b", json::object(), 1s, {}, {});

    auto deadline = correlator.next_deadline();
    ASSERT_TRUE(deadline.has_value());
    EXPECT_LT(*deadline, before + 2s);
}

TEST(RpcCorrelatorTest, FailAllSettlesEveryPendingRequest)
{
    RpcCorrelator correlator;
    WireCapture wire;

    auto a = correlator.send_request(wire.writer(), "a", json::object(), 5s);
    auto b = correlator.send_request(wire.writer(), "b", json::object(), 5s);

    EXPECT_EQ(correlator.fail_all(std::make_exception_ptr(
                  toolhost::SupervisorStoppingError("Supervisor is stopping"))),
              2u);
    EXPECT_THROW(a.get(), toolhost::SupervisorStoppingError);
    EXPECT_THROW(b.get(), toolhost::SupervisorStoppingError);
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST(RpcCorrelatorTest, WriteFailureSettlesWithConnectionError)
{
    RpcCorrelator correlator;
    auto failing = [](const std::string&) { throw std::runtime_error("Broken pipe"); };

    auto future = correlator.send_request(failing, "a", json::object(), 5s);
    EXPECT_THROW(future.get(), toolhost::ConnectionError);
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST(RpcCorrelatorTest, NotificationsCarryNoId)
{
    RpcCorrelator correlator;
    WireCapture wire;
    correlator.send_notification(wire.writer(), "notifications/initialized");

    ASSERT_EQ(wire.lines.size(), 1u);
    EXPECT_FALSE(wire.lines[0].contains("id"));
    EXPECT_EQ(wire.lines[0]["method"], "notifications/initialized");
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST(RpcCorrelatorTest, DestructorFailsOutstandingRequests)
{
    std::future<json> future;
    {
        RpcCorrelator correlator;
        WireCapture wire;
        future = correlator.send_request(wire.writer(), "a", json::object(), 5s);
    }
    EXPECT_THROW(future.get(), toolhost::SupervisorStoppingError);
}

// Each request settles exactly once even when responses, expiry and fail_all race
TEST(RpcCorrelatorTest, EveryRequestSettlesExactlyOnceUnderRaces)
{
    constexpr int kRequests = 200;
    RpcCorrelator correlator;
    std::vector<std::atomic<int>> settled(kRequests + 1);
    for (auto& s : settled)
        s = 0;

    auto noop = [](const std::string&) {};
    for (int i = 0; i < kRequests; ++i)
    {
        correlator.send_request(
            noop, "m", json::object(), (i % 3 == 0) ? 1ms : 10s,
            [&settled, i](const json&) { ++settled[i + 1]; },
            [&settled, i](std::exception_ptr) { ++settled[i + 1]; });
    }

    std::thread responder(
        [&]
        {
            for (int id = kRequests; id >= 1; --id)
                correlator.handle_message(response(id, json::object()));
        });
    std::thread expirer(
        [&]
        {
            for (int i = 0; i < 20; ++i)
                correlator.expire_overdue(RpcCorrelator::Clock::now() + 5ms);
        });

    responder.join();
    expirer.join();
    correlator.fail_all(std::make_exception_ptr(toolhost::SupervisorStoppingError("stop")));

    for (int id = 1; id <= kRequests; ++id)
        EXPECT_EQ(settled[id].load(), 1) << "request id " << id;
    EXPECT_EQ(correlator.pending_count(), 0u);
}

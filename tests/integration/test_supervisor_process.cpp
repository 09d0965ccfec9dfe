// End-to-end supervisor runs against the toolhost_fake_server fixture.

#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <toolhost/toolhost.hpp>

using namespace toolhost;
using namespace std::chrono_literals;

namespace
{
SupervisorOptions fake_server_options(EnvironmentBundle environment = {})
{
    SupervisorOptions options;
    options.executable = test::fake_server_path();
    options.environment = std::move(environment);
    options.handshake_timeout_ms = 1000;
    options.request_timeout_ms = 5000;
    options.termination_grace_ms = 500;
    return options;
}
} // namespace

TEST(SupervisorProcessTest, StartListAndCall)
{
    SKIP_WITHOUT_FAKE_SERVER();

    ToolSupervisor supervisor(fake_server_options({{"TENANT_ID", "tenant-1"}}));
    supervisor.start().get();

    EXPECT_TRUE(supervisor.is_ready());
    EXPECT_EQ(supervisor.active_tier(), ClientTier::Persistent);
    EXPECT_GT(supervisor.get_pid(), 0);
    EXPECT_EQ((*supervisor.server_info())["serverInfo"]["name"], "fake-tool-server");

    auto tools = supervisor.list_tools().get();
    ASSERT_EQ(tools.size(), 4u);
    EXPECT_EQ(tools[0].name, "echo_env");

    auto tenant = supervisor.call_tool("echo_env", {{"name", "TENANT_ID"}}).get();
    EXPECT_EQ(tenant.text(), "tenant-1");

    supervisor.stop().get();
    EXPECT_FALSE(supervisor.is_alive());
}

TEST(SupervisorProcessTest, GenericQueryReachesGraphTool)
{
    SKIP_WITHOUT_FAKE_SERVER();

    ToolSupervisor supervisor(fake_server_options());
    supervisor.start().get();

    auto result = supervisor.call_tool("query", {{"endpoint", "/me"}, {"method", "GET"}}).get();
    json data = json::parse(result.text());
    EXPECT_EQ(data["displayName"], "Test User");
    EXPECT_EQ(data["requestedPath"], "/me");
    EXPECT_EQ(data["requestedMethod"], "get");
}

TEST(SupervisorProcessTest, ConcurrentCallsResolveIndependently)
{
    SKIP_WITHOUT_FAKE_SERVER();

    ToolSupervisor supervisor(fake_server_options());
    supervisor.start().get();

    std::vector<std::future<ToolResult>> calls;
    for (int i = 0; i < 20; ++i)
        calls.push_back(supervisor.call_tool("add", {{"a", i}, {"b", 100}}));

    for (int i = 0; i < 20; ++i)
        EXPECT_EQ(calls[i].get().text(), std::to_string(i + 100));
    EXPECT_EQ(supervisor.pending_requests(), 0u);
}

// Only the enhanced tier carries the variable the server insists on
TEST(SupervisorProcessTest, FallsBackToTierThatCompletesHandshake)
{
    SKIP_WITHOUT_FAKE_SERVER();

    auto options = fake_server_options({{"FAKE_SERVER_SILENT_UNLESS", "GRAPH_IDENTITY"}});
    options.handshake_timeout_ms = 300;
    options.enhanced_identity = {{"GRAPH_IDENTITY", "enhanced"}};
    ToolSupervisor supervisor(options);

    supervisor.start().get();
    EXPECT_EQ(supervisor.active_tier(), ClientTier::EnhancedGraphAccess);

    auto identity = supervisor.call_tool("echo_env", {{"name", "GRAPH_IDENTITY"}}).get();
    EXPECT_EQ(identity.text(), "enhanced");
}

TEST(SupervisorProcessTest, LegacyScriptTierExportsEnvironment)
{
    SKIP_WITHOUT_FAKE_SERVER();

    auto options = fake_server_options({{"ACCESS_TOKEN", "aaa.bbb.ccc"}});
    options.launch_order = {ClientTier::Legacy};
    ToolSupervisor supervisor(options);

    supervisor.start().get();
    EXPECT_EQ(supervisor.active_tier(), ClientTier::Legacy);
    EXPECT_EQ(supervisor.call_tool("echo_env", {{"name", "ACCESS_TOKEN"}}).get().text(),
              "aaa.bbb.ccc");
}

TEST(SupervisorProcessTest, NoiseOnStdoutIsTolerated)
{
    SKIP_WITHOUT_FAKE_SERVER();

    ToolSupervisor supervisor(fake_server_options({{"FAKE_SERVER_MODE", "noise"}}));
    supervisor.start().get();
    EXPECT_EQ(supervisor.call_tool("add", {{"a", 1}, {"b", 1}}).get().text(), "2");
}

TEST(SupervisorProcessTest, ServerInitiatedRequestsDoNotDisturbCalls)
{
    SKIP_WITHOUT_FAKE_SERVER();

    ToolSupervisor supervisor(fake_server_options({{"FAKE_SERVER_MODE", "ping"}}));
    supervisor.start().get();
    EXPECT_EQ(supervisor.call_tool("add", {{"a", 2}, {"b", 2}}).get().text(), "4");
    EXPECT_TRUE(supervisor.is_ready());
}

TEST(SupervisorProcessTest, CrashSurfacesAndSupervisorRecovers)
{
    SKIP_WITHOUT_FAKE_SERVER();

    ToolSupervisor supervisor(
        fake_server_options({{"FAKE_SERVER_CRASH_AFTER", "1"}, {"FAKE_SERVER_EXIT_CODE", "4"}}));
    supervisor.start().get();

    EXPECT_EQ(supervisor.call_tool("add", {{"a", 1}, {"b", 2}}).get().text(), "3");

    try
    {
        supervisor.call_tool("add", {{"a", 1}, {"b", 2}}).get();
        FAIL() << "expected ProcessCrashError";
    }
    catch (const ProcessCrashError& e)
    {
        EXPECT_EQ(e.exit_code(), std::optional<int>(4));
    }

    ASSERT_TRUE(test::wait_until([&] { return supervisor.state() == SupervisorState::Idle; }));
    EXPECT_FALSE(supervisor.is_alive());

    supervisor.start().get();
    EXPECT_EQ(supervisor.call_tool("add", {{"a", 2}, {"b", 2}}).get().text(), "4");
}

TEST(SupervisorProcessTest, EchoingServerIsReportedAsMisconfigured)
{
    SKIP_WITHOUT_FAKE_SERVER();

    ToolSupervisor supervisor(fake_server_options({{"FAKE_SERVER_ECHO", "1"}}));
    supervisor.start().get();

    EXPECT_THROW(supervisor.call_tool("query", {{"endpoint", "/me"}}).get(), ConfigurationError);
}

TEST(SupervisorProcessTest, RestartAppliesNewCredentials)
{
    SKIP_WITHOUT_FAKE_SERVER();

    ToolSupervisor supervisor(fake_server_options({{"ACCESS_TOKEN", "old.token.value"}}));
    supervisor.start().get();
    long first_pid = supervisor.get_pid();

    supervisor.restart_with_new_credentials({{"ACCESS_TOKEN", "new.token.value"}}).get();

    EXPECT_NE(supervisor.get_pid(), first_pid);
    EXPECT_EQ(supervisor.call_tool("echo_env", {{"name", "ACCESS_TOKEN"}}).get().text(),
              "new.token.value");
}

TEST(SupervisorProcessTest, RestartRejectsCallsInFlight)
{
    SKIP_WITHOUT_FAKE_SERVER();

    ToolSupervisor supervisor(fake_server_options({{"ACCESS_TOKEN", "old.token.value"}}));
    supervisor.start().get();
    long first_pid = supervisor.get_pid();

    auto slow = supervisor.call_tool("sleep", {{"ms", 20000}});
    ASSERT_TRUE(test::wait_until([&] { return supervisor.pending_requests() == 1; }));

    supervisor.restart_with_new_credentials({{"ACCESS_TOKEN", "new.token.value"}}).get();

    ASSERT_EQ(slow.wait_for(0ms), std::future_status::ready);
    EXPECT_THROW(slow.get(), SupervisorStoppingError);
    EXPECT_NE(supervisor.get_pid(), first_pid);
    EXPECT_EQ(supervisor.call_tool("add", {{"a", 1}, {"b", 1}}).get().text(), "2");
}

TEST(SupervisorProcessTest, StopTerminatesStubbornServer)
{
    SKIP_WITHOUT_FAKE_SERVER();

    ToolSupervisor supervisor(fake_server_options({{"FAKE_SERVER_MODE", "ignore_sigterm"}}));
    supervisor.start().get();

    auto slow = supervisor.call_tool("sleep", {{"ms", 20000}});
    std::this_thread::sleep_for(100ms);

    auto started = std::chrono::steady_clock::now();
    supervisor.stop().get();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

    EXPECT_THROW(slow.get(), SupervisorStoppingError);
    EXPECT_FALSE(supervisor.is_alive());
}

TEST(SupervisorProcessTest, UnknownExecutableFailsEveryTier)
{
    auto options = fake_server_options();
    options.executable = "toolhost-definitely-missing-tool";
    ToolSupervisor missing(options);

    try
    {
        missing.start().get();
        FAIL() << "expected LaunchError";
    }
    catch (const LaunchError& e)
    {
        EXPECT_EQ(e.attempts().size(), 3u);
    }
    EXPECT_EQ(missing.state(), SupervisorState::Failed);
}

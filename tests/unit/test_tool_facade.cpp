#include <gtest/gtest.h>
#include <toolhost/errors.hpp>
#include <toolhost/tools.hpp>

using namespace toolhost;

namespace
{
ToolFacade echo_checked_facade()
{
    SanityChecker checker;
    checker.add_check("echoed_arguments", check_echoed_arguments);
    return ToolFacade(default_tool_aliases(), std::move(checker));
}

json text_result(const std::string& text)
{
    return {{"content", json::array({{{"type", "text"}, {"text", text}}})}};
}
} // namespace

// ============================================================================
// Alias mapping
// ============================================================================

TEST(ToolFacadeTest, GenericQueryMapsToGraphTool)
{
    auto facade = echo_checked_facade();
    auto call = facade.map_call(
        "query", {{"endpoint", "/me"}, {"method", "GET"}, {"query", {{"$top", 5}}}});

    EXPECT_EQ(call.requested_name, "query");
    EXPECT_EQ(call.target_name, "Lokka-Microsoft");
    EXPECT_EQ(call.arguments["apiType"], "graph");
    EXPECT_EQ(call.arguments["method"], "get");
    EXPECT_EQ(call.arguments["path"], "/me");
    EXPECT_EQ(call.arguments["queryParams"]["$top"], "5");
    EXPECT_EQ(call.original_arguments["endpoint"], "/me");
}

TEST(ToolFacadeTest, UnaliasedToolPassesThrough)
{
    auto facade = echo_checked_facade();
    json args = {{"a", 1}, {"b", 2}};
    auto call = facade.map_call("add", args);

    EXPECT_EQ(call.target_name, "add");
    EXPECT_EQ(call.arguments, args);
}

TEST(ToolFacadeTest, NullArgumentsBecomeEmptyObject)
{
    auto facade = echo_checked_facade();
    auto call = facade.map_call("list", nullptr);
    EXPECT_TRUE(call.arguments.is_object());
    EXPECT_TRUE(call.arguments.empty());
}

TEST(ToolFacadeTest, ReshapeGraphQueryKeepsOptionalFields)
{
    json out = reshape_graph_query({{"path", "/users"},
                                    {"apiType", "azure"},
                                    {"body", {{"x", 1}}},
                                    {"apiVersion", "2021-04-01"},
                                    {"subscriptionId", "sub"}});

    EXPECT_EQ(out["apiType"], "azure");
    EXPECT_EQ(out["method"], "get");
    EXPECT_EQ(out["path"], "/users");
    EXPECT_EQ(out["body"]["x"], 1);
    EXPECT_EQ(out["apiVersion"], "2021-04-01");
    EXPECT_EQ(out["subscriptionId"], "sub");
    EXPECT_FALSE(out.contains("queryParams"));
}

TEST(ToolFacadeTest, ArgumentShapeNames)
{
    EXPECT_EQ(parse_argument_shape("graph_query"), ArgumentShape::GraphQuery);
    EXPECT_EQ(parse_argument_shape("passthrough"), ArgumentShape::Passthrough);
    EXPECT_FALSE(parse_argument_shape("other").has_value());
    EXPECT_EQ(to_string(ArgumentShape::GraphQuery), "graph_query");
}

// ============================================================================
// Result interpretation and echo detection
// ============================================================================

TEST(ToolFacadeTest, GenuineResultIsReturned)
{
    auto facade = echo_checked_facade();
    auto call = facade.map_call("query", {{"endpoint", "/me"}, {"method", "GET"}});

    auto result = facade.interpret_result(call, text_result("{\"displayName\":\"Test User\"}"));
    EXPECT_EQ(result.text(), "{\"displayName\":\"Test User\"}");
    EXPECT_FALSE(result.is_error);
}

TEST(ToolFacadeTest, IsErrorFlagIsCarried)
{
    auto facade = echo_checked_facade();
    auto call = facade.map_call("add", {{"a", 1}});
    json raw = text_result("bad input");
    raw["isError"] = true;

    EXPECT_TRUE(facade.interpret_result(call, raw).is_error);
}

// A result that parrots the call arguments is rejected
TEST(ToolFacadeTest, EchoedArgumentsRaiseConfigurationError)
{
    auto facade = echo_checked_facade();
    auto call = facade.map_call("query", {{"endpoint", "/me"}, {"method", "GET"}});

    EXPECT_THROW(facade.interpret_result(call, text_result(call.arguments.dump())),
                 ConfigurationError);
    EXPECT_THROW(facade.interpret_result(call, text_result(call.original_arguments.dump(2))),
                 ConfigurationError);
    EXPECT_THROW(facade.interpret_result(
                     call, text_result("Response from tool Lokka-Microsoft with args {...}")),
                 ConfigurationError);
}

TEST(ToolFacadeTest, EchoCheckIgnoresCallsWithoutArguments)
{
    auto facade = echo_checked_facade();
    auto call = facade.map_call("status", json::object());
    EXPECT_NO_THROW(facade.interpret_result(call, text_result("{}")));
}

TEST(ToolFacadeTest, KeywordCheckIsOptIn)
{
    auto facade = echo_checked_facade();
    auto call = facade.map_call("add", {{"a", 1}});
    json raw = text_result("graph results for args a");

    EXPECT_NO_THROW(facade.interpret_result(call, raw));

    SanityChecker checker;
    checker.add_check("argument_keywords", check_argument_keywords);
    ToolFacade strict(default_tool_aliases(), std::move(checker));
    EXPECT_THROW(strict.interpret_result(call, raw), ConfigurationError);
}

TEST(ToolFacadeTest, CheckerNamesTheFailedCheck)
{
    SanityChecker checker;
    checker.add_check("always", [](const ToolCall&, const ToolResult&)
                      { return std::optional<std::string>("nope"); });
    EXPECT_EQ(checker.size(), 1u);

    ToolCall call;
    call.requested_name = "x";
    try
    {
        checker.verify(call, ToolResult{});
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_NE(std::string(e.what()).find("always: nope"), std::string::npos);
    }
}

// ============================================================================
// tools/list and cache
// ============================================================================

TEST(ToolFacadeTest, ParseToolList)
{
    auto tools = ToolFacade::parse_tool_list(
        {{"tools",
          json::array({{{"name", "a"}, {"description", "A"}, {"inputSchema", {{"type", "object"}}}},
                       {{"name", "b"}}})}});

    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "a");
    EXPECT_EQ(tools[0].description, "A");
    EXPECT_EQ(tools[0].input_schema["type"], "object");
    EXPECT_EQ(tools[1].name, "b");
}

TEST(ToolFacadeTest, MalformedToolListThrows)
{
    EXPECT_THROW(ToolFacade::parse_tool_list(json::object()), ToolhostError);
    EXPECT_THROW(ToolFacade::parse_tool_list({{"tools", json::array({{{"x", 1}}})}}),
                 ToolhostError);
}

TEST(ToolFacadeTest, CacheAndInvalidate)
{
    auto facade = echo_checked_facade();
    EXPECT_FALSE(facade.cached_tools().has_value());

    facade.cache_tools({ToolDescriptor{"a", "", json::object()}});
    ASSERT_TRUE(facade.cached_tools().has_value());
    EXPECT_EQ(facade.cached_tools()->at(0).name, "a");

    facade.invalidate();
    EXPECT_FALSE(facade.cached_tools().has_value());
}

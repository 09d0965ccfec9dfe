#include <gtest/gtest.h>
#include <toolhost/types.hpp>

using namespace toolhost;

TEST(TypesTest, ClientTierNames)
{
    EXPECT_EQ(to_string(ClientTier::Persistent), "Persistent");
    EXPECT_EQ(to_string(ClientTier::EnhancedGraphAccess), "EnhancedGraphAccess");
    EXPECT_EQ(to_string(ClientTier::None), "None");

    EXPECT_EQ(parse_client_tier("Managed"), ClientTier::Managed);
    EXPECT_EQ(parse_client_tier("Legacy"), ClientTier::Legacy);
    EXPECT_FALSE(parse_client_tier("managed").has_value());
    EXPECT_FALSE(parse_client_tier("").has_value());
}

TEST(TypesTest, SupervisorStateNames)
{
    EXPECT_EQ(to_string(SupervisorState::Idle), "Idle");
    EXPECT_EQ(to_string(SupervisorState::Ready), "Ready");
    EXPECT_EQ(to_string(SupervisorState::Restarting), "Restarting");
    EXPECT_EQ(to_string(SupervisorState::Failed), "Failed");
}

TEST(TypesTest, LogLevelNames)
{
    EXPECT_EQ(to_string(LogLevel::Warning), "warning");
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(TypesTest, ToolDescriptorFromJson)
{
    auto tool = ToolDescriptor::from_json(
        {{"name", "Lokka-Microsoft"},
         {"description", "Query Microsoft APIs"},
         {"inputSchema", {{"type", "object"}, {"required", {"apiType", "path"}}}}});

    EXPECT_EQ(tool.name, "Lokka-Microsoft");
    EXPECT_EQ(tool.description, "Query Microsoft APIs");
    EXPECT_EQ(tool.input_schema["required"].size(), 2u);

    json back = tool.to_json();
    EXPECT_EQ(back["name"], "Lokka-Microsoft");
    EXPECT_EQ(back["inputSchema"]["type"], "object");
}

TEST(TypesTest, ToolDescriptorDefaults)
{
    auto tool = ToolDescriptor::from_json({{"name", "bare"}, {"description", 5}});

    EXPECT_EQ(tool.name, "bare");
    EXPECT_TRUE(tool.description.empty());
    EXPECT_TRUE(tool.input_schema.is_object());
    EXPECT_TRUE(tool.input_schema.empty());
}

TEST(TypesTest, ToolDescriptorRequiresName)
{
    EXPECT_THROW(ToolDescriptor::from_json({{"description", "x"}}), json::exception);
}

TEST(TypesTest, ToolResultTextJoinsTextBlocks)
{
    ToolResult result;
    result.content = json::array({{{"type", "text"}, {"text", "first"}},
                                  {{"type", "image"}, {"data", "..."}},
                                  {{"type", "text"}, {"text", "second"}},
                                  {{"type", "text"}, {"text", 42}}});

    EXPECT_EQ(result.text(), "first\nsecond");
}

TEST(TypesTest, ToolResultTextEmpty)
{
    ToolResult result;
    EXPECT_EQ(result.text(), "");
    EXPECT_FALSE(result.is_error);

    result.content = "not an array";
    EXPECT_EQ(result.text(), "");
}

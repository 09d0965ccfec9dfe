#include <toolhost/types.hpp>

namespace toolhost
{

std::string to_string(ClientTier tier)
{
    switch (tier)
    {
    case ClientTier::Persistent:
        return "Persistent";
    case ClientTier::Managed:
        return "Managed";
    case ClientTier::EnhancedGraphAccess:
        return "EnhancedGraphAccess";
    case ClientTier::Legacy:
        return "Legacy";
    case ClientTier::None:
        return "None";
    }
    return "None";
}

std::optional<ClientTier> parse_client_tier(const std::string& name)
{
    for (auto tier : {ClientTier::Persistent, ClientTier::Managed, ClientTier::EnhancedGraphAccess,
                      ClientTier::Legacy, ClientTier::None})
        if (to_string(tier) == name)
            return tier;
    return std::nullopt;
}

std::string to_string(SupervisorState state)
{
    switch (state)
    {
    case SupervisorState::Idle:
        return "Idle";
    case SupervisorState::Starting:
        return "Starting";
    case SupervisorState::Ready:
        return "Ready";
    case SupervisorState::Restarting:
        return "Restarting";
    case SupervisorState::Stopping:
        return "Stopping";
    case SupervisorState::Failed:
        return "Failed";
    }
    return "Idle";
}

std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

std::optional<LogLevel> parse_log_level(const std::string& name)
{
    for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error})
        if (to_string(level) == name)
            return level;
    return std::nullopt;
}

ToolDescriptor ToolDescriptor::from_json(const json& j)
{
    ToolDescriptor tool;
    tool.name = j.at("name").get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        tool.description = j["description"].get<std::string>();
    if (j.contains("inputSchema") && j["inputSchema"].is_object())
        tool.input_schema = j["inputSchema"];
    return tool;
}

json ToolDescriptor::to_json() const
{
    return {{"name", name}, {"description", description}, {"inputSchema", input_schema}};
}

std::string ToolResult::text() const
{
    std::string out;
    if (!content.is_array())
        return out;

    for (const auto& block : content)
    {
        if (!block.is_object() || block.value("type", "") != "text")
            continue;
        if (!block.contains("text") || !block["text"].is_string())
            continue;
        if (!out.empty())
            out += "\n";
        out += block["text"].get<std::string>();
    }
    return out;
}

} // namespace toolhost

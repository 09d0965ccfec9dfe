#ifndef TOOLHOST_TYPES_HPP
#define TOOLHOST_TYPES_HPP

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace toolhost
{

using json = nlohmann::json;

// Which launch strategy owns the running child
enum class ClientTier
{
    Persistent,
    Managed,
    EnhancedGraphAccess,
    Legacy,
    None
};

std::string to_string(ClientTier tier);
std::optional<ClientTier> parse_client_tier(const std::string& name);

enum class SupervisorState
{
    Idle,
    Starting,
    Ready,
    Restarting,
    Stopping,
    Failed
};

std::string to_string(SupervisorState state);

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

std::string to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& name);

using LogCallback = std::function<void(LogLevel, const std::string&)>;
using StderrCallback = std::function<void(const std::string&)>;

// Tool as advertised by tools/list
struct ToolDescriptor
{
    std::string name;
    std::string description;
    json input_schema = json::object();

    static ToolDescriptor from_json(const json& j);
    json to_json() const;
};

// Result of tools/call
struct ToolResult
{
    json content = json::array(); // MCP content blocks
    bool is_error = false;
    json raw;                     // Full result object as received

    // Concatenated text of all "text" content blocks
    std::string text() const;
};

} // namespace toolhost

#endif // TOOLHOST_TYPES_HPP

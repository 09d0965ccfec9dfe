#ifndef TOOLHOST_TOOLS_HPP
#define TOOLHOST_TOOLS_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <toolhost/types.hpp>
#include <vector>

namespace toolhost
{

// How arguments of an aliased tool are rewritten
enum class ArgumentShape
{
    Passthrough,
    // {endpoint|path, method, query|queryParams, body, apiType, apiVersion, subscriptionId}
    // -> {apiType, method (lower-case), path, queryParams, body, apiVersion, subscriptionId}
    GraphQuery
};

std::string to_string(ArgumentShape shape);
std::optional<ArgumentShape> parse_argument_shape(const std::string& name);

// Generic tool name exposed to callers, mapped onto the wrapped tool's method
struct ToolAlias
{
    std::string generic_name;
    std::string target_name;
    ArgumentShape shape = ArgumentShape::Passthrough;
};

// "query" and "microsoft_graph_query" -> "Lokka-Microsoft"
std::vector<ToolAlias> default_tool_aliases();

json reshape_graph_query(const json& arguments);

// A call after alias mapping
struct ToolCall
{
    std::string requested_name;
    std::string target_name;
    json arguments;          // as sent to the child
    json original_arguments; // as supplied by the caller
};

// Returns a description of the problem, or nullopt when the result looks genuine
using ResponseCheck =
    std::function<std::optional<std::string>(const ToolCall&, const ToolResult&)>;

// Structural echo detection: the result text contains the serialized arguments, a text
// block decodes to the arguments, or the result announces "... with args".
std::optional<std::string> check_echoed_arguments(const ToolCall& call, const ToolResult& result);

// Keyword heuristic ("query with args", "apitype", method+path, graph+args).
// Prone to false positives on real data; not installed by default.
std::optional<std::string> check_argument_keywords(const ToolCall& call, const ToolResult& result);

class SanityChecker
{
  public:
    SanityChecker() = default;

    void add_check(std::string name, ResponseCheck check);

    // Throws ConfigurationError naming the failed check
    void verify(const ToolCall& call, const ToolResult& result) const;

    size_t size() const
    {
        return checks_.size();
    }

  private:
    std::vector<std::pair<std::string, ResponseCheck>> checks_;
};

// Maps generic calls onto the wrapped tool, interprets results, caches tools/list
class ToolFacade
{
  public:
    ToolFacade(std::vector<ToolAlias> aliases, SanityChecker checker);

    ToolCall map_call(const std::string& name, const json& arguments) const;

    // Build the ToolResult for a tools/call result and run the sanity checks
    ToolResult interpret_result(const ToolCall& call, const json& result) const;

    // Parse {tools:[...]}; throws ToolhostError on a malformed payload
    static std::vector<ToolDescriptor> parse_tool_list(const json& result);

    void cache_tools(std::vector<ToolDescriptor> tools);
    std::optional<std::vector<ToolDescriptor>> cached_tools() const;
    void invalidate();

    const std::vector<ToolAlias>& aliases() const
    {
        return aliases_;
    }

  private:
    std::vector<ToolAlias> aliases_;
    SanityChecker checker_;

    mutable std::mutex cache_mutex_;
    std::optional<std::vector<ToolDescriptor>> cache_;
};

} // namespace toolhost

#endif // TOOLHOST_TOOLS_HPP

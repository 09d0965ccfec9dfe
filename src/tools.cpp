#include <algorithm>
#include <cctype>
#include <toolhost/errors.hpp>
#include <toolhost/tools.hpp>

namespace toolhost
{

namespace
{
std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

bool has_arguments(const json& args)
{
    return !args.is_null() && !(args.is_object() && args.empty());
}

std::string string_field(const json& args, const char* key)
{
    if (args.contains(key) && args[key].is_string())
        return args[key].get<std::string>();
    return {};
}

// Query parameter values are sent as strings
json stringify_values(const json& params)
{
    if (!params.is_object())
        return params;

    json out = json::object();
    for (auto it = params.begin(); it != params.end(); ++it)
        out[it.key()] = it.value().is_string() ? it.value() : json(it.value().dump());
    return out;
}

// Everything the result says in plain text: text blocks, or the dump when there are none
std::string result_text(const ToolResult& result)
{
    std::string text = result.text();
    if (text.empty() && !result.raw.is_null())
        text = result.raw.dump();
    return text;
}
} // namespace

std::string to_string(ArgumentShape shape)
{
    return shape == ArgumentShape::GraphQuery ? "graph_query" : "passthrough";
}

std::optional<ArgumentShape> parse_argument_shape(const std::string& name)
{
    if (name == "graph_query")
        return ArgumentShape::GraphQuery;
    if (name == "passthrough")
        return ArgumentShape::Passthrough;
    return std::nullopt;
}

std::vector<ToolAlias> default_tool_aliases()
{
    return {
        {"query", "Lokka-Microsoft", ArgumentShape::GraphQuery},
        {"microsoft_graph_query", "Lokka-Microsoft", ArgumentShape::GraphQuery},
    };
}

json reshape_graph_query(const json& arguments)
{
    json out = json::object();
    if (!arguments.is_object())
        return out;

    std::string api_type = string_field(arguments, "apiType");
    out["apiType"] = api_type.empty() ? "graph" : api_type;

    std::string method = lower(string_field(arguments, "method"));
    out["method"] = method.empty() ? "get" : method;

    std::string path = string_field(arguments, "endpoint");
    if (path.empty())
        path = string_field(arguments, "path");
    out["path"] = path;

    for (const char* key : {"queryParams", "query", "params"})
    {
        if (arguments.contains(key) && arguments[key].is_object())
        {
            out["queryParams"] = stringify_values(arguments[key]);
            break;
        }
    }

    if (arguments.contains("body") && !arguments["body"].is_null())
        out["body"] = arguments["body"];
    if (arguments.contains("apiVersion") && arguments["apiVersion"].is_string())
        out["apiVersion"] = arguments["apiVersion"];
    if (arguments.contains("graphApiVersion") && arguments["graphApiVersion"].is_string())
        out["graphApiVersion"] = arguments["graphApiVersion"];
    if (arguments.contains("subscriptionId") && arguments["subscriptionId"].is_string())
        out["subscriptionId"] = arguments["subscriptionId"];

    return out;
}

// ============================================================================
// Response checks
// ============================================================================

std::optional<std::string> check_echoed_arguments(const ToolCall& call, const ToolResult& result)
{
    if (!has_arguments(call.original_arguments) && !has_arguments(call.arguments))
        return std::nullopt;

    const std::string text = result_text(result);

    for (const json* args : {&call.original_arguments, &call.arguments})
    {
        if (!has_arguments(*args))
            continue;
        if (contains(text, args->dump()))
            return "result contains the serialized call arguments";
        if (result.raw == *args)
            return "result is the call arguments";
    }

    if (result.content.is_array())
    {
        for (const auto& block : result.content)
        {
            if (!block.is_object() || block.value("type", "") != "text" ||
                !block.contains("text") || !block["text"].is_string())
                continue;

            json decoded = json::parse(block["text"].get<std::string>(), nullptr, false);
            if (decoded.is_discarded())
                continue;
            if ((has_arguments(call.original_arguments) && decoded == call.original_arguments) ||
                (has_arguments(call.arguments) && decoded == call.arguments))
                return "a text block decodes to the call arguments";
        }
    }

    std::string lowered = lower(text);
    if (contains(lowered, "response from tool ") && contains(lowered, " with args"))
        return "result announces the tool invocation instead of data";

    return std::nullopt;
}

std::optional<std::string> check_argument_keywords(const ToolCall& call, const ToolResult& result)
{
    (void)call;
    const std::string text = lower(result_text(result));

    if (contains(text, "query with args"))
        return "result mentions 'query with args'";
    if (contains(text, "apitype"))
        return "result mentions 'apiType'";
    if (contains(text, "\"method\"") && contains(text, "\"path\""))
        return "result carries method and path fields";
    if (contains(text, "graph") && contains(text, "args"))
        return "result mentions graph arguments";

    return std::nullopt;
}

// ============================================================================
// SanityChecker
// ============================================================================

void SanityChecker::add_check(std::string name, ResponseCheck check)
{
    checks_.emplace_back(std::move(name), std::move(check));
}

void SanityChecker::verify(const ToolCall& call, const ToolResult& result) const
{
    for (const auto& [name, check] : checks_)
    {
        if (!check)
            continue;
        if (auto problem = check(call, result))
        {
            throw ConfigurationError(
                "Tool '" + call.requested_name +
                "' returned its own query arguments instead of data; the tool process is "
                "likely missing authentication or configuration (" +
                name + ": " + *problem + ")");
        }
    }
}

// ============================================================================
// ToolFacade
// ============================================================================

ToolFacade::ToolFacade(std::vector<ToolAlias> aliases, SanityChecker checker)
    : aliases_(std::move(aliases)), checker_(std::move(checker))
{
}

ToolCall ToolFacade::map_call(const std::string& name, const json& arguments) const
{
    ToolCall call;
    call.requested_name = name;
    call.target_name = name;
    call.original_arguments = arguments.is_null() ? json::object() : arguments;
    call.arguments = call.original_arguments;

    for (const auto& alias : aliases_)
    {
        if (alias.generic_name != name)
            continue;

        call.target_name = alias.target_name;
        if (alias.shape == ArgumentShape::GraphQuery)
            call.arguments = reshape_graph_query(call.original_arguments);
        break;
    }

    return call;
}

ToolResult ToolFacade::interpret_result(const ToolCall& call, const json& result) const
{
    ToolResult out;
    out.raw = result;

    if (result.is_object())
    {
        if (result.contains("content") && result["content"].is_array())
            out.content = result["content"];
        if (result.contains("isError") && result["isError"].is_boolean())
            out.is_error = result["isError"].get<bool>();
    }

    checker_.verify(call, out);
    return out;
}

std::vector<ToolDescriptor> ToolFacade::parse_tool_list(const json& result)
{
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
        throw ToolhostError("Malformed tools/list result: missing 'tools' array");

    std::vector<ToolDescriptor> tools;
    for (const auto& item : result["tools"])
    {
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string())
            throw ToolhostError("Malformed tools/list entry: " + item.dump());
        tools.push_back(ToolDescriptor::from_json(item));
    }
    return tools;
}

void ToolFacade::cache_tools(std::vector<ToolDescriptor> tools)
{
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_ = std::move(tools);
}

std::optional<std::vector<ToolDescriptor>> ToolFacade::cached_tools() const
{
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_;
}

void ToolFacade::invalidate()
{
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.reset();
}

} // namespace toolhost

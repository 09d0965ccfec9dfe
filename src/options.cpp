#include <cstdlib>
#include <fstream>
#include <toolhost/errors.hpp>
#include <toolhost/options.hpp>

namespace toolhost
{

namespace
{
std::optional<int> env_int(const char* name)
{
    const char* value = std::getenv(name);
    if (!value || !*value)
        return std::nullopt;

    try
    {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size() || parsed <= 0)
            return std::nullopt;
        return parsed;
    }
    catch (const std::logic_error&)
    {
        // invalid_argument / out_of_range: keep the configured value
        return std::nullopt;
    }
}

bool env_flag(const char* name)
{
    const char* value = std::getenv(name);
    if (!value || !*value)
        return false;
    std::string v(value);
    return v != "0" && v != "false" && v != "FALSE";
}

template <typename T> void read_field(const json& j, const char* key, T& out)
{
    if (!j.contains(key))
        return;
    try
    {
        out = j.at(key).get<T>();
    }
    catch (const json::exception& e)
    {
        throw ConfigurationError(std::string("Invalid config field '") + key + "': " + e.what());
    }
}

ClientTier tier_from_json(const json& j)
{
    if (j.is_string())
        if (auto tier = parse_client_tier(j.get<std::string>()); tier && *tier != ClientTier::None)
            return *tier;
    throw ConfigurationError("Invalid launch tier: " + j.dump());
}
} // namespace

void apply_environment_overrides(SupervisorOptions& options)
{
    if (options.executable.empty())
        if (const char* exe = std::getenv("TOOLHOST_EXECUTABLE"); exe && *exe)
            options.executable = exe;

    if (env_flag("TOOLHOST_REQUIRE_EXPLICIT_EXECUTABLE"))
        options.require_explicit_executable = true;

    if (auto ms = env_int("TOOLHOST_HANDSHAKE_TIMEOUT_MS"))
        options.handshake_timeout_ms = *ms;
    if (auto ms = env_int("TOOLHOST_REQUEST_TIMEOUT_MS"))
        options.request_timeout_ms = *ms;
}

SupervisorOptions options_from_json(const json& j)
{
    if (!j.is_object())
        throw ConfigurationError("Config must be a JSON object");

    SupervisorOptions options;
    read_field(j, "executable", options.executable);
    read_field(j, "args", options.args);
    if (j.contains("working_directory") && j["working_directory"].is_string())
        options.working_directory = j["working_directory"].get<std::string>();

    read_field(j, "environment", options.environment);
    read_field(j, "default_environment", options.default_environment);
    read_field(j, "forced_environment", options.forced_environment);
    read_field(j, "sensitive_variables", options.sensitive_variables);
    read_field(j, "inherit_environment", options.inherit_environment);
    read_field(j, "sanitize_environment", options.sanitize_environment);
    read_field(j, "allowed_env_vars", options.allowed_env_vars);

    if (j.contains("required_variables"))
    {
        if (!j["required_variables"].is_array())
            throw ConfigurationError("Invalid config field 'required_variables': expected array");
        options.required_variables.clear();
        for (const auto& item : j["required_variables"])
        {
            RequirementRule rule;
            if (item.is_string())
            {
                rule.variable = item.get<std::string>();
            }
            else if (item.is_object() && item.contains("variable"))
            {
                read_field(item, "variable", rule.variable);
                read_field(item, "when_variable", rule.when_variable);
                read_field(item, "when_value", rule.when_value);
            }
            else
            {
                throw ConfigurationError("Invalid required variable entry: " + item.dump());
            }
            options.required_variables.push_back(rule);
        }
    }

    if (j.contains("launch_order"))
    {
        if (!j["launch_order"].is_array())
            throw ConfigurationError("Invalid config field 'launch_order': expected array");
        options.launch_order.clear();
        for (const auto& item : j["launch_order"])
            options.launch_order.push_back(tier_from_json(item));
    }
    read_field(j, "enhanced_identity", options.enhanced_identity);

    read_field(j, "handshake_timeout_ms", options.handshake_timeout_ms);
    read_field(j, "request_timeout_ms", options.request_timeout_ms);
    read_field(j, "termination_grace_ms", options.termination_grace_ms);

    read_field(j, "protocol_version", options.protocol_version);
    read_field(j, "client_name", options.client_name);
    read_field(j, "client_version", options.client_version);

    read_field(j, "allowed_executable_paths", options.allowed_executable_paths);
    if (j.contains("executable_sha256") && j["executable_sha256"].is_string())
        options.executable_sha256 = j["executable_sha256"].get<std::string>();
    read_field(j, "require_explicit_executable", options.require_explicit_executable);
    read_field(j, "max_message_buffer_size", options.max_message_buffer_size);

    if (j.contains("tool_aliases"))
    {
        if (!j["tool_aliases"].is_array())
            throw ConfigurationError("Invalid config field 'tool_aliases': expected array");
        options.tool_aliases.clear();
        for (const auto& item : j["tool_aliases"])
        {
            ToolAlias alias;
            read_field(item, "generic_name", alias.generic_name);
            read_field(item, "target_name", alias.target_name);
            std::string shape = "passthrough";
            read_field(item, "shape", shape);
            auto parsed = parse_argument_shape(shape);
            if (!parsed || alias.generic_name.empty() || alias.target_name.empty())
                throw ConfigurationError("Invalid tool alias: " + item.dump());
            alias.shape = *parsed;
            options.tool_aliases.push_back(alias);
        }
    }
    read_field(j, "detect_echoed_arguments", options.detect_echoed_arguments);
    read_field(j, "detect_argument_keywords", options.detect_argument_keywords);

    if (j.contains("log_level"))
    {
        auto level = j["log_level"].is_string()
                         ? parse_log_level(j["log_level"].get<std::string>())
                         : std::nullopt;
        if (!level)
            throw ConfigurationError("Invalid log_level: " + j["log_level"].dump());
        options.log_level = *level;
    }

    return options;
}

json options_to_json(const SupervisorOptions& options)
{
    json j;
    j["executable"] = options.executable;
    j["args"] = options.args;
    if (options.working_directory)
        j["working_directory"] = *options.working_directory;

    j["environment"] = options.environment;
    j["default_environment"] = options.default_environment;
    j["forced_environment"] = options.forced_environment;
    j["sensitive_variables"] = options.sensitive_variables;
    j["inherit_environment"] = options.inherit_environment;
    j["sanitize_environment"] = options.sanitize_environment;
    j["allowed_env_vars"] = options.allowed_env_vars;

    json rules = json::array();
    for (const auto& rule : options.required_variables)
        rules.push_back({{"variable", rule.variable},
                         {"when_variable", rule.when_variable},
                         {"when_value", rule.when_value}});
    j["required_variables"] = rules;

    json order = json::array();
    for (auto tier : options.launch_order)
        order.push_back(to_string(tier));
    j["launch_order"] = order;
    j["enhanced_identity"] = options.enhanced_identity;

    j["handshake_timeout_ms"] = options.handshake_timeout_ms;
    j["request_timeout_ms"] = options.request_timeout_ms;
    j["termination_grace_ms"] = options.termination_grace_ms;
    j["protocol_version"] = options.protocol_version;
    j["client_name"] = options.client_name;
    j["client_version"] = options.client_version;

    j["allowed_executable_paths"] = options.allowed_executable_paths;
    if (options.executable_sha256)
        j["executable_sha256"] = *options.executable_sha256;
    j["require_explicit_executable"] = options.require_explicit_executable;
    j["max_message_buffer_size"] = options.max_message_buffer_size;

    json aliases = json::array();
    for (const auto& alias : options.tool_aliases)
        aliases.push_back({{"generic_name", alias.generic_name},
                           {"target_name", alias.target_name},
                           {"shape", to_string(alias.shape)}});
    j["tool_aliases"] = aliases;
    j["detect_echoed_arguments"] = options.detect_echoed_arguments;
    j["detect_argument_keywords"] = options.detect_argument_keywords;
    j["log_level"] = to_string(options.log_level);

    return j;
}

SupervisorOptions load_options_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
        throw ConfigurationError("Cannot open config file: " + path);

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded())
        throw ConfigurationError("Config file is not valid JSON: " + path);

    return options_from_json(j);
}

EnvironmentPolicy make_environment_policy(const SupervisorOptions& options)
{
    EnvironmentPolicy policy;
    policy.inherit = options.inherit_environment;
    policy.sanitize = options.sanitize_environment;
    policy.allowed_variables = options.allowed_env_vars;
    policy.defaults = options.default_environment;
    policy.forced = options.forced_environment;
    policy.sensitive_variables = options.sensitive_variables;
    policy.requirements = options.required_variables;
    return policy;
}

} // namespace toolhost

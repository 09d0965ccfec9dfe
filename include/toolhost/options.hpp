#ifndef TOOLHOST_OPTIONS_HPP
#define TOOLHOST_OPTIONS_HPP

#include <optional>
#include <set>
#include <string>
#include <toolhost/environment.hpp>
#include <toolhost/tools.hpp>
#include <toolhost/types.hpp>
#include <vector>

namespace toolhost
{

struct SupervisorOptions
{
    // Executable name (searched in the child's PATH) or path.
    // Falls back to TOOLHOST_EXECUTABLE when empty.
    std::string executable;
    std::vector<std::string> args;
    std::optional<std::string> working_directory;

    // Caller-supplied variables (credentials, mode flags); empty values are ignored
    EnvironmentBundle environment;
    // Placeholders filling absent or empty variables, e.g. USE_CLIENT_TOKEN=true
    EnvironmentBundle default_environment;
    // Applied last, even when empty
    EnvironmentBundle forced_environment;
    std::set<std::string> sensitive_variables = {"ACCESS_TOKEN", "CLIENT_SECRET"};
    std::vector<RequirementRule> required_variables;
    bool inherit_environment = true;
    // Inherit only essential system variables plus allowed_env_vars
    bool sanitize_environment = false;
    std::vector<std::string> allowed_env_vars;

    // Launch tiers in priority order
    std::vector<ClientTier> launch_order = {ClientTier::Persistent, ClientTier::Managed,
                                            ClientTier::EnhancedGraphAccess, ClientTier::Legacy};
    // Identity variables for the EnhancedGraphAccess tier (e.g. a fallback CLIENT_ID).
    // The tier is skipped when empty.
    EnvironmentBundle enhanced_identity;

    int handshake_timeout_ms = 30000;
    int request_timeout_ms = 30000;
    int termination_grace_ms = 5000;

    std::string protocol_version = "2024-11-05";
    std::string client_name = "toolhost";
    std::string client_version; // empty: library version

    // Executable verification
    std::vector<std::string> allowed_executable_paths;
    std::optional<std::string> executable_sha256;
    // Only accept executables given as a path, never a PATH search.
    // Also enabled by TOOLHOST_REQUIRE_EXPLICIT_EXECUTABLE.
    bool require_explicit_executable = false;

    size_t max_message_buffer_size = 1024 * 1024;

    // Tool façade
    std::vector<ToolAlias> tool_aliases = default_tool_aliases();
    bool detect_echoed_arguments = true;
    // Opt-in keyword heuristic (see check_argument_keywords)
    bool detect_argument_keywords = false;
    std::vector<std::pair<std::string, ResponseCheck>> response_checks;

    // Logging: callback receives everything; without one, messages at or above
    // log_level go to std::cerr
    LogLevel log_level = LogLevel::Warning;
    std::optional<LogCallback> log_callback;
    std::optional<StderrCallback> stderr_callback;
};

// Apply TOOLHOST_EXECUTABLE, TOOLHOST_REQUIRE_EXPLICIT_EXECUTABLE,
// TOOLHOST_HANDSHAKE_TIMEOUT_MS and TOOLHOST_REQUEST_TIMEOUT_MS.
// Unparseable values are ignored.
void apply_environment_overrides(SupervisorOptions& options);

// Serializable subset (callbacks and custom checks are not represented).
// Throws ConfigurationError on wrongly typed or unknown enum values.
SupervisorOptions options_from_json(const json& j);
json options_to_json(const SupervisorOptions& options);

// Read a JSON config file; throws ConfigurationError
SupervisorOptions load_options_file(const std::string& path);

EnvironmentPolicy make_environment_policy(const SupervisorOptions& options);

} // namespace toolhost

#endif // TOOLHOST_OPTIONS_HPP

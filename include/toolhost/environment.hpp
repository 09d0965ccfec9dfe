#ifndef TOOLHOST_ENVIRONMENT_HPP
#define TOOLHOST_ENVIRONMENT_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

namespace toolhost
{

// Complete environment handed to a child process
using EnvironmentBundle = std::map<std::string, std::string>;

// Variable `variable` must be non-empty. When `when_variable` is set the rule only applies
// if the bundle holds `when_value` for it (e.g. TENANT_ID required when USE_CERTIFICATE=true).
struct RequirementRule
{
    std::string variable;
    std::string when_variable;
    std::string when_value;
};

struct EnvironmentPolicy
{
    // Start from the inherited environment at all
    bool inherit = true;

    // Keep only essential system variables plus allowed_variables from the inherited set
    bool sanitize = false;
    std::vector<std::string> allowed_variables;

    // Placeholders used only where the variable is absent or empty after overrides
    EnvironmentBundle defaults;

    // Applied last, including empty values
    EnvironmentBundle forced;

    // Values stripped of control, quote and shell characters before use
    std::set<std::string> sensitive_variables = {"ACCESS_TOKEN", "CLIENT_SECRET"};

    std::vector<RequirementRule> requirements;
};

// Snapshot of this process's environment
EnvironmentBundle current_environment();

// System variables kept when the inherited environment is sanitized
const std::vector<std::string>& essential_environment_variables();

// Merge, lowest to highest precedence: inherited base, caller overrides (empty values dropped),
// default placeholders (fill-only), forced values. Sensitive values are sanitized.
// Throws ConfigurationError when a requirement is not met.
EnvironmentBundle resolve_environment(const EnvironmentBundle& base,
                                      const EnvironmentBundle& overrides,
                                      const EnvironmentPolicy& policy = {});

// Apply non-empty entries of `overrides` on top of `bundle`
void merge_non_empty(EnvironmentBundle& bundle, const EnvironmentBundle& overrides);

// Strip whitespace, control characters, quotes and shell metacharacters
std::string sanitize_secret(const std::string& value);

// Three dot-separated base64url segments
bool looks_like_jwt(const std::string& token);

// Names of variables that violate `rules`, in rule order
std::vector<std::string> missing_requirements(const EnvironmentBundle& bundle,
                                              const std::vector<RequirementRule>& rules);

// Throws ConfigurationError listing every missing variable
void validate_environment(const EnvironmentBundle& bundle,
                          const std::vector<RequirementRule>& rules);

// "NAME=SET (n chars), OTHER=NOT SET" without revealing values
std::string describe_environment(const EnvironmentBundle& bundle,
                                 const std::vector<std::string>& names);

} // namespace toolhost

#endif // TOOLHOST_ENVIRONMENT_HPP

#include <algorithm>
#include <cctype>
#include <sstream>
#include <toolhost/environment.hpp>
#include <toolhost/errors.hpp>

extern char** environ;

namespace toolhost
{

namespace
{
bool is_stripped_secret_char(unsigned char c)
{
    if (std::iscntrl(c) || std::isspace(c))
        return true;

    switch (c)
    {
    case '`':
    case '$':
    case '(':
    case ')':
    case '{':
    case '}':
    case '[':
    case ']':
    case '\\':
    case '"':
    case '\'':
    case ';':
    case '|':
    case '&':
    case '<':
    case '>':
        return true;
    default:
        return false;
    }
}

bool is_base64url(const std::string& segment)
{
    if (segment.empty())
        return false;
    return std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return std::isalnum(c) || c == '-' || c == '_'; });
}
} // namespace

EnvironmentBundle current_environment()
{
    EnvironmentBundle env;
    if (!environ)
        return env;

    for (char** entry = environ; *entry != nullptr; ++entry)
    {
        std::string item(*entry);
        auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0)
            continue;
        env.emplace(item.substr(0, eq), item.substr(eq + 1));
    }
    return env;
}

const std::vector<std::string>& essential_environment_variables()
{
    static const std::vector<std::string> vars = {
        "PATH",   // Executable lookup
        "HOME",   // Home directory access
        "TMPDIR", // Temporary directory
        "TEMP",
        "TMP",
        "LANG", // Locale settings
        "LC_ALL",
        "TERM",
        "SHELL",
        "USER",
    };
    return vars;
}

void merge_non_empty(EnvironmentBundle& bundle, const EnvironmentBundle& overrides)
{
    for (const auto& [key, value] : overrides)
        if (!value.empty())
            bundle[key] = value;
}

EnvironmentBundle resolve_environment(const EnvironmentBundle& base,
                                      const EnvironmentBundle& overrides,
                                      const EnvironmentPolicy& policy)
{
    EnvironmentBundle bundle;

    if (policy.inherit)
    {
        if (policy.sanitize)
        {
            for (const auto& name : essential_environment_variables())
                if (auto it = base.find(name); it != base.end())
                    bundle[name] = it->second;
            for (const auto& name : policy.allowed_variables)
                if (auto it = base.find(name); it != base.end())
                    bundle[name] = it->second;
        }
        else
        {
            bundle = base;
        }
    }

    merge_non_empty(bundle, overrides);

    for (const auto& [key, value] : policy.defaults)
    {
        auto it = bundle.find(key);
        if (it == bundle.end() || it->second.empty())
            bundle[key] = value;
    }

    for (const auto& [key, value] : policy.forced)
        bundle[key] = value;

    for (const auto& name : policy.sensitive_variables)
    {
        auto it = bundle.find(name);
        if (it == bundle.end())
            continue;

        std::string cleaned = sanitize_secret(it->second);
        if (cleaned.empty())
            bundle.erase(it);
        else
            it->second = std::move(cleaned);
    }

    validate_environment(bundle, policy.requirements);
    return bundle;
}

std::string sanitize_secret(const std::string& value)
{
    std::string cleaned;
    cleaned.reserve(value.size());
    for (unsigned char c : value)
        if (!is_stripped_secret_char(c))
            cleaned.push_back(static_cast<char>(c));
    return cleaned;
}

bool looks_like_jwt(const std::string& token)
{
    if (token.empty())
        return false;

    std::vector<std::string> parts;
    std::stringstream ss(token);
    std::string part;
    while (std::getline(ss, part, '.'))
        parts.push_back(part);

    if (parts.size() != 3 || token.back() == '.')
        return false;
    return std::all_of(parts.begin(), parts.end(), is_base64url);
}

std::vector<std::string> missing_requirements(const EnvironmentBundle& bundle,
                                              const std::vector<RequirementRule>& rules)
{
    std::vector<std::string> missing;
    for (const auto& rule : rules)
    {
        if (!rule.when_variable.empty())
        {
            auto cond = bundle.find(rule.when_variable);
            if (cond == bundle.end() || cond->second != rule.when_value)
                continue;
        }

        auto it = bundle.find(rule.variable);
        if (it == bundle.end() || it->second.empty())
            if (std::find(missing.begin(), missing.end(), rule.variable) == missing.end())
                missing.push_back(rule.variable);
    }
    return missing;
}

void validate_environment(const EnvironmentBundle& bundle,
                          const std::vector<RequirementRule>& rules)
{
    auto missing = missing_requirements(bundle, rules);
    if (missing.empty())
        return;

    std::string names;
    for (const auto& name : missing)
    {
        if (!names.empty())
            names += ", ";
        names += name;
    }
    throw ConfigurationError("Missing required environment variables: " + names,
                             std::move(missing));
}

std::string describe_environment(const EnvironmentBundle& bundle,
                                 const std::vector<std::string>& names)
{
    std::ostringstream oss;
    bool first = true;
    for (const auto& name : names)
    {
        if (!first)
            oss << ", ";
        first = false;

        auto it = bundle.find(name);
        if (it == bundle.end() || it->second.empty())
            oss << name << "=NOT SET";
        else
            oss << name << "=SET (" << it->second.size() << " chars)";
    }
    return oss.str();
}

} // namespace toolhost

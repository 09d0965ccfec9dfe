#include "internal/subprocess/process.hpp"
#include "internal/transport/executable_verification.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <random>
#include <sstream>
#include <sys/stat.h>
#include <toolhost/errors.hpp>
#include <toolhost/launch.hpp>
#include <unistd.h>

namespace toolhost
{

namespace
{
// Create the launcher with O_EXCL|O_NOFOLLOW so a planted file or symlink is never reused
std::string write_launcher_script(const std::string& contents, const std::string& directory)
{
    namespace fs = std::filesystem;

    auto make_name = []
    {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<int> dist(0, 15);
        std::string hex(8, '0');
        const char* digits = "0123456789abcdef";
        for (auto& c : hex)
            c = digits[dist(gen)];
        return std::string("toolhost-launch-") + hex + ".sh";
    };

    fs::path dir = directory.empty() ? fs::temp_directory_path() : fs::path(directory);

    const int max_attempts = 10;
    for (int attempt = 0; attempt < max_attempts; ++attempt)
    {
        fs::path script = dir / make_name();

        int fd = ::open(script.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC,
                        S_IRWXU);
        if (fd < 0)
        {
            if (errno == EEXIST || errno == ELOOP)
                continue; // Try a different name
            throw ToolhostError("Cannot create launcher script in " + dir.string() + ": " +
                                std::strerror(errno));
        }

        size_t written = 0;
        while (written < contents.size())
        {
            ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                int err = errno;
                ::close(fd);
                std::error_code ec;
                fs::remove(script, ec);
                throw ToolhostError("Cannot write launcher script " + script.string() + ": " +
                                    std::strerror(err));
            }
            written += static_cast<size_t>(n);
        }

        // umask may have narrowed the mode
        ::fchmod(fd, S_IRWXU);
        ::close(fd);
        return script.string();
    }

    throw ToolhostError("Failed to create launcher script after " +
                        std::to_string(max_attempts) + " attempts");
}

std::string executable_for_shell(const LaunchContext& context, const EnvironmentBundle& env)
{
    // The shell resolves bare names itself unless verification needs the real path
    if (context.verification_configured())
        return resolve_executable(context, env);
    if (context.executable.empty())
        throw ExecutableNotFoundError("No executable configured");
    return context.executable;
}

void require_shell(const LaunchContext& context, const EnvironmentBundle& env)
{
    std::optional<std::string> search_path;
    if (auto it = env.find("PATH"); it != env.end())
        search_path = it->second;
    if (!subprocess::find_executable(context.shell, search_path))
        throw ExecutableNotFoundError("Shell not available: " + context.shell);
}
} // namespace

LaunchCommand LaunchStrategy::base_command(const EnvironmentBundle& bundle,
                                           const LaunchContext& context) const
{
    LaunchCommand command;
    command.environment = bundle;
    merge_non_empty(command.environment, overrides_);
    command.inherit_environment = false;
    command.working_directory = context.working_directory;
    command.tier = tier_;
    command.strategy_name = name_;
    return command;
}

LaunchCommand DirectExecStrategy::prepare(const EnvironmentBundle& bundle,
                                          const LaunchContext& context) const
{
    LaunchCommand command = base_command(bundle, context);
    command.executable = resolve_executable(context, command.environment);
    command.args = context.args;
    return command;
}

LaunchCommand ShellExecStrategy::prepare(const EnvironmentBundle& bundle,
                                         const LaunchContext& context) const
{
    LaunchCommand command = base_command(bundle, context);
    require_shell(context, command.environment);

    command.executable = context.shell;
    command.args = {"-c", "exec \"$0\" \"$@\"", executable_for_shell(context, command.environment)};
    command.args.insert(command.args.end(), context.args.begin(), context.args.end());
    return command;
}

LaunchCommand ScriptExecStrategy::prepare(const EnvironmentBundle& bundle,
                                          const LaunchContext& context) const
{
    LaunchCommand command = base_command(bundle, context);
    require_shell(context, command.environment);

    std::string executable = executable_for_shell(context, command.environment);
    std::string script = write_launcher_script(render_script(command.environment, executable),
                                               context.staging_directory);

    command.executable = context.shell;
    command.args = {script};
    command.args.insert(command.args.end(), context.args.begin(), context.args.end());
    command.staged_files.push_back(script);
    return command;
}

std::string ScriptExecStrategy::render_script(const EnvironmentBundle& environment,
                                              const std::string& executable)
{
    std::ostringstream oss;
    oss << "#!/bin/sh\n";
    for (const auto& [key, value] : environment)
        if (is_shell_identifier(key))
            oss << "export " << key << "=" << shell_quote(value) << "\n";
    oss << "exec " << shell_quote(executable) << " \"$@\"\n";
    return oss.str();
}

std::vector<std::unique_ptr<LaunchStrategy>>
make_default_strategies(const std::vector<ClientTier>& order,
                        const EnvironmentBundle& enhanced_identity)
{
    std::vector<std::unique_ptr<LaunchStrategy>> strategies;
    std::vector<ClientTier> seen;

    for (auto tier : order)
    {
        if (std::find(seen.begin(), seen.end(), tier) != seen.end())
            continue;
        seen.push_back(tier);

        switch (tier)
        {
        case ClientTier::Persistent:
            strategies.push_back(std::make_unique<DirectExecStrategy>(tier));
            break;
        case ClientTier::Managed:
            strategies.push_back(std::make_unique<ShellExecStrategy>(tier));
            break;
        case ClientTier::EnhancedGraphAccess:
            if (!enhanced_identity.empty())
                strategies.push_back(std::make_unique<DirectExecStrategy>(
                    tier, enhanced_identity, "enhanced-direct"));
            break;
        case ClientTier::Legacy:
            strategies.push_back(std::make_unique<ScriptExecStrategy>(tier));
            break;
        case ClientTier::None:
            break;
        }
    }

    return strategies;
}

std::string resolve_executable(const LaunchContext& context, const EnvironmentBundle& bundle)
{
    if (context.executable.empty())
        throw ExecutableNotFoundError("No executable configured");

    if (context.require_explicit_executable && context.executable.find('/') == std::string::npos)
        throw ExecutableNotFoundError("An explicit executable path is required; '" +
                                      context.executable + "' would need a PATH search");

    std::optional<std::string> search_path;
    if (auto it = bundle.find("PATH"); it != bundle.end())
        search_path = it->second;

    auto resolved = subprocess::find_executable(context.executable, search_path);
    if (!resolved)
        throw ExecutableNotFoundError("Could not find executable '" + context.executable +
                                      "' in PATH");

    internal::verify_executable(*resolved, context.allowed_executable_paths,
                                context.executable_sha256);
    return *resolved;
}

std::string shell_quote(const std::string& value)
{
    std::string quoted = "'";
    for (char c : value)
    {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}

bool is_shell_identifier(const std::string& name)
{
    if (name.empty())
        return false;
    if (!(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_'))
        return false;
    for (unsigned char c : name)
        if (!(std::isalnum(c) || c == '_'))
            return false;
    return true;
}

} // namespace toolhost

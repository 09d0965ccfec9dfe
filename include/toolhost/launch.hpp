#ifndef TOOLHOST_LAUNCH_HPP
#define TOOLHOST_LAUNCH_HPP

#include <memory>
#include <optional>
#include <string>
#include <toolhost/environment.hpp>
#include <toolhost/transport.hpp>
#include <toolhost/types.hpp>
#include <vector>

namespace toolhost
{

// What every strategy needs to know about the wrapped executable
struct LaunchContext
{
    std::string executable;
    std::vector<std::string> args;
    std::optional<std::string> working_directory;

    std::vector<std::string> allowed_executable_paths;
    std::optional<std::string> executable_sha256;
    bool require_explicit_executable = false;

    std::string shell = "/bin/sh";
    // Where ScriptExecStrategy stages its launcher; empty means the temp directory
    std::string staging_directory;

    bool verification_configured() const
    {
        return !allowed_executable_paths.empty() || executable_sha256.has_value() ||
               require_explicit_executable;
    }
};

// One way of starting the wrapped executable
class LaunchStrategy
{
  public:
    LaunchStrategy(ClientTier tier, std::string name, EnvironmentBundle overrides)
        : tier_(tier), name_(std::move(name)), overrides_(std::move(overrides))
    {
    }
    virtual ~LaunchStrategy() = default;

    const std::string& name() const
    {
        return name_;
    }

    ClientTier tier() const
    {
        return tier_;
    }

    // Strategy-specific variables merged over the bundle (empty values ignored)
    const EnvironmentBundle& overrides() const
    {
        return overrides_;
    }

    // Build the command. Throws ExecutableNotFoundError or ToolhostError when the
    // strategy cannot run in this environment.
    virtual LaunchCommand prepare(const EnvironmentBundle& bundle,
                                  const LaunchContext& context) const = 0;

  protected:
    LaunchCommand base_command(const EnvironmentBundle& bundle,
                               const LaunchContext& context) const;

  private:
    ClientTier tier_;
    std::string name_;
    EnvironmentBundle overrides_;
};

// exec the resolved executable with the bundle as its whole environment
class DirectExecStrategy : public LaunchStrategy
{
  public:
    explicit DirectExecStrategy(ClientTier tier = ClientTier::Persistent,
                                EnvironmentBundle overrides = {}, std::string name = "direct")
        : LaunchStrategy(tier, std::move(name), std::move(overrides))
    {
    }

    LaunchCommand prepare(const EnvironmentBundle& bundle,
                          const LaunchContext& context) const override;
};

// /bin/sh -c 'exec "$0" "$@"' executable args...; the shell resolves PATH
class ShellExecStrategy : public LaunchStrategy
{
  public:
    explicit ShellExecStrategy(ClientTier tier = ClientTier::Managed,
                               EnvironmentBundle overrides = {}, std::string name = "shell")
        : LaunchStrategy(tier, std::move(name), std::move(overrides))
    {
    }

    LaunchCommand prepare(const EnvironmentBundle& bundle,
                          const LaunchContext& context) const override;
};

// Stages a private launcher script that exports every variable textually before
// exec'ing the executable, for contexts that drop the inherited environment
class ScriptExecStrategy : public LaunchStrategy
{
  public:
    explicit ScriptExecStrategy(ClientTier tier = ClientTier::Legacy,
                                EnvironmentBundle overrides = {}, std::string name = "script")
        : LaunchStrategy(tier, std::move(name), std::move(overrides))
    {
    }

    LaunchCommand prepare(const EnvironmentBundle& bundle,
                          const LaunchContext& context) const override;

    static std::string render_script(const EnvironmentBundle& environment,
                                     const std::string& executable);
};

// Default tier mapping: Persistent=direct, Managed=shell,
// EnhancedGraphAccess=direct with identity overrides (skipped when empty), Legacy=script
std::vector<std::unique_ptr<LaunchStrategy>>
make_default_strategies(const std::vector<ClientTier>& order,
                        const EnvironmentBundle& enhanced_identity = {});

// Resolve against the bundle's PATH and verify. Throws ExecutableNotFoundError.
std::string resolve_executable(const LaunchContext& context, const EnvironmentBundle& bundle);

// Single-quote for /bin/sh
std::string shell_quote(const std::string& value);

bool is_shell_identifier(const std::string& name);

} // namespace toolhost

#endif // TOOLHOST_LAUNCH_HPP

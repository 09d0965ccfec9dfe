#ifndef TOOLHOST_ERRORS_HPP
#define TOOLHOST_ERRORS_HPP

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolhost
{

// Base exception
class ToolhostError : public std::runtime_error
{
  public:
    explicit ToolhostError(const std::string& message) : std::runtime_error(message) {}
};

// Executable could not be found, is not allowlisted, or failed its integrity check
class ExecutableNotFoundError : public ToolhostError
{
  public:
    explicit ExecutableNotFoundError(const std::string& message) : ToolhostError(message) {}
};

// One failed launch strategy
struct LaunchAttempt
{
    std::string strategy;
    std::string tier;
    std::string reason;
};

// Every launch strategy failed
class LaunchError : public ToolhostError
{
  public:
    explicit LaunchError(const std::string& message) : ToolhostError(message) {}

    LaunchError(const std::string& message, std::vector<LaunchAttempt> attempts)
        : ToolhostError(message), attempts_(std::move(attempts))
    {
    }

    const std::vector<LaunchAttempt>& attempts() const
    {
        return attempts_;
    }

  private:
    std::vector<LaunchAttempt> attempts_;
};

// Transport not connected, or write to a terminated process
class ConnectionError : public ToolhostError
{
  public:
    explicit ConnectionError(const std::string& message) : ToolhostError(message) {}
};

// JSON decode error (framer buffer overflow)
class JSONDecodeError : public ToolhostError
{
  public:
    explicit JSONDecodeError(const std::string& message) : ToolhostError(message) {}
};

// No response arrived before the request deadline
class RequestTimeoutError : public ToolhostError
{
  public:
    RequestTimeoutError(const std::string& message, std::string method, std::int64_t id)
        : ToolhostError(message), method_(std::move(method)), id_(id)
    {
    }

    const std::string& method() const
    {
        return method_;
    }

    std::int64_t id() const
    {
        return id_;
    }

  private:
    std::string method_;
    std::int64_t id_;
};

// JSON-RPC error object returned by the child process
class RemoteError : public ToolhostError
{
  public:
    RemoteError(int code, const std::string& remote_message)
        : ToolhostError("Remote error " + std::to_string(code) + ": " + remote_message),
          code_(code), remote_message_(remote_message), data_(nullptr)
    {
    }

    RemoteError(int code, const std::string& remote_message, const nlohmann::json& data)
        : ToolhostError("Remote error " + std::to_string(code) + ": " + remote_message),
          code_(code), remote_message_(remote_message),
          data_(std::make_shared<nlohmann::json>(data))
    {
    }

    int code() const
    {
        return code_;
    }

    const std::string& remote_message() const
    {
        return remote_message_;
    }

    // Optional "data" member of the error object
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    int code_;
    std::string remote_message_;
    std::shared_ptr<nlohmann::json> data_;
};

// Missing required environment, or a result that shows the child is misconfigured
class ConfigurationError : public ToolhostError
{
  public:
    explicit ConfigurationError(const std::string& message) : ToolhostError(message) {}

    ConfigurationError(const std::string& message, std::vector<std::string> missing_variables)
        : ToolhostError(message), missing_variables_(std::move(missing_variables))
    {
    }

    const std::vector<std::string>& missing_variables() const
    {
        return missing_variables_;
    }

  private:
    std::vector<std::string> missing_variables_;
};

// Child process exited while requests were outstanding
class ProcessCrashError : public ToolhostError
{
  public:
    ProcessCrashError(const std::string& message, std::optional<int> exit_code)
        : ToolhostError(message), exit_code_(exit_code)
    {
    }

    std::optional<int> exit_code() const
    {
        return exit_code_;
    }

  private:
    std::optional<int> exit_code_;
};

// Request abandoned because the supervisor is stopping or restarting
class SupervisorStoppingError : public ToolhostError
{
  public:
    explicit SupervisorStoppingError(const std::string& message) : ToolhostError(message) {}
};

} // namespace toolhost

#endif // TOOLHOST_ERRORS_HPP

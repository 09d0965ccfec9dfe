#ifndef TOOLHOST_INTERNAL_LOGGER_HPP
#define TOOLHOST_INTERNAL_LOGGER_HPP

#include <optional>
#include <string>
#include <toolhost/types.hpp>

namespace toolhost
{
namespace internal
{

// Forwards to the caller's log callback, or to std::cerr at or above the threshold
class Logger
{
  public:
    Logger() = default;
    Logger(LogLevel threshold, std::optional<LogCallback> callback)
        : threshold_(threshold), callback_(std::move(callback))
    {
    }

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }

    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }

    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }

    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

  private:
    LogLevel threshold_ = LogLevel::Warning;
    std::optional<LogCallback> callback_;
};

} // namespace internal
} // namespace toolhost

#endif // TOOLHOST_INTERNAL_LOGGER_HPP

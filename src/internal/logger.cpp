#include "logger.hpp"

#include <iostream>
#include <mutex>

namespace toolhost
{
namespace internal
{

namespace
{
std::mutex& stderr_mutex()
{
    static std::mutex mutex;
    return mutex;
}
} // namespace

void Logger::log(LogLevel level, const std::string& message) const
{
    if (callback_)
    {
        try
        {
            (*callback_)(level, message);
            return;
        }
        catch (const std::exception& e)
        {
            std::lock_guard<std::mutex> lock(stderr_mutex());
            std::cerr << "[toolhost] log callback threw: " << e.what() << std::endl;
        }
    }

    if (level < threshold_)
        return;

    std::lock_guard<std::mutex> lock(stderr_mutex());
    std::cerr << "[toolhost] " << to_string(level) << ": " << message << std::endl;
}

} // namespace internal
} // namespace toolhost

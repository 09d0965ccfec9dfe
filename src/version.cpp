#include <sstream>
#include <toolhost/version.hpp>

namespace toolhost
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH;
    return oss.str();
}

} // namespace toolhost

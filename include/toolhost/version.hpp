#ifndef TOOLHOST_VERSION_HPP
#define TOOLHOST_VERSION_HPP

#include <string>

namespace toolhost
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 1;

std::string version_string();

} // namespace toolhost

#endif // TOOLHOST_VERSION_HPP

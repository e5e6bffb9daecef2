#ifndef OSUTIL_DOT_HPP_INCLUDED
#define OSUTIL_DOT_HPP_INCLUDED

#include <cstdint>
#include <optional>
#include <string>

namespace osutil {
// A number, or a name from services(5).  An unknown service is fatal.
uint16_t get_port(char const* const service, char const* const proto);

// The value of an environment variable, if set and not empty.
std::optional<std::string> get_env(char const* const name);

unsigned hardware_threads();
} // namespace osutil

#endif // OSUTIL_DOT_HPP_INCLUDED

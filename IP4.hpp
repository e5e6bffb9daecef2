#ifndef IP4_DOT_HPP
#define IP4_DOT_HPP

#include <string>
#include <string_view>

namespace IP4 {
auto is_address(std::string_view addr) -> bool;

// Dotted quad without leading zeros, "010.001.2.3" → "10.1.2.3".
auto canonical(std::string_view addr) -> std::string;

// The reverse lookup labels, "1.2.3.4" → "4.3.2.1.", ready for
// "in-addr.arpa" to be appended.
auto reverse(std::string_view addr) -> std::string;

constexpr auto loopback{"127.0.0.1"};

constexpr auto reverse_zone{"in-addr.arpa"};
} // namespace IP4

#endif // IP4_DOT_HPP

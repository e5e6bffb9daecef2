#ifndef IP6_DOT_HPP
#define IP6_DOT_HPP

#include <optional>
#include <string>
#include <string_view>

namespace IP6 {
auto is_address(std::string_view addr) -> bool;

// RFC 5952 text form, as inet_ntop(3) writes it.
auto canonical(std::string_view addr) -> std::string;

// From the 32 hex digits of an address, most significant first.
auto from_nibbles(std::string_view hex) -> std::optional<std::string>;

// For an address in ::ffff:0:0/96, the embedded IPv4 dotted quad.
auto mapped_ip4(std::string_view addr) -> std::optional<std::string>;

// The reverse lookup labels, one per nibble, least significant first,
// ready for "ip6.arpa" to be appended.
auto reverse(std::string_view addr) -> std::string;

auto constexpr loopback{"::1"};

auto constexpr reverse_zone{"ip6.arpa"};

auto constexpr nibbles{32};
} // namespace IP6

#endif // IP6_DOT_HPP

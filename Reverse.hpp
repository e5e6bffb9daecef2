#ifndef REVERSE_DOT_HPP
#define REVERSE_DOT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Reverse lookup names back to the addresses they stand for.  An
// empty optional means the name is not a well formed reverse name.

namespace Reverse {

// "4.3.2.1.in-addr.arpa" → "1.2.3.4"
std::optional<std::string> ip4(std::string_view name);

struct ip6_candidates {
  std::string                ip6; // canonical
  std::optional<std::string> ip4; // if ip6 is IPv4-mapped

  std::vector<std::string> all() const
  {
    std::vector<std::string> ret{ip6};
    if (ip4)
      ret.push_back(*ip4);
    return ret;
  }
};

// 32 nibble labels followed by "ip6.arpa".
std::optional<ip6_candidates> ip6(std::string_view name);

} // namespace Reverse

#endif // REVERSE_DOT_HPP

#ifndef ROUTER_DOT_HPP
#define ROUTER_DOT_HPP

#include <string>
#include <string_view>

#include "DNS-message.hpp"

// Dispatch of a query to the one handler that answers it.  The rules
// are tried in the order of the enumerators, first match wins.

namespace Router {

enum class rule {
  localhost_a,
  localhost_aaaa,
  local_a,
  local_aaaa,
  local_cname,
  local_mx,
  ptr4,
  ptr6,
  forward,
};

constexpr char const* rule_c_str(rule r)
{
  switch (r) { // clang-format off
  case rule::localhost_a:    return "localhost A";
  case rule::localhost_aaaa: return "localhost AAAA";
  case rule::local_a:        return "local A";
  case rule::local_aaaa:     return "local AAAA";
  case rule::local_cname:    return "local CNAME";
  case rule::local_mx:       return "local MX";
  case rule::ptr4:           return "PTR in-addr.arpa";
  case rule::ptr6:           return "PTR ip6.arpa";
  case rule::forward:        return "forward";
  } // clang-format on
  return "*** unknown rule ***";
}

struct match {
  rule        which{rule::forward};
  std::string label; // the name with the local suffix removed
};

class table {
public:
  explicit table(std::string suffix);

  match route(DNS::Query const& q) const;

  std::string const& suffix() const { return suffix_; }

private:
  std::string suffix_;
};

} // namespace Router

#endif // ROUTER_DOT_HPP

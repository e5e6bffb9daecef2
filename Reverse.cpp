#include "Reverse.hpp"

#include "IP4.hpp"
#include "IP6.hpp"
#include "Name.hpp"

#include <algorithm>

#include <boost/algorithm/string/join.hpp>

#include <glog/logging.h>

namespace Reverse {

std::optional<std::string> ip4(std::string_view name)
{
  auto labels = Name::labels(Name::below(name, IP4::reverse_zone));
  if (labels.size() != 4) {
    LOG(INFO) << "malformed address: " << labels.size() << " labels in "
              << name;
    return {};
  }

  std::reverse(begin(labels), end(labels));
  auto const addr = boost::algorithm::join(labels, ".");

  if (!IP4::is_address(addr)) {
    LOG(INFO) << "malformed address: " << addr << " from " << name;
    return {};
  }

  return IP4::canonical(addr);
}

std::optional<ip6_candidates> ip6(std::string_view name)
{
  auto labels = Name::labels(Name::below(name, IP6::reverse_zone));
  if (labels.size() != IP6::nibbles) {
    LOG(INFO) << "malformed address: " << labels.size() << " labels in "
              << name;
    return {};
  }

  std::string hex;
  hex.reserve(IP6::nibbles);
  for (auto it = rbegin(labels); it != rend(labels); ++it) {
    if (it->size() != 1) {
      LOG(INFO) << "malformed address: label «" << *it << "» in " << name;
      return {};
    }
    hex += it->front();
  }

  auto const addr = IP6::from_nibbles(hex);
  if (!addr) {
    LOG(INFO) << "malformed address: non-hex nibble in " << name;
    return {};
  }

  return ip6_candidates{*addr, IP6::mapped_ip4(*addr)};
}

} // namespace Reverse

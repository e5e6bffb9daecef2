#include "Router.hpp"

#include "IP4.hpp"
#include "IP6.hpp"
#include "Name.hpp"

#include <glog/logging.h>

namespace Router {

table::table(std::string suffix)
  : suffix_(std::move(suffix))
{
  CHECK(!suffix_.empty()) << "empty local suffix";
}

match table::route(DNS::Query const& q) const
{
  using DNS::RR_type;

  if (Name::iequal(q.name, "localhost")) {
    if (q.type == RR_type::A)
      return {rule::localhost_a, {}};
    if (q.type == RR_type::AAAA)
      return {rule::localhost_aaaa, {}};
  }

  if (auto const label = Name::below(q.name, suffix_); !label.empty()) {
    switch (q.type) {
    case RR_type::A: return {rule::local_a, std::string(label)};
    case RR_type::AAAA: return {rule::local_aaaa, std::string(label)};
    case RR_type::CNAME: return {rule::local_cname, std::string(label)};
    case RR_type::MX: return {rule::local_mx, std::string(label)};
    default: break;
    }
  }

  if (q.type == RR_type::PTR) {
    if (!Name::below(q.name, IP4::reverse_zone).empty())
      return {rule::ptr4, {}};
    if (!Name::below(q.name, IP6::reverse_zone).empty())
      return {rule::ptr6, {}};
  }

  return {rule::forward, {}};
}

} // namespace Router

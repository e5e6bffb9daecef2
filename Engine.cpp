#include "Engine.hpp"

#include "DNS-iostream.hpp"
#include "IP4.hpp"
#include "IP6.hpp"
#include "Name.hpp"
#include "Reverse.hpp"

#include <glog/logging.h>

namespace Engine {

constexpr uint16_t default_mx_preference = 10;

char const* outcome_c_str(outcome const& o)
{
  if (std::holds_alternative<answered>(o))
    return "answered";
  if (std::holds_alternative<forwarded>(o))
    return "forwarded";
  return DNS::rcode_c_str(std::get<failed>(o).rcode);
}

namespace {
DNS::RR_type rule_type(Router::rule which)
{
  switch (which) {
  case Router::rule::local_a: return DNS::RR_type::A;
  case Router::rule::local_aaaa: return DNS::RR_type::AAAA;
  case Router::rule::local_cname: return DNS::RR_type::CNAME;
  case Router::rule::local_mx: return DNS::RR_type::MX;
  default: break;
  }
  LOG(FATAL) << "not a local rule: " << Router::rule_c_str(which);
  return DNS::RR_type::NONE;
}

std::string target_name(std::optional<std::string> const& cname)
{
  if (!cname)
    throw std::invalid_argument("no target name");
  auto const name = Name::strip_dots(*cname);
  if (name.empty())
    throw std::invalid_argument("empty target name");
  return std::string(name);
}

// Throws std::invalid_argument if rec is no good as a type record.
DNS::RR to_rr(Record const& rec, DNS::RR_type type)
{
  switch (type) {
  case DNS::RR_type::A:
    if (!rec.ipv4address)
      throw std::invalid_argument("no ipv4address");
    return DNS::RR_A(*rec.ipv4address);

  case DNS::RR_type::AAAA:
    if (!rec.ipv6address)
      throw std::invalid_argument("no ipv6address");
    return DNS::RR_AAAA(*rec.ipv6address);

  case DNS::RR_type::CNAME: return DNS::RR_CNAME(target_name(rec.cname));

  case DNS::RR_type::MX:
    return DNS::RR_MX(target_name(rec.cname),
                      rec.priority.value_or(default_mx_preference));

  default: break;
  }
  throw std::invalid_argument("unsupported type");
}
} // namespace

resolver::resolver(std::string suffix, uint32_t ttl, RecordStore& store)
  : router_(std::move(suffix))
  , ttl_(ttl)
  , store_(store)
{
}

outcome resolver::resolve(DNS::Query const& q) const
{
  auto const m = router_.route(q);

  outcome o = forwarded{};

  switch (m.which) {
  case Router::rule::localhost_a:
  case Router::rule::localhost_aaaa: o = localhost_(q.type); break;

  case Router::rule::local_a:
  case Router::rule::local_aaaa:
  case Router::rule::local_cname:
  case Router::rule::local_mx: o = local_(m.which, m.label); break;

  case Router::rule::ptr4:
  case Router::rule::ptr6: o = ptr_(m.which, q.name); break;

  case Router::rule::forward: break;
  }

  VLOG(1) << q.name << '/' << q.type << " via " << Router::rule_c_str(m.which)
          << ": " << outcome_c_str(o);

  return o;
}

outcome resolver::localhost_(DNS::RR_type type) const
{
  if (type == DNS::RR_type::AAAA)
    return answered{{DNS::RR_AAAA(IP6::loopback)}, ttl_};
  return answered{{DNS::RR_A(IP4::loopback)}, ttl_};
}

outcome resolver::local_(Router::rule which, std::string const& label) const
{
  auto const type = rule_type(which);

  std::vector<Record> records;
  try {
    records = store_.lookup(RecordStore::by_name_type{label, type});
  }
  catch (RecordStore::unavailable const& e) {
    LOG(WARNING) << "store unavailable for " << label << '/' << type << ": "
                 << e.what();
    return failed{DNS::Rcode::SERVFAIL};
  }

  DNS::RR_collection answers;
  for (auto const& rec : records) {
    try {
      answers.push_back(to_rr(rec, type));
    }
    catch (std::invalid_argument const& e) {
      LOG(WARNING) << "skipping " << type << " record for " << rec.name << ": "
                   << e.what();
      continue;
    }
    if (type == DNS::RR_type::CNAME)
      break; // first one only
  }

  if (answers.empty())
    return failed{DNS::Rcode::NXDOMAIN};

  return answered{std::move(answers), ttl_};
}

outcome resolver::ptr_(Router::rule which, std::string const& name) const
{
  RecordStore::filter f;

  if (which == Router::rule::ptr4) {
    auto const addr = Reverse::ip4(name);
    if (!addr)
      return failed{DNS::Rcode::REFUSED};
    f = RecordStore::by_ipv4{*addr};
  }
  else {
    auto const cands = Reverse::ip6(name);
    if (!cands)
      return failed{DNS::Rcode::REFUSED};
    f = RecordStore::by_ipv6{cands->all()};
  }

  std::vector<Record> records;
  try {
    records = store_.lookup(f);
  }
  catch (RecordStore::unavailable const& e) {
    LOG(WARNING) << "store unavailable for " << name << ", forwarding: "
                 << e.what();
    return forwarded{};
  }

  DNS::RR_collection answers;
  for (auto const& rec : records) {
    auto const host = Name::strip_dots(rec.name);
    if (host.empty()) {
      LOG(WARNING) << "skipping nameless record for " << name;
      continue;
    }
    answers.push_back(
        DNS::RR_PTR(std::string(host) + '.' + router_.suffix()));
  }

  if (answers.empty())
    return forwarded{};

  return answered{std::move(answers), ttl_};
}

} // namespace Engine

#include "Engine.hpp"

#include "DNS-iostream.hpp"
#include "IP6.hpp"

#include <optional>
#include <string>

#include <glog/logging.h>

using DNS::RR_type;
using DNS::Rcode;

namespace {
class memory_store : public RecordStore {
public:
  std::vector<Record> records;
  int                 lookups{0};

  std::vector<Record> lookup(filter const& f) override
  {
    ++lookups;
    std::vector<Record> ret;
    for (auto const& rec : records) {
      if (matches(rec, f))
        ret.push_back(rec);
    }
    return ret;
  }

private:
  static bool matches(Record const& rec, filter const& f)
  {
    if (auto const nt = std::get_if<by_name_type>(&f))
      return rec.name == nt->name && rec.type == nt->type;
    if (auto const v4 = std::get_if<by_ipv4>(&f))
      return rec.ipv4address == v4->address;
    for (auto const& cand : std::get<by_ipv6>(f).candidates) {
      if (rec.ipv6address == cand || rec.ipv4address == cand)
        return true;
    }
    return false;
  }
};

class broken_store : public RecordStore {
public:
  int lookups{0};

  std::vector<Record> lookup(filter const&) override
  {
    ++lookups;
    throw unavailable("database is locked");
  }
};

Record rec(std::string                name,
           RR_type                    type,
           std::optional<std::string> v4,
           std::optional<std::string> v6,
           std::optional<std::string> cname    = {},
           std::optional<uint16_t>    priority = {})
{
  return Record{std::move(name), type,  std::move(v4), std::move(v6),
                std::move(cname), priority};
}

DNS::Query query(std::string name, RR_type type)
{
  DNS::Query q;
  q.name         = std::move(name);
  q.type         = type;
  q.has_question = true;
  return q;
}

DNS::RR_collection const& answers(Engine::outcome const& o)
{
  CHECK(std::holds_alternative<Engine::answered>(o))
      << Engine::outcome_c_str(o);
  CHECK_EQ(std::get<Engine::answered>(o).ttl, 300u);
  return std::get<Engine::answered>(o).answers;
}

Rcode rcode(Engine::outcome const& o)
{
  CHECK(std::holds_alternative<Engine::failed>(o)) << Engine::outcome_c_str(o);
  return std::get<Engine::failed>(o).rcode;
}

bool forwarded(Engine::outcome const& o)
{
  return std::holds_alternative<Engine::forwarded>(o);
}

auto const ip6_ptr_mapped = IP6::reverse("::ffff:10.0.0.7") + "ip6.arpa";
auto const ip6_ptr_plain  = IP6::reverse("2001:db8::2") + "ip6.arpa";
auto const ip6_ptr_none   = IP6::reverse("2001:db8::99") + "ip6.arpa";
} // namespace

int main(int argc, char* argv[])
{
  memory_store store;
  store.records = {
      rec("web", RR_type::A, "10.0.0.1", "2001:db8::1"),
      rec("web", RR_type::A, "10.0.0.2", {}),
      rec("web", RR_type::AAAA, {}, "2001:db8::2"),
      rec("broken", RR_type::A, "10.0.0.999", {}),
      rec("broken", RR_type::A, {}, {}),
      rec("half", RR_type::A, "bogus", {}),
      rec("half", RR_type::A, "10.0.0.3", {}),
      rec("www", RR_type::CNAME, {}, {}, "web.example.com."),
      rec("www", RR_type::CNAME, {}, {}, "other.example.com"),
      rec("dangling", RR_type::CNAME, {}, {}, {}),
      rec("mail", RR_type::MX, {}, {}, "mx1.example.com", 5),
      rec("mail", RR_type::MX, {}, {}, "mx2.example.com"),
      rec("mapped", RR_type::A, "10.0.0.7", {}),
  };

  Engine::resolver const engine("example.com", 300, store);

  // localhost never touches the store
  auto const lh = engine.resolve(query("localhost", RR_type::A));
  CHECK_EQ(answers(lh).size(), 1u);
  CHECK(answers(lh)[0] == DNS::RR{DNS::RR_A{"127.0.0.1"}});
  auto const lh6 = engine.resolve(query("LocalHost", RR_type::AAAA));
  CHECK(answers(lh6)[0] == DNS::RR{DNS::RR_AAAA{"::1"}});
  CHECK_EQ(store.lookups, 0);

  auto const a = answers(engine.resolve(query("web.example.com", RR_type::A)));
  CHECK_EQ(a.size(), 2u);
  CHECK(a[0] == DNS::RR{DNS::RR_A{"10.0.0.1"}});
  CHECK(a[1] == DNS::RR{DNS::RR_A{"10.0.0.2"}});

  // AAAA looks for AAAA records, not for the ipv6address of A records
  auto const aaaa =
      answers(engine.resolve(query("web.example.com", RR_type::AAAA)));
  CHECK_EQ(aaaa.size(), 1u);
  CHECK(aaaa[0] == DNS::RR{DNS::RR_AAAA{"2001:db8::2"}});

  CHECK_EQ(rcode(engine.resolve(query("nope.example.com", RR_type::A))),
           Rcode::NXDOMAIN);
  CHECK_EQ(rcode(engine.resolve(query("nope.example.com", RR_type::AAAA))),
           Rcode::NXDOMAIN);
  CHECK_EQ(rcode(engine.resolve(query("nope.example.com", RR_type::MX))),
           Rcode::NXDOMAIN);
  CHECK_EQ(rcode(engine.resolve(query("mail.example.com", RR_type::CNAME))),
           Rcode::NXDOMAIN);

  // unusable records are skipped
  CHECK_EQ(rcode(engine.resolve(query("broken.example.com", RR_type::A))),
           Rcode::NXDOMAIN);
  auto const half =
      answers(engine.resolve(query("half.example.com", RR_type::A)));
  CHECK_EQ(half.size(), 1u);
  CHECK(half[0] == DNS::RR{DNS::RR_A{"10.0.0.3"}});

  // CNAME: the first one only
  auto const cn =
      answers(engine.resolve(query("www.example.com", RR_type::CNAME)));
  CHECK_EQ(cn.size(), 1u);
  CHECK(cn[0] == DNS::RR{DNS::RR_CNAME{"web.example.com"}});
  CHECK_EQ(rcode(engine.resolve(query("dangling.example.com", RR_type::CNAME))),
           Rcode::NXDOMAIN);

  auto const mx = answers(engine.resolve(query("mail.example.com", RR_type::MX)));
  CHECK_EQ(mx.size(), 2u);
  CHECK(mx[0] == DNS::RR{DNS::RR_MX{"mx1.example.com", 5}});
  CHECK(mx[1] == DNS::RR{DNS::RR_MX{"mx2.example.com", 10}});

  // PTR
  auto const ptr =
      answers(engine.resolve(query("2.0.0.10.in-addr.arpa", RR_type::PTR)));
  CHECK_EQ(ptr.size(), 1u);
  CHECK(ptr[0] == DNS::RR{DNS::RR_PTR{"web.example.com"}});

  auto const ptr0 =
      answers(engine.resolve(query("2.0.0.010.in-addr.arpa", RR_type::PTR)));
  CHECK(ptr0[0] == DNS::RR{DNS::RR_PTR{"web.example.com"}});

  CHECK(forwarded(engine.resolve(query("9.9.9.9.in-addr.arpa", RR_type::PTR))));
  CHECK_EQ(rcode(engine.resolve(query("3.2.1.in-addr.arpa", RR_type::PTR))),
           Rcode::REFUSED);
  CHECK_EQ(rcode(engine.resolve(query("x.3.2.1.in-addr.arpa", RR_type::PTR))),
           Rcode::REFUSED);
  CHECK_EQ(rcode(engine.resolve(query("1.0.ip6.arpa", RR_type::PTR))),
           Rcode::REFUSED);

  auto const p6 = answers(engine.resolve(query(ip6_ptr_plain, RR_type::PTR)));
  CHECK_EQ(p6.size(), 1u);
  CHECK(p6[0] == DNS::RR{DNS::RR_PTR{"web.example.com"}});

  auto const p6m = answers(engine.resolve(query(ip6_ptr_mapped, RR_type::PTR)));
  CHECK_EQ(p6m.size(), 1u);
  CHECK(p6m[0] == DNS::RR{DNS::RR_PTR{"mapped.example.com"}});

  CHECK(forwarded(engine.resolve(query(ip6_ptr_none, RR_type::PTR))));

  // everything else
  CHECK(forwarded(engine.resolve(query("www.google.com", RR_type::A))));
  CHECK(forwarded(engine.resolve(query("web.example.com", RR_type::TXT))));

  // store down: fail closed for the zone, open for PTR
  broken_store           down;
  Engine::resolver const dead("example.com", 300, down);

  CHECK_EQ(rcode(dead.resolve(query("web.example.com", RR_type::A))),
           Rcode::SERVFAIL);
  CHECK_EQ(rcode(dead.resolve(query("web.example.com", RR_type::MX))),
           Rcode::SERVFAIL);
  CHECK(forwarded(dead.resolve(query("4.3.2.1.in-addr.arpa", RR_type::PTR))));
  CHECK(forwarded(dead.resolve(query(ip6_ptr_plain, RR_type::PTR))));
  CHECK_EQ(rcode(dead.resolve(query("bogus.in-addr.arpa", RR_type::PTR))),
           Rcode::REFUSED);
  CHECK_EQ(down.lookups, 4);

  auto const dead_lh = dead.resolve(query("localhost", RR_type::A));
  CHECK_EQ(answers(dead_lh).size(), 1u);
  CHECK_EQ(down.lookups, 4);
}

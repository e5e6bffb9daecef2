#include "Router.hpp"

#include <glog/logging.h>

using DNS::RR_type;
using Router::rule;

namespace {
DNS::Query query(char const* name, RR_type type)
{
  DNS::Query q;
  q.name         = name;
  q.type         = type;
  q.has_question = true;
  return q;
}
} // namespace

int main(int argc, char* argv[])
{
  Router::table const rt("example.com");

  struct {
    char const* name;
    RR_type     type;
    rule        which;
    char const* label;
  } const cases[]{
      {"localhost", RR_type::A, rule::localhost_a, ""},
      {"LOCALHOST", RR_type::AAAA, rule::localhost_aaaa, ""},
      {"localhost", RR_type::MX, rule::forward, ""},
      {"web.example.com", RR_type::A, rule::local_a, "web"},
      {"Web.Example.COM", RR_type::AAAA, rule::local_aaaa, "Web"},
      {"www.example.com", RR_type::CNAME, rule::local_cname, "www"},
      {"mail.example.com", RR_type::MX, rule::local_mx, "mail"},
      {"a.b.example.com", RR_type::A, rule::local_a, "a.b"},
      {"web.example.com", RR_type::TXT, rule::forward, ""},
      {"web.example.com", RR_type::PTR, rule::forward, ""},
      {"example.com", RR_type::A, rule::forward, ""},
      {"webexample.com", RR_type::A, rule::forward, ""},
      {"web.example.com.org", RR_type::A, rule::forward, ""},
      {"4.3.2.1.in-addr.arpa", RR_type::PTR, rule::ptr4, ""},
      {"bogus.in-addr.arpa", RR_type::PTR, rule::ptr4, ""},
      {"4.3.2.1.in-addr.arpa", RR_type::A, rule::forward, ""},
      {"in-addr.arpa", RR_type::PTR, rule::forward, ""},
      {"1.0.ip6.arpa", RR_type::PTR, rule::ptr6, ""},
      {"1.0.IP6.ARPA", RR_type::PTR, rule::ptr6, ""},
      {"www.google.com", RR_type::A, rule::forward, ""},
      {"", RR_type::NS, rule::forward, ""},
  };

  for (auto const& c : cases) {
    auto const m = rt.route(query(c.name, c.type));
    CHECK(m.which == c.which) << c.name << '/' << DNS::RR_type_c_str(c.type)
                              << " went to " << Router::rule_c_str(m.which);
    CHECK_EQ(m.label, c.label) << c.name;
  }

  // the localhost rules come first, whatever the suffix
  Router::table const lh("localhost");
  CHECK(lh.route(query("localhost", RR_type::A)).which == rule::localhost_a);
  CHECK(lh.route(query("x.localhost", RR_type::A)).which == rule::local_a);
}

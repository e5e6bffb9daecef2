#include "Settings.hpp"

#include <cstdlib>

#include <gflags/gflags.h>

#include <glog/logging.h>

DECLARE_string(dns_suffix);
DECLARE_uint64(dns_ttl);
DECLARE_uint64(threads);
DECLARE_uint64(upstream_timeout_ms);

using Upstream::sock_type;

int main(int argc, char* argv[])
{
  using Settings_util::database_path;
  using Settings_util::normalize_suffix;

  CHECK_EQ(normalize_suffix("Example.COM."), "example.com");
  CHECK_EQ(normalize_suffix(".lan"), "lan");
  CHECK_EQ(normalize_suffix(""), "");

  CHECK_EQ(*database_path("sqlite:///var/lib/dnsd/zone.db"),
           "/var/lib/dnsd/zone.db");
  CHECK_EQ(*database_path("sqlite://zone.db"), "zone.db");
  CHECK_EQ(*database_path("sqlite:zone.db"), "zone.db");
  CHECK_EQ(*database_path("SQLite:zone.db"), "zone.db");
  CHECK_EQ(*database_path("/var/lib/dnsd/zone.db"), "/var/lib/dnsd/zone.db");
  CHECK_EQ(*database_path("./odd:name.db"), "./odd:name.db");
  CHECK(!database_path(""));
  CHECK(!database_path("sqlite://"));
  CHECK(!database_path("postgres://user@host/dns"));
  CHECK(!database_path("mysql2://localhost/dns"));

  std::vector<Upstream::endpoint> ups;
  Settings_util::add_upstream(ups, "10.0.0.1", "");
  Settings_util::add_upstream(ups, "2620:fe::fe", "5353");
  Settings_util::add_upstream(ups, "10.0.0.2", "domain");
  CHECK_EQ(ups.size(), 6u);
  CHECK(ups[0].typ == sock_type::dgram);
  CHECK(ups[1].typ == sock_type::stream);
  CHECK_EQ(ups[0].addr, "10.0.0.1");
  CHECK_EQ(ups[0].port, 53);
  CHECK_EQ(ups[1].port, 53);
  CHECK_EQ(ups[2].addr, "2620:fe::fe");
  CHECK_EQ(ups[3].port, 5353);
  CHECK_EQ(ups[5].port, 53);

  setenv("DNS_SUFFIX", ".Corp.Example.", 1);
  setenv("DNS_PORT", "5353", 1);
  setenv("DNS_TTL", "60", 1);
  setenv("DATABASE_URL", "sqlite:///var/lib/dnsd/zone.db", 1);
  setenv("UPSTREAM_DNS1_IP", "9.9.9.9", 1);
  unsetenv("UPSTREAM_DNS1_PORT");
  setenv("UPSTREAM_DNS2_IP", "2620:fe::fe", 1);
  setenv("UPSTREAM_DNS2_PORT", "5300", 1);

  auto const env = Settings::from_flags();
  CHECK_EQ(env.suffix, "corp.example");
  CHECK_EQ(env.port, 5353);
  CHECK_EQ(env.ttl, 60u);
  CHECK_EQ(env.database, "/var/lib/dnsd/zone.db");
  CHECK_EQ(env.upstream_timeout.count(), 2000);
  CHECK_GE(env.threads, 1u);
  CHECK_EQ(env.upstreams.size(), 4u);
  CHECK(env.upstreams[0].typ == sock_type::dgram);
  CHECK_EQ(env.upstreams[0].addr, "9.9.9.9");
  CHECK_EQ(env.upstreams[0].port, 53);
  CHECK(env.upstreams[1].typ == sock_type::stream);
  CHECK_EQ(env.upstreams[1].addr, "9.9.9.9");
  CHECK(env.upstreams[2].typ == sock_type::dgram);
  CHECK_EQ(env.upstreams[2].addr, "2620:fe::fe");
  CHECK_EQ(env.upstreams[2].port, 5300);
  CHECK(env.upstreams[3].typ == sock_type::stream);

  // flags win over the environment
  FLAGS_dns_suffix          = "LAN";
  FLAGS_dns_ttl             = 120;
  FLAGS_threads             = 3;
  FLAGS_upstream_timeout_ms = 250;
  unsetenv("UPSTREAM_DNS2_IP");
  unsetenv("DNS_PORT");

  auto const flags = Settings::from_flags();
  CHECK_EQ(flags.suffix, "lan");
  CHECK_EQ(flags.port, 53);
  CHECK_EQ(flags.ttl, 120u);
  CHECK_EQ(flags.threads, 3u);
  CHECK_EQ(flags.upstream_timeout.count(), 250);
  CHECK_EQ(flags.upstreams.size(), 2u);
}

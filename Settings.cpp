#include "Settings.hpp"

#include "IP4.hpp"
#include "IP6.hpp"
#include "Name.hpp"
#include "osutil.hpp"

#include <cstdlib>

#include <boost/algorithm/string/predicate.hpp>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_string(dns_suffix, "", "local zone suffix [DNS_SUFFIX]");
DEFINE_string(dns_port, "", "port to listen on [DNS_PORT]");
DEFINE_string(upstream1_ip, "", "primary upstream nameserver [UPSTREAM_DNS1_IP]");
DEFINE_string(upstream1_port, "", "its port [UPSTREAM_DNS1_PORT]");
DEFINE_string(upstream2_ip, "", "secondary upstream nameserver [UPSTREAM_DNS2_IP]");
DEFINE_string(upstream2_port, "", "its port [UPSTREAM_DNS2_PORT]");
DEFINE_uint64(dns_ttl, 0, "TTL of local answers in seconds [DNS_TTL]");
DEFINE_string(database_url, "", "record store, sqlite:path [DATABASE_URL]");
DEFINE_uint64(upstream_timeout_ms, 2000, "timeout per upstream attempt");
DEFINE_uint64(threads, 0, "worker threads, 0 for one per CPU");

namespace {
std::string flag_or_env(std::string const& flag, char const* env)
{
  if (!flag.empty())
    return flag;
  return osutil::get_env(env).value_or("");
}
} // namespace

namespace Settings_util {

std::string normalize_suffix(std::string_view suffix)
{
  return Name::to_lower(Name::strip_dots(suffix));
}

std::optional<std::string> database_path(std::string_view url)
{
  using boost::algorithm::istarts_with;

  if (url.empty())
    return {};

  auto const schema = url.find(':');
  if (schema == std::string_view::npos || url.find('/') < schema)
    return std::string(url); // plain path

  if (!istarts_with(std::string(url), "sqlite:"))
    return {};

  auto path = url.substr(std::char_traits<char>::length("sqlite:"));
  if (path.substr(0, 2) == "//")
    path.remove_prefix(2);

  if (path.empty())
    return {};
  return std::string(path);
}

void add_upstream(std::vector<Upstream::endpoint>& upstreams,
                  std::string const&               addr,
                  std::string const&               port)
{
  CHECK(IP4::is_address(addr) || IP6::is_address(addr))
      << "upstream nameserver «" << addr << "» is not an IP address";

  auto const svc = port.empty() ? "domain" : port.c_str();

  upstreams.push_back(Upstream::endpoint{Upstream::sock_type::dgram, addr,
                                         osutil::get_port(svc, "udp")});
  upstreams.push_back(Upstream::endpoint{Upstream::sock_type::stream, addr,
                                         osutil::get_port(svc, "tcp")});
}

} // namespace Settings_util

Settings Settings::from_flags()
{
  Settings s;

  s.suffix = Settings_util::normalize_suffix(
      flag_or_env(FLAGS_dns_suffix, "DNS_SUFFIX"));
  CHECK(!s.suffix.empty()) << "no DNS suffix, set --dns_suffix or DNS_SUFFIX";

  auto const port = flag_or_env(FLAGS_dns_port, "DNS_PORT");
  if (!port.empty())
    s.port = osutil::get_port(port.c_str(), "udp");

  if (FLAGS_dns_ttl) {
    s.ttl = static_cast<uint32_t>(FLAGS_dns_ttl);
  }
  else if (auto const ttl = osutil::get_env("DNS_TTL"); ttl) {
    char*      ep = nullptr;
    auto const val{strtoul(ttl->c_str(), &ep, 10)};
    CHECK(ep && *ep == '\0') << "DNS_TTL «" << *ttl << "» is not a number";
    s.ttl = static_cast<uint32_t>(val);
  }

  auto const url = flag_or_env(FLAGS_database_url, "DATABASE_URL");
  auto const db  = Settings_util::database_path(url);
  if (!db) {
    LOG(FATAL) << "unsupported database URL «" << url
               << "», set --database_url or DATABASE_URL to sqlite:path";
  }
  s.database = *db;

  auto const ip1 = flag_or_env(FLAGS_upstream1_ip, "UPSTREAM_DNS1_IP");
  auto const ip2 = flag_or_env(FLAGS_upstream2_ip, "UPSTREAM_DNS2_IP");
  CHECK(!ip1.empty()) << "no upstream nameserver, set --upstream1_ip or "
                         "UPSTREAM_DNS1_IP";

  Settings_util::add_upstream(
      s.upstreams, ip1, flag_or_env(FLAGS_upstream1_port, "UPSTREAM_DNS1_PORT"));
  if (!ip2.empty()) {
    Settings_util::add_upstream(
        s.upstreams, ip2,
        flag_or_env(FLAGS_upstream2_port, "UPSTREAM_DNS2_PORT"));
  }

  CHECK_GT(FLAGS_upstream_timeout_ms, 0u);
  s.upstream_timeout = std::chrono::milliseconds(FLAGS_upstream_timeout_ms);

  s.threads = FLAGS_threads ? static_cast<unsigned>(FLAGS_threads)
                            : osutil::hardware_threads();

  LOG(INFO) << "suffix " << s.suffix << ", port " << s.port << ", ttl "
            << s.ttl << ", database " << s.database << ", " << s.threads
            << " threads";
  for (auto const& ep : s.upstreams)
    LOG(INFO) << "upstream " << ep;

  return s;
}

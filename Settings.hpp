#ifndef SETTINGS_DOT_HPP
#define SETTINGS_DOT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Upstream.hpp"

namespace Config {
constexpr uint16_t default_port = 53;
constexpr uint32_t default_ttl  = 300;
} // namespace Config

// Everything the server needs to know, fixed at startup.

struct Settings {
  std::string suffix; // lower case, no leading or trailing dots
  uint16_t    port{Config::default_port};
  uint32_t    ttl{Config::default_ttl};
  std::string database; // path of the SQLite file

  std::vector<Upstream::endpoint> upstreams;
  std::chrono::milliseconds       upstream_timeout{Config::upstream_timeout};

  unsigned threads{1};

  // From the command line flags, each falling back to its environment
  // variable.  Bad or missing settings are fatal.
  static Settings from_flags();
};

namespace Settings_util {
// "Example.COM." → "example.com"
std::string normalize_suffix(std::string_view suffix);

// "sqlite:///var/db/dns.db", "sqlite:dns.db", or a plain path.  Any
// other scheme is not supported.
std::optional<std::string> database_path(std::string_view url);

// Both transports for one nameserver, UDP first.
void add_upstream(std::vector<Upstream::endpoint>& upstreams,
                  std::string const&               addr,
                  std::string const&               port);
} // namespace Settings_util

#endif // SETTINGS_DOT_HPP

#ifndef UPSTREAM_DOT_HPP
#define UPSTREAM_DOT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "DNS-message.hpp"

namespace Config {
constexpr auto upstream_timeout = std::chrono::milliseconds(2000);
} // namespace Config

namespace Upstream {

enum class sock_type : bool { stream, dgram };

struct endpoint {
  sock_type   typ;
  std::string addr; // IPv4 or IPv6 address
  uint16_t    port;
};

std::ostream& operator<<(std::ostream& os, endpoint const& ep);

// One query, one reply: no retries, no checks on what comes back.
class Transport {
public:
  virtual ~Transport() = default;

  virtual std::optional<DNS::message> xchg(endpoint const&     ep,
                                           DNS::message const& q) = 0;
};

// A fresh socket per exchange; UDP, or TCP with the two octet length
// prefix.  Each exchange is bounded by timeout.
class SocketTransport : public Transport {
public:
  explicit SocketTransport(
      std::chrono::milliseconds timeout = Config::upstream_timeout);

  std::optional<DNS::message> xchg(endpoint const&     ep,
                                   DNS::message const& q) override;

private:
  std::chrono::milliseconds timeout_;
};

// Tries each endpoint in turn until one gives a reply to q.  An empty
// optional means every endpoint failed.
class Forwarder {
public:
  Forwarder(std::vector<endpoint> endpoints, Transport& transport);

  std::optional<DNS::message> forward(DNS::message const& q) const;

  std::vector<endpoint> const& endpoints() const { return endpoints_; }

private:
  std::vector<endpoint> endpoints_;
  Transport&            transport_;
};

} // namespace Upstream

#endif // UPSTREAM_DOT_HPP

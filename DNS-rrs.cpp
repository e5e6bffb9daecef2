#include "DNS-rrs.hpp"

#include "Name.hpp"

#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace DNS {

std::optional<RR_type> RR_type_from_str(std::string_view str)
{
  for (auto type : {RR_type::A, RR_type::AAAA, RR_type::CNAME, RR_type::MX,
                    RR_type::PTR, RR_type::NS, RR_type::SOA, RR_type::TXT,
                    RR_type::SRV}) {
    if (Name::iequal(str, RR_type_c_str(type)))
      return type;
  }
  return {};
}

RR_A::RR_A(std::string_view addr)
{
  std::string const addr_str(addr); // inet_pton wants NUL termination
  if (inet_pton(AF_INET, addr_str.c_str(), &addr_) != 1)
    throw std::invalid_argument(fmt::format("bad IPv4 address «{}»", addr));
  PCHECK(inet_ntop(AF_INET, &addr_, str_, sizeof str_));
}

RR_A::RR_A(uint8_t const* rd, size_t sz)
{
  static_assert(sizeof(addr_) == 4);
  CHECK_EQ(sz, sizeof(addr_));
  std::memcpy(&addr_, rd, sizeof(addr_));
  PCHECK(inet_ntop(AF_INET, &addr_, str_, sizeof str_));
}

RR_AAAA::RR_AAAA(std::string_view addr)
{
  std::string const addr_str(addr);
  if (inet_pton(AF_INET6, addr_str.c_str(), &addr_) != 1)
    throw std::invalid_argument(fmt::format("bad IPv6 address «{}»", addr));
  PCHECK(inet_ntop(AF_INET6, &addr_, str_, sizeof str_));
}

RR_AAAA::RR_AAAA(uint8_t const* rd, size_t sz)
{
  static_assert(sizeof(addr_) == 16);
  CHECK_EQ(sz, sizeof(addr_));
  std::memcpy(&addr_, rd, sizeof(addr_));
  PCHECK(inet_ntop(AF_INET6, &addr_, str_, sizeof str_));
}

} // namespace DNS

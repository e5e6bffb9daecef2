#ifndef DNS_IOSTREAM_DOT_HPP
#define DNS_IOSTREAM_DOT_HPP

#include "DNS-rrs.hpp"

#include <iostream>

namespace DNS {

inline std::ostream& operator<<(std::ostream& os, DNS::RR_A const& rr_a)
{
  return os << "A " << rr_a.c_str();
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR_CNAME const& rr_c)
{
  return os << "CNAME " << rr_c.str();
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR_PTR const& rr_ptr)
{
  return os << "PTR " << rr_ptr.str();
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR_MX const& rr_mx)
{
  return os << "MX " << rr_mx.preference() << ' ' << rr_mx.exchange();
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR_AAAA const& rr_aaaa)
{
  return os << "AAAA " << rr_aaaa.c_str();
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR const& rr)
{
  std::visit([&os](auto const& r) { os << r; }, rr);
  return os;
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR_type const& type)
{
  auto const str = DNS::RR_type_c_str(type);
  if (*str == '*')
    return os << "TYPE" << static_cast<uint16_t>(type);
  return os << str;
}

inline std::ostream& operator<<(std::ostream& os, DNS::Rcode const& rcode)
{
  switch (rcode) { // clang-format off
  case DNS::Rcode::NOERROR:  return os << "NOERROR";
  case DNS::Rcode::FORMERR:  return os << "FORMERR";
  case DNS::Rcode::SERVFAIL: return os << "SERVFAIL";
  case DNS::Rcode::NXDOMAIN: return os << "NXDOMAIN";
  case DNS::Rcode::NOTIMP:   return os << "NOTIMP";
  case DNS::Rcode::REFUSED:  return os << "REFUSED";
  } // clang-format on
  return os << "RCODE" << static_cast<unsigned>(rcode);
}

} // namespace DNS

#endif // DNS_IOSTREAM_DOT_HPP

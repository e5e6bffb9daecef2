#ifndef DNS_RRS_DOT_HPP
#define DNS_RRS_DOT_HPP

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace DNS {

enum class RR_type : uint16_t {
  // RFC 1035 section 3.2.2 “TYPE values”
  NONE,
  A,
  NS,
  CNAME = 5,
  SOA   = 6,
  PTR   = 12,
  MX    = 15,
  TXT   = 16,

  // RFC 3596 section 2.1 “AAAA record type”
  AAAA = 28,

  // RFC 2782 Service locator
  SRV = 33,

  // RFC 6891 EDNS(0) OPT pseudo-RR
  OPT = 41,

  // RFC 1035 section 3.2.3 “QTYPE values”
  AXFR = 252,
  ANY  = 255,
};

constexpr char const* RR_type_c_str(RR_type type)
{
  switch (type) { // clang-format off
  case RR_type::NONE:  return "NONE";
  case RR_type::A:     return "A";
  case RR_type::NS:    return "NS";
  case RR_type::CNAME: return "CNAME";
  case RR_type::SOA:   return "SOA";
  case RR_type::PTR:   return "PTR";
  case RR_type::MX:    return "MX";
  case RR_type::TXT:   return "TXT";
  case RR_type::AAAA:  return "AAAA";
  case RR_type::SRV:   return "SRV";
  case RR_type::OPT:   return "OPT";
  case RR_type::AXFR:  return "AXFR";
  case RR_type::ANY:   return "ANY";
  } // clang-format on
  return "*** unknown RR_type ***";
}

// The spelling used in the type column of the record store.
std::optional<RR_type> RR_type_from_str(std::string_view str);

// RFC 1035 section 4.1.1, the ones we send.
enum class Rcode : uint8_t {
  NOERROR  = 0,
  FORMERR  = 1,
  SERVFAIL = 2,
  NXDOMAIN = 3,
  NOTIMP   = 4,
  REFUSED  = 5,
};

constexpr char const* rcode_c_str(uint16_t rcode)
{
  // https://www.iana.org/assignments/dns-parameters/dns-parameters.xhtml#dns-parameters-6
  switch (rcode) { // clang-format off
  case 0:  return "no error";                           // [RFC1035]
  case 1:  return "format error";                       // [RFC1035]
  case 2:  return "server failure";                     // [RFC1035]
  case 3:  return "non-existent domain";                // [RFC1035]
  case 4:  return "not implemented";                    // [RFC1035]
  case 5:  return "query Refused";                      // [RFC1035]
  } // clang-format on
  return "*** rcode not used here ***";
}

constexpr char const* rcode_c_str(Rcode rcode)
{
  return rcode_c_str(static_cast<uint16_t>(rcode));
}

class RR_A {
public:
  explicit RR_A(std::string_view addr); // throws std::invalid_argument
  RR_A(uint8_t const* rd, size_t sz);

  std::optional<std::string> as_str() const { return std::string{str_}; }

  in_addr const& addr() const { return addr_; }
  char const*    c_str() const { return str_; }
  constexpr static RR_type rr_type() { return RR_type::A; }

  bool operator==(RR_A const& rhs) const { return strcmp(str_, rhs.str_) == 0; }
  bool operator<(RR_A const& rhs) const { return strcmp(str_, rhs.str_) < 0; }

private:
  in_addr addr_{};
  char    str_[INET_ADDRSTRLEN]{};
};

class RR_AAAA {
public:
  explicit RR_AAAA(std::string_view addr); // throws std::invalid_argument
  RR_AAAA(uint8_t const* rd, size_t sz);

  std::optional<std::string> as_str() const { return std::string{c_str()}; }

  in6_addr const& addr() const { return addr_; }
  char const*     c_str() const { return str_; }
  constexpr static RR_type rr_type() { return RR_type::AAAA; }

  bool operator==(RR_AAAA const& rhs) const
  {
    return strcmp(c_str(), rhs.c_str()) == 0;
  }
  bool operator<(RR_AAAA const& rhs) const
  {
    return strcmp(c_str(), rhs.c_str()) < 0;
  }

private:
  in6_addr addr_{};
  char     str_[INET6_ADDRSTRLEN]{};
};

class RR_CNAME {
public:
  explicit RR_CNAME(std::string cname)
    : cname_(std::move(cname))
  {
  }

  std::optional<std::string> as_str() const { return str(); }

  std::string const& str() const { return cname_; }
  char const*        c_str() const { return str().c_str(); }
  constexpr static RR_type rr_type() { return RR_type::CNAME; }

  bool operator==(RR_CNAME const& rhs) const { return str() == rhs.str(); }
  bool operator<(RR_CNAME const& rhs) const { return str() < rhs.str(); }

private:
  std::string cname_;
};

// RFC 2181 section 10.2 PTR records
class RR_PTR {
public:
  explicit RR_PTR(std::string ptrdname)
    : ptrdname_(std::move(ptrdname))
  {
  }

  std::optional<std::string> as_str() const { return str(); }

  std::string const&       str() const { return ptrdname_; }
  char const*              c_str() const { return str().c_str(); }
  constexpr static RR_type rr_type() { return RR_type::PTR; }

  bool operator==(RR_PTR const& rhs) const { return str() == rhs.str(); }
  bool operator<(RR_PTR const& rhs) const { return str() < rhs.str(); }

private:
  std::string ptrdname_;
};

class RR_MX {
public:
  RR_MX(std::string exchange, uint16_t preference)
    : exchange_(std::move(exchange))
    , preference_(preference)
  {
  }

  std::optional<std::string> as_str() const { return exchange(); }

  std::string const& exchange() const { return exchange_; }
  uint16_t           preference() const { return preference_; }

  constexpr static RR_type rr_type() { return RR_type::MX; }

  bool operator==(RR_MX const& rhs) const
  {
    return (preference() == rhs.preference()) && (exchange() == rhs.exchange());
  }
  bool operator<(RR_MX const& rhs) const
  {
    if (preference() == rhs.preference())
      return exchange() < rhs.exchange();
    return preference() < rhs.preference();
  }

private:
  std::string exchange_;
  uint16_t    preference_;
};

using RR = std::variant<RR_A, RR_CNAME, RR_PTR, RR_MX, RR_AAAA>;

using RR_collection = std::vector<RR>;

} // namespace DNS

#endif // DNS_RRS_DOT_HPP

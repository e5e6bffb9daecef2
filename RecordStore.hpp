#ifndef RECORDSTORE_DOT_HPP
#define RECORDSTORE_DOT_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "DNS-rrs.hpp"

// A row of the zone data.  Which of the optional fields is set
// depends on type; rows that don't fit their type are skipped by the
// users of this, not rejected here.

struct Record {
  std::string                name;
  DNS::RR_type               type{DNS::RR_type::NONE};
  std::optional<std::string> ipv4address;
  std::optional<std::string> ipv6address;
  std::optional<std::string> cname; // CNAME target or MX exchange
  std::optional<uint16_t>    priority;
};

class RecordStore {
public:
  // Every failure of the backing store, whatever its cause, is
  // reported as one of these.
  class unavailable : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  struct by_name_type {
    std::string  name;
    DNS::RR_type type;
  };
  struct by_ipv4 {
    std::string address;
  };
  struct by_ipv6 {
    std::vector<std::string> candidates;
  };

  using filter = std::variant<by_name_type, by_ipv4, by_ipv6>;

  virtual ~RecordStore() = default;

  // Zero records is a normal result.  Throws unavailable.
  virtual std::vector<Record> lookup(filter const& f) = 0;
};

#endif // RECORDSTORE_DOT_HPP

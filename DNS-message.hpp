#ifndef DNS_MESSAGE_DOT_HPP
#define DNS_MESSAGE_DOT_HPP

#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <vector>

#include "DNS-rrs.hpp"

#include <glog/logging.h>

namespace Config {
auto constexpr max_udp_sz{uint16_t(4 * 1024)};

// RFC 1035 section 4.2.1, without EDNS0
auto constexpr min_udp_sz{uint16_t(512)};

auto constexpr max_tcp_sz{std::numeric_limits<uint16_t>::max()};
} // namespace Config

namespace DNS {

class message {
public:
  using octet       = unsigned char;
  using container_t = std::vector<octet>;

  message() = default;

  explicit message(container_t::size_type sz)
    : buf_(sz)
  {
    CHECK_LE(sz, std::numeric_limits<uint16_t>::max());
  }

  explicit message(container_t&& buf)
    : buf_{std::move(buf)}
  {
    CHECK_LE(buf_.size(), std::numeric_limits<uint16_t>::max());
  }

  message(octet const* data, size_t sz)
    : buf_(data, data + sz)
  {
    CHECK_LE(sz, std::numeric_limits<uint16_t>::max());
  }

  operator std::span<octet>() { return {buf_.data(), buf_.size()}; }
  operator std::span<octet const>() const { return {buf_.data(), buf_.size()}; }

  octet const* data() const { return buf_.data(); }
  uint16_t     size() const { return static_cast<uint16_t>(buf_.size()); }

  // Header fields; only valid if size() >= min_sz().
  uint16_t id() const;
  bool     is_response() const;
  bool     authoritative_answer() const;
  bool     truncation() const;
  bool     recursion_available() const;
  uint16_t rcode() const;
  uint16_t ancount() const;

  static size_t min_sz();

private:
  container_t buf_;
};

inline auto size(message const& msg) { return msg.size(); }

// A query as it arrived from a client.
struct Query {
  uint16_t    id{0};
  uint8_t     opcode{0};
  bool        recursion_desired{false};
  bool        has_question{false};
  std::string name; // no trailing dot
  RR_type     type{RR_type::NONE};
  uint16_t    cls{1}; // IN

  // From an EDNS0 OPT in the additional section, if any.
  uint16_t udp_payload_sz{Config::min_udp_sz};
};

// Decode a client query.  Returns false if the message must be
// dropped without reply (too short, or not a query).  Otherwise rcode
// is NOERROR for a usable question, or the error to reply with.
bool decode_query(message const& msg, Query& q, Rcode& rcode);

// Build the reply to q.  If the encoded reply would exceed max_sz the
// answers are left out and the TC bit is set.
message create_response(Query const&         q,
                        Rcode                rcode,
                        RR_collection const& answers,
                        uint32_t             ttl,
                        bool                 authoritative,
                        uint16_t             max_sz);

inline message create_error(Query const& q, Rcode rcode, bool authoritative)
{
  return create_response(q, rcode, RR_collection{}, 0, authoritative,
                         Config::max_tcp_sz);
}

// An upstream reply cut down to header and question with TC set, for
// a UDP client that can't take the whole of it.
message create_truncated(Query const& q, message const& reply);

// Client side: a question with an EDNS0 OPT, as sent to a nameserver.
message
create_question(char const* name, RR_type type, uint16_t cls, uint16_t id);

RR_collection get_records(message const& pkt, bool& bogus_or_indeterminate);

} // namespace DNS

#endif // DNS_MESSAGE_DOT_HPP

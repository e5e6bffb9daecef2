#include "DNS-message.hpp"

#include "DNS-iostream.hpp"

#include <algorithm>
#include <cstring>
#include <ios>
#include <optional>
#include <type_traits>

namespace {
using octet = DNS::message::octet;

// RFC 1035 section 4.1.4, the top two bits of a compression pointer
auto constexpr cmprs_flags{octet(0xC0)};

// RFC 1035 section 4.1.1, a standard query
auto constexpr opcode_query{uint8_t(0)};

// RFC 1035 section 2.3.4, including the length octets
auto constexpr max_name_wire_sz{255};

octet constexpr lo(uint16_t n) { return octet(n & 0xFF); }
octet constexpr hi(uint16_t n) { return octet((n >> 8) & 0xFF); }

constexpr uint16_t as_u16(octet hi, octet lo)
{
  return (uint16_t(hi) << 8) + lo;
}

constexpr void set_bit(octet& o, octet mask, bool on)
{
  if (on)
    o |= mask;
  else
    o &= ~mask;
}

/*
                                           1  1  1  1  1  1
             0  1  2  3  4  5  6  7  8  9  0  1  2  3  4  5
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |                      ID                       |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |QR|   Opcode  |AA|TC|RD|RA| Z|AD|CD|   RCODE   |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |                    QDCOUNT                    |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |                    ANCOUNT                    |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |                    NSCOUNT                    |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |                    ARCOUNT                    |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+

 */

class header {
  octet id_hi_;
  octet id_lo_;

  octet flags_0_{0};
  octet flags_1_{0};

  octet qdcount_hi_{0};
  octet qdcount_lo_{0};

  octet ancount_hi_{0};
  octet ancount_lo_{0};

  octet nscount_hi_{0};
  octet nscount_lo_{0};

  octet arcount_hi_{0};
  octet arcount_lo_{0};

public:
  explicit header(uint16_t id)
    : id_hi_(hi(id))
    , id_lo_(lo(id))
  {
    static_assert(sizeof(header) == 12);
  }

  uint16_t id() const { return as_u16(id_hi_, id_lo_); }

  uint16_t qdcount() const { return as_u16(qdcount_hi_, qdcount_lo_); }
  uint16_t ancount() const { return as_u16(ancount_hi_, ancount_lo_); }
  uint16_t nscount() const { return as_u16(nscount_hi_, nscount_lo_); }
  uint16_t arcount() const { return as_u16(arcount_hi_, arcount_lo_); }

  // clang-format off
  bool    query_response()       const { return (flags_0_ & 0x80) != 0; }
  uint8_t opcode()               const { return (flags_0_ >> 3) & 0xf; }
  bool    authoritative_answer() const { return (flags_0_ & 0x04) != 0; }
  bool    truncation()           const { return (flags_0_ & 0x02) != 0; }
  bool    recursion_desired()    const { return (flags_0_ & 0x01) != 0; }

  bool checking_disabled()   const { return (flags_1_ & 0x10) != 0; }
  bool authentic_data()      const { return (flags_1_ & 0x20) != 0; }
  bool recursion_available() const { return (flags_1_ & 0x80) != 0; }
  // clang-format on

  uint16_t rcode() const { return flags_1_ & 0xf; }

  void set_query_response(bool on) { set_bit(flags_0_, 0x80, on); }
  void set_opcode(uint8_t opcode)
  {
    flags_0_ = (flags_0_ & 0x87) | ((opcode & 0xf) << 3);
  }
  void set_authoritative_answer(bool on) { set_bit(flags_0_, 0x04, on); }
  void set_truncation(bool on) { set_bit(flags_0_, 0x02, on); }
  void set_recursion_desired(bool on) { set_bit(flags_0_, 0x01, on); }
  void set_recursion_available(bool on) { set_bit(flags_1_, 0x80, on); }
  void set_rcode(uint8_t rcode) { flags_1_ = (flags_1_ & 0xf0) | (rcode & 0xf); }

  void set_qdcount(uint16_t n)
  {
    qdcount_hi_ = hi(n);
    qdcount_lo_ = lo(n);
  }
  void set_ancount(uint16_t n)
  {
    ancount_hi_ = hi(n);
    ancount_lo_ = lo(n);
  }
  void set_arcount(uint16_t n)
  {
    arcount_hi_ = hi(n);
    arcount_lo_ = lo(n);
  }
};

class question {
  octet qtype_hi_;
  octet qtype_lo_;

  octet qclass_hi_;
  octet qclass_lo_;

public:
  explicit question(DNS::RR_type qtype, uint16_t qclass)
    : qtype_hi_(hi(static_cast<uint16_t>(qtype)))
    , qtype_lo_(lo(static_cast<uint16_t>(qtype)))
    , qclass_hi_(hi(qclass))
    , qclass_lo_(lo(qclass))
  {
    static_assert(sizeof(question) == 4);
  }

  DNS::RR_type qtype() const
  {
    return static_cast<DNS::RR_type>(as_u16(qtype_hi_, qtype_lo_));
  }
  uint16_t qclass() const { return as_u16(qclass_hi_, qclass_lo_); }
};

/*

<https://tools.ietf.org/html/rfc6891#section-6.1.2>

       +------------+--------------+------------------------------+
       | Field Name | Field Type   | Description                  |
       +------------+--------------+------------------------------+
       | NAME       | domain name  | MUST be 0 (root domain)      |
       | TYPE       | u_int16_t    | OPT (41)                     |
       | CLASS      | u_int16_t    | requestor's UDP payload size |
       | TTL        | u_int32_t    | extended RCODE and flags     |
       | RDLEN      | u_int16_t    | length of all RDATA          |
       | RDATA      | octet stream | {attribute,value} pairs      |
       +------------+--------------+------------------------------+

*/

class edns0_opt_meta_rr {
  octet root_domain_name_{0}; // must be zero

  octet type_hi_{0};
  octet type_lo_{static_cast<octet>(DNS::RR_type::OPT)};

  octet class_hi_; // UDP payload size
  octet class_lo_;

  octet extended_rcode_{0};
  octet version_{0};

  octet z_hi_{0};
  octet z_lo_{0};

  octet rdlen_hi_{0};
  octet rdlen_lo_{0};

public:
  explicit edns0_opt_meta_rr(uint16_t max_udp_sz)
    : class_hi_(hi(max_udp_sz))
    , class_lo_(lo(max_udp_sz))
  {
    static_assert(sizeof(edns0_opt_meta_rr) == 11);
  }
};

/*

<https://tools.ietf.org/html/rfc1035>

4.1.3. Resource record format
                                    1  1  1  1  1  1
      0  1  2  3  4  5  6  7  8  9  0  1  2  3  4  5
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                                               |
    /                                               /
    /                      NAME                     /
    |                                               |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                      TYPE                     |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                     CLASS                     |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                      TTL                      |
    |                                               |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                   RDLENGTH                    |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--|
    /                     RDATA                     /
    /                                               /
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+

 */

class rr {
  octet type_hi_;
  octet type_lo_;

  octet class_hi_;
  octet class_lo_;

  octet ttl_0_;
  octet ttl_1_;
  octet ttl_2_;
  octet ttl_3_;

  octet rdlength_hi_;
  octet rdlength_lo_;

public:
  rr(DNS::RR_type type, uint16_t cls, uint32_t ttl)
    : type_hi_(hi(static_cast<uint16_t>(type)))
    , type_lo_(lo(static_cast<uint16_t>(type)))
    , class_hi_(hi(cls))
    , class_lo_(lo(cls))
    , ttl_0_(octet((ttl >> 24) & 0xFF))
    , ttl_1_(octet((ttl >> 16) & 0xFF))
    , ttl_2_(octet((ttl >> 8) & 0xFF))
    , ttl_3_(octet(ttl & 0xFF))
    , rdlength_hi_(0)
    , rdlength_lo_(0)
  {
    static_assert(sizeof(rr) == 10);
  }

  uint16_t rr_type() const { return as_u16(type_hi_, type_lo_); }
  uint16_t rr_class() const { return as_u16(class_hi_, class_lo_); }
  uint32_t rr_ttl() const
  {
    return (uint32_t(ttl_0_) << 24) + (uint32_t(ttl_1_) << 16) +
           (uint32_t(ttl_2_) << 8) + (uint32_t(ttl_3_));
  }

  uint16_t rdlength() const { return as_u16(rdlength_hi_, rdlength_lo_); }

  auto cdata() const
  {
    return reinterpret_cast<char const*>(this) + sizeof(rr);
  }
  auto rddata() const { return reinterpret_cast<octet const*>(cdata()); }
  auto next_rr_name() const { return rddata() + rdlength(); }
};

// offset of RDLENGTH within rr
auto constexpr rdlength_offset{8};

// Compression pointer to the question name, which always follows the
// header (RFC 1035 section 4.1.4).
auto constexpr question_name_ptr{uint16_t(cmprs_flags << 8 | 12)};

template <typename T>
void put(DNS::message::container_t& buf, T const& t)
{
  auto const p = reinterpret_cast<octet const*>(&t);
  buf.insert(end(buf), p, p + sizeof(T));
}

void put_u16(DNS::message::container_t& buf, uint16_t n)
{
  buf.push_back(hi(n));
  buf.push_back(lo(n));
}

// name processing code mostly adapted from c-ares

// return the length of the expansion of an encoded domain name, or -1
// if the encoding is invalid

int name_length(octet const* encoded, DNS::message const& pkt)
{
  auto const sp     = static_cast<std::span<DNS::message::octet const>>(pkt);
  auto const sp_end = sp.data() + sp.size();

  // Allow the caller to pass us buf + len and have us check for it.
  if (encoded >= sp_end)
    return -1;

  int length  = 0;
  int wire_sz = 1; // the root label
  int nindir  = 0; // count indirections

  while (*encoded) {

    auto const top = (*encoded & cmprs_flags);

    if (top == cmprs_flags) {
      // Check the offset and go there.
      if (encoded + 1 >= sp_end)
        return -1;

      unsigned const offset = (*encoded & ~cmprs_flags) << 8 | *(encoded + 1);

      // Only to a prior occurrence of a name.
      if (offset >= static_cast<unsigned>(encoded - sp.data()))
        return -1;

      encoded = sp.data() + offset;

      ++nindir;

      auto constexpr max_indirs = 50; // maximum indirections allowed for a name

      // If we've seen more indirects than the message length, or over
      // some limit, then there's a loop.
      if (nindir > std::streamsize(sp.size()) || nindir > max_indirs)
        return -1;
    }
    else if (top == 0) {
      auto offset = *encoded;
      if (encoded + offset + 1 >= sp_end)
        return -1;

      wire_sz += offset + 1;
      if (wire_sz > max_name_wire_sz)
        return -1;

      ++encoded;

      while (offset--) {
        length += (*encoded == '.' || *encoded == '\\') ? 2 : 1;
        encoded++;
      }

      ++length;
    }
    else {
      // RFC 1035 4.1.4 says other options (01, 10) for top 2
      // bits are reserved.
      return -1;
    }
  }

  // If there were any labels at all, then the number of dots is one
  // less than the number of labels, so subtract one.

  return length ? length - 1 : length;
}

bool expand_name(octet const*        encoded,
                 DNS::message const& pkt,
                 std::string&        name,
                 int&                enc_len)
{
  auto const sp = static_cast<std::span<DNS::message::octet const>>(pkt);

  name.clear();

  auto indir = false;

  auto const nlen = name_length(encoded, pkt);
  if (nlen < 0) {
    LOG(WARNING) << "bad name";
    return false;
  }

  name.reserve(nlen);

  if (nlen == 0) {
    // RFC 2181 says this should be ".": the root of the DNS tree.
    // Since this function strips trailing dots though, it becomes ""s

    // indirect root label (like 0xc0 0x0c) is 2 bytes long
    if ((*encoded & cmprs_flags) == cmprs_flags)
      enc_len = 2;
    else
      enc_len = 1; // the caller should move one byte to get past this

    return true;
  }

  // error-checking done by name_length()
  auto p = encoded;
  while (*p) {
    if ((*p & cmprs_flags) == cmprs_flags) {
      if (!indir) {
        enc_len = static_cast<int>(p + 2 - encoded);
        indir   = true;
      }
      p = sp.data() + ((*p & ~cmprs_flags) << 8 | *(p + 1));
    }
    else {
      int len = *p;
      p++;
      while (len--) {
        if (*p == '.' || *p == '\\')
          name += '\\';
        name += static_cast<char>(*p);
        p++;
      }
      name += '.';
    }
  }

  if (!indir)
    enc_len = static_cast<int>(p + 1 - encoded);

  if (name.length() && (name.back() == '.')) {
    name.pop_back();
  }

  return true;
}

// Append the wire encoding of name, uncompressed.  Returns false,
// leaving buf as it was, if name can't be encoded.

bool name_put(DNS::message::container_t& buf, std::string_view name)
{
  auto const start = buf.size();

  if (name == ".")
    name.remove_prefix(1);

  while (!name.empty()) {
    if (name.front() == '.') {
      LOG(WARNING) << "zero length label";
      buf.resize(start);
      return false;
    }

    auto const len_pos = buf.size();
    buf.push_back(0);

    uint8_t len = 0;
    size_t  p   = 0;
    for (; p < name.size() && name[p] != '.'; ++p) {
      if (name[p] == '\\' && p + 1 < name.size())
        ++p;
      if (++len > 63) {
        // RFC-1035 Section 2.3.4. Size limits
        LOG(WARNING) << "label exceeds 63 octets";
        buf.resize(start);
        return false;
      }
      buf.push_back(static_cast<octet>(name[p]));
    }
    buf[len_pos] = len;

    if (p == name.size())
      break;

    name.remove_prefix(p + 1);
  }

  // Add the zero-length label at the end.
  buf.push_back(0);

  if (buf.size() - start > 255) {
    // RFC-1035 Section 2.3.4. Size limits
    LOG(WARNING) << "domain name exceeds 255 octets";
    buf.resize(start);
    return false;
  }

  return true;
}

void put_rdata(DNS::message::container_t& buf, DNS::RR_A const& a)
{
  auto const p = reinterpret_cast<octet const*>(&a.addr());
  buf.insert(end(buf), p, p + sizeof(a.addr()));
}

void put_rdata(DNS::message::container_t& buf, DNS::RR_AAAA const& aaaa)
{
  auto const p = reinterpret_cast<octet const*>(&aaaa.addr());
  buf.insert(end(buf), p, p + sizeof(aaaa.addr()));
}

void put_rdata(DNS::message::container_t& buf, DNS::RR_CNAME const& cname)
{
  CHECK(name_put(buf, cname.str())) << "bad CNAME target " << cname.str();
}

void put_rdata(DNS::message::container_t& buf, DNS::RR_PTR const& ptr)
{
  CHECK(name_put(buf, ptr.str())) << "bad PTR name " << ptr.str();
}

void put_rdata(DNS::message::container_t& buf, DNS::RR_MX const& mx)
{
  put_u16(buf, mx.preference());
  CHECK(name_put(buf, mx.exchange())) << "bad MX exchange " << mx.exchange();
}

// Names are validated before they get this far, in rr_name_ok().
bool rr_name_ok(DNS::RR const& answer)
{
  DNS::message::container_t scratch;
  return std::visit(
      [&scratch](auto const& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, DNS::RR_CNAME> ||
                      std::is_same_v<T, DNS::RR_PTR>) {
          return name_put(scratch, r.str());
        }
        else if constexpr (std::is_same_v<T, DNS::RR_MX>) {
          return name_put(scratch, r.exchange());
        }
        else {
          return true;
        }
      },
      answer);
}

void put_answer(DNS::message::container_t& buf,
                DNS::RR const&             answer,
                uint16_t                   cls,
                uint32_t                   ttl)
{
  put_u16(buf, question_name_ptr);

  auto const rr_pos = buf.size();
  std::visit(
      [&buf, cls, ttl](auto const& r) {
        put(buf, rr{r.rr_type(), cls, ttl});
        put_rdata(buf, r);
      },
      answer);

  auto const rdlength = buf.size() - rr_pos - sizeof(rr);
  CHECK_LE(rdlength, std::numeric_limits<uint16_t>::max());
  buf[rr_pos + rdlength_offset]     = hi(static_cast<uint16_t>(rdlength));
  buf[rr_pos + rdlength_offset + 1] = lo(static_cast<uint16_t>(rdlength));
}

DNS::message::container_t encode_response(DNS::Query const&         q,
                                          DNS::Rcode                rcode,
                                          DNS::RR_collection const& answers,
                                          uint32_t                  ttl,
                                          bool                      aa,
                                          bool                      tc)
{
  DNS::message::container_t buf;
  buf.reserve(Config::min_udp_sz);

  header hdr(q.id);
  hdr.set_query_response(true);
  hdr.set_opcode(q.opcode);
  hdr.set_authoritative_answer(aa);
  hdr.set_truncation(tc);
  hdr.set_recursion_desired(q.recursion_desired);
  hdr.set_recursion_available(true);
  hdr.set_rcode(static_cast<uint8_t>(rcode));

  auto const with_question = q.has_question;
  hdr.set_qdcount(with_question ? 1 : 0);
  hdr.set_ancount(with_question ? static_cast<uint16_t>(answers.size()) : 0);
  put(buf, hdr);

  if (!with_question)
    return buf;

  CHECK(name_put(buf, q.name)) << "question name does not encode: " << q.name;
  put(buf, question{q.type, q.cls});

  for (auto const& answer : answers) {
    put_answer(buf, answer, q.cls, ttl);
  }

  return buf;
}

std::optional<DNS::RR>
get_A(rr const* rr_p, DNS::message const& pkt, bool& err)
{
  if (rr_p->rdlength() != 4) {
    LOG(WARNING) << "bogus A record";
    err = true;
    return {};
  }
  return DNS::RR_A{rr_p->rddata(), rr_p->rdlength()};
}

std::optional<DNS::RR>
get_CNAME(rr const* rr_p, DNS::message const& pkt, bool& err)
{
  std::string name;
  int         enc_len;
  if (!expand_name(rr_p->rddata(), pkt, name, enc_len)) {
    LOG(WARNING) << "bogus CNAME record";
    err = true;
    return {};
  }
  return DNS::RR_CNAME{name};
}

std::optional<DNS::RR>
get_PTR(rr const* rr_p, DNS::message const& pkt, bool& err)
{
  std::string name;
  int         enc_len;
  if (!expand_name(rr_p->rddata(), pkt, name, enc_len)) {
    LOG(WARNING) << "bogus PTR record";
    err = true;
    return {};
  }
  return DNS::RR_PTR{name};
}

std::optional<DNS::RR>
get_MX(rr const* rr_p, DNS::message const& pkt, bool& err)
{
  std::string name;
  int         enc_len;
  if (rr_p->rdlength() < 3) {
    LOG(WARNING) << "bogus MX record";
    err = true;
    return {};
  }
  auto       p          = rr_p->rddata();
  auto const preference = as_u16(p[0], p[1]);
  p += 2;
  if (!expand_name(p, pkt, name, enc_len)) {
    LOG(WARNING) << "bogus MX record";
    err = true;
    return {};
  }
  return DNS::RR_MX{name, preference};
}

std::optional<DNS::RR>
get_AAAA(rr const* rr_p, DNS::message const& pkt, bool& err)
{
  if (rr_p->rdlength() != 16) {
    LOG(WARNING) << "bogus AAAA record";
    err = true;
    return {};
  }
  return DNS::RR_AAAA{rr_p->rddata(), rr_p->rdlength()};
}

std::optional<DNS::RR>
get_rr(rr const* rr_p, DNS::message const& pkt, bool& err)
{
  auto const typ = static_cast<DNS::RR_type>(rr_p->rr_type());

  switch (typ) { // clang-format off
  case DNS::RR_type::A:     return get_A    (rr_p, pkt, err);
  case DNS::RR_type::CNAME: return get_CNAME(rr_p, pkt, err);
  case DNS::RR_type::PTR:   return get_PTR  (rr_p, pkt, err);
  case DNS::RR_type::MX:    return get_MX   (rr_p, pkt, err);
  case DNS::RR_type::AAAA:  return get_AAAA (rr_p, pkt, err);
  default: break;
  } // clang-format on

  LOG(WARNING) << "unsupported RR type " << typ;
  return {};
}
} // namespace

namespace DNS {

uint16_t message::id() const
{
  auto const hdr_p = reinterpret_cast<header const*>(buf_.data());
  return hdr_p->id();
}

bool message::is_response() const
{
  return reinterpret_cast<header const*>(buf_.data())->query_response();
}

bool message::authoritative_answer() const
{
  return reinterpret_cast<header const*>(buf_.data())->authoritative_answer();
}

bool message::truncation() const
{
  return reinterpret_cast<header const*>(buf_.data())->truncation();
}

bool message::recursion_available() const
{
  return reinterpret_cast<header const*>(buf_.data())->recursion_available();
}

uint16_t message::rcode() const
{
  return reinterpret_cast<header const*>(buf_.data())->rcode();
}

uint16_t message::ancount() const
{
  return reinterpret_cast<header const*>(buf_.data())->ancount();
}

size_t message::min_sz() { return sizeof(header); }

bool decode_query(message const& msg, Query& q, Rcode& rcode)
{
  auto const sp     = static_cast<std::span<message::octet const>>(msg);
  auto const sp_end = sp.data() + sp.size();

  if (sp.size() < sizeof(header)) {
    LOG(WARNING) << "message too short, " << sp.size() << " octets";
    return false;
  }

  auto const hdr_p = reinterpret_cast<header const*>(sp.data());
  if (hdr_p->query_response()) {
    LOG(WARNING) << "response where a query was expected, id " << hdr_p->id();
    return false;
  }

  q.id                = hdr_p->id();
  q.opcode            = hdr_p->opcode();
  q.recursion_desired = hdr_p->recursion_desired();

  rcode = Rcode::NOERROR;

  if (hdr_p->opcode() != opcode_query) {
    LOG(INFO) << "opcode " << unsigned(hdr_p->opcode()) << " not implemented";
    rcode = Rcode::NOTIMP;
    return true;
  }

  if (hdr_p->qdcount() != 1) {
    LOG(WARNING) << "qdcount == " << hdr_p->qdcount();
    rcode = Rcode::FORMERR;
    return true;
  }

  // p is a pointer that pushes forward in the message as we process
  // each section
  auto p = sp.data() + sizeof(header);

  auto enc_len = 0;
  if (!expand_name(p, msg, q.name, enc_len) ||
      ((p + enc_len + sizeof(question)) > sp_end)) {
    LOG(WARNING) << "bad question in query id " << q.id;
    q.name.clear();
    rcode = Rcode::FORMERR;
    return true;
  }
  p += enc_len;

  auto const question_p = reinterpret_cast<question const*>(p);
  p += sizeof(question);

  q.type         = question_p->qtype();
  q.cls          = question_p->qclass();
  q.has_question = true;

  // Look for an EDNS0 OPT in what follows, for the client's payload
  // size; a query has no business carrying answers, but skip them.
  auto const rrs = hdr_p->ancount() + hdr_p->nscount() + hdr_p->arcount();
  for (auto i = 0; i < rrs; ++i) {
    std::string x;
    if (!expand_name(p, msg, x, enc_len) ||
        ((p + enc_len + sizeof(rr)) > sp_end)) {
      LOG(WARNING) << "bad RR following question for " << q.name << '/'
                   << q.type;
      break;
    }
    p += enc_len;
    auto const rr_p = reinterpret_cast<rr const*>(p);
    if (rr_p->next_rr_name() > sp_end) {
      LOG(WARNING) << "RR overruns message for " << q.name << '/' << q.type;
      break;
    }
    if (rr_p->rr_type() == static_cast<uint16_t>(DNS::RR_type::OPT)) {
      q.udp_payload_sz = std::clamp(rr_p->rr_class(), Config::min_udp_sz,
                                    Config::max_udp_sz);
    }
    p = rr_p->next_rr_name();
  }

  return true;
}

message create_response(Query const&         q,
                        Rcode                rcode,
                        RR_collection const& answers,
                        uint32_t             ttl,
                        bool                 authoritative,
                        uint16_t             max_sz)
{
  RR_collection usable;
  usable.reserve(answers.size());
  for (auto const& answer : answers) {
    if (rr_name_ok(answer))
      usable.push_back(answer);
    else
      LOG(WARNING) << "dropping answer that does not encode: " << answer;
  }

  auto buf = encode_response(q, rcode, usable, ttl, authoritative, false);
  if (buf.size() > max_sz) {
    LOG(INFO) << "response for " << q.name << '/' << q.type << " is "
              << buf.size() << " octets, truncating to fit " << max_sz;
    buf = encode_response(q, rcode, RR_collection{}, ttl, authoritative, true);
  }

  return message{std::move(buf)};
}

message create_truncated(Query const& q, message const& reply)
{
  CHECK_GE(size(reply), message::min_sz());
  auto const rcode = static_cast<Rcode>(reply.rcode());
  return message{encode_response(q, rcode, RR_collection{}, 0,
                                 reply.authoritative_answer(), true)};
}

message create_question(char const* name, RR_type type, uint16_t cls, uint16_t id)
{
  message::container_t buf;

  header hdr(id);
  hdr.set_recursion_desired(true);
  hdr.set_qdcount(1);
  hdr.set_arcount(1); // 1 additional for the OPT
  put(buf, hdr);

  CHECK(name_put(buf, name)) << "malformed domain name " << name;

  put(buf, question(type, cls));
  put(buf, edns0_opt_meta_rr(Config::max_udp_sz));

  return message{std::move(buf)};
}

RR_collection get_records(message const& pkt, bool& bogus_or_indeterminate)
{
  auto const sp     = static_cast<std::span<message::octet const>>(pkt);
  auto const sp_end = sp.data() + sp.size();

  RR_collection ret;

  if (sp.size() < sizeof(header)) {
    bogus_or_indeterminate = true;
    LOG(WARNING) << "message too short";
    return ret;
  }

  auto const hdr_p = reinterpret_cast<header const*>(sp.data());

  auto p = sp.data() + sizeof(header);

  // skip queries
  for (auto i = 0; i < hdr_p->qdcount(); ++i) {
    std::string qname;
    auto        enc_len = 0;

    if (!expand_name(p, pkt, qname, enc_len)) {
      bogus_or_indeterminate = true;
      LOG(WARNING) << "bad message";
      return RR_collection{};
    }
    p += enc_len;
    p += sizeof(question);
  }

  // get answers
  for (auto i = 0; i < hdr_p->ancount(); ++i) {
    std::string name;
    auto        enc_len = 0;
    if (!expand_name(p, pkt, name, enc_len)) {
      bogus_or_indeterminate = true;
      LOG(WARNING) << "bad message";
      return RR_collection{};
    }
    p += enc_len;
    if ((p + sizeof(rr)) > sp_end) {
      bogus_or_indeterminate = true;
      LOG(WARNING) << "bad message";
      return RR_collection{};
    }
    auto rr_p = reinterpret_cast<rr const*>(p);
    if (rr_p->next_rr_name() > sp_end) {
      bogus_or_indeterminate = true;
      LOG(WARNING) << "bad message";
      return RR_collection{};
    }

    auto rr_ret = get_rr(rr_p, pkt, bogus_or_indeterminate);

    if (bogus_or_indeterminate)
      return RR_collection{};

    if (rr_ret)
      ret.emplace_back(*rr_ret);

    p = rr_p->next_rr_name();
  }

  return ret;
}

} // namespace DNS

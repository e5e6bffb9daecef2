#include "DNS-message.hpp"

#include "DNS-iostream.hpp"

#include <glog/logging.h>

using DNS::RR_type;
using DNS::Rcode;

namespace {
DNS::message edit(DNS::message const& msg, size_t pos, unsigned char val)
{
  DNS::message::container_t buf(msg.data(), msg.data() + size(msg));
  buf[pos] = val;
  return DNS::message{std::move(buf)};
}

// Header of a query with one question and arcount additional RRs.
DNS::message::container_t raw_query(unsigned char arcount = 0)
{
  return {0x42, 0x42, 0x01, 0x00, 0, 1, 0, 0, 0, 0, 0, arcount};
}

void put_label(DNS::message::container_t& buf, unsigned char len, char c)
{
  buf.push_back(len);
  buf.insert(end(buf), size_t(len), static_cast<unsigned char>(c));
}

// qtype A, qclass IN
void put_a_in(DNS::message::container_t& buf)
{
  buf.insert(end(buf), {0, 1, 0, 1});
}

// The question is unusable: FORMERR, and a reply without it.
void check_formerr(DNS::message::container_t buf)
{
  DNS::message const msg{std::move(buf)};
  DNS::Query         q;
  auto               rcode = Rcode::NOERROR;
  CHECK(DNS::decode_query(msg, q, rcode));
  CHECK_EQ(rcode, Rcode::FORMERR);
  CHECK(!q.has_question);

  auto const reply = DNS::create_error(q, rcode, false);
  CHECK_EQ(reply.rcode(), 1);
  CHECK_EQ(reply.id(), 0x4242);
  CHECK_EQ(size(reply), DNS::message::min_sz());
}

DNS::Query decoded(DNS::message const& msg)
{
  DNS::Query q;
  auto       rcode = Rcode::SERVFAIL;
  CHECK(DNS::decode_query(msg, q, rcode));
  CHECK_EQ(rcode, Rcode::NOERROR);
  return q;
}
} // namespace

int main(int argc, char* argv[])
{
  auto const qmsg =
      DNS::create_question("www.Example.com", RR_type::A, 1, 0x1234);
  CHECK_EQ(qmsg.id(), 0x1234);
  CHECK(!qmsg.is_response());

  auto const q = decoded(qmsg);
  CHECK_EQ(q.id, 0x1234);
  CHECK_EQ(q.name, "www.Example.com");
  CHECK_EQ(q.type, RR_type::A);
  CHECK_EQ(q.cls, 1);
  CHECK(q.recursion_desired);
  CHECK(q.has_question);
  CHECK_EQ(q.udp_payload_sz, Config::max_udp_sz); // from the OPT

  // answers
  DNS::RR_collection const rrs{DNS::RR_A{"1.2.3.4"}, DNS::RR_A{"5.6.7.8"}};
  auto const rsp = DNS::create_response(q, Rcode::NOERROR, rrs, 300, true,
                                        Config::min_udp_sz);
  CHECK_EQ(rsp.id(), 0x1234);
  CHECK(rsp.is_response());
  CHECK(rsp.authoritative_answer());
  CHECK(rsp.recursion_available());
  CHECK(!rsp.truncation());
  CHECK_EQ(rsp.rcode(), 0);
  CHECK_EQ(rsp.ancount(), 2);

  auto bogus{false};
  auto const got = DNS::get_records(rsp, bogus);
  CHECK(!bogus);
  CHECK_EQ(got.size(), 2u);
  CHECK(got[0] == rrs[0]);
  CHECK(got[1] == rrs[1]);

  // a response is not a query
  DNS::Query rq;
  auto       rcode = Rcode::NOERROR;
  CHECK(!DNS::decode_query(rsp, rq, rcode));

  // too short
  DNS::message const shorty{qmsg.data(), 5};
  CHECK(!DNS::decode_query(shorty, rq, rcode));

  // other record types
  auto const mxq = decoded(DNS::create_question("example.com", RR_type::MX, 1, 7));
  DNS::RR_collection const mxs{DNS::RR_MX{"mail.example.com", 10},
                               DNS::RR_MX{"backup.example.com", 20}};
  auto const mx_rsp =
      DNS::create_response(mxq, Rcode::NOERROR, mxs, 60, true, 512);
  auto const mx_got = DNS::get_records(mx_rsp, bogus);
  CHECK(!bogus);
  CHECK_EQ(mx_got.size(), 2u);
  CHECK(mx_got[0] == mxs[0]);
  CHECK(mx_got[1] == mxs[1]);

  auto const pq = decoded(
      DNS::create_question("4.3.2.1.in-addr.arpa", RR_type::PTR, 1, 8));
  CHECK_EQ(pq.name, "4.3.2.1.in-addr.arpa");
  DNS::RR_collection const ptrs{DNS::RR_PTR{"web.example.com"}};
  auto const p_got = DNS::get_records(
      DNS::create_response(pq, Rcode::NOERROR, ptrs, 60, true, 512), bogus);
  CHECK(!bogus);
  CHECK_EQ(p_got.size(), 1u);
  CHECK(p_got[0] == ptrs[0]);

  DNS::RR_collection const mixed{DNS::RR_AAAA{"2001:db8::1"},
                                 DNS::RR_CNAME{"alias.example.com"}};
  auto const m_got = DNS::get_records(
      DNS::create_response(q, Rcode::NOERROR, mixed, 60, true, 512), bogus);
  CHECK(!bogus);
  CHECK_EQ(m_got.size(), 2u);
  CHECK(m_got[0] == mixed[0]);
  CHECK(m_got[1] == mixed[1]);

  // failures carry no answers
  auto const nx = DNS::create_error(q, Rcode::NXDOMAIN, true);
  CHECK_EQ(nx.rcode(), 3);
  CHECK_EQ(nx.ancount(), 0);
  CHECK(nx.authoritative_answer());

  auto const refused = DNS::create_error(q, Rcode::REFUSED, false);
  CHECK_EQ(refused.rcode(), 5);
  CHECK(!refused.authoritative_answer());

  // too big for a plain UDP reply
  DNS::RR_collection lots;
  for (auto i = 0; i < 40; ++i)
    lots.emplace_back(DNS::RR_A{"10.0.0." + std::to_string(i)});
  auto const big =
      DNS::create_response(q, Rcode::NOERROR, lots, 300, true, 512);
  CHECK(big.truncation());
  CHECK_EQ(big.ancount(), 0);
  CHECK_LE(size(big), 512);

  auto const big_tcp = DNS::create_response(q, Rcode::NOERROR, lots, 300,
                                            true, Config::max_tcp_sz);
  CHECK(!big_tcp.truncation());
  CHECK_EQ(big_tcp.ancount(), 40);

  auto const cut = DNS::create_truncated(q, big_tcp);
  CHECK(cut.truncation());
  CHECK(cut.is_response());
  CHECK_EQ(cut.id(), q.id);
  CHECK_EQ(cut.ancount(), 0);

  // an answer whose name can't be encoded is left out
  DNS::RR_collection const bad{DNS::RR_CNAME{"a..b"},
                               DNS::RR_CNAME{"ok.example.com"}};
  auto const b_rsp = DNS::create_response(q, Rcode::NOERROR, bad, 60, true, 512);
  CHECK_EQ(b_rsp.ancount(), 1);

  // opcode STATUS
  auto const status = edit(qmsg, 2, qmsg.data()[2] | (2 << 3));
  DNS::Query sq;
  CHECK(DNS::decode_query(status, sq, rcode));
  CHECK_EQ(rcode, Rcode::NOTIMP);
  auto const not_impl = DNS::create_error(sq, rcode, false);
  CHECK_EQ(not_impl.rcode(), 4);
  CHECK_EQ(not_impl.id(), 0x1234);

  // no question
  auto const empty = edit(qmsg, 5, 0);
  DNS::Query eq;
  CHECK(DNS::decode_query(empty, eq, rcode));
  CHECK_EQ(rcode, Rcode::FORMERR);
  CHECK_EQ(DNS::create_error(eq, rcode, false).rcode(), 1);

  // question runs off the end
  DNS::message const chopped{qmsg.data(), 16};
  DNS::Query         cq;
  CHECK(DNS::decode_query(chopped, cq, rcode));
  CHECK_EQ(rcode, Rcode::FORMERR);

  // no OPT, classic 512 octet limit
  auto const no_opt = edit(qmsg, 11, 0);
  CHECK_EQ(decoded(no_opt).udp_payload_sz, Config::min_udp_sz);

  { // a name of exactly 255 octets is fine
    auto buf = raw_query();
    put_label(buf, 63, 'a');
    put_label(buf, 63, 'b');
    put_label(buf, 63, 'c');
    put_label(buf, 61, 'd');
    buf.push_back(0);
    put_a_in(buf);
    auto const lq = decoded(DNS::message{std::move(buf)});
    CHECK_EQ(lq.name.size(), 253u);
    auto const reply = DNS::create_error(lq, Rcode::SERVFAIL, false);
    CHECK_EQ(reply.rcode(), 2);
  }

  { // one octet more is not
    auto buf = raw_query();
    put_label(buf, 63, 'a');
    put_label(buf, 63, 'b');
    put_label(buf, 63, 'c');
    put_label(buf, 62, 'd');
    buf.push_back(0);
    put_a_in(buf);
    check_formerr(std::move(buf));
  }

  { // labels chained by a pointer forward, past the question
    auto buf = raw_query();
    put_label(buf, 63, 'a');
    buf.push_back(0xC0);
    buf.push_back(12 + 64 + 2 + 4);
    put_a_in(buf);
    for (auto c : {'b', 'c', 'd', 'e'})
      put_label(buf, 63, c);
    buf.push_back(0);
    check_formerr(std::move(buf));
  }

  { // pointer to itself
    auto buf = raw_query();
    buf.push_back(0xC0);
    buf.push_back(12);
    put_a_in(buf);
    check_formerr(std::move(buf));
  }

  { // pointer loop through a label
    auto buf = raw_query();
    put_label(buf, 3, 'x');
    buf.push_back(0xC0);
    buf.push_back(12);
    put_a_in(buf);
    check_formerr(std::move(buf));
  }

  { // pointer past the end of the message
    auto buf = raw_query();
    buf.push_back(0xC0);
    buf.push_back(0xFF);
    put_a_in(buf);
    check_formerr(std::move(buf));
  }

  { // reserved label type
    auto buf = raw_query();
    buf.push_back(0x40);
    buf.push_back(0x01);
    buf.push_back(0);
    put_a_in(buf);
    check_formerr(std::move(buf));
  }

  { // over long name in an OPT that points back at the question
    auto buf = raw_query(1);
    put_label(buf, 63, 'a');
    put_label(buf, 63, 'b');
    put_label(buf, 63, 'c');
    buf.push_back(0);
    put_a_in(buf);
    put_label(buf, 63, 'd');
    buf.push_back(0xC0);
    buf.push_back(12);
    buf.insert(end(buf), {0, 41, 0x10, 0, 0, 0, 0, 0, 0, 0});
    auto const oq = decoded(DNS::message{std::move(buf)});
    CHECK(oq.has_question);
    CHECK_EQ(oq.name.size(), 191u);
    CHECK_EQ(oq.udp_payload_sz, Config::min_udp_sz); // OPT not used
  }
}

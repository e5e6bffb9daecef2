#include "Server.hpp"

#include "DNS-iostream.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <stdexcept>
#include <thread>

#include <glog/logging.h>

using DNS::RR_type;
using Server::transport;

using boost::asio::ip::tcp;
using namespace std::chrono_literals;

namespace {
class one_record_store : public RecordStore {
public:
  std::vector<Record> lookup(filter const& f) override
  {
    auto const nt = std::get_if<by_name_type>(&f);
    if (nt && nt->name == "web" && nt->type == RR_type::A)
      return {Record{"web", RR_type::A, "10.0.0.1", {}, {}, {}}};
    if (nt && nt->name == "crash")
      throw std::runtime_error("unexpected");
    return {};
  }
};

class canned_transport : public Upstream::Transport {
public:
  std::optional<DNS::message> reply;
  int                         calls{0};

  std::optional<DNS::message> xchg(Upstream::endpoint const&,
                                   DNS::message const&) override
  {
    ++calls;
    return reply;
  }
};

DNS::message no_opt(DNS::message const& msg)
{
  DNS::message::container_t buf(msg.data(), msg.data() + size(msg));
  buf[11] = 0; // arcount
  buf.resize(buf.size() - 11);
  return DNS::message{std::move(buf)};
}

DNS::message upstream_reply(DNS::message const& qmsg, int n_answers)
{
  DNS::Query q;
  auto       rcode = DNS::Rcode::NOERROR;
  CHECK(DNS::decode_query(qmsg, q, rcode));
  DNS::RR_collection rrs;
  for (auto i = 0; i < n_answers; ++i)
    rrs.emplace_back(DNS::RR_A{"192.0.2." + std::to_string(i)});
  return DNS::create_response(q, rcode, rrs, 60, false, Config::max_tcp_sz);
}
// An upstream that takes its time.
class slow_transport : public Upstream::Transport {
public:
  std::optional<DNS::message> xchg(Upstream::endpoint const&,
                                   DNS::message const& q) override
  {
    std::this_thread::sleep_for(500ms);
    return upstream_reply(q, 1);
  }
};

void tcp_send(tcp::socket& sock, DNS::message const& msg)
{
  DNS::message::container_t buf{
      static_cast<DNS::message::octet>(size(msg) >> 8),
      static_cast<DNS::message::octet>(size(msg) & 0xFF)};
  buf.insert(end(buf), msg.data(), msg.data() + size(msg));
  boost::asio::write(sock, boost::asio::buffer(buf));
}

DNS::message tcp_recv(tcp::socket& sock)
{
  std::array<DNS::message::octet, 2> len;
  boost::asio::read(sock, boost::asio::buffer(len));
  DNS::message::container_t buf((len[0] << 8) | len[1]);
  boost::asio::read(sock, boost::asio::buffer(buf));
  return DNS::message{std::move(buf)};
}

void tcp_session_checks(Server::responder const& r)
{
  boost::asio::io_context  io;
  boost::asio::thread_pool pool(2);

  Server::listener l(io, pool, 0, r, 200ms);
  l.start();

  std::thread io_thread([&io] { io.run(); });

  boost::asio::io_context client_io;
  tcp::socket             sock(client_io);
  sock.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(),
                             l.tcp_port()));

  // forwarded, and slower than the idle timeout
  auto const goog = DNS::create_question("www.google.com", RR_type::A, 1, 21);
  tcp_send(sock, goog);
  auto const f = tcp_recv(sock);
  CHECK_EQ(f.id(), 21);
  CHECK_EQ(f.ancount(), 1);

  // the same connection is good for another
  auto const web = DNS::create_question("web.example.com", RR_type::A, 1, 22);
  tcp_send(sock, web);
  auto const a = tcp_recv(sock);
  CHECK_EQ(a.id(), 22);
  CHECK(a.authoritative_answer());

  // then nothing, and it's closed
  std::array<DNS::message::octet, 2> len;
  boost::system::error_code          ec;
  boost::asio::read(sock, boost::asio::buffer(len), ec);
  CHECK(ec == boost::asio::error::eof) << ec.message();

  io.stop();
  io_thread.join();
  pool.join();
}
} // namespace

int main(int argc, char* argv[])
{
  one_record_store       store;
  Engine::resolver const engine("example.com", 300, store);

  canned_transport          t;
  Upstream::Forwarder const fwd({{Upstream::sock_type::dgram, "192.0.2.53", 53}},
                                t);

  Server::responder const r(engine, fwd);

  // local answer
  auto const web = DNS::create_question("web.example.com", RR_type::A, 1, 10);
  auto const a   = r.respond(web, transport::udp);
  CHECK(a);
  CHECK_EQ(a->id(), 10);
  CHECK(a->is_response());
  CHECK(a->authoritative_answer());
  CHECK(a->recursion_available());
  CHECK_EQ(a->rcode(), 0);
  auto bogus{false};
  auto const rrs = DNS::get_records(*a, bogus);
  CHECK_EQ(rrs.size(), 1u);
  CHECK(rrs[0] == DNS::RR{DNS::RR_A{"10.0.0.1"}});

  // local miss
  auto const nx = r.respond(
      DNS::create_question("nope.example.com", RR_type::A, 1, 11), transport::tcp);
  CHECK_EQ(nx->rcode(), 3);
  CHECK(nx->authoritative_answer());
  CHECK_EQ(nx->ancount(), 0);

  // malformed reverse name
  auto const refused = r.respond(
      DNS::create_question("1.2.in-addr.arpa", RR_type::PTR, 1, 12),
      transport::udp);
  CHECK_EQ(refused->rcode(), 5);

  // a failure nobody expected is still answered
  auto const crash = r.respond(
      DNS::create_question("crash.example.com", RR_type::A, 1, 13),
      transport::udp);
  CHECK_EQ(crash->rcode(), 2);
  CHECK_EQ(crash->id(), 13);

  CHECK_EQ(t.calls, 0);

  // forwarded, and the upstream reply relayed untouched
  auto const goog = DNS::create_question("www.google.com", RR_type::A, 1, 14);
  t.reply         = upstream_reply(goog, 2);
  auto const f    = r.respond(goog, transport::udp);
  CHECK(f);
  CHECK_EQ(t.calls, 1);
  CHECK_EQ(size(*f), size(*t.reply));
  CHECK(std::equal(f->data(), f->data() + size(*f), t.reply->data()));
  CHECK(!f->authoritative_answer());

  // too big for a client without EDNS0
  auto const small = no_opt(goog);
  t.reply          = upstream_reply(small, 40);
  CHECK_GT(size(*t.reply), Config::min_udp_sz);
  auto const cut = r.respond(small, transport::udp);
  CHECK(cut->truncation());
  CHECK_EQ(cut->ancount(), 0);
  CHECK_EQ(cut->id(), 14);

  // but fine over TCP
  auto const whole = r.respond(small, transport::tcp);
  CHECK(!whole->truncation());
  CHECK_EQ(whole->ancount(), 40);

  // no upstream answered
  t.reply = std::nullopt;
  auto const fail = r.respond(goog, transport::udp);
  CHECK_EQ(fail->rcode(), 2);
  CHECK_EQ(fail->id(), 14);

  // responses are dropped
  CHECK(!r.respond(*a, transport::udp));

  // opcode other than QUERY
  DNS::message::container_t notify(web.data(), web.data() + size(web));
  notify[2] |= (4 << 3);
  auto const ni = r.respond(DNS::message{std::move(notify)}, transport::udp);
  CHECK_EQ(ni->rcode(), 4);

  slow_transport            slow;
  Upstream::Forwarder const slow_fwd(
      {{Upstream::sock_type::stream, "192.0.2.53", 53}}, slow);
  Server::responder const slow_r(engine, slow_fwd);
  tcp_session_checks(slow_r);
}

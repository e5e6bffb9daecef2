#include "Upstream.hpp"

#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using Upstream::endpoint;
using Upstream::sock_type;

namespace {
class scripted_transport : public Upstream::Transport {
public:
  std::vector<std::optional<DNS::message>> replies;
  std::vector<endpoint>                    tried;

  std::optional<DNS::message> xchg(endpoint const&     ep,
                                   DNS::message const& q) override
  {
    auto const n = tried.size();
    tried.push_back(ep);
    if (n < replies.size())
      return replies[n];
    return {};
  }
};

std::vector<endpoint> endpoints(uint16_t port1, uint16_t port2)
{
  return {
      {sock_type::dgram, "127.0.0.1", port1},
      {sock_type::stream, "127.0.0.1", port1},
      {sock_type::dgram, "::1", port2},
      {sock_type::stream, "::1", port2},
  };
}

DNS::message reply_to(DNS::message const& qmsg, uint16_t id, bool tc = false)
{
  DNS::Query q;
  auto       rcode = DNS::Rcode::NOERROR;
  CHECK(DNS::decode_query(qmsg, q, rcode));
  q.id = id;
  DNS::RR_collection const a{DNS::RR_A{"8.8.8.8"}};
  return DNS::create_response(q, rcode, a, 60, false,
                              tc ? 20 : Config::max_tcp_sz);
}

// The reply a nameserver would give: the query with QR set.
void make_response(unsigned char* buf) { buf[2] |= 0x80; }

uint16_t port_of(int fd)
{
  sockaddr_in sin{};
  socklen_t   len = sizeof sin;
  PCHECK(getsockname(fd, reinterpret_cast<sockaddr*>(&sin), &len) == 0);
  return ntohs(sin.sin_port);
}

int bound_socket(int typ)
{
  auto const fd = socket(AF_INET, typ, 0);
  PCHECK(fd >= 0);
  sockaddr_in sin{};
  sin.sin_family      = AF_INET;
  sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  PCHECK(bind(fd, reinterpret_cast<sockaddr*>(&sin), sizeof sin) == 0);
  return fd;
}

bool read_n(int fd, unsigned char* p, size_t n)
{
  while (n) {
    auto const r = read(fd, p, n);
    if (r <= 0)
      return false;
    p += r;
    n -= r;
  }
  return true;
}
} // namespace

int main(int argc, char* argv[])
{
  auto const q = DNS::create_question("www.google.com", DNS::RR_type::A, 1,
                                      0x4242);

  { // first one answers
    scripted_transport t;
    t.replies = {reply_to(q, 0x4242)};
    Upstream::Forwarder const fwd(endpoints(53, 53), t);
    auto const                r = fwd.forward(q);
    CHECK(r);
    CHECK_EQ(r->id(), 0x4242);
    CHECK_EQ(t.tried.size(), 1u);
  }

  { // primary down on both transports, the secondary is next
    scripted_transport t;
    t.replies = {std::nullopt, std::nullopt, reply_to(q, 0x4242)};
    Upstream::Forwarder const fwd(endpoints(5301, 5302), t);
    CHECK(fwd.forward(q));
    CHECK_EQ(t.tried.size(), 3u);
    CHECK(t.tried[0].typ == sock_type::dgram);
    CHECK_EQ(t.tried[0].port, 5301);
    CHECK(t.tried[1].typ == sock_type::stream);
    CHECK_EQ(t.tried[1].port, 5301);
    CHECK(t.tried[2].typ == sock_type::dgram);
    CHECK_EQ(t.tried[2].addr, "::1");
    CHECK_EQ(t.tried[2].port, 5302);
  }

  { // all down, failure only after the last
    scripted_transport t;
    Upstream::Forwarder const fwd(endpoints(53, 53), t);
    CHECK(!fwd.forward(q));
    CHECK_EQ(t.tried.size(), 4u);
    CHECK(t.tried[3].typ == sock_type::stream);
    CHECK_EQ(t.tried[3].addr, "::1");
  }

  { // replies that aren't replies to this query count as failures
    scripted_transport t;
    t.replies = {
        reply_to(q, 0x1111),                    // wrong id
        DNS::message{q.data(), 7},              // short
        q,                                      // not a response
        reply_to(q, 0x4242),
    };
    Upstream::Forwarder const fwd(endpoints(53, 53), t);
    auto const                r = fwd.forward(q);
    CHECK(r);
    CHECK(r->is_response());
    CHECK_EQ(t.tried.size(), 4u);
  }

  { // a truncated reply is passed back for the client to retry on TCP
    scripted_transport t;
    t.replies = {reply_to(q, 0x4242, true)};
    Upstream::Forwarder const fwd(endpoints(53, 53), t);
    auto const                r = fwd.forward(q);
    CHECK(r);
    CHECK(r->truncation());
    CHECK_EQ(t.tried.size(), 1u);
  }

  Upstream::SocketTransport sock_t(std::chrono::milliseconds(500));

  { // UDP nameserver on loopback
    auto const fd   = bound_socket(SOCK_DGRAM);
    auto const port = port_of(fd);

    std::thread ns([fd] {
      unsigned char buf[512];
      sockaddr_in   from{};
      socklen_t     len = sizeof from;
      auto const    n   = recvfrom(fd, buf, sizeof buf, 0,
                                   reinterpret_cast<sockaddr*>(&from), &len);
      PCHECK(n > 0);
      make_response(buf);
      PCHECK(sendto(fd, buf, n, 0, reinterpret_cast<sockaddr*>(&from), len)
             == n);
    });

    auto const r = sock_t.xchg({sock_type::dgram, "127.0.0.1", port}, q);
    ns.join();
    close(fd);

    CHECK(r);
    CHECK_EQ(size(*r), size(q));
    CHECK_EQ(r->id(), 0x4242);
    CHECK(r->is_response());
  }

  { // TCP nameserver on loopback
    auto const fd   = bound_socket(SOCK_STREAM);
    auto const port = port_of(fd);
    PCHECK(listen(fd, 1) == 0);

    std::thread ns([fd] {
      auto const conn = accept(fd, nullptr, nullptr);
      PCHECK(conn >= 0);
      unsigned char len[2];
      CHECK(read_n(conn, len, sizeof len));
      std::vector<unsigned char> buf((len[0] << 8) | len[1]);
      CHECK(read_n(conn, buf.data(), buf.size()));
      make_response(buf.data());
      PCHECK(write(conn, len, sizeof len) == ssize_t(sizeof len));
      PCHECK(write(conn, buf.data(), buf.size()) == ssize_t(buf.size()));
      close(conn);
    });

    auto const r = sock_t.xchg({sock_type::stream, "127.0.0.1", port}, q);
    ns.join();
    close(fd);

    CHECK(r);
    CHECK_EQ(size(*r), size(q));
    CHECK_EQ(r->id(), 0x4242);
    CHECK(r->is_response());
  }

  { // nothing listening
    auto const fd   = bound_socket(SOCK_DGRAM);
    auto const port = port_of(fd);
    close(fd);

    CHECK(!sock_t.xchg({sock_type::dgram, "127.0.0.1", port}, q));
    CHECK(!sock_t.xchg({sock_type::stream, "127.0.0.1", port}, q));

    Upstream::Forwarder const fwd(
        {{sock_type::dgram, "127.0.0.1", port},
         {sock_type::stream, "127.0.0.1", port}},
        sock_t);
    CHECK(!fwd.forward(q));
  }

  { // out of file descriptors
    auto const fd   = bound_socket(SOCK_DGRAM);
    auto const port = port_of(fd);

    auto const lowest_free = dup(STDERR_FILENO);
    PCHECK(lowest_free >= 0);
    close(lowest_free);

    rlimit saved{};
    PCHECK(getrlimit(RLIMIT_NOFILE, &saved) == 0);
    auto lowered     = saved;
    lowered.rlim_cur = lowest_free;
    PCHECK(setrlimit(RLIMIT_NOFILE, &lowered) == 0);

    auto const r = sock_t.xchg({sock_type::dgram, "127.0.0.1", port}, q);

    Upstream::Forwarder const fwd(
        {{sock_type::dgram, "127.0.0.1", port},
         {sock_type::stream, "127.0.0.1", port}},
        sock_t);
    auto const fr = fwd.forward(q);

    PCHECK(setrlimit(RLIMIT_NOFILE, &saved) == 0);
    close(fd);

    CHECK(!r);
    CHECK(!fr);
  }
}

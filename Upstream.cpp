#include "Upstream.hpp"

#include "IP4.hpp"
#include "IP6.hpp"
#include "POSIX.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_bool(log_dns_data, false, "log all DNS messages");

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace Upstream {

std::ostream& operator<<(std::ostream& os, endpoint const& ep)
{
  auto const proto = (ep.typ == sock_type::stream) ? "tcp" : "udp";
  if (IP6::is_address(ep.addr))
    return os << proto << ":[" << ep.addr << "]:" << ep.port;
  return os << proto << ':' << ep.addr << ':' << ep.port;
}

namespace {
class socket_fd {
public:
  socket_fd(socket_fd const&) = delete;
  socket_fd& operator=(socket_fd const&) = delete;

  socket_fd(int domain, int typ)
    : fd_(socket(domain, typ, 0))
  {
    if (fd_ < 0) {
      PLOG(WARNING) << "socket() failed";
      return;
    }
    POSIX::set_nonblocking(fd_);
  }
  ~socket_fd()
  {
    if (fd_ >= 0)
      close(fd_);
  }

  explicit operator bool() const { return fd_ >= 0; }

  int get() const { return fd_; }

private:
  int fd_;
};

milliseconds time_left(steady_clock::time_point end_time)
{
  auto const now = steady_clock::now();
  if (now >= end_time)
    return milliseconds(0);
  return duration_cast<milliseconds>(end_time - now);
}

bool connect_to(int fd, endpoint const& ep, milliseconds timeout)
{
  auto t_o{false};

  if (IP4::is_address(ep.addr)) {
    auto in4{sockaddr_in{}};
    in4.sin_family = AF_INET;
    in4.sin_port   = htons(ep.port);
    CHECK_EQ(inet_pton(AF_INET, ep.addr.c_str(),
                       reinterpret_cast<void*>(&in4.sin_addr)),
             1);
    return POSIX::connect(fd, reinterpret_cast<const sockaddr*>(&in4),
                          sizeof(in4), timeout, t_o);
  }

  auto in6{sockaddr_in6{}};
  in6.sin6_family = AF_INET6;
  in6.sin6_port   = htons(ep.port);
  CHECK_EQ(inet_pton(AF_INET6, ep.addr.c_str(),
                     reinterpret_cast<void*>(&in6.sin6_addr)),
           1);
  return POSIX::connect(fd, reinterpret_cast<const sockaddr*>(&in6),
                        sizeof(in6), timeout, t_o);
}

// Read exactly n octets, or fail.
bool read_all(int fd, char* s, std::streamsize n, steady_clock::time_point end)
{
  while (n) {
    auto       t_o{false};
    auto const n_ret = POSIX::read(fd, s, n, time_left(end), t_o);
    if (n_ret <= 0) {
      if (n_ret == 0)
        LOG(WARNING) << "connection closed by nameserver";
      return false;
    }
    s += n_ret;
    n -= n_ret;
  }
  return true;
}
} // namespace

SocketTransport::SocketTransport(milliseconds timeout)
  : timeout_(timeout)
{
}

std::optional<DNS::message> SocketTransport::xchg(endpoint const&     ep,
                                                  DNS::message const& q)
{
  auto const end_time = steady_clock::now() + timeout_;

  auto const domain = IP4::is_address(ep.addr) ? AF_INET : AF_INET6;
  auto const typ    = (ep.typ == sock_type::stream) ? SOCK_STREAM : SOCK_DGRAM;

  socket_fd sock(domain, typ);
  if (!sock) {
    LOG(WARNING) << "no socket for " << ep;
    return {};
  }

  if (!connect_to(sock.get(), ep, time_left(end_time))) {
    LOG(WARNING) << "can't connect to " << ep;
    return {};
  }

  auto t_o{false};

  if (ep.typ == sock_type::stream) {
    DNS::message::container_t bfr;
    bfr.reserve(2 + size(q));
    bfr.push_back(static_cast<DNS::message::octet>(size(q) >> 8));
    bfr.push_back(static_cast<DNS::message::octet>(size(q) & 0xFF));
    bfr.insert(end(bfr), q.data(), q.data() + size(q));

    auto const buf = reinterpret_cast<char const*>(bfr.data());
    auto const sz  = static_cast<std::streamsize>(bfr.size());
    if (POSIX::write(sock.get(), buf, sz, time_left(end_time), t_o) != sz) {
      LOG(WARNING) << "write to " << ep << " failed";
      return {};
    }

    unsigned char len[2];
    if (!read_all(sock.get(), reinterpret_cast<char*>(len), sizeof len,
                  end_time)) {
      LOG(WARNING) << "no reply length from " << ep;
      return {};
    }

    DNS::message::container_t reply((len[0] << 8) | len[1]);
    if (!read_all(sock.get(), reinterpret_cast<char*>(reply.data()),
                  static_cast<std::streamsize>(reply.size()), end_time)) {
      LOG(WARNING) << "short reply from " << ep;
      return {};
    }

    if (FLAGS_log_dns_data)
      LOG(INFO) << ep << " replied " << reply.size() << " octets";

    return DNS::message{std::move(reply)};
  }

  auto const buf = reinterpret_cast<char const*>(q.data());
  if (POSIX::write(sock.get(), buf, size(q), time_left(end_time), t_o)
      != size(q)) {
    LOG(WARNING) << "send to " << ep << " failed";
    return {};
  }

  DNS::message::container_t reply(Config::max_udp_sz);

  auto const a_buf    = reinterpret_cast<char*>(reply.data());
  auto const a_buflen = POSIX::read(sock.get(), a_buf, Config::max_udp_sz,
                                    time_left(end_time), t_o);
  if (a_buflen < 0) {
    LOG(WARNING) << "no reply from " << ep << (t_o ? " (timed out)" : "");
    return {};
  }

  reply.resize(a_buflen);

  if (FLAGS_log_dns_data)
    LOG(INFO) << ep << " replied " << reply.size() << " octets";

  return DNS::message{std::move(reply)};
}

Forwarder::Forwarder(std::vector<endpoint> endpoints, Transport& transport)
  : endpoints_(std::move(endpoints))
  , transport_(transport)
{
  CHECK(!endpoints_.empty()) << "no upstream nameservers";
}

std::optional<DNS::message> Forwarder::forward(DNS::message const& q) const
{
  CHECK_GE(size(q), DNS::message::min_sz());

  for (auto const& ep : endpoints_) {
    auto reply = transport_.xchg(ep, q);
    if (!reply) {
      LOG(WARNING) << "failing over from " << ep;
      continue;
    }
    if (size(*reply) < DNS::message::min_sz()) {
      LOG(WARNING) << "packet too small from " << ep << ", failing over";
      continue;
    }
    if (reply->id() != q.id()) {
      LOG(WARNING) << "wrong id " << reply->id() << " from " << ep
                   << ", failing over";
      continue;
    }
    if (!reply->is_response()) {
      LOG(WARNING) << "not a response from " << ep << ", failing over";
      continue;
    }
    VLOG(1) << "reply from " << ep;
    return reply;
  }

  LOG(WARNING) << "no upstream nameserver answered";
  return {};
}

} // namespace Upstream

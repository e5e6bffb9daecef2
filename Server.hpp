#ifndef SERVER_DOT_HPP
#define SERVER_DOT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include <boost/asio.hpp>

#include "DNS-message.hpp"
#include "Engine.hpp"
#include "Upstream.hpp"

namespace Config {
constexpr auto tcp_idle_timeout = std::chrono::seconds(10);
} // namespace Config

namespace Server {

enum class transport { udp, tcp };

// From query message to reply message.  An empty optional means the
// query is dropped without reply.
class responder {
public:
  responder(Engine::resolver const& engine, Upstream::Forwarder const& fwd);

  std::optional<DNS::message> respond(DNS::message const& msg,
                                      transport           via) const;

private:
  DNS::message reply_(DNS::Query const&   q,
                      DNS::message const& msg,
                      uint16_t            max_sz) const;

  Engine::resolver const&    engine_;
  Upstream::Forwarder const& fwd_;
};

// UDP and TCP on the IPv6 wildcard address, taking IPv4 as mapped
// addresses too.  Socket I/O runs on io, each query on pool.  A TCP
// connection with nothing to do for idle is closed.
class listener {
public:
  listener(listener const&) = delete;
  listener& operator=(listener const&) = delete;

  listener(boost::asio::io_context&            io,
           boost::asio::thread_pool&           pool,
           uint16_t                            port,
           responder const&                    r,
           std::chrono::steady_clock::duration idle = Config::tcp_idle_timeout);

  void start();

  uint16_t udp_port() const;
  uint16_t tcp_port() const;

private:
  void receive_();
  void accept_();

  boost::asio::thread_pool&           pool_;
  responder const&                    responder_;
  std::chrono::steady_clock::duration idle_;

  boost::asio::ip::udp::socket   udp_;
  boost::asio::ip::tcp::acceptor acceptor_;
};

} // namespace Server

#endif // SERVER_DOT_HPP

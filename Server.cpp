#include "Server.hpp"

#include "DNS-iostream.hpp"

#include <array>

#include <gflags/gflags.h>

#include <glog/logging.h>

DECLARE_bool(log_dns_data);

using boost::asio::ip::tcp;
using boost::asio::ip::udp;
using boost::system::error_code;

namespace Server {

responder::responder(Engine::resolver const&    engine,
                     Upstream::Forwarder const& fwd)
  : engine_(engine)
  , fwd_(fwd)
{
}

std::optional<DNS::message> responder::respond(DNS::message const& msg,
                                               transport           via) const
{
  DNS::Query q;
  auto       rcode = DNS::Rcode::NOERROR;
  if (!DNS::decode_query(msg, q, rcode))
    return {};

  auto const over_tcp = via == transport::tcp;

  if (FLAGS_log_dns_data) {
    LOG(INFO) << (over_tcp ? "tcp" : "udp") << " query id " << q.id << ", "
              << size(msg) << " octets, " << q.name << '/' << q.type;
  }

  if (rcode != DNS::Rcode::NOERROR)
    return DNS::create_error(q, rcode, false);

  auto const max_sz = over_tcp ? Config::max_tcp_sz : q.udp_payload_sz;

  std::optional<DNS::message> reply;
  try {
    reply = reply_(q, msg, max_sz);
  }
  catch (std::exception const& e) {
    LOG(ERROR) << "query " << q.name << '/' << q.type << " failed: " << e.what();
    reply = DNS::create_error(q, DNS::Rcode::SERVFAIL, false);
  }

  if (FLAGS_log_dns_data) {
    LOG(INFO) << "reply id " << reply->id() << ", " << size(*reply)
              << " octets, " << DNS::rcode_c_str(reply->rcode());
  }

  return reply;
}

DNS::message responder::reply_(DNS::Query const&   q,
                               DNS::message const& msg,
                               uint16_t            max_sz) const
{
  auto const o = engine_.resolve(q);

  if (auto const a = std::get_if<Engine::answered>(&o)) {
    return DNS::create_response(q, DNS::Rcode::NOERROR, a->answers, a->ttl,
                                true, max_sz);
  }

  if (auto const f = std::get_if<Engine::failed>(&o)) {
    auto const aa = f->rcode == DNS::Rcode::NXDOMAIN;
    return DNS::create_response(q, f->rcode, DNS::RR_collection{}, 0, aa,
                                max_sz);
  }

  auto reply = fwd_.forward(msg);
  if (!reply)
    return DNS::create_error(q, DNS::Rcode::SERVFAIL, false);

  if (size(*reply) > max_sz) {
    LOG(INFO) << "upstream reply for " << q.name << '/' << q.type << " is "
              << size(*reply) << " octets, truncating to fit " << max_sz;
    return DNS::create_truncated(q, *reply);
  }

  return std::move(*reply);
}

namespace {
struct udp_request {
  udp::endpoint                                         sender;
  std::array<DNS::message::octet, Config::max_udp_sz> buf;
};

class tcp_session : public std::enable_shared_from_this<tcp_session> {
public:
  tcp_session(tcp::socket                         sock,
              boost::asio::thread_pool&           pool,
              responder const&                    r,
              std::chrono::steady_clock::duration idle)
    : sock_(std::move(sock))
    , timer_(sock_.get_executor())
    , pool_(pool)
    , responder_(r)
    , idle_(idle)
  {
  }

  void start() { read_length_(); }

private:
  void read_length_()
  {
    arm_timer_();
    boost::asio::async_read(
        sock_, boost::asio::buffer(len_),
        [self = shared_from_this()](error_code ec, std::size_t) {
          if (ec)
            return self->close_(ec);
          self->read_body_();
        });
  }

  void read_body_()
  {
    auto const sz = (len_[0] << 8) | len_[1];
    if (sz < DNS::message::min_sz()) {
      LOG(WARNING) << "message too short, " << sz << " octets, from "
                   << peer_();
      return close_({});
    }
    body_.resize(sz);
    boost::asio::async_read(
        sock_, boost::asio::buffer(body_),
        [self = shared_from_this()](error_code ec, std::size_t) {
          if (ec)
            return self->close_(ec);
          self->dispatch_();
        });
  }

  void dispatch_()
  {
    busy_ = true;
    timer_.cancel();
    boost::asio::post(pool_, [self = shared_from_this()] {
      std::optional<DNS::message> reply;
      try {
        DNS::message const q{self->body_.data(), self->body_.size()};
        reply = self->responder_.respond(q, transport::tcp);
      }
      catch (std::exception const& e) {
        LOG(ERROR) << "tcp query from " << self->peer_() << ": " << e.what();
      }
      boost::asio::post(self->sock_.get_executor(),
                        [self, reply = std::move(reply)]() mutable {
                          self->write_(std::move(reply));
                        });
    });
  }

  void write_(std::optional<DNS::message> reply)
  {
    busy_ = false;
    if (!reply)
      return read_length_();

    out_.clear();
    out_.reserve(2 + size(*reply));
    out_.push_back(static_cast<DNS::message::octet>(size(*reply) >> 8));
    out_.push_back(static_cast<DNS::message::octet>(size(*reply) & 0xFF));
    out_.insert(end(out_), reply->data(), reply->data() + size(*reply));

    boost::asio::async_write(
        sock_, boost::asio::buffer(out_),
        [self = shared_from_this()](error_code ec, std::size_t) {
          if (ec)
            return self->close_(ec);
          self->read_length_();
        });
  }

  void arm_timer_()
  {
    timer_.expires_after(idle_);
    timer_.async_wait([w = weak_from_this()](error_code ec) {
      if (ec)
        return; // cancelled
      if (auto self = w.lock()) {
        // A wait cancelled or re-armed after it completed still
        // lands here.
        auto const now = boost::asio::steady_timer::clock_type::now();
        if (self->busy_ || self->timer_.expiry() > now)
          return;
        VLOG(1) << "tcp connection from " << self->peer_() << " idle";
        error_code ignored;
        self->sock_.close(ignored);
      }
    });
  }

  void close_(error_code ec)
  {
    if (ec && ec != boost::asio::error::eof &&
        ec != boost::asio::error::operation_aborted) {
      LOG(INFO) << "tcp connection from " << peer_() << ": " << ec.message();
    }
    timer_.cancel();
    error_code ignored;
    sock_.close(ignored);
  }

  std::string peer_() const
  {
    error_code ec;
    auto const ep = sock_.remote_endpoint(ec);
    return ec ? std::string("<unknown>") : ep.address().to_string();
  }

  tcp::socket               sock_;
  boost::asio::steady_timer timer_;
  boost::asio::thread_pool&           pool_;
  responder const&                    responder_;
  std::chrono::steady_clock::duration idle_;

  bool busy_{false}; // a query is with the pool

  std::array<DNS::message::octet, 2> len_{};
  DNS::message::container_t          body_;
  DNS::message::container_t          out_;
};
} // namespace

listener::listener(boost::asio::io_context&            io,
                   boost::asio::thread_pool&           pool,
                   uint16_t                            port,
                   responder const&                    r,
                   std::chrono::steady_clock::duration idle)
  : pool_(pool)
  , responder_(r)
  , idle_(idle)
  , udp_(io)
  , acceptor_(io)
{
  auto const any = boost::asio::ip::address_v6::any();

  udp::endpoint const uep(any, port);
  udp_.open(uep.protocol());
  udp_.set_option(boost::asio::ip::v6_only(false));
  udp_.set_option(boost::asio::socket_base::reuse_address(true));
  udp_.bind(uep);

  tcp::endpoint const tep(any, port);
  acceptor_.open(tep.protocol());
  acceptor_.set_option(boost::asio::ip::v6_only(false));
  acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
  acceptor_.bind(tep);
  acceptor_.listen();
}

uint16_t listener::udp_port() const { return udp_.local_endpoint().port(); }

uint16_t listener::tcp_port() const
{
  return acceptor_.local_endpoint().port();
}

void listener::start()
{
  LOG(INFO) << "listening on udp port " << udp_port() << " and tcp port "
            << tcp_port();
  receive_();
  accept_();
}

void listener::receive_()
{
  auto req = std::make_shared<udp_request>();

  udp_.async_receive_from(
      boost::asio::buffer(req->buf), req->sender,
      [this, req](error_code ec, std::size_t n) {
        if (ec == boost::asio::error::operation_aborted)
          return;

        if (ec) {
          LOG(WARNING) << "udp receive failed: " << ec.message();
          return receive_();
        }

        boost::asio::post(pool_, [this, req, n] {
          std::optional<DNS::message> reply;
          try {
            DNS::message const q{req->buf.data(), n};
            reply = responder_.respond(q, transport::udp);
          }
          catch (std::exception const& e) {
            LOG(ERROR) << "udp query from " << req->sender.address() << ": "
                       << e.what();
          }
          if (!reply)
            return;

          auto out = std::make_shared<DNS::message>(std::move(*reply));
          boost::asio::post(udp_.get_executor(), [this, req, out] {
            udp_.async_send_to(
                boost::asio::buffer(out->data(), size(*out)), req->sender,
                [req, out](error_code ec, std::size_t) {
                  if (ec) {
                    LOG(WARNING) << "udp send to " << req->sender.address()
                                 << " failed: " << ec.message();
                  }
                });
          });
        });

        receive_();
      });
}

void listener::accept_()
{
  acceptor_.async_accept([this](error_code ec, tcp::socket sock) {
    if (ec == boost::asio::error::operation_aborted)
      return;

    if (ec) {
      LOG(WARNING) << "tcp accept failed: " << ec.message();
    }
    else {
      std::make_shared<tcp_session>(std::move(sock), pool_, responder_,
                                    idle_)
          ->start();
    }

    accept_();
  });
}

} // namespace Server

#include "Engine.hpp"
#include "SQLiteStore.hpp"
#include "Server.hpp"
#include "Settings.hpp"
#include "Upstream.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <memory>

#include <boost/asio.hpp>

#include <gflags/gflags.h>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    SetUsageMessage("authoritative for one zone, forwarding the rest");
    ParseCommandLineFlags(&argc, &argv, true);
  }

  auto const log_dir{getenv("GOOGLE_LOG_DIR")};
  if (log_dir) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
  }

  google::InitGoogleLogging(argv[0]);

  auto const settings = Settings::from_flags();

  SQLiteStore      store(settings.database);
  Engine::resolver engine(settings.suffix, settings.ttl, store);

  Upstream::SocketTransport transport(settings.upstream_timeout);
  Upstream::Forwarder       fwd(settings.upstreams, transport);

  Server::responder responder(engine, fwd);

  boost::asio::io_context  io;
  boost::asio::thread_pool pool(settings.threads);

  std::unique_ptr<Server::listener> listener;
  try {
    listener = std::make_unique<Server::listener>(io, pool, settings.port,
                                                  responder);
  }
  catch (boost::system::system_error const& e) {
    LOG(FATAL) << "can't listen on port " << settings.port << ": " << e.what();
  }

  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&io](boost::system::error_code ec, int sig) {
    if (!ec) {
      LOG(INFO) << "signal " << sig << ", shutting down";
      io.stop();
    }
  });

  listener->start();
  io.run();

  pool.join();
  LOG(INFO) << "done";
}

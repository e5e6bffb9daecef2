#include "osutil.hpp"

#include <cstdlib>
#include <limits>
#include <thread>
#include <vector>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <glog/logging.h>

namespace osutil {

uint16_t get_port(char const* const service, char const* const proto)
{
  char*      ep = nullptr;
  auto const service_no{strtoul(service, &ep, 10)};
  if (*service && ep && (*ep == '\0')) {
    CHECK_LE(service_no, std::numeric_limits<uint16_t>::max())
        << "port " << service << " out of range";
    return static_cast<uint16_t>(service_no);
  }

  std::vector<char> str_buf(1024); // suggested by getservbyname_r(3)

  auto     result_buf{servent{}};
  servent* result_ptr = nullptr;
  while (getservbyname_r(service, proto, &result_buf, str_buf.data(),
                         str_buf.size(), &result_ptr)
         == ERANGE) {
    CHECK_LT(str_buf.size(), 64 * 1024); // ridiculous
    str_buf.resize(str_buf.size() * 2);
  }
  if (result_ptr == nullptr) {
    LOG(FATAL) << "service " << service << " unknown";
  }
  return ntohs(result_buf.s_port);
}

std::optional<std::string> get_env(char const* const name)
{
  auto const ev{getenv(name)};
  if (ev == nullptr || *ev == '\0')
    return {};
  return std::string{ev};
}

unsigned hardware_threads()
{
  auto const n = std::thread::hardware_concurrency();
  return n ? n : 1;
}

} // namespace osutil

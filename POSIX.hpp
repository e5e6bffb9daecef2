#ifndef POSIX_DOT_HPP
#define POSIX_DOT_HPP

#include <chrono>
#include <ios>

#include <sys/socket.h>
#include <unistd.h>

// Blocking-style I/O on non-blocking descriptors, each call bounded
// by a timeout.  Failures are logged and returned, t_o is set when
// the time ran out.

class POSIX {
public:
  POSIX()             = delete;
  POSIX(POSIX const&) = delete;

  static void set_nonblocking(int fd);

  static bool input_ready(int fd_in, std::chrono::milliseconds wait);
  static bool output_ready(int fd_out, std::chrono::milliseconds wait);

  static bool connect(int                       fd,
                      sockaddr const*           addr,
                      socklen_t                 addrlen,
                      std::chrono::milliseconds timeout,
                      bool&                     t_o);

  static std::streamsize read(int                       fd,
                              char*                     s,
                              std::streamsize           n,
                              std::chrono::milliseconds timeout,
                              bool&                     t_o);

  static std::streamsize write(int                       fd,
                               const char*               s,
                               std::streamsize           n,
                               std::chrono::milliseconds timeout,
                               bool&                     t_o);
};

#endif // POSIX_DOT_HPP

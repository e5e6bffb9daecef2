#include "POSIX.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  int fds[2];
  PCHECK(pipe(fds) == 0);

  POSIX::set_nonblocking(fds[0]);
  POSIX::set_nonblocking(fds[1]);

  CHECK(!POSIX::input_ready(fds[0], std::chrono::milliseconds(1)));
  CHECK(POSIX::output_ready(fds[1], std::chrono::milliseconds(1)));

  auto t_o{false};
  char buf[8];
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, std::chrono::milliseconds(10),
                       t_o),
           -1);
  CHECK(t_o);

  t_o = false;
  CHECK_EQ(POSIX::write(fds[1], "hello", 5, std::chrono::milliseconds(10), t_o),
           5);
  CHECK(!t_o);
  CHECK(POSIX::input_ready(fds[0], std::chrono::milliseconds(1)));
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, std::chrono::milliseconds(10),
                       t_o),
           5);
  CHECK(!t_o);

  close(fds[1]);
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, std::chrono::milliseconds(10),
                       t_o),
           0);
  close(fds[0]);
}

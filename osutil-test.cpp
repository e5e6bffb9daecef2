#include "osutil.hpp"

#include <cstdlib>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  CHECK_EQ(osutil::get_port("53", "udp"), 53);
  CHECK_EQ(osutil::get_port("5353", "tcp"), 5353);
  CHECK_EQ(osutil::get_port("domain", "udp"), 53);
  CHECK_EQ(osutil::get_port("domain", "tcp"), 53);

  setenv("OSUTIL_TEST_VAR", "value", 1);
  CHECK_EQ(*osutil::get_env("OSUTIL_TEST_VAR"), "value");
  setenv("OSUTIL_TEST_VAR", "", 1);
  CHECK(!osutil::get_env("OSUTIL_TEST_VAR"));
  unsetenv("OSUTIL_TEST_VAR");
  CHECK(!osutil::get_env("OSUTIL_TEST_VAR"));

  CHECK_GE(osutil::hardware_threads(), 1u);
}

#include "IP4.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP4::canonical;
  using IP4::is_address;
  using IP4::reverse;

  CHECK(is_address("0.0.0.0"));
  CHECK(is_address("69.0.0.0"));
  CHECK(is_address("250.0.0.0"));
  CHECK(is_address("255.0.0.1"));
  CHECK(is_address("127.0.0.1"));

  CHECK(!is_address("127.0.0.1."));
  CHECK(!is_address("foo.bar"));
  CHECK(!is_address(""));
  CHECK(!is_address("1.2.3"));
  CHECK(!is_address("1.2.3.4.5"));

  // This is acceptable:
  CHECK(is_address("001.001.001.001"));
  // and this
  CHECK(is_address("01.01.01.01"));
  // but not:
  CHECK(!is_address("0001.0.0.0"));

  CHECK(!is_address("256.0.0.0"));
  CHECK(!is_address("1.300.0.0"));
  CHECK(!is_address("1.1.1000.0"));
  CHECK(!is_address("1.1.1.260"));

  CHECK_EQ(canonical("001.001.001.001"), "1.1.1.1");
  CHECK_EQ(canonical("010.000.02.3"), "10.0.2.3");
  CHECK_EQ(canonical("192.168.0.1"), "192.168.0.1");

  auto const rev{reverse("1.2.3.4")};
  CHECK_EQ(0, rev.compare("4.3.2.1."));
}

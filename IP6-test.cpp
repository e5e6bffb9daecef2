#include "IP6.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP6::canonical;
  using IP6::from_nibbles;
  using IP6::is_address;
  using IP6::mapped_ip4;

  CHECK(is_address("::1"));
  CHECK(is_address("::ffff:0.0.0.0"));
  CHECK(is_address("::ffff:255.255.255.255"));
  CHECK(is_address("fd12:3456:789a:1::1"));
  CHECK(is_address("2001:0db8:85a3:0000:0000:8a2e:0370:7334"));

  CHECK(!is_address(""));
  CHECK(!is_address("1.2.3.4"));
  CHECK(!is_address("2001:db8::1::2"));
  CHECK(!is_address("fffff::1"));

  CHECK_EQ(canonical("2001:0db8:85a3:0000:0000:8a2e:0370:7334"),
           "2001:db8:85a3::8a2e:370:7334");
  CHECK_EQ(canonical("0:0:0:0:0:0:0:1"), "::1");
  CHECK_EQ(canonical("2001:DB8::1"), "2001:db8::1");

  CHECK_EQ(*from_nibbles("20010db8000000000000000000000001"), "2001:db8::1");
  CHECK_EQ(*from_nibbles("00000000000000000000FFFF01020304"),
           "::ffff:1.2.3.4");
  CHECK(!from_nibbles("2001"));
  CHECK(!from_nibbles("2001Xdb8000000000000000000000001"));

  CHECK_EQ(*mapped_ip4("::ffff:1.2.3.4"), "1.2.3.4");
  CHECK_EQ(*mapped_ip4("::ffff:c0a8:1"), "192.168.0.1");
  CHECK(!mapped_ip4("2001:db8::1"));
  CHECK(!mapped_ip4("::1"));

  CHECK_EQ(IP6::reverse("2001:db8::1"),
           "1.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.8.b.d.0.1.0.0.2.");
}

#include "Reverse.hpp"

#include "IP4.hpp"
#include "IP6.hpp"

#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  CHECK_EQ(*Reverse::ip4("4.3.2.1.in-addr.arpa"), "1.2.3.4");
  CHECK_EQ(*Reverse::ip4("4.3.2.1.IN-ADDR.ARPA"), "1.2.3.4");
  CHECK_EQ(*Reverse::ip4("001.0.168.192.in-addr.arpa"), "192.168.0.1");

  CHECK(!Reverse::ip4("3.2.1.in-addr.arpa"));
  CHECK(!Reverse::ip4("5.4.3.2.1.in-addr.arpa"));
  CHECK(!Reverse::ip4("256.3.2.1.in-addr.arpa"));
  CHECK(!Reverse::ip4("x.3.2.1.in-addr.arpa"));
  CHECK(!Reverse::ip4("4..2.1.in-addr.arpa"));
  CHECK(!Reverse::ip4("in-addr.arpa"));

  auto const v4 = std::string{"10.20.30.40"};
  CHECK_EQ(*Reverse::ip4(IP4::reverse(v4) + IP4::reverse_zone), v4);

  auto const plain = Reverse::ip6(IP6::reverse("2001:db8::1") + "ip6.arpa");
  CHECK(plain);
  CHECK_EQ(plain->ip6, "2001:db8::1");
  CHECK(!plain->ip4);
  CHECK_EQ(plain->all().size(), 1u);

  auto const mapped =
      Reverse::ip6(IP6::reverse("::ffff:1.2.3.4") + IP6::reverse_zone);
  CHECK(mapped);
  CHECK_EQ(mapped->ip6, "::ffff:1.2.3.4");
  CHECK_EQ(*mapped->ip4, "1.2.3.4");
  auto const all = mapped->all();
  CHECK_EQ(all.size(), 2u);
  CHECK_EQ(all[0], "::ffff:1.2.3.4");
  CHECK_EQ(all[1], "1.2.3.4");

  // upper case nibbles
  auto const upper = Reverse::ip6(
      "1.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.8.B.D.0.1.0.0.2.ip6.arpa");
  CHECK(upper);
  CHECK_EQ(upper->ip6, "2001:db8::1");

  CHECK(!Reverse::ip6("1.0.0.2.ip6.arpa"));
  CHECK(!Reverse::ip6(
      "10.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.8.b.d.0.1.0.0.2.ip6.arpa"));
  CHECK(!Reverse::ip6(
      "g.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.8.b.d.0.1.0.0.2.ip6.arpa"));
  CHECK(!Reverse::ip6("ip6.arpa"));
}

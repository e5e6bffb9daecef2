#include "IP6.hpp"

#include <cctype>

#include <fmt/format.h>

#include <arpa/inet.h>
#include <arpa/nameser.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::one;
using tao::pegtl::opt;
using tao::pegtl::parse;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::rep_opt;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::string;
using tao::pegtl::two;

using tao::pegtl::abnf::DIGIT;
using tao::pegtl::abnf::HEXDIG;

#include <glog/logging.h>

namespace IP6 {

using dot   = one<'.'>;
using colon = one<':'>;

// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};
// clang-format on

struct ipv4_address
  : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet> {
};

struct h16 : rep_min_max<1, 4, HEXDIG> {
};

struct ls32 : sor<seq<h16, colon, h16>, ipv4_address> {
};

struct dcolon : two<':'> {
};

// clang-format off
struct ipv6_address : sor<seq<                                          rep<6, h16, colon>, ls32>,
                          seq<                                  dcolon, rep<5, h16, colon>, ls32>,
                          seq<opt<h16                        >, dcolon, rep<4, h16, colon>, ls32>,
                          seq<opt<h16,     opt<   colon, h16>>, dcolon, rep<3, h16, colon>, ls32>,
                          seq<opt<h16, rep_opt<2, colon, h16>>, dcolon, rep<2, h16, colon>, ls32>,
                          seq<opt<h16, rep_opt<3, colon, h16>>, dcolon,        h16, colon,  ls32>,
                          seq<opt<h16, rep_opt<4, colon, h16>>, dcolon,                     ls32>,
                          seq<opt<h16, rep_opt<5, colon, h16>>, dcolon,                      h16>,
                          seq<opt<h16, rep_opt<6, colon, h16>>, dcolon                          >> {};
// clang-format on

struct ipv6_address_only : seq<ipv6_address, eof> {
};

namespace {
auto to_in6(std::string_view addr_str) -> in6_addr
{
  static_assert(sizeof(in6_addr) == NS_IN6ADDRSZ, "in6_addr is the wrong size");

  in6_addr   addr{};
  auto const str = std::string{addr_str}; // inet_pton wants a NUL
  CHECK_EQ(1, inet_pton(AF_INET6, str.c_str(), &addr))
      << "not an address: " << addr_str;
  return addr;
}

auto to_str(in6_addr const& addr) -> std::string
{
  char str[INET6_ADDRSTRLEN];
  PCHECK(inet_ntop(AF_INET6, &addr, str, sizeof str));
  return str;
}

int hex_value(char ch)
{
  auto const c = std::tolower(static_cast<unsigned char>(ch));
  if ('0' <= c && c <= '9')
    return c - '0';
  if ('a' <= c && c <= 'f')
    return c - 'a' + 10;
  return -1;
}
} // namespace

auto is_address(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "ip6"};
  return parse<IP6::ipv6_address_only>(in);
}

auto canonical(std::string_view addr) -> std::string
{
  return to_str(to_in6(addr));
}

auto from_nibbles(std::string_view hex) -> std::optional<std::string>
{
  if (hex.size() != nibbles)
    return {};

  in6_addr addr{};
  auto     addr_uint = reinterpret_cast<uint8_t*>(&addr);

  for (auto n{0}; n < NS_IN6ADDRSZ; ++n) {
    auto const hi = hex_value(hex[2 * n]);
    auto const lo = hex_value(hex[2 * n + 1]);
    if (hi < 0 || lo < 0)
      return {};
    addr_uint[n] = static_cast<uint8_t>((hi << 4) | lo);
  }

  return to_str(addr);
}

auto mapped_ip4(std::string_view addr_str) -> std::optional<std::string>
{
  auto const addr = to_in6(addr_str);
  if (!IN6_IS_ADDR_V4MAPPED(&addr))
    return {};

  auto const addr_uint = reinterpret_cast<uint8_t const*>(&addr);
  return fmt::format("{}.{}.{}.{}", addr_uint[12], addr_uint[13],
                     addr_uint[14], addr_uint[15]);
}

auto reverse(std::string_view addr_str) -> std::string
{
  auto const addr      = to_in6(addr_str);
  auto const addr_uint = reinterpret_cast<uint8_t const*>(&addr);

  auto q{std::string{}};
  q.reserve(2 * nibbles);

  for (auto n{NS_IN6ADDRSZ - 1}; n >= 0; --n) {
    auto const ch = addr_uint[n];

    auto const lo = ch & 0xF;
    auto const hi = (ch >> 4) & 0xF;

    auto constexpr hex_digits = "0123456789abcdef";

    q += hex_digits[lo];
    q += '.';
    q += hex_digits[hi];
    q += '.';
  }

  return q;
}
} // namespace IP6

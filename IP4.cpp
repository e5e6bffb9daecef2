#include "IP4.hpp"

#include <charconv>
#include <vector>

#include <glog/logging.h>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::nothing;
using tao::pegtl::one;
using tao::pegtl::parse;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::string;

using tao::pegtl::abnf::DIGIT;

namespace IP4 {

using dot = one<'.'>;

// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};
// clang-format on

struct ipv4_address
  : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet, eof> {
};

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<dec_octet> {
  template <typename Input>
  static void apply(Input const& in, std::vector<std::string>& a)
  {
    a.push_back(in.string());
  }
};

namespace {
auto octets(std::string_view addr) -> std::vector<std::string>
{
  std::vector<std::string> a;
  a.reserve(4);

  memory_input<> in{addr.data(), addr.size(), "addr"};
  CHECK((parse<ipv4_address, action>(in, a))) << "not an address: " << addr;
  CHECK_EQ(a.size(), 4u);

  return a;
}
} // namespace

auto is_address(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "addr"};
  return parse<ipv4_address>(in);
}

auto canonical(std::string_view addr) -> std::string
{
  auto const a = octets(addr);

  unsigned o[4]{};
  for (auto i = 0u; i < 4; ++i) {
    std::from_chars(a[i].data(), a[i].data() + a[i].size(), o[i]);
  }

  return fmt::format("{}.{}.{}.{}", o[0], o[1], o[2], o[3]);
}

auto reverse(std::string_view addr) -> std::string
{
  auto const a = octets(addr);
  return fmt::format("{}.{}.{}.{}.", a[3], a[2], a[1], a[0]);
}
} // namespace IP4

#ifndef NAME_DOT_HPP
#define NAME_DOT_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

// DNS names, ASCII case-insensitive, carried without the trailing
// root dot.

namespace Name {

inline bool iequal_char(char a, char b)
{
  return std::tolower(static_cast<unsigned char>(a)) ==
         std::tolower(static_cast<unsigned char>(b));
}

inline bool iequal(std::string_view a, std::string_view b)
{
  return (size(a) == size(b)) &&
         std::equal(begin(b), end(b), begin(a), iequal_char);
}

inline bool iends_with(std::string_view str, std::string_view suffix)
{
  return (str.size() >= suffix.size()) &&
         iequal(str.substr(str.size() - suffix.size()), suffix);
}

inline std::string to_lower(std::string_view name)
{
  std::string ret(name);
  std::transform(begin(ret), end(ret), begin(ret), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return ret;
}

inline std::string_view strip_dots(std::string_view name)
{
  while (!name.empty() && name.front() == '.')
    name.remove_prefix(1);
  while (!name.empty() && name.back() == '.')
    name.remove_suffix(1);
  return name;
}

// The "<label>" part of "<label>.<zone>", or empty if name is not
// strictly below zone.
inline std::string_view below(std::string_view name, std::string_view zone)
{
  if (zone.empty() || name.size() < zone.size() + 2)
    return {};
  if (!iends_with(name, zone))
    return {};
  auto const dot = name.size() - zone.size() - 1;
  if (name[dot] != '.')
    return {};
  return name.substr(0, dot);
}

inline std::vector<std::string> labels(std::string_view name)
{
  std::vector<std::string> ret;
  if (name.empty())
    return ret;
  boost::algorithm::split(ret, name, boost::algorithm::is_any_of("."));
  return ret;
}

} // namespace Name

#endif // NAME_DOT_HPP

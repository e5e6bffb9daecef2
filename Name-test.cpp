#include "Name.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  using Name::below;
  using Name::iends_with;
  using Name::iequal;

  CHECK(iequal("", ""));
  CHECK(!iequal("a", ""));
  CHECK(!iequal("", "b"));

  CHECK(iequal("LocalHost", "localhost"));
  CHECK(!iequal("localhost.", "localhost"));

  CHECK(iends_with("Host.Example.COM", "example.com"));
  CHECK(!iends_with("com", "example.com"));

  CHECK_EQ(Name::to_lower("Example.COM"), "example.com");
  CHECK_EQ(Name::strip_dots(".example.com."), "example.com");
  CHECK_EQ(Name::strip_dots("..."), "");

  CHECK_EQ(below("web.example.com", "example.com"), "web");
  CHECK_EQ(below("a.b.Example.Com", "example.com"), "a.b");
  CHECK_EQ(below("example.com", "example.com"), "");
  CHECK_EQ(below(".example.com", "example.com"), "");
  CHECK_EQ(below("webexample.com", "example.com"), "");
  CHECK_EQ(below("web.example.com.evil", "example.com"), "");
  CHECK_EQ(below("web.example.com", ""), "");

  auto const l = Name::labels("4.3.2.1");
  CHECK_EQ(l.size(), 4u);
  CHECK_EQ(l[0], "4");
  CHECK_EQ(l[3], "1");

  CHECK(Name::labels("").empty());
  CHECK_EQ(Name::labels("a..b").size(), 3u);
}

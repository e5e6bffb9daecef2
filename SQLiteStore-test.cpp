#include "SQLiteStore.hpp"

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include <glog/logging.h>

#include <sqlite3.h>
#include <unistd.h>

using DNS::RR_type;

namespace {
auto constexpr zone_sql = R"(
CREATE TABLE dns_records (
  name        TEXT NOT NULL,
  type        TEXT NOT NULL,
  ipv4address TEXT,
  ipv6address TEXT,
  cname       TEXT,
  priority    INTEGER
);
INSERT INTO dns_records VALUES ('web',   'A',     '10.0.0.1', '2001:db8::1', NULL, NULL);
INSERT INTO dns_records VALUES ('web',   'A',     '10.0.0.2', NULL,          NULL, NULL);
INSERT INTO dns_records VALUES ('web',   'AAAA',  NULL,       '2001:db8::2', NULL, NULL);
INSERT INTO dns_records VALUES ('Mail',  'mx',    NULL,       NULL,          'mx1.example.com', 10);
INSERT INTO dns_records VALUES ('mail',  'MX',    NULL,       NULL,          'mx2.example.com', NULL);
INSERT INTO dns_records VALUES ('www',   'CNAME', NULL,       NULL,          'web.example.com', NULL);
INSERT INTO dns_records VALUES ('old',   'A',     '1.2.3.4',  NULL,          NULL, NULL);
INSERT INTO dns_records VALUES ('v6',    'AAAA',  NULL,       '::FFFF:1.2.3.4', NULL, NULL);
INSERT INTO dns_records VALUES ('odd',   'HINFO', '10.9.9.9', NULL,          NULL, 70000);
)";

// abs() of the smallest integer is an error, raised as the row is read.
auto constexpr mixed_sql = R"(
CREATE TABLE zone (
  name        TEXT NOT NULL,
  type        TEXT NOT NULL,
  ipv4address TEXT,
  priority    INTEGER
);
CREATE VIEW dns_records AS
  SELECT rowid AS rowid, name, type, ipv4address, NULL AS ipv6address,
         NULL AS cname, abs(priority) AS priority
  FROM zone;
INSERT INTO zone VALUES ('web',  'A', '10.0.0.1', NULL);
INSERT INTO zone VALUES ('boom', 'A', '10.0.0.2', -9223372036854775807 - 1);
)";

void create_db(std::string const& path, char const* sql)
{
  sqlite3* db = nullptr;
  CHECK_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
  char* err = nullptr;
  auto const rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  CHECK_EQ(rc, SQLITE_OK) << (err ? err : "");
  sqlite3_free(err);
  CHECK_EQ(sqlite3_close(db), SQLITE_OK);
}

std::string temp_db(char const* what)
{
  auto const dir = std::filesystem::temp_directory_path();
  auto const p = dir / fmt::format("SQLiteStore-test-{}-{}.db", getpid(), what);
  std::filesystem::remove(p);
  return p.string();
}
} // namespace

int main(int argc, char* argv[])
{
  auto const path = temp_db("zone");
  create_db(path, zone_sql);

  SQLiteStore store(path);

  auto a = store.lookup(RecordStore::by_name_type{"web", RR_type::A});
  CHECK_EQ(a.size(), 2u);
  CHECK_EQ(a[0].name, "web");
  CHECK(a[0].type == RR_type::A);
  CHECK_EQ(*a[0].ipv4address, "10.0.0.1");
  CHECK_EQ(*a[0].ipv6address, "2001:db8::1");
  CHECK(!a[0].cname);
  CHECK(!a[0].priority);
  CHECK_EQ(*a[1].ipv4address, "10.0.0.2");
  CHECK(!a[1].ipv6address);

  // case-insensitive name and type
  auto const web = store.lookup(RecordStore::by_name_type{"WEB", RR_type::A});
  CHECK_EQ(web.size(), 2u);

  auto const aaaa =
      store.lookup(RecordStore::by_name_type{"web", RR_type::AAAA});
  CHECK_EQ(aaaa.size(), 1u);
  CHECK_EQ(*aaaa[0].ipv6address, "2001:db8::2");

  auto const mx = store.lookup(RecordStore::by_name_type{"mail", RR_type::MX});
  CHECK_EQ(mx.size(), 2u);
  CHECK(mx[0].type == RR_type::MX);
  CHECK_EQ(*mx[0].cname, "mx1.example.com");
  CHECK_EQ(*mx[0].priority, 10);
  CHECK(!mx[1].priority);

  CHECK(store.lookup(RecordStore::by_name_type{"nope", RR_type::A}).empty());
  CHECK(store.lookup(RecordStore::by_name_type{"www", RR_type::A}).empty());

  auto const v4 = store.lookup(RecordStore::by_ipv4{"10.0.0.2"});
  CHECK_EQ(v4.size(), 1u);
  CHECK_EQ(v4[0].name, "web");

  CHECK(store.lookup(RecordStore::by_ipv4{"10.0.0.3"}).empty());

  auto const v6 = store.lookup(RecordStore::by_ipv6{{"2001:db8::2"}});
  CHECK_EQ(v6.size(), 1u);
  CHECK(v6[0].type == RR_type::AAAA);

  // a mapped address matches the stored mapped form and the plain IPv4
  auto const mapped =
      store.lookup(RecordStore::by_ipv6{{"::ffff:1.2.3.4", "1.2.3.4"}});
  CHECK_EQ(mapped.size(), 2u);
  CHECK_EQ(mapped[0].name, "old");
  CHECK_EQ(mapped[1].name, "v6");

  // unknown type and out of range priority are passed along, not fatal
  auto const odd = store.lookup(RecordStore::by_ipv4{"10.9.9.9"});
  CHECK_EQ(odd.size(), 1u);
  CHECK(odd[0].type == RR_type::NONE);
  CHECK(!odd[0].priority);

  { // one connection shared by several threads, some lookups failing
    auto const mixed_path = temp_db("mixed");
    create_db(mixed_path, mixed_sql);
    SQLiteStore mixed(mixed_path);

    std::vector<std::thread> threads;
    for (auto t = 0; t < 8; ++t) {
      threads.emplace_back([&mixed, t] {
        for (auto i = 0; i < 50; ++i) {
          if (t % 2) {
            auto const rrs =
                mixed.lookup(RecordStore::by_name_type{"web", RR_type::A});
            CHECK_EQ(rrs.size(), 1u);
            continue;
          }
          try {
            mixed.lookup(RecordStore::by_name_type{"boom", RR_type::A});
            LOG(FATAL) << "lookup of boom worked";
          }
          catch (RecordStore::unavailable const& e) {
            CHECK(std::string(e.what()).find("integer overflow") !=
                  std::string::npos)
                << e.what();
          }
        }
      });
    }
    for (auto& thread : threads)
      thread.join();

    std::filesystem::remove(mixed_path);
  }

  std::filesystem::remove(path);

  // no table
  auto const empty_path = temp_db("empty");
  create_db(empty_path, "CREATE TABLE other (x TEXT);");
  SQLiteStore empty(empty_path);
  auto        threw{false};
  try {
    empty.lookup(RecordStore::by_ipv4{"10.0.0.1"});
  }
  catch (RecordStore::unavailable const&) {
    threw = true;
  }
  CHECK(threw);
  std::filesystem::remove(empty_path);

  // no file at all, every time
  SQLiteStore missing(temp_db("missing"));
  for (auto i = 0; i < 2; ++i) {
    threw = false;
    try {
      missing.lookup(RecordStore::by_name_type{"web", RR_type::A});
    }
    catch (RecordStore::unavailable const&) {
      threw = true;
    }
    CHECK(threw);
  }
}

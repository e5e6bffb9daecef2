#ifndef SQLITESTORE_DOT_HPP
#define SQLITESTORE_DOT_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "RecordStore.hpp"

struct sqlite3;

namespace Config {
constexpr auto store_busy_timeout = std::chrono::milliseconds(1500);
} // namespace Config

// The dns_records table of an SQLite database, opened read-only.
//
//   CREATE TABLE dns_records (
//     name        TEXT NOT NULL,
//     type        TEXT NOT NULL,  -- A, AAAA, CNAME, MX
//     ipv4address TEXT,
//     ipv6address TEXT,
//     cname       TEXT,           -- CNAME target, MX exchange
//     priority    INTEGER         -- MX preference
//   );
//
// The connection is opened on first use, in serialized mode so it may
// be shared by all threads, and reopened after a failure.

class SQLiteStore : public RecordStore {
public:
  SQLiteStore(SQLiteStore const&) = delete;
  SQLiteStore& operator=(SQLiteStore const&) = delete;

  explicit SQLiteStore(
      std::string               path,
      std::chrono::milliseconds busy_timeout = Config::store_busy_timeout);

  std::vector<Record> lookup(filter const& f) override;

  std::string const& path() const { return path_; }

private:
  std::shared_ptr<sqlite3> db_();
  void                     reset_(std::shared_ptr<sqlite3> const& db);

  std::string               path_;
  std::chrono::milliseconds busy_timeout_;

  std::mutex               mtx_;
  std::shared_ptr<sqlite3> db_handle_;
};

#endif // SQLITESTORE_DOT_HPP

#include "SQLiteStore.hpp"

#include "IP4.hpp"

#include <limits>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <glog/logging.h>

#include <sqlite3.h>

namespace {
auto constexpr columns{
    "SELECT name, type, ipv4address, ipv6address, cname, priority "
    "FROM dns_records "};

using stmt_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// Error codes after which the connection is not worth keeping.
bool connection_lost(int rc)
{
  switch (rc & 0xFF) {
  case SQLITE_CANTOPEN:
  case SQLITE_CORRUPT:
  case SQLITE_IOERR:
  case SQLITE_NOTADB:
  case SQLITE_READONLY:
    return true;
  }
  return false;
}

std::optional<std::string> column_text(sqlite3_stmt* stmt, int col)
{
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL)
    return {};
  auto const txt = sqlite3_column_text(stmt, col);
  auto const len = sqlite3_column_bytes(stmt, col);
  return std::string(reinterpret_cast<char const*>(txt), len);
}

std::optional<uint16_t> column_priority(sqlite3_stmt* stmt, int col)
{
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL)
    return {};
  auto const val = sqlite3_column_int64(stmt, col);
  if (val < 0 || val > std::numeric_limits<uint16_t>::max()) {
    LOG(WARNING) << "priority " << val << " out of range";
    return {};
  }
  return static_cast<uint16_t>(val);
}

// The connection's own mutex, so the error message read after a
// failed call is the one that call left.
class db_lock {
public:
  db_lock(db_lock const&) = delete;
  db_lock& operator=(db_lock const&) = delete;

  explicit db_lock(sqlite3* db)
    : mtx_(sqlite3_db_mutex(db))
  {
    sqlite3_mutex_enter(mtx_);
  }
  ~db_lock() { sqlite3_mutex_leave(mtx_); }

private:
  sqlite3_mutex* mtx_;
};

class query_builder {
public:
  std::string              sql;
  std::vector<std::string> params;

  void operator()(RecordStore::by_name_type const& f)
  {
    sql = fmt::format("{}WHERE name = ?1 COLLATE NOCASE "
                      "AND type = ?2 COLLATE NOCASE ORDER BY rowid",
                      columns);
    params = {f.name, DNS::RR_type_c_str(f.type)};
  }

  void operator()(RecordStore::by_ipv4 const& f)
  {
    sql    = fmt::format("{}WHERE ipv4address = ?1 ORDER BY rowid", columns);
    params = {f.address};
  }

  void operator()(RecordStore::by_ipv6 const& f)
  {
    std::vector<std::string> ip6_params;
    std::vector<std::string> ip4_params;
    for (auto const& cand : f.candidates) {
      params.push_back(cand);
      ip6_params.push_back(fmt::format("?{}", params.size()));
    }
    for (auto const& cand : f.candidates) {
      if (IP4::is_address(cand)) {
        params.push_back(cand);
        ip4_params.push_back(fmt::format("?{}", params.size()));
      }
    }

    auto where = fmt::format("ipv6address COLLATE NOCASE IN ({})",
                             fmt::join(ip6_params, ", "));
    if (!ip4_params.empty()) {
      where += fmt::format(" OR ipv4address IN ({})",
                           fmt::join(ip4_params, ", "));
    }
    sql = fmt::format("{}WHERE {} ORDER BY rowid", columns, where);
  }
};
} // namespace

SQLiteStore::SQLiteStore(std::string path, std::chrono::milliseconds busy_timeout)
  : path_(std::move(path))
  , busy_timeout_(busy_timeout)
{
}

std::shared_ptr<sqlite3> SQLiteStore::db_()
{
  std::scoped_lock lck(mtx_);
  if (db_handle_)
    return db_handle_;

  sqlite3* db = nullptr;

  auto const flags = SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX;
  auto const rc    = sqlite3_open_v2(path_.c_str(), &db, flags, nullptr);
  if (rc != SQLITE_OK) {
    auto const msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    auto const err = fmt::format("can't open {}: {}", path_, msg);
    sqlite3_close(db); // harmless on nullptr
    LOG(WARNING) << err;
    throw unavailable(err);
  }

  sqlite3_busy_timeout(db, static_cast<int>(busy_timeout_.count()));

  LOG(INFO) << "opened " << path_;
  db_handle_.reset(db, sqlite3_close);
  return db_handle_;
}

void SQLiteStore::reset_(std::shared_ptr<sqlite3> const& db)
{
  std::scoped_lock lck(mtx_);
  if (db_handle_ == db) {
    LOG(WARNING) << "closing " << path_;
    db_handle_.reset();
  }
}

std::vector<Record> SQLiteStore::lookup(filter const& f)
{
  query_builder qb;
  std::visit(qb, f);

  auto const db = db_();
  db_lock    lck(db.get());

  auto fail = [&](int rc) {
    auto const err = fmt::format("{}: {}", path_, sqlite3_errmsg(db.get()));
    LOG(WARNING) << err;
    if (connection_lost(rc))
      reset_(db);
    return unavailable(err);
  };

  sqlite3_stmt* raw_stmt = nullptr;

  auto rc = sqlite3_prepare_v2(db.get(), qb.sql.c_str(),
                               static_cast<int>(qb.sql.size()), &raw_stmt,
                               nullptr);
  stmt_ptr stmt(raw_stmt, sqlite3_finalize);
  if (rc != SQLITE_OK)
    throw fail(rc);

  for (auto i{0u}; i < qb.params.size(); ++i) {
    auto const& p = qb.params[i];
    rc = sqlite3_bind_text(stmt.get(), static_cast<int>(i + 1), p.data(),
                           static_cast<int>(p.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
      throw fail(rc);
  }

  std::vector<Record> records;

  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    Record rec;
    rec.name = column_text(stmt.get(), 0).value_or("");

    auto const type = column_text(stmt.get(), 1).value_or("");
    if (auto const t = DNS::RR_type_from_str(type); t) {
      rec.type = *t;
    }
    else {
      LOG(WARNING) << "unknown type «" << type << "» for " << rec.name;
    }

    rec.ipv4address = column_text(stmt.get(), 2);
    rec.ipv6address = column_text(stmt.get(), 3);
    rec.cname       = column_text(stmt.get(), 4);
    rec.priority    = column_priority(stmt.get(), 5);

    records.push_back(std::move(rec));
  }
  if (rc != SQLITE_DONE)
    throw fail(rc);

  return records;
}

#include "storage/sqlite_name_store.h"
#include "common/error.h"
#include <filesystem>
#include <sqlite3.h>

namespace trackcast {

namespace {
const char *kCreateTable = "CREATE TABLE IF NOT EXISTS devices ("
                           "udid TEXT PRIMARY KEY, "
                           "real_name TEXT, "
                           "custom_name TEXT, "
                           "last_seen TIMESTAMP DEFAULT CURRENT_TIMESTAMP)";

const char *kSelect =
    "SELECT real_name, custom_name FROM devices WHERE udid = ?";

const char *kUpsert =
    "INSERT INTO devices (udid, real_name, custom_name) VALUES (?, ?, ?) "
    "ON CONFLICT(udid) DO UPDATE SET "
    "real_name = COALESCE(excluded.real_name, devices.real_name), "
    "custom_name = COALESCE(excluded.custom_name, devices.custom_name), "
    "last_seen = CURRENT_TIMESTAMP";

void bind_optional(sqlite3_stmt *stmt, int index,
                   const std::optional<std::string> &value) {
  if (value) {
    sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::optional<std::string> column_optional(sqlite3_stmt *stmt, int index) {
  auto text = sqlite3_column_text(stmt, index);
  if (text == nullptr || *text == '\0') {
    return std::nullopt;
  }
  return std::string(reinterpret_cast<const char *>(text));
}
} // namespace

SqliteNameStore::SqliteNameStore(const std::string &db_path)
    : db_path_(db_path), logger_(Logger::get("store")) {}

SqliteNameStore::~SqliteNameStore() { close(); }

void SqliteNameStore::open() {
  std::lock_guard<std::mutex> lock(db_mutex_);
  if (db_ != nullptr) {
    return;
  }

  auto parent = std::filesystem::path(db_path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }

  if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
    std::string reason = sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw Error::persistence("open " + db_path_, reason);
  }

  char *err_msg = nullptr;
  if (sqlite3_exec(db_, kCreateTable, nullptr, nullptr, &err_msg) !=
      SQLITE_OK) {
    std::string reason = err_msg ? err_msg : "unknown error";
    sqlite3_free(err_msg);
    sqlite3_close(db_);
    db_ = nullptr;
    throw Error::persistence("create devices table", reason);
  }

  LOG_INFO(logger_, "name store opened: {}", db_path_);
}

void SqliteNameStore::close() {
  std::lock_guard<std::mutex> lock(db_mutex_);
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
    LOG_DEBUG(logger_, "name store closed");
  }
}

std::optional<NameRecord> SqliteNameStore::get(const std::string &udid) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  if (db_ == nullptr) {
    LOG_WARN(logger_, "name lookup for {} on closed store", udid);
    return std::nullopt;
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kSelect, -1, &stmt, nullptr) != SQLITE_OK) {
    LOG_ERROR(logger_, "failed to prepare name lookup: {}",
              sqlite3_errmsg(db_));
    return std::nullopt;
  }

  sqlite3_bind_text(stmt, 1, udid.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<NameRecord> record;
  int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    record = NameRecord{column_optional(stmt, 0), column_optional(stmt, 1)};
  } else if (rc != SQLITE_DONE) {
    LOG_ERROR(logger_, "name lookup for {} failed: {}", udid,
              sqlite3_errmsg(db_));
  }

  sqlite3_finalize(stmt);
  return record;
}

void SqliteNameStore::upsert(const std::string &udid,
                             const std::optional<std::string> &factory_name,
                             const std::optional<std::string> &user_name) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  if (db_ == nullptr) {
    throw Error::persistence("upsert " + udid, "store is not open");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kUpsert, -1, &stmt, nullptr) != SQLITE_OK) {
    throw Error::persistence("upsert " + udid, sqlite3_errmsg(db_));
  }

  sqlite3_bind_text(stmt, 1, udid.c_str(), -1, SQLITE_TRANSIENT);
  bind_optional(stmt, 2, factory_name);
  bind_optional(stmt, 3, user_name);

  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  if (rc != SQLITE_DONE) {
    throw Error::persistence("upsert " + udid, sqlite3_errmsg(db_));
  }
  LOG_DEBUG(logger_, "stored names for {}", udid);
}

} // namespace trackcast

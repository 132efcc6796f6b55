#pragma once

#include "common/logger.h"
#include "storage/name_store.h"
#include <mutex>

struct sqlite3;

namespace trackcast {

class SqliteNameStore : public NameStore {
public:
  explicit SqliteNameStore(const std::string &db_path);
  ~SqliteNameStore() override;

  SqliteNameStore(const SqliteNameStore &) = delete;
  SqliteNameStore &operator=(const SqliteNameStore &) = delete;

  // opens the database and creates the devices table
  void open();
  void close();

  std::optional<NameRecord> get(const std::string &udid) override;
  void upsert(const std::string &udid,
              const std::optional<std::string> &factory_name,
              const std::optional<std::string> &user_name) override;

  const std::string &path() const { return db_path_; }

private:
  std::string db_path_;
  sqlite3 *db_{nullptr};

  std::mutex db_mutex_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace trackcast

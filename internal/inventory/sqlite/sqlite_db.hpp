#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace fleetwatch::inventory::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The inventory database belongs to the asset management application, so
  the poller opens it read-only. Tests open it writable to seed fixtures.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool read_only = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (fixtures, pragmas)
  void Exec(const std::string& sql);

  // Prepared statement, finalized when the handle goes out of scope
  using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;
  Statement Prepare(const std::string& sql);

  const std::string& path() const {
    return path_;
  }

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  bool        read_only_;
};

} // namespace fleetwatch::inventory::sqlite

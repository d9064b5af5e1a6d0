#include "sqlite_inventory.hpp"

#include "internal/util/errors.hpp"

namespace fleetwatch::inventory::sqlite {

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

SqliteInventory::SqliteInventory(std::string path, std::string query) : path_(std::move(path)), query_(std::move(query)) {
  if (query_.empty()) query_ = kDefaultQuery;
}

std::vector<InventoryRow> SqliteInventory::Query() {
  std::lock_guard lock(mutex_);

  try {
    if (!db_) db_ = std::make_unique<SqliteDB>(path_);

    auto stmt = db_->Prepare(query_);
    if (sqlite3_column_count(stmt.get()) < 6) {
      throw util::InventoryError("inventory query must return id, ip, hostname, brand, os, condition");
    }

    std::vector<InventoryRow> rows;
    int                       rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
      InventoryRow row;
      row.id        = ColText(stmt.get(), 0);
      row.address   = ColText(stmt.get(), 1);
      row.hostname  = ColText(stmt.get(), 2);
      row.brand     = ColText(stmt.get(), 3);
      row.os        = ColText(stmt.get(), 4);
      row.condition = ColText(stmt.get(), 5);
      rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
      throw util::InventoryError(std::string("sqlite step: ") + sqlite3_errmsg(db_->Handle()));
    }
    return rows;
  } catch (const util::InventoryError&) {
    db_.reset();
    throw;
  }
}

std::vector<model::Device> SqliteInventory::ListDevices() {
  return ToDevices(Query(), "sqlite");
}

} // namespace fleetwatch::inventory::sqlite

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/inventory/inventory.hpp"
#include "internal/inventory/sqlite/sqlite_db.hpp"

namespace fleetwatch::inventory::sqlite {

/*
  Reads devices from the asset inventory's SQLite database.

  The query must return six columns in order:
      id, ip, hostname, brand, os, condition

  The connection is opened on first use and dropped after an error, so a
  database that is missing at startup only fails the cycles that need it.
*/
class SqliteInventory final : public Inventory {
 public:
  static constexpr const char* kDefaultQuery =
      "SELECT i.id, i.ip, i.hostname, i.merk, i.os, i.kondisi "
      "FROM inventaris i JOIN jenis_barangs j ON i.jenis_barang_id = j.id "
      "WHERE j.ping = 1 ORDER BY i.id;";

  explicit SqliteInventory(std::string path, std::string query = kDefaultQuery);

  std::vector<model::Device> ListDevices() override;

 private:
  std::vector<InventoryRow> Query();

  std::string               path_;
  std::string               query_;
  std::mutex                mutex_;
  std::unique_ptr<SqliteDB> db_;
};

} // namespace fleetwatch::inventory::sqlite

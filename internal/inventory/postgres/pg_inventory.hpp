#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/inventory/inventory.hpp"

namespace fleetwatch::inventory::postgres {

/*
  Same contract as SqliteInventory, against PostgreSQL through libpqxx.
  One connection, reopened after a failure; pqxx connections are not
  thread-safe so queries are serialized.
*/
class PgInventory final : public Inventory {
 public:
  static constexpr const char* kDefaultQuery =
      "SELECT i.id::text, i.ip, i.hostname, i.merk, i.os, i.kondisi::text "
      "FROM inventaris i JOIN jenis_barangs j ON i.jenis_barang_id = j.id "
      "WHERE j.ping = 1 ORDER BY i.id";

  explicit PgInventory(std::string conninfo, std::string query = kDefaultQuery);

  std::vector<model::Device> ListDevices() override;

 private:
  std::string                       conninfo_;
  std::string                       query_;
  std::mutex                        mutex_;
  std::unique_ptr<pqxx::connection> conn_;
};

} // namespace fleetwatch::inventory::postgres

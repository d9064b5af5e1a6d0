#include "pg_inventory.hpp"

#include "internal/util/errors.hpp"

namespace fleetwatch::inventory::postgres {

namespace {

std::string Text(const pqxx::field& field) {
  return field.is_null() ? std::string() : std::string(field.c_str());
}

} // namespace

PgInventory::PgInventory(std::string conninfo, std::string query) : conninfo_(std::move(conninfo)), query_(std::move(query)) {
  if (query_.empty()) query_ = kDefaultQuery;
}

std::vector<model::Device> PgInventory::ListDevices() {
  std::vector<InventoryRow> rows;
  {
    std::lock_guard lock(mutex_);
    try {
      if (!conn_) conn_ = std::make_unique<pqxx::connection>(conninfo_);

      pqxx::read_transaction tx(*conn_);
      auto                   res = tx.exec(query_);
      if (res.columns() < 6) {
        throw util::InventoryError("inventory query must return id, ip, hostname, brand, os, condition");
      }

      rows.reserve(res.size());
      for (const auto& r : res) {
        InventoryRow row;
        row.id        = Text(r[0]);
        row.address   = Text(r[1]);
        row.hostname  = Text(r[2]);
        row.brand     = Text(r[3]);
        row.os        = Text(r[4]);
        row.condition = Text(r[5]);
        rows.push_back(std::move(row));
      }
      tx.commit();
    } catch (const util::InventoryError&) {
      conn_.reset();
      throw;
    } catch (const std::exception& e) {
      conn_.reset();
      throw util::InventoryError(std::string("postgres inventory: ") + e.what());
    }
  }
  return ToDevices(rows, "postgres");
}

} // namespace fleetwatch::inventory::postgres

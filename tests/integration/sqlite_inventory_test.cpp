#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/inventory/sqlite/sqlite_db.hpp"
#include "internal/inventory/sqlite/sqlite_inventory.hpp"
#include "internal/util/errors.hpp"

namespace {

using fleetwatch::inventory::sqlite::SqliteDB;
using fleetwatch::inventory::sqlite::SqliteInventory;
using fleetwatch::model::Condition;

std::filesystem::path FixturePath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "fleetwatch_sqlite_inventory_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  std::filesystem::remove(path);
  return path;
}

void Seed(const std::filesystem::path& path) {
  SqliteDB db(path.string(), /*read_only=*/false);
  db.Exec(R"(
    CREATE TABLE jenis_barangs (id INTEGER PRIMARY KEY, nama TEXT, ping INTEGER NOT NULL DEFAULT 0);
    CREATE TABLE inventaris (
      id INTEGER PRIMARY KEY,
      jenis_barang_id INTEGER NOT NULL,
      ip TEXT,
      hostname TEXT,
      merk TEXT,
      os TEXT,
      kondisi TEXT
    );
    INSERT INTO jenis_barangs VALUES (1, 'PC', 1), (2, 'Monitor', 0), (3, 'Printer', 1);
    INSERT INTO inventaris VALUES
      (1, 1, '10.0.0.1', 'lab-pc-01', 'Lenovo', 'Windows 10', 'Baik'),
      (2, 2, '10.0.0.2', 'monitor-02', 'LG', NULL, 'Baik'),
      (3, 3, '10.0.0.3', 'printer-03', 'Epson', NULL, 'maintenance'),
      (4, 1, '10.0.0.4', 'lab-pc-04', 'Lenovo', 'Windows 10', 'Hilang'),
      (5, 1, NULL, 'lab-pc-05', 'Lenovo', 'Windows 10', 'Baik'),
      (6, 1, '10.0.0.600', 'lab-pc-06', 'Lenovo', 'Windows 10', 'Baik'),
      (7, 1, '10.0.0.7', 'lab-pc-07', 'Lenovo', 'Windows 10', 'Rusak');
  )");
}

void TestDefaultQueryReturnsPingableDevices() {
  const auto path = FixturePath("default_query");
  Seed(path);

  SqliteInventory inventory(path.string());
  const auto      devices = inventory.ListDevices();

  // monitor excluded by type; null address, bad address and unknown condition rejected
  assert(devices.size() == 3);
  assert(devices[0].id == "1");
  assert(devices[0].address == "10.0.0.1");
  assert(devices[0].hostname == "lab-pc-01");
  assert(devices[0].brand == "Lenovo");
  assert(devices[0].os == "Windows 10");
  assert(devices[0].condition == Condition::kOk);

  assert(devices[1].id == "3");
  assert(devices[1].os.empty());
  assert(devices[1].condition == Condition::kMaintenance);

  // missing devices are returned; the scheduler decides not to poll them
  assert(devices[2].id == "4");
  assert(devices[2].condition == Condition::kMissing);
}

void TestCustomQuery() {
  const auto path = FixturePath("custom_query");
  Seed(path);

  SqliteInventory inventory(path.string(),
                            "SELECT id, ip, hostname, merk, os, kondisi FROM inventaris WHERE merk = 'Epson';");
  const auto      devices = inventory.ListDevices();
  assert(devices.size() == 1);
  assert(devices[0].hostname == "printer-03");
}

void TestNarrowQueryIsRejected() {
  const auto path = FixturePath("narrow_query");
  Seed(path);

  SqliteInventory inventory(path.string(), "SELECT id, ip FROM inventaris;");
  bool            threw = false;
  try {
    (void)inventory.ListDevices();
  } catch (const fleetwatch::util::InventoryError&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingDatabaseFailsUntilItAppears() {
  const auto path = FixturePath("appears_later");

  // constructing never touches the file
  SqliteInventory inventory(path.string());

  bool threw = false;
  try {
    (void)inventory.ListDevices();
  } catch (const fleetwatch::util::InventoryError&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(path));

  Seed(path);
  assert(inventory.ListDevices().size() == 3);
}

void TestReadOnlyConnectionCannotWrite() {
  const auto path = FixturePath("read_only");
  Seed(path);

  SqliteDB db(path.string());
  bool     threw = false;
  try {
    db.Exec("DELETE FROM inventaris;");
  } catch (const fleetwatch::util::InventoryError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaultQueryReturnsPingableDevices();
  TestCustomQuery();
  TestNarrowQueryIsRejected();
  TestMissingDatabaseFailsUntilItAppears();
  TestReadOnlyConnectionCannotWrite();

  std::cout << "fleetwatch_integration_sqlite_inventory: pass\n";
  return 0;
}

#include "static_inventory.hpp"

namespace fleetwatch::inventory {

StaticInventory::StaticInventory(std::vector<InventoryRow> rows) : rows_(std::move(rows)) {
}

std::vector<model::Device> StaticInventory::ListDevices() {
  return ToDevices(rows_, "static");
}

} // namespace fleetwatch::inventory

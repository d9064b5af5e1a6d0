#pragma once

#include <vector>

#include "internal/inventory/inventory.hpp"

namespace fleetwatch::inventory {

// Fixed device list, typically from the YAML config.
class StaticInventory final : public Inventory {
 public:
  explicit StaticInventory(std::vector<InventoryRow> rows);

  std::vector<model::Device> ListDevices() override;

 private:
  std::vector<InventoryRow> rows_;
};

} // namespace fleetwatch::inventory

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/device.hpp"

namespace fleetwatch::inventory {

/*
  Raw inventory record as the backend returns it, before validation.
*/
struct InventoryRow {
  std::string id;
  std::string address;
  std::string hostname;
  std::string brand;
  std::string os;
  std::string condition;
};

/*
  Source of the device set polled each cycle.

  ListDevices() returns only well-formed devices; records with an empty or
  unparseable address or an unknown condition are logged and skipped.
  Backend failures throw util::InventoryError.
*/
class Inventory {
 public:
  virtual ~Inventory() = default;

  virtual std::vector<model::Device> ListDevices() = 0;
};

// nullopt (and *reason set) when the row cannot become a Device.
std::optional<model::Device> ToDevice(const InventoryRow& row, std::string* reason = nullptr);

// Converts rows, logging and dropping the invalid ones.
std::vector<model::Device> ToDevices(const std::vector<InventoryRow>& rows, const char* source);

} // namespace fleetwatch::inventory

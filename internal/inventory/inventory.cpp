#include "inventory.hpp"

#include "internal/observability/logging.hpp"

namespace fleetwatch::inventory {

using fleetwatch::observability::IntField;
using fleetwatch::observability::StringField;

std::optional<model::Device> ToDevice(const InventoryRow& row, std::string* reason) {
  auto fail = [reason](const char* why) -> std::optional<model::Device> {
    if (reason) *reason = why;
    return std::nullopt;
  };

  if (row.address.empty()) return fail("empty address");
  if (!model::IsValidAddress(row.address)) return fail("invalid address");

  auto condition = model::ParseCondition(row.condition);
  if (!condition) return fail("unknown condition");

  model::Device device;
  device.id        = row.id;
  device.address   = row.address;
  device.hostname  = row.hostname;
  device.brand     = row.brand;
  device.os        = row.os;
  device.condition = *condition;
  return device;
}

std::vector<model::Device> ToDevices(const std::vector<InventoryRow>& rows, const char* source) {
  std::vector<model::Device> devices;
  devices.reserve(rows.size());

  std::size_t rejected = 0;
  for (const auto& row : rows) {
    std::string reason;
    if (auto device = ToDevice(row, &reason)) {
      devices.push_back(std::move(*device));
      continue;
    }
    ++rejected;
    FLEETWATCH_LOG_DEBUG("Inventory record skipped", {StringField("source", source), StringField("id", row.id),
                                                      StringField("address", row.address), StringField("reason", reason)});
  }

  if (rejected > 0) {
    FLEETWATCH_LOG_WARN("Invalid inventory records skipped",
                        {StringField("source", source), IntField("rejected", static_cast<std::int64_t>(rejected))});
  }
  return devices;
}

} // namespace fleetwatch::inventory

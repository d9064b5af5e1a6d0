#pragma once

#include "config/config.pb.h"

namespace fleetwatch::config {

// Fills every unset field with its documented default.
void ApplyDefaults(fleetwatch::runtime::config::RuntimeConfig* config);

// Throws util::InvalidConfig on the first violation.
void Validate(const fleetwatch::runtime::config::RuntimeConfig& config);

} // namespace fleetwatch::config

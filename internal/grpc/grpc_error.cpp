#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace fleetwatch::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace fleetwatch::util;

  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const InvalidConfig*>(&e) || dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const StoreError*>(&e) || dynamic_cast<const InventoryError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace fleetwatch::grpc

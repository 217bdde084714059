#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace slotwatch::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace slotwatch::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InitializationError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const DriverError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace slotwatch::grpc

#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace graphflow::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace graphflow::util;

  // Code of the original error, message with the invocation id.
  if (const auto* failed = dynamic_cast<const InvocationFailed*>(&e)) {
    if (failed->Cause()) {
      try {
        std::rethrow_exception(failed->Cause());
      } catch (const std::exception& cause) {
        return {ToStatus(cause).error_code(), e.what()};
      }
    }
    return {::grpc::StatusCode::INTERNAL, e.what()};
  }

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const UnknownNodeError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const CodecError*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }
  if (dynamic_cast<const StepBudgetExceeded*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace graphflow::grpc

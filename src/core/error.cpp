#include "md5mux/core/error.hpp"

namespace md5mux {

const char* error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::AlreadyFinalized:
      return "already_finalized";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::EngineStopped:
      return "engine_stopped";
    case ErrorCode::KernelFault:
      return "kernel_fault";
    case ErrorCode::IoError:
      return "io_error";
    case ErrorCode::Internal:
      return "internal";
  }
  return "unknown";
}

}  // namespace md5mux

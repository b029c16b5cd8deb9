#include "md5mux/scheduler/scheduler.hpp"

#if __has_include(<xxhash.h>)
#include <xxhash.h>
#else
#error "xxhash.h is required"
#endif

namespace md5mux {

size_t slot_for(Uid uid, SlotPolicy policy) noexcept {
  switch (policy) {
    case SlotPolicy::LowBits:
      return static_cast<size_t>(uid % kLaneCount);
    case SlotPolicy::Mixed:
      return static_cast<size_t>(XXH64(&uid, sizeof(uid), 0) % kLaneCount);
  }
  return static_cast<size_t>(uid % kLaneCount);
}

const char* slot_policy_name(SlotPolicy policy) noexcept {
  switch (policy) {
    case SlotPolicy::LowBits:
      return "low-bits";
    case SlotPolicy::Mixed:
      return "mixed";
  }
  return "unknown";
}

const char* batch_mode_name(BatchMode mode) noexcept {
  switch (mode) {
    case BatchMode::Masked:
      return "masked";
    case BatchMode::Uniform:
      return "uniform";
  }
  return "unknown";
}

}  // namespace md5mux

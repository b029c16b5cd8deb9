#pragma once

#include <cstddef>
#include <memory>
#include <span>

#include "md5mux/core/types.hpp"

namespace md5mux {

enum class KernelKind { Lanes, Scalar };

// Batched MD5 compression over kLaneCount independent lanes.
//
// For every lane whose bit is set in `mask`, advance() consumes exactly
// `rounds` consecutive 64-byte chunks from the front of that lane's input and
// folds them into states[lane]. Lanes with a clear bit are left bit-for-bit
// unchanged and their input is never read. A call that breaks this contract
// throws Error{ErrorCode::KernelFault}.
class IKernel {
 public:
  virtual ~IKernel() = default;

  virtual KernelKind kind() const noexcept = 0;
  virtual const char* name() const noexcept = 0;

  virtual void advance(LaneStates& states,
                       std::span<const LaneInput, kLaneCount> inputs,
                       LaneMask mask,
                       size_t rounds) = 0;
};

std::unique_ptr<IKernel> make_kernel(KernelKind kind);

const char* kernel_kind_name(KernelKind kind) noexcept;

}  // namespace md5mux

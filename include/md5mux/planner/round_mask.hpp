#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "md5mux/core/types.hpp"

namespace md5mux {

// Splits one batch into round-groups so every lane stops participating as
// soon as its input is exhausted. `lengths` are byte lengths per lane, each a
// multiple of 64; a zero length means the lane has no work in this batch.
//
// The returned groups are in execution order, their round counts sum to the
// longest lane, and each mask holds exactly the lanes with rounds left.
std::vector<MaskRounds> plan_rounds(std::span<const size_t, kLaneCount> lengths);

// Single group covering every non-empty lane for the longest lane's rounds.
// Shorter lanes must be padded and their surplus rounds discarded by the
// caller.
std::vector<MaskRounds> plan_uniform(std::span<const size_t, kLaneCount> lengths);

// One mask per 64-byte round.
std::vector<LaneMask> expand_plan(std::span<const MaskRounds> plan);

size_t total_rounds(std::span<const MaskRounds> plan) noexcept;

}  // namespace md5mux

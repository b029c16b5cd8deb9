#include "md5mux/planner/round_mask.hpp"

#include <algorithm>
#include <array>
#include <format>

#include "md5mux/core/error.hpp"

namespace md5mux {
namespace {

struct LaneRounds {
  size_t rounds{};
  size_t lane{};
};

std::array<size_t, kLaneCount> to_rounds(std::span<const size_t, kLaneCount> lengths) {
  std::array<size_t, kLaneCount> out{};
  for (size_t lane = 0; lane < kLaneCount; ++lane) {
    if (!is_block_multiple(lengths[lane])) {
      throw Error{ErrorCode::InvalidArgument,
                  std::format("lane {} length {} is not a multiple of {}", lane, lengths[lane],
                              kBlockSize)};
    }
    out[lane] = lengths[lane] / kBlockSize;
  }
  return out;
}

}  // namespace

std::vector<MaskRounds> plan_rounds(std::span<const size_t, kLaneCount> lengths) {
  const auto rounds = to_rounds(lengths);

  std::array<LaneRounds, kLaneCount> sorted{};
  for (size_t lane = 0; lane < kLaneCount; ++lane) {
    sorted[lane] = LaneRounds{rounds[lane], lane};
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const LaneRounds& x, const LaneRounds& y) { return x.rounds < y.rounds; });

  // Empty lanes sort first and are retired before any group is emitted.
  LaneMask live = kAllLanes;
  size_t consumed = 0;
  std::vector<MaskRounds> plan;
  plan.reserve(kLaneCount);
  for (const auto& s : sorted) {
    if (s.rounds > consumed) {
      plan.push_back(MaskRounds{live, s.rounds - consumed});
      consumed = s.rounds;
    }
    live &= ~(LaneMask{1} << s.lane);
  }
  return plan;
}

std::vector<MaskRounds> plan_uniform(std::span<const size_t, kLaneCount> lengths) {
  const auto rounds = to_rounds(lengths);

  LaneMask active = 0;
  size_t longest = 0;
  for (size_t lane = 0; lane < kLaneCount; ++lane) {
    if (rounds[lane] > 0) {
      active |= LaneMask{1} << lane;
      longest = std::max(longest, rounds[lane]);
    }
  }
  if (active == 0) {
    return {};
  }
  return {MaskRounds{active, longest}};
}

std::vector<LaneMask> expand_plan(std::span<const MaskRounds> plan) {
  std::vector<LaneMask> out;
  out.reserve(total_rounds(plan));
  for (const auto& group : plan) {
    out.insert(out.end(), group.rounds, group.mask);
  }
  return out;
}

size_t total_rounds(std::span<const MaskRounds> plan) noexcept {
  size_t total = 0;
  for (const auto& group : plan) {
    total += group.rounds;
  }
  return total;
}

}  // namespace md5mux

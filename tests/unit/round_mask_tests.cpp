#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iostream>
#include <vector>

#include "md5mux/core/error.hpp"
#include "md5mux/planner/round_mask.hpp"

namespace {

using Lengths = std::array<size_t, md5mux::kLaneCount>;

Lengths from_rounds(const std::array<size_t, md5mux::kLaneCount>& rounds) {
  Lengths out{};
  for (size_t i = 0; i < rounds.size(); ++i) {
    out[i] = rounds[i] * md5mux::kBlockSize;
  }
  return out;
}

// Sum equals the longest lane, and lane i is in the mask of round r exactly
// when r < rounds[i].
bool plan_is_exact(const std::array<size_t, md5mux::kLaneCount>& rounds,
                   const std::vector<md5mux::MaskRounds>& plan) {
  size_t longest = 0;
  for (const size_t r : rounds) {
    longest = std::max(longest, r);
  }
  if (md5mux::total_rounds(plan) != longest) {
    std::cerr << std::format("total rounds {} != longest lane {}\n",
                             md5mux::total_rounds(plan), longest);
    return false;
  }

  const auto per_round = md5mux::expand_plan(plan);
  for (size_t r = 0; r < per_round.size(); ++r) {
    for (size_t lane = 0; lane < md5mux::kLaneCount; ++lane) {
      const bool in_mask = (per_round[r] >> lane) & 1u;
      if (in_mask != (r < rounds[lane])) {
        std::cerr << std::format("round {} lane {}: in_mask={} but lane has {} rounds\n", r,
                                 lane, in_mask, rounds[lane]);
        return false;
      }
    }
  }
  return true;
}

bool test_mixed_lengths() {
  const std::array<size_t, md5mux::kLaneCount> rounds{1, 1, 3, 3, 3, 5, 0, 2};
  const auto lengths = from_rounds(rounds);
  const auto plan = md5mux::plan_rounds(lengths);

  const std::vector<md5mux::MaskRounds> expected{
      {0b10111111, 1},
      {0b10111100, 1},
      {0b00111100, 1},
      {0b00100000, 2},
  };
  if (plan != expected) {
    std::cerr << std::format("unexpected plan with {} groups\n", plan.size());
    for (const auto& g : plan) {
      std::cerr << std::format("  mask=0x{:02x} rounds={}\n", g.mask, g.rounds);
    }
    return false;
  }
  return plan_is_exact(rounds, plan);
}

bool test_equal_lengths() {
  const std::array<size_t, md5mux::kLaneCount> rounds{4, 4, 4, 4, 4, 4, 4, 4};
  const auto plan = md5mux::plan_rounds(from_rounds(rounds));
  if (plan.size() != 1 || plan[0].mask != md5mux::kAllLanes || plan[0].rounds != 4) {
    std::cerr << std::format("equal lanes should give one full group, got {}\n", plan.size());
    return false;
  }
  return true;
}

bool test_partial_and_empty() {
  const std::array<size_t, md5mux::kLaneCount> none{};
  if (!md5mux::plan_rounds(from_rounds(none)).empty()) {
    std::cerr << std::format("all-empty batch should produce no groups\n");
    return false;
  }
  if (!md5mux::plan_uniform(from_rounds(none)).empty()) {
    std::cerr << std::format("all-empty uniform plan should be empty\n");
    return false;
  }

  const std::array<size_t, md5mux::kLaneCount> two{0, 2, 0, 0, 0, 2, 0, 0};
  const auto plan = md5mux::plan_rounds(from_rounds(two));
  if (plan.size() != 1 || plan[0].mask != 0b00100010 || plan[0].rounds != 2) {
    std::cerr << std::format("two equal active lanes should give one 0x22 group\n");
    return false;
  }
  return plan_is_exact(two, plan);
}

bool test_uniform_plan() {
  const std::array<size_t, md5mux::kLaneCount> rounds{1, 0, 3, 0, 2, 0, 0, 7};
  const auto plan = md5mux::plan_uniform(from_rounds(rounds));
  if (plan.size() != 1 || plan[0].mask != 0b10010101 || plan[0].rounds != 7) {
    std::cerr << std::format("uniform plan should cover active lanes for 7 rounds\n");
    return false;
  }
  return true;
}

bool test_random_lengths() {
  uint64_t s = 0x1234567887654321ULL;
  for (int iter = 0; iter < 2000; ++iter) {
    std::array<size_t, md5mux::kLaneCount> rounds{};
    for (auto& r : rounds) {
      s ^= s << 13;
      s ^= s >> 7;
      s ^= s << 17;
      r = static_cast<size_t>(s % 6);
    }
    const auto plan = md5mux::plan_rounds(from_rounds(rounds));
    if (!plan_is_exact(rounds, plan)) {
      std::cerr << std::format("random plan failed at iteration {}\n", iter);
      return false;
    }
    if (plan.size() > md5mux::kLaneCount) {
      std::cerr << std::format("plan has {} groups, more than the lane count\n", plan.size());
      return false;
    }
  }
  return true;
}

bool test_unaligned_length_rejected() {
  Lengths lengths{};
  lengths[3] = 100;
  bool rejected = false;
  try {
    static_cast<void>(md5mux::plan_rounds(lengths));
  } catch (const md5mux::Error &e) {
    rejected = (e.code() == md5mux::ErrorCode::InvalidArgument);
  }
  if (!rejected) {
    std::cerr << std::format("expected invalid argument for a 100-byte lane\n");
    return false;
  }
  return true;
}

} // namespace

int main() {
  if (!test_mixed_lengths()) {
    return 1;
  }
  if (!test_equal_lengths()) {
    return 1;
  }
  if (!test_partial_and_empty()) {
    return 1;
  }
  if (!test_uniform_plan()) {
    return 1;
  }
  if (!test_random_lengths()) {
    return 1;
  }
  if (!test_unaligned_length_rejected()) {
    return 1;
  }
  return 0;
}

#include "scheduler/lane_batch.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

#include "md5mux/hash/md5.hpp"
#include "md5mux/planner/round_mask.hpp"

namespace md5mux::sched {
namespace {

bool lane_active(LaneMask mask, size_t lane) noexcept {
  return (mask >> lane) & 1u;
}

}  // namespace

LaneBatch::LaneBatch(IKernel& kernel, BatchMode mode, SlotPolicy policy, bool verify_kernel)
    : kernel_(kernel), mode_(mode), policy_(policy), verify_kernel_(verify_kernel) {}

void LaneBatch::accept(Uid uid,
                       std::vector<uint8_t> block,
                       std::optional<std::promise<Digest>> result) {
  if (uid == kNoSession) {
    throw Error{ErrorCode::InvalidArgument, "uid 0 is reserved"};
  }
  if (block.empty() || !is_block_multiple(block.size())) {
    throw Error{ErrorCode::InvalidArgument,
                std::format("block of {} bytes is not a positive multiple of {}", block.size(),
                            kBlockSize)};
  }

  const size_t lane = slot_for(uid, policy_);
  if (slots_[lane].occupied()) {
    try {
      flush(FlushCause::Collision);
    } catch (const Error& e) {
      if (result.has_value()) {
        result->set_exception(std::make_exception_ptr(e));
      }
      throw;
    }
  }

  slots_[lane] = LaneSlot{uid, std::move(block), std::move(result)};
  if (pending_++ == 0) {
    oldest_ = Clock::now();
  }

  if (pending_ == kLaneCount) {
    flush(FlushCause::Full);
  }
}

void LaneBatch::flush(FlushCause cause) {
  if (pending_ == 0) {
    return;
  }

  std::array<size_t, kLaneCount> lengths{};
  LaneStates states{};
  for (size_t lane = 0; lane < kLaneCount; ++lane) {
    states[lane] = kInitialState;
    const auto& slot = slots_[lane];
    if (!slot.occupied()) {
      continue;
    }
    lengths[lane] = slot.block.size();
    if (auto it = states_.find(slot.uid); it != states_.end()) {
      states[lane] = it->second;
    }
  }

  states = mode_ == BatchMode::Masked ? run_masked(states, lengths) : run_uniform(states, lengths);

  // Nothing below throws, so a batch lands in the table as a whole.
  for (size_t lane = 0; lane < kLaneCount; ++lane) {
    auto& slot = slots_[lane];
    if (!slot.occupied()) {
      continue;
    }
    ++stats_.blocks;
    stats_.bytes += slot.block.size();
    if (slot.result.has_value()) {
      slot.result->set_value(encode_digest(states[lane]));
      states_.erase(slot.uid);
      ++stats_.digests;
    } else {
      states_[slot.uid] = states[lane];
    }
    slot = LaneSlot{};
  }
  pending_ = 0;
  oldest_.reset();

  ++stats_.batches;
  switch (cause) {
    case FlushCause::Full:
      ++stats_.flush_full;
      break;
    case FlushCause::Collision:
      ++stats_.flush_collision;
      break;
    case FlushCause::Timeout:
      ++stats_.flush_timeout;
      break;
    case FlushCause::Stop:
      ++stats_.flush_stop;
      break;
  }
}

LaneStates LaneBatch::run_masked(LaneStates states, const std::array<size_t, kLaneCount>& lengths) {
  const auto plan = plan_rounds(lengths);

  std::array<size_t, kLaneCount> cursor{};
  LaneInputs inputs{};
  for (const auto& group : plan) {
    for (size_t lane = 0; lane < kLaneCount; ++lane) {
      inputs[lane] = lane_active(group.mask, lane)
                         ? LaneInput(slots_[lane].block).subspan(cursor[lane])
                         : LaneInput{};
    }
    invoke(states, inputs, group.mask, group.rounds);
    for (size_t lane = 0; lane < kLaneCount; ++lane) {
      if (lane_active(group.mask, lane)) {
        cursor[lane] += group.rounds * kBlockSize;
      }
    }
  }
  return states;
}

LaneStates LaneBatch::run_uniform(LaneStates states, const std::array<size_t, kLaneCount>& lengths) {
  const auto plan = plan_uniform(lengths);
  if (plan.empty()) {
    return states;
  }
  const auto [mask, rounds] = plan.front();

  // Every active lane runs the longest lane's rounds over zero-padded input;
  // each lane keeps the state it had when its own data ran out.
  std::array<std::vector<uint8_t>, kLaneCount> padded{};
  for (size_t lane = 0; lane < kLaneCount; ++lane) {
    if (lane_active(mask, lane)) {
      padded[lane] = slots_[lane].block;
      padded[lane].resize(rounds * kBlockSize, 0);
    }
  }

  LaneStates kept = states;
  LaneInputs inputs{};
  for (size_t r = 0; r < rounds; ++r) {
    for (size_t lane = 0; lane < kLaneCount; ++lane) {
      inputs[lane] = lane_active(mask, lane)
                         ? LaneInput(padded[lane]).subspan(r * kBlockSize, kBlockSize)
                         : LaneInput{};
    }
    invoke(states, inputs, mask, 1);
    for (size_t lane = 0; lane < kLaneCount; ++lane) {
      if (lane_active(mask, lane) && lengths[lane] / kBlockSize == r + 1) {
        kept[lane] = states[lane];
      }
    }
  }
  return kept;
}

void LaneBatch::invoke(LaneStates& states, const LaneInputs& inputs, LaneMask mask, size_t rounds) {
  const LaneStates before = states;
  kernel_.advance(states, inputs, mask, rounds);
  ++stats_.kernel_calls;

  if (!verify_kernel_) {
    return;
  }
  for (size_t lane = 0; lane < kLaneCount; ++lane) {
    if (!lane_active(mask, lane) && states[lane] != before[lane]) {
      throw Error{ErrorCode::KernelFault,
                  std::format("kernel '{}' modified masked-off lane {}", kernel_.name(), lane)};
    }
  }
}

void LaneBatch::reset(Uid uid) {
  const size_t lane = slot_for(uid, policy_);
  auto& slot = slots_[lane];
  if (uid != kNoSession && slot.uid == uid) {
    if (slot.result.has_value()) {
      slot.result->set_exception(std::make_exception_ptr(
          Error{ErrorCode::Cancelled, std::format("session {} was reset before its digest", uid)}));
    }
    slot = LaneSlot{};
    if (--pending_ == 0) {
      oldest_.reset();
    }
  }
  states_.erase(uid);
  ++stats_.resets;
}

void LaneBatch::abandon(const Error& err) {
  for (auto& slot : slots_) {
    if (slot.occupied() && slot.result.has_value()) {
      slot.result->set_exception(std::make_exception_ptr(err));
    }
    slot = LaneSlot{};
  }
  states_.clear();
  pending_ = 0;
  oldest_.reset();
}

std::optional<State> LaneBatch::interim(Uid uid) const {
  if (auto it = states_.find(uid); it != states_.end()) {
    return it->second;
  }
  return std::nullopt;
}

SchedulerStats LaneBatch::stats() const {
  SchedulerStats out = stats_;
  out.live_states = states_.size();
  return out;
}

}  // namespace md5mux::sched

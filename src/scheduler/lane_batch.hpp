#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <optional>
#include <unordered_map>
#include <vector>

#include "md5mux/core/error.hpp"
#include "md5mux/core/types.hpp"
#include "md5mux/kernel/kernel.hpp"
#include "md5mux/scheduler/scheduler.hpp"

namespace md5mux::sched {

enum class FlushCause { Full, Collision, Timeout, Stop };

struct LaneSlot {
  Uid uid{kNoSession};
  std::vector<uint8_t> block{};
  std::optional<std::promise<Digest>> result{};

  bool occupied() const noexcept { return uid != kNoSession; }
};

// Lane slots plus the interim-state table. Owned by exactly one thread; none
// of the members synchronize.
class LaneBatch {
 public:
  using Clock = std::chrono::steady_clock;

  LaneBatch(IKernel& kernel, BatchMode mode, SlotPolicy policy, bool verify_kernel);

  LaneBatch(const LaneBatch&) = delete;
  LaneBatch& operator=(const LaneBatch&) = delete;

  // Places `block` in the uid's slot. An occupied slot is flushed first, and a
  // batch runs as soon as every lane holds a block. `result` is set for the
  // session's final block and receives its digest.
  void accept(Uid uid, std::vector<uint8_t> block, std::optional<std::promise<Digest>> result);

  // Runs one batch over the occupied slots. A kernel fault leaves the slots
  // and the state table untouched and propagates.
  void flush(FlushCause cause);

  // Drops uid's pending block and interim state. Idempotent.
  void reset(Uid uid);

  // Fails every pending finalize with `err` and forgets all sessions.
  void abandon(const Error& err);

  size_t pending() const noexcept { return pending_; }
  std::optional<Clock::time_point> oldest_pending() const noexcept { return oldest_; }
  std::optional<State> interim(Uid uid) const;
  size_t live_states() const noexcept { return states_.size(); }
  const LaneSlot& slot(size_t lane) const { return slots_[lane]; }

  SchedulerStats stats() const;

 private:
  LaneStates run_masked(LaneStates states, const std::array<size_t, kLaneCount>& lengths);
  LaneStates run_uniform(LaneStates states, const std::array<size_t, kLaneCount>& lengths);
  void invoke(LaneStates& states, const LaneInputs& inputs, LaneMask mask, size_t rounds);

  IKernel& kernel_;
  BatchMode mode_{BatchMode::Masked};
  SlotPolicy policy_{SlotPolicy::LowBits};
  bool verify_kernel_{true};

  std::array<LaneSlot, kLaneCount> slots_{};
  std::unordered_map<Uid, State> states_{};
  size_t pending_{0};
  std::optional<Clock::time_point> oldest_{};

  SchedulerStats stats_{};
};

}  // namespace md5mux::sched

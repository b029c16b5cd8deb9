#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "md5mux/core/types.hpp"
#include "md5mux/kernel/kernel.hpp"

namespace md5mux {

enum class BatchMode { Masked, Uniform };

// How a uid is reduced to a lane slot. LowBits keeps sequential uids on
// distinct slots; Mixed hashes the uid first for callers whose uids share low
// bits. Two live sessions that reduce to the same slot force early, partial
// batches, so at most kLaneCount sessions can hold an unflushed block at once.
enum class SlotPolicy { LowBits, Mixed };

struct SchedulerConfig {
  std::chrono::microseconds flush_timeout{20};
  uint32_t inbox_depth{64};
  BatchMode batching{BatchMode::Masked};
  KernelKind kernel{KernelKind::Lanes};
  SlotPolicy slot_policy{SlotPolicy::LowBits};
  bool verify_kernel{true};
};

struct SchedulerStats {
  uint64_t batches{};
  uint64_t flush_full{};
  uint64_t flush_collision{};
  uint64_t flush_timeout{};
  uint64_t flush_stop{};
  uint64_t kernel_calls{};
  uint64_t blocks{};
  uint64_t bytes{};
  uint64_t digests{};
  uint64_t resets{};
  uint64_t live_states{};
};

class ILaneScheduler {
 public:
  virtual ~ILaneScheduler() = default;

  virtual void start() = 0;

  // Hands `block` to the engine and returns once it is queued. The length must
  // be a positive multiple of 64.
  virtual void submit(Uid uid, std::vector<uint8_t> block) = 0;

  // Queues the session's last (already padded) block and waits for its digest.
  virtual Digest finalize(Uid uid, std::vector<uint8_t> block) = 0;

  // Drops any pending block and interim state for `uid`. Idempotent.
  virtual void reset(Uid uid) = 0;

  virtual void stop() = 0;

  virtual SchedulerStats stats() const = 0;
  virtual const SchedulerConfig& config() const noexcept = 0;
};

std::unique_ptr<ILaneScheduler> make_scheduler(const SchedulerConfig& cfg);

size_t slot_for(Uid uid, SlotPolicy policy) noexcept;

const char* batch_mode_name(BatchMode mode) noexcept;
const char* slot_policy_name(SlotPolicy policy) noexcept;

}  // namespace md5mux

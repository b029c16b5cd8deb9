#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "md5mux/core/types.hpp"
#include "md5mux/scheduler/scheduler.hpp"

namespace md5mux {

// Allocates a process-unique session id. The first id is kLaneCount, never 0.
Uid next_uid() noexcept;

// Streaming MD5 bound to a shared lane scheduler. Not thread-safe: one
// stream is driven by one thread at a time.
class Md5Stream {
 public:
  explicit Md5Stream(std::shared_ptr<ILaneScheduler> scheduler);
  ~Md5Stream();

  Md5Stream(const Md5Stream&) = delete;
  Md5Stream& operator=(const Md5Stream&) = delete;

  void write(std::span<const uint8_t> data);
  Digest sum();
  void reset();

  Uid uid() const noexcept { return uid_; }
  uint64_t written() const noexcept { return len_; }
  bool finalized() const noexcept { return final_; }

  static constexpr size_t size() noexcept { return kDigestSize; }
  static constexpr size_t block_size() noexcept { return kBlockSize; }

 private:
  std::shared_ptr<ILaneScheduler> scheduler_;
  Uid uid_{kNoSession};
  std::array<uint8_t, kBlockSize> buf_{};
  size_t nbuf_{0};
  uint64_t len_{0};
  bool submitted_{false};
  bool final_{false};
};

}  // namespace md5mux

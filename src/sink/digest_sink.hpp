#pragma once

#include <atomic>
#include <cstdint>

#include "md5mux/core/types.hpp"

namespace md5mux::app {

// Order-independent fingerprint over many session digests, so runs that hash
// the same payloads compare equal whatever the batching.
class DigestSink {
 public:
  explicit DigestSink(uint64_t seed);
  ~DigestSink() = default;

  DigestSink(const DigestSink&) = delete;
  DigestSink& operator=(const DigestSink&) = delete;

  void consume(uint64_t session, const Digest& digest);
  uint64_t fingerprint() const;
  uint64_t count() const;

 private:
  uint64_t seed_{0};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> xor_lane_{0};
  std::atomic<uint64_t> mix_lane_{0};
};

}  // namespace md5mux::app

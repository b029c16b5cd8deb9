#include "sink/digest_sink.hpp"

#include <array>

#if __has_include(<xxhash.h>)
#include <xxhash.h>
#else
#error "xxhash.h is required"
#endif

namespace md5mux::app {

DigestSink::DigestSink(uint64_t seed) : seed_(seed), mix_lane_(seed) {}

void DigestSink::consume(uint64_t session, const Digest& digest) {
  constexpr uint64_t kMixMul = 0x9e3779b97f4a7c15ULL;
  const uint64_t h = XXH64(digest.data(), digest.size(), seed_ ^ session);

  count_.fetch_add(1, std::memory_order_relaxed);
  xor_lane_.fetch_xor(h, std::memory_order_relaxed);
  mix_lane_.fetch_add(h * kMixMul, std::memory_order_relaxed);
}

uint64_t DigestSink::fingerprint() const {
  const std::array<uint64_t, 4> state{
      seed_,
      count_.load(std::memory_order_relaxed),
      xor_lane_.load(std::memory_order_relaxed),
      mix_lane_.load(std::memory_order_relaxed),
  };
  return XXH64(state.data(), sizeof(state), seed_ ^ 0x243f6a8885a308d3ULL);
}

uint64_t DigestSink::count() const { return count_.load(std::memory_order_relaxed); }

}  // namespace md5mux::app

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace md5mux::app {

// Deterministic per-session message bytes: the same (seed, session) pair
// always yields the same payload, and lengths need not be block aligned.
class PayloadGenerator {
 public:
  explicit PayloadGenerator(uint64_t seed);

  void generate(uint64_t session, std::vector<uint8_t>& out, size_t size) const;

  // Length for `session` in [base - base/4, base], so concurrent sessions end
  // in different batches.
  size_t jittered_size(uint64_t session, size_t base) const;

 private:
  uint64_t seed_;
};

}  // namespace md5mux::app

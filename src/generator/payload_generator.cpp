#include "generator/payload_generator.hpp"

#include <cstring>

#include "app/math_utils.hpp"

namespace md5mux::app {
namespace {

uint64_t session_state(uint64_t seed, uint64_t session) {
  uint64_t s = seed ^ (session * 0x9e3779b97f4a7c15ULL);
  return s == 0 ? 0x2545f4914f6cdd1dULL : s;
}

}  // namespace

PayloadGenerator::PayloadGenerator(uint64_t seed) : seed_(seed) {}

void PayloadGenerator::generate(uint64_t session, std::vector<uint8_t>& out, size_t size) const {
  out.resize(size);
  uint64_t s = session_state(seed_, session);

  size_t i = 0;
  for (; i + 8 <= size; i += 8) {
    const uint64_t v = xorshift64(s);
    std::memcpy(out.data() + i, &v, 8);
  }
  if (i < size) {
    uint64_t v = xorshift64(s);
    for (; i < size; ++i) {
      out[i] = static_cast<uint8_t>(v);
      v >>= 8;
    }
  }
}

size_t PayloadGenerator::jittered_size(uint64_t session, size_t base) const {
  if (base < 4) {
    return base;
  }
  uint64_t s = session_state(seed_ ^ 0x5bd1e995ULL, session);
  return base - static_cast<size_t>(xorshift64(s) % (base / 4 + 1));
}

}  // namespace md5mux::app

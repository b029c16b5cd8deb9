#include <cstdint>
#include <format>
#include <iostream>
#include <vector>

#include "generator/payload_generator.hpp"
#include "sink/digest_sink.hpp"

int main() {
  const md5mux::app::PayloadGenerator gen1(42);
  const md5mux::app::PayloadGenerator gen2(42);
  const md5mux::app::PayloadGenerator gen3(99);

  std::vector<uint8_t> a;
  std::vector<uint8_t> b;
  std::vector<uint8_t> c;
  std::vector<uint8_t> d;

  gen1.generate(7, a, 4099);
  gen2.generate(7, b, 4099);
  gen3.generate(7, c, 4099);
  gen1.generate(8, d, 4099);

  if (a.size() != 4099) {
    std::cerr << std::format("generated {} bytes, wanted 4099\n", a.size());
    return 1;
  }
  if (a != b) {
    std::cerr << std::format(
        "Determinism failed: same seed and session produced different output\n");
    return 1;
  }
  if (a == c || a == d) {
    std::cerr << std::format(
        "Diversity failed: different seed or session produced identical output\n");
    return 1;
  }

  for (uint64_t s = 0; s < 64; ++s) {
    const size_t n = gen1.jittered_size(s, 1000);
    if (n < 750 || n > 1000 || n != gen2.jittered_size(s, 1000)) {
      std::cerr << std::format("jittered_size({}, 1000) = {}\n", s, n);
      return 1;
    }
  }

  md5mux::Digest x{};
  md5mux::Digest y{};
  x[0] = 1;
  y[15] = 2;

  md5mux::app::DigestSink forward(5);
  md5mux::app::DigestSink backward(5);
  forward.consume(0, x);
  forward.consume(1, y);
  backward.consume(1, y);
  backward.consume(0, x);
  if (forward.fingerprint() != backward.fingerprint() || forward.count() != 2) {
    std::cerr << std::format("DigestSink depends on consume order\n");
    return 1;
  }

  md5mux::app::DigestSink swapped(5);
  swapped.consume(0, y);
  swapped.consume(1, x);
  if (swapped.fingerprint() == forward.fingerprint()) {
    std::cerr << std::format("DigestSink ignores which session produced a digest\n");
    return 1;
  }

  return 0;
}

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace md5mux::kernel {

inline constexpr std::array<uint32_t, 64> kRoundConstants{
    0xd76aa478, 0xe8c7b756, 0x242070db, 0xc1bdceee, 0xf57c0faf, 0x4787c62a, 0xa8304613, 0xfd469501,
    0x698098d8, 0x8b44f7af, 0xffff5bb1, 0x895cd7be, 0x6b901122, 0xfd987193, 0xa679438e, 0x49b40821,
    0xf61e2562, 0xc040b340, 0x265e5a51, 0xe9b6c7aa, 0xd62f105d, 0x02441453, 0xd8a1e681, 0xe7d3fbc8,
    0x21e1cde6, 0xc33707d6, 0xf4d50d87, 0x455a14ed, 0xa9e3e905, 0xfcefa3f8, 0x676f02d9, 0x8d2a4c8a,
    0xfffa3942, 0x8771f681, 0x6d9d6122, 0xfde5380c, 0xa4beea44, 0x4bdecfa9, 0xf6bb4b60, 0xbebfbc70,
    0x289b7ec6, 0xeaa127fa, 0xd4ef3085, 0x04881d05, 0xd9d4d039, 0xe6db99e5, 0x1fa27cf8, 0xc4ac5665,
    0xf4292244, 0x432aff97, 0xab9423a7, 0xfc93a039, 0x655b59c3, 0x8f0ccc92, 0xffeff47d, 0x85845dd1,
    0x6fa87e4f, 0xfe2ce6e0, 0xa3014314, 0x4e0811a1, 0xf7537e82, 0xbd3af235, 0x2ad7d2bb, 0xeb86d391,
};

inline constexpr std::array<int, 16> kShifts{
    7, 12, 17, 22, 5, 9, 14, 20, 4, 11, 16, 23, 6, 10, 15, 21,
};

inline constexpr uint32_t rotl(uint32_t v, int s) noexcept {
  return (v << s) | (v >> (32 - s));
}

inline constexpr uint32_t load_le32(const uint8_t* p) noexcept {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

// 64 MD5 steps over one 64-byte chunk. `W` is uint32_t for a single lane or a
// lane vector providing the bitwise operators, `+` and an overload of rotl().
template <class W>
inline void compress_chunk(W& a, W& b, W& c, W& d, const std::array<W, 16>& m) {
  const W aa = a;
  const W bb = b;
  const W cc = c;
  const W dd = d;

  for (size_t i = 0; i < 64; ++i) {
    W f;
    size_t g = 0;
    switch (i / 16) {
      case 0:
        f = (b & c) | (~b & d);
        g = i;
        break;
      case 1:
        f = (d & b) | (~d & c);
        g = (5 * i + 1) % 16;
        break;
      case 2:
        f = b ^ c ^ d;
        g = (3 * i + 5) % 16;
        break;
      default:
        f = c ^ (b | ~d);
        g = (7 * i) % 16;
        break;
    }
    f = f + a + W(kRoundConstants[i]) + m[g];
    a = d;
    d = c;
    c = b;
    b = b + rotl(f, kShifts[(i / 16) * 4 + (i % 4)]);
  }

  a = a + aa;
  b = b + bb;
  c = c + cc;
  d = d + dd;
}

}  // namespace md5mux::kernel

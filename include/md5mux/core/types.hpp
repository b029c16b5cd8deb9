#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace md5mux {

inline constexpr size_t kLaneCount = 8;
inline constexpr size_t kBlockSize = 64;
inline constexpr size_t kDigestSize = 16;

// Session handle; zero means "no session".
using Uid = uint64_t;
inline constexpr Uid kNoSession = 0;

// Running MD5 state (A, B, C, D).
using State = std::array<uint32_t, 4>;
inline constexpr State kInitialState{0x67452301u, 0xefcdab89u, 0x98badcfeu, 0x10325476u};

using Digest = std::array<uint8_t, kDigestSize>;

// Bit i selects lane i.
using LaneMask = uint32_t;
inline constexpr LaneMask kAllLanes = (LaneMask{1} << kLaneCount) - 1;

using LaneStates = std::array<State, kLaneCount>;
using LaneInput = std::span<const uint8_t>;
using LaneInputs = std::array<LaneInput, kLaneCount>;

struct MaskRounds {
  LaneMask mask{};
  size_t rounds{};

  friend bool operator==(const MaskRounds&, const MaskRounds&) = default;
};

inline constexpr bool is_block_multiple(size_t len) noexcept {
  return len % kBlockSize == 0;
}

}  // namespace md5mux

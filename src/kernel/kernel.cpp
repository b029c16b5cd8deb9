#include "md5mux/kernel/kernel.hpp"

#include <array>
#include <format>

#include "kernel/md5_rounds.hpp"
#include "md5mux/core/error.hpp"

namespace md5mux {
namespace {

using kernel::compress_chunk;
using kernel::load_le32;

// Eight 32-bit lanes advanced in lock-step. Written as plain loops over a
// fixed-size array so the compiler can map each operator onto one vector
// instruction.
struct LaneVec {
  std::array<uint32_t, kLaneCount> v{};

  LaneVec() = default;
  explicit LaneVec(uint32_t x) { v.fill(x); }

  friend LaneVec operator+(const LaneVec& x, const LaneVec& y) {
    LaneVec r;
    for (size_t i = 0; i < kLaneCount; ++i) {
      r.v[i] = x.v[i] + y.v[i];
    }
    return r;
  }
  friend LaneVec operator&(const LaneVec& x, const LaneVec& y) {
    LaneVec r;
    for (size_t i = 0; i < kLaneCount; ++i) {
      r.v[i] = x.v[i] & y.v[i];
    }
    return r;
  }
  friend LaneVec operator|(const LaneVec& x, const LaneVec& y) {
    LaneVec r;
    for (size_t i = 0; i < kLaneCount; ++i) {
      r.v[i] = x.v[i] | y.v[i];
    }
    return r;
  }
  friend LaneVec operator^(const LaneVec& x, const LaneVec& y) {
    LaneVec r;
    for (size_t i = 0; i < kLaneCount; ++i) {
      r.v[i] = x.v[i] ^ y.v[i];
    }
    return r;
  }
  friend LaneVec operator~(const LaneVec& x) {
    LaneVec r;
    for (size_t i = 0; i < kLaneCount; ++i) {
      r.v[i] = ~x.v[i];
    }
    return r;
  }
};

LaneVec rotl(const LaneVec& x, int s) {
  LaneVec r;
  for (size_t i = 0; i < kLaneCount; ++i) {
    r.v[i] = kernel::rotl(x.v[i], s);
  }
  return r;
}

bool lane_active(LaneMask mask, size_t lane) noexcept {
  return (mask >> lane) & 1u;
}

void check_contract(std::span<const LaneInput, kLaneCount> inputs, LaneMask mask, size_t rounds) {
  if (rounds == 0) {
    throw Error{ErrorCode::KernelFault, "kernel invoked with zero rounds"};
  }
  if (mask == 0 || (mask & ~kAllLanes) != 0) {
    throw Error{ErrorCode::KernelFault, std::format("invalid lane mask 0x{:x}", mask)};
  }
  const size_t need = rounds * kBlockSize;
  for (size_t lane = 0; lane < kLaneCount; ++lane) {
    if (lane_active(mask, lane) && inputs[lane].size() < need) {
      throw Error{ErrorCode::KernelFault,
                  std::format("lane {} holds {} bytes, {} rounds need {}", lane,
                              inputs[lane].size(), rounds, need)};
    }
  }
}

class LanesKernel final : public IKernel {
 public:
  KernelKind kind() const noexcept override { return KernelKind::Lanes; }
  const char* name() const noexcept override { return "lanes"; }

  void advance(LaneStates& states,
               std::span<const LaneInput, kLaneCount> inputs,
               LaneMask mask,
               size_t rounds) override {
    check_contract(inputs, mask, rounds);

    LaneVec a;
    LaneVec b;
    LaneVec c;
    LaneVec d;
    for (size_t lane = 0; lane < kLaneCount; ++lane) {
      a.v[lane] = states[lane][0];
      b.v[lane] = states[lane][1];
      c.v[lane] = states[lane][2];
      d.v[lane] = states[lane][3];
    }

    std::array<LaneVec, 16> m{};
    for (size_t r = 0; r < rounds; ++r) {
      const size_t offset = r * kBlockSize;
      for (size_t w = 0; w < 16; ++w) {
        for (size_t lane = 0; lane < kLaneCount; ++lane) {
          m[w].v[lane] = lane_active(mask, lane)
                             ? load_le32(inputs[lane].data() + offset + w * 4)
                             : 0u;
        }
      }
      compress_chunk(a, b, c, d, m);
    }

    for (size_t lane = 0; lane < kLaneCount; ++lane) {
      if (lane_active(mask, lane)) {
        states[lane] = State{a.v[lane], b.v[lane], c.v[lane], d.v[lane]};
      }
    }
  }
};

class ScalarKernel final : public IKernel {
 public:
  KernelKind kind() const noexcept override { return KernelKind::Scalar; }
  const char* name() const noexcept override { return "scalar"; }

  void advance(LaneStates& states,
               std::span<const LaneInput, kLaneCount> inputs,
               LaneMask mask,
               size_t rounds) override {
    check_contract(inputs, mask, rounds);

    for (size_t lane = 0; lane < kLaneCount; ++lane) {
      if (!lane_active(mask, lane)) {
        continue;
      }
      uint32_t a = states[lane][0];
      uint32_t b = states[lane][1];
      uint32_t c = states[lane][2];
      uint32_t d = states[lane][3];
      std::array<uint32_t, 16> m{};
      for (size_t r = 0; r < rounds; ++r) {
        const uint8_t* chunk = inputs[lane].data() + r * kBlockSize;
        for (size_t w = 0; w < 16; ++w) {
          m[w] = load_le32(chunk + w * 4);
        }
        compress_chunk(a, b, c, d, m);
      }
      states[lane] = State{a, b, c, d};
    }
  }
};

}  // namespace

std::unique_ptr<IKernel> make_kernel(KernelKind kind) {
  switch (kind) {
    case KernelKind::Lanes:
      return std::make_unique<LanesKernel>();
    case KernelKind::Scalar:
      return std::make_unique<ScalarKernel>();
  }
  throw Error{ErrorCode::InvalidArgument, "unknown kernel kind"};
}

const char* kernel_kind_name(KernelKind kind) noexcept {
  switch (kind) {
    case KernelKind::Lanes:
      return "lanes";
    case KernelKind::Scalar:
      return "scalar";
  }
  return "unknown";
}

}  // namespace md5mux

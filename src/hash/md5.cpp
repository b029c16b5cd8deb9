#include "md5mux/hash/md5.hpp"

#include <array>
#include <format>

#include "md5mux/core/error.hpp"
#include "md5mux/kernel/kernel.hpp"

namespace md5mux {

std::vector<uint8_t> pad_final_block(std::span<const uint8_t> tail, uint64_t total_len) {
  if (tail.size() >= kBlockSize) {
    throw Error{ErrorCode::InvalidArgument,
                std::format("padding tail of {} bytes exceeds one block", tail.size())};
  }

  const size_t rem = static_cast<size_t>(total_len % kBlockSize);
  const size_t pad = rem < 56 ? 56 - rem : kBlockSize + 56 - rem;

  std::vector<uint8_t> out;
  out.reserve(tail.size() + pad + 8);
  out.insert(out.end(), tail.begin(), tail.end());
  out.push_back(0x80);
  out.insert(out.end(), pad - 1, 0);

  const uint64_t bits = total_len << 3;
  for (size_t i = 0; i < 8; ++i) {
    out.push_back(static_cast<uint8_t>(bits >> (8 * i)));
  }

  if (!is_block_multiple(out.size())) {
    throw Error{ErrorCode::InvalidArgument,
                std::format("tail of {} bytes does not match message length {}", tail.size(),
                            total_len)};
  }
  return out;
}

Digest encode_digest(const State& state) noexcept {
  Digest out{};
  for (size_t w = 0; w < state.size(); ++w) {
    for (size_t i = 0; i < 4; ++i) {
      out[w * 4 + i] = static_cast<uint8_t>(state[w] >> (8 * i));
    }
  }
  return out;
}

State decode_digest(const Digest& digest) noexcept {
  State out{};
  for (size_t w = 0; w < out.size(); ++w) {
    for (size_t i = 0; i < 4; ++i) {
      out[w] |= static_cast<uint32_t>(digest[w * 4 + i]) << (8 * i);
    }
  }
  return out;
}

std::string to_hex(const Digest& digest) {
  std::string out;
  out.reserve(digest.size() * 2);
  for (const uint8_t b : digest) {
    out += std::format("{:02x}", b);
  }
  return out;
}

Digest md5_reference(std::span<const uint8_t> data) {
  const size_t whole = data.size() - data.size() % kBlockSize;
  const auto tail = pad_final_block(data.subspan(whole), data.size());

  auto kernel = make_kernel(KernelKind::Scalar);
  LaneStates states{};
  states[0] = kInitialState;

  LaneInputs inputs{};
  if (whole > 0) {
    inputs[0] = data.first(whole);
    kernel->advance(states, inputs, 1u, whole / kBlockSize);
  }
  inputs[0] = tail;
  kernel->advance(states, inputs, 1u, tail.size() / kBlockSize);
  return encode_digest(states[0]);
}

}  // namespace md5mux

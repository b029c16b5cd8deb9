#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "md5mux/core/types.hpp"

namespace md5mux {

// Standard MD5 padding for the last partial block: `tail` is what remains
// after the last whole block (under 64 bytes) and `total_len` is the length of
// the whole message in bytes. The result is 64 or 128 bytes long.
std::vector<uint8_t> pad_final_block(std::span<const uint8_t> tail, uint64_t total_len);

Digest encode_digest(const State& state) noexcept;
State decode_digest(const Digest& digest) noexcept;

std::string to_hex(const Digest& digest);

// One-shot MD5 with the scalar kernel, independent of the scheduler.
Digest md5_reference(std::span<const uint8_t> data);

}  // namespace md5mux

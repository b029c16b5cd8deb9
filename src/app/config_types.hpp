#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "md5mux/scheduler/scheduler.hpp"

namespace md5mux::app {

enum class Command { Sum, Bench };

struct Config {
  Command command{Command::Sum};
  SchedulerConfig engine{};

  // sum
  std::vector<std::filesystem::path> files;
  uint32_t jobs{static_cast<uint32_t>(kLaneCount)};
  size_t read_size{64 * 1024};
  bool verify{false};

  // bench
  uint32_t sessions{static_cast<uint32_t>(kLaneCount)};
  size_t payload_size{4ULL * 1024ULL * 1024ULL};
  size_t chunk_size{64 * 1024};
  uint32_t repeats{3};
  uint64_t seed{1};
  std::optional<std::filesystem::path> json_output;
};

struct Stats {
  double mean{0.0};
  double median{0.0};
  double p95{0.0};
  double min{0.0};
  double max{0.0};
};

struct FileDigest {
  std::filesystem::path path;
  Digest digest{};
  std::optional<std::string> error;
};

struct BenchResult {
  uint32_t repeat{0};
  double wall_sec{0.0};
  uint64_t bytes{0};
  uint64_t fingerprint{0};
  SchedulerStats engine{};
};

}  // namespace md5mux::app

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

#include "app/config_types.hpp"
#include "md5mux/core/expected.hpp"
#include "md5mux/scheduler/scheduler.hpp"

int run_cli_impl(int argc, char** argv);

namespace md5mux::app {

md5mux::Expected<Config> parse_args(int argc, char** argv);

// Hashes every file through `engine`, at most `jobs` files at a time. Results
// keep the order of `files`; per-file failures are reported in FileDigest.
std::vector<FileDigest> hash_files(const std::shared_ptr<ILaneScheduler>& engine,
                                   std::span<const std::filesystem::path> files,
                                   uint32_t jobs,
                                   size_t read_size);

md5mux::Expected<BenchResult> run_bench_repeat(const Config& cfg, uint32_t repeat);

}  // namespace md5mux::app

#include "app/cli_runner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>

#include "app/math_utils.hpp"
#include "generator/payload_generator.hpp"
#include "md5mux/core/error.hpp"
#include "md5mux/hash/md5.hpp"
#include "md5mux/hash/md5_stream.hpp"
#include "sink/digest_sink.hpp"

namespace {

using Clock = std::chrono::steady_clock;

using AppError = md5mux::Error;

template <typename T>
using Result = md5mux::Expected<T>;

using md5mux::BatchMode;
using md5mux::ErrorCode;
using md5mux::ILaneScheduler;
using md5mux::KernelKind;
using md5mux::SchedulerConfig;
using md5mux::SlotPolicy;
using md5mux::app::BenchResult;
using md5mux::app::Command;
using md5mux::app::Config;
using md5mux::app::FileDigest;
using md5mux::app::Stats;
using md5mux::app::calc_stats;
using md5mux::app::to_gbps;

Result<KernelKind> parse_kernel(const std::string& s) {
  if (s == "lanes") {
    return KernelKind::Lanes;
  }
  if (s == "scalar") {
    return KernelKind::Scalar;
  }
  return std::unexpected(AppError{ErrorCode::InvalidArgument, "invalid --kernel"});
}

Result<BatchMode> parse_batching(const std::string& s) {
  if (s == "masked") {
    return BatchMode::Masked;
  }
  if (s == "uniform") {
    return BatchMode::Uniform;
  }
  return std::unexpected(AppError{ErrorCode::InvalidArgument, "invalid --batching"});
}

Result<SlotPolicy> parse_slot_policy(const std::string& s) {
  if (s == "low-bits") {
    return SlotPolicy::LowBits;
  }
  if (s == "mixed") {
    return SlotPolicy::Mixed;
  }
  return std::unexpected(AppError{ErrorCode::InvalidArgument, "invalid --slot-policy"});
}

void add_engine_args(argparse::ArgumentParser& p) {
  const SchedulerConfig defaults{};
  p.add_argument("--kernel")
      .help("compression kernel: lanes|scalar")
      .default_value(std::string("lanes"));
  p.add_argument("--batching")
      .help("batch execution: masked|uniform")
      .default_value(std::string("masked"));
  p.add_argument("--slot-policy")
      .help("uid to lane reduction: low-bits|mixed")
      .default_value(std::string("low-bits"));
  p.add_argument("--flush-timeout-us")
      .help("flush a partial batch after this many microseconds")
      .scan<'u', uint32_t>()
      .default_value(static_cast<uint32_t>(defaults.flush_timeout.count()));
  p.add_argument("--inbox-depth")
      .help("bounded scheduler inbox depth")
      .scan<'u', uint32_t>()
      .default_value(defaults.inbox_depth);
  p.add_argument("--no-kernel-check")
      .help("skip the masked-lane check after each kernel call")
      .default_value(false)
      .implicit_value(true);
}

Result<SchedulerConfig> read_engine_args(const argparse::ArgumentParser& p) {
  SchedulerConfig engine{};

  auto kernel = parse_kernel(p.get<std::string>("--kernel"));
  if (!kernel) {
    return std::unexpected(kernel.error());
  }
  engine.kernel = *kernel;

  auto batching = parse_batching(p.get<std::string>("--batching"));
  if (!batching) {
    return std::unexpected(batching.error());
  }
  engine.batching = *batching;

  auto policy = parse_slot_policy(p.get<std::string>("--slot-policy"));
  if (!policy) {
    return std::unexpected(policy.error());
  }
  engine.slot_policy = *policy;

  engine.flush_timeout = std::chrono::microseconds(p.get<uint32_t>("--flush-timeout-us"));
  engine.inbox_depth = p.get<uint32_t>("--inbox-depth");
  engine.verify_kernel = !p.get<bool>("--no-kernel-check");

  if (engine.flush_timeout.count() == 0 || engine.inbox_depth == 0) {
    return std::unexpected(
        AppError{ErrorCode::InvalidArgument, "--flush-timeout-us and --inbox-depth must be > 0"});
  }
  return engine;
}

Result<std::shared_ptr<ILaneScheduler>> start_engine(const SchedulerConfig& cfg) {
  try {
    std::shared_ptr<ILaneScheduler> engine = md5mux::make_scheduler(cfg);
    engine->start();
    return engine;
  } catch (const AppError& e) {
    return std::unexpected(e);
  }
}

Result<md5mux::Digest> hash_file(const std::shared_ptr<ILaneScheduler>& engine,
                                 const std::filesystem::path& path,
                                 size_t read_size) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::unexpected(
        AppError{ErrorCode::IoError, std::format("failed to open {}", path.string())});
  }

  std::vector<uint8_t> buf(std::max<size_t>(read_size, 1));
  try {
    md5mux::Md5Stream stream(engine);
    for (;;) {
      in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
      const auto n = static_cast<size_t>(in.gcount());
      if (n > 0) {
        stream.write(std::span<const uint8_t>(buf.data(), n));
      }
      if (!in) {
        if (in.eof()) {
          break;
        }
        return std::unexpected(
            AppError{ErrorCode::IoError, std::format("failed to read {}", path.string())});
      }
    }
    return stream.sum();
  } catch (const AppError& e) {
    return std::unexpected(e);
  }
}

Result<std::vector<uint8_t>> read_whole_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::unexpected(
        AppError{ErrorCode::IoError, std::format("failed to open {}", path.string())});
  }
  std::vector<uint8_t> out((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return std::unexpected(
        AppError{ErrorCode::IoError, std::format("failed to read {}", path.string())});
  }
  return out;
}

Result<int> run_sum(const Config& cfg) {
  auto engine = start_engine(cfg.engine);
  if (!engine) {
    return std::unexpected(engine.error());
  }

  auto results = md5mux::app::hash_files(*engine, cfg.files, cfg.jobs, cfg.read_size);
  (*engine)->stop();

  int rc = 0;
  for (auto& r : results) {
    if (!r.error.has_value() && cfg.verify) {
      auto data = read_whole_file(r.path);
      if (!data) {
        r.error = data.error().what();
      } else if (md5mux::md5_reference(*data) != r.digest) {
        r.error = "digest does not match the reference MD5";
      }
    }

    if (r.error.has_value()) {
      std::cerr << std::format("md5mux: {}: {}\n", r.path.string(), *r.error);
      rc = 1;
      continue;
    }
    std::cout << md5mux::to_hex(r.digest) << "  " << r.path.string() << "\n";
  }
  return rc;
}

void print_repeat(const BenchResult& r) {
  const auto& e = r.engine;
  std::cout << "repeat=" << r.repeat << " wall_sec=" << std::fixed << std::setprecision(3)
            << r.wall_sec << " eff_GBps=" << to_gbps(r.bytes, r.wall_sec)
            << " batches=" << e.batches << " kernel_calls=" << e.kernel_calls
            << " flush(full/collision/timeout/stop)=" << e.flush_full << "/" << e.flush_collision
            << "/" << e.flush_timeout << "/" << e.flush_stop << " fingerprint=0x" << std::hex
            << r.fingerprint << std::dec << "\n";
}

Stats throughput_stats(const std::vector<BenchResult>& repeats) {
  std::vector<double> eff;
  eff.reserve(repeats.size());
  for (const auto& r : repeats) {
    eff.push_back(to_gbps(r.bytes, r.wall_sec));
  }
  return calc_stats(std::move(eff));
}

std::string stats_json(const Stats& s) {
  return std::format(R"({{"mean": {:.6f}, "median": {:.6f}, "p95": {:.6f}, "min": {:.6f}, "max": {:.6f}}})",
                     s.mean, s.median, s.p95, s.min, s.max);
}

Result<void> write_json_summary(const Config& cfg, const std::vector<BenchResult>& repeats) {
  if (!cfg.json_output.has_value()) {
    return {};
  }
  std::ofstream out(*cfg.json_output, std::ios::trunc);
  if (!out.is_open()) {
    return std::unexpected(AppError{ErrorCode::IoError, "failed to open JSON output path"});
  }

  uint64_t batches = 0;
  uint64_t kernel_calls = 0;
  for (const auto& r : repeats) {
    batches += r.engine.batches;
    kernel_calls += r.engine.kernel_calls;
  }

  out << "{\n";
  out << "  \"config\": {\"kernel\": \"" << md5mux::kernel_kind_name(cfg.engine.kernel)
      << "\", \"batching\": \"" << md5mux::batch_mode_name(cfg.engine.batching)
      << "\", \"slot_policy\": \"" << md5mux::slot_policy_name(cfg.engine.slot_policy)
      << "\", \"flush_timeout_us\": " << cfg.engine.flush_timeout.count()
      << ", \"sessions\": " << cfg.sessions << ", \"payload_size\": " << cfg.payload_size
      << ", \"chunk_size\": " << cfg.chunk_size << ", \"repeats\": " << cfg.repeats << "},\n";
  out << "  \"metrics\": {\n";
  out << "    \"eff_GBps\": " << stats_json(throughput_stats(repeats)) << ",\n";
  out << "    \"batches\": " << batches << ",\n";
  out << "    \"kernel_calls\": " << kernel_calls << "\n";
  out << "  }\n";
  out << "}\n";

  return {};
}

Result<int> run_bench(const Config& cfg) {
  std::vector<BenchResult> repeats;
  repeats.reserve(cfg.repeats);

  for (uint32_t r = 0; r < cfg.repeats; ++r) {
    auto result = md5mux::app::run_bench_repeat(cfg, r);
    if (!result) {
      return std::unexpected(result.error());
    }
    print_repeat(*result);
    if (!repeats.empty() && repeats.front().fingerprint != result->fingerprint) {
      return std::unexpected(
          AppError{ErrorCode::Internal, "digest fingerprint changed between repeats"});
    }
    repeats.push_back(*result);
  }

  const auto eff = throughput_stats(repeats);
  std::cout << "\n=== Summary (mean/median/p95/min/max) ===\n";
  std::cout << "eff_GBps: " << eff.mean << " / " << eff.median << " / " << eff.p95 << " / "
            << eff.min << " / " << eff.max << "\n";

  auto json = write_json_summary(cfg, repeats);
  if (!json) {
    return std::unexpected(json.error());
  }
  return 0;
}

}  // namespace

namespace md5mux::app {

md5mux::Expected<Config> parse_args(int argc, char** argv) {
  Config cfg{};

  argparse::ArgumentParser program("md5mux");
  program.add_description("MD5 over many concurrent streams, batched onto 8 compression lanes.");

  argparse::ArgumentParser sum_cmd("sum");
  sum_cmd.add_description("print MD5 digests of files, hashing them concurrently");
  sum_cmd.add_argument("files").nargs(argparse::nargs_pattern::at_least_one);
  sum_cmd.add_argument("--jobs")
      .help("files hashed at the same time")
      .scan<'u', uint32_t>()
      .default_value(cfg.jobs);
  sum_cmd.add_argument("--read-size")
      .help("bytes read from a file per write")
      .scan<'u', size_t>()
      .default_value(cfg.read_size);
  sum_cmd.add_argument("--verify")
      .help("recompute every digest with the reference MD5")
      .default_value(false)
      .implicit_value(true);
  add_engine_args(sum_cmd);

  argparse::ArgumentParser bench_cmd("bench");
  bench_cmd.add_description("hash generated payloads from concurrent sessions and report throughput");
  bench_cmd.add_argument("--sessions").scan<'u', uint32_t>().default_value(cfg.sessions);
  bench_cmd.add_argument("--size").scan<'u', size_t>().default_value(cfg.payload_size);
  bench_cmd.add_argument("--chunk").scan<'u', size_t>().default_value(cfg.chunk_size);
  bench_cmd.add_argument("--repeats").scan<'u', uint32_t>().default_value(cfg.repeats);
  bench_cmd.add_argument("--seed").scan<'u', uint64_t>().default_value(cfg.seed);
  bench_cmd.add_argument("--json").default_value(std::string(""));
  bench_cmd.add_argument("--verify").default_value(false).implicit_value(true);
  add_engine_args(bench_cmd);

  program.add_subparser(sum_cmd);
  program.add_subparser(bench_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return std::unexpected(AppError{ErrorCode::InvalidArgument, "argument parsing failed"});
  }

  const argparse::ArgumentParser* cmd = nullptr;
  if (program.is_subcommand_used(sum_cmd)) {
    cfg.command = Command::Sum;
    cmd = &sum_cmd;
    for (const auto& f : sum_cmd.get<std::vector<std::string>>("files")) {
      cfg.files.emplace_back(f);
    }
    cfg.jobs = std::max(1u, sum_cmd.get<uint32_t>("--jobs"));
    cfg.read_size = sum_cmd.get<size_t>("--read-size");
    cfg.verify = sum_cmd.get<bool>("--verify");
  } else if (program.is_subcommand_used(bench_cmd)) {
    cfg.command = Command::Bench;
    cmd = &bench_cmd;
    cfg.sessions = bench_cmd.get<uint32_t>("--sessions");
    cfg.payload_size = bench_cmd.get<size_t>("--size");
    cfg.chunk_size = bench_cmd.get<size_t>("--chunk");
    cfg.repeats = bench_cmd.get<uint32_t>("--repeats");
    cfg.seed = bench_cmd.get<uint64_t>("--seed");
    cfg.verify = bench_cmd.get<bool>("--verify");
    const auto json = bench_cmd.get<std::string>("--json");
    if (!json.empty()) {
      cfg.json_output = std::filesystem::path(json);
    }
  } else {
    std::cerr << program;
    return std::unexpected(AppError{ErrorCode::InvalidArgument, "missing command (sum|bench)"});
  }

  auto engine = read_engine_args(*cmd);
  if (!engine) {
    return std::unexpected(engine.error());
  }
  cfg.engine = *engine;

  if (cfg.read_size == 0 || cfg.chunk_size == 0 || cfg.sessions == 0 || cfg.repeats == 0) {
    return std::unexpected(AppError{ErrorCode::InvalidArgument, "invalid zero-valued options"});
  }
  return cfg;
}

std::vector<FileDigest> hash_files(const std::shared_ptr<ILaneScheduler>& engine,
                                   std::span<const std::filesystem::path> files,
                                   uint32_t jobs,
                                   size_t read_size) {
  std::vector<FileDigest> results(files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    results[i].path = files[i];
  }

  std::atomic<size_t> next_index{0};
  const auto workers_needed = std::min<size_t>(std::max(1u, jobs), files.size());

  std::vector<std::thread> workers;
  workers.reserve(workers_needed);
  for (size_t w = 0; w < workers_needed; ++w) {
    workers.emplace_back([&]() {
      for (;;) {
        const size_t i = next_index.fetch_add(1, std::memory_order_relaxed);
        if (i >= files.size()) {
          break;
        }
        auto digest = hash_file(engine, files[i], read_size);
        if (digest) {
          results[i].digest = *digest;
        } else {
          results[i].error = digest.error().what();
        }
      }
    });
  }
  for (auto& t : workers) {
    t.join();
  }
  return results;
}

md5mux::Expected<BenchResult> run_bench_repeat(const Config& cfg, uint32_t repeat) {
  auto engine = start_engine(cfg.engine);
  if (!engine) {
    return std::unexpected(engine.error());
  }

  const PayloadGenerator generator(cfg.seed);
  std::vector<std::vector<uint8_t>> payloads(cfg.sessions);
  uint64_t total_bytes = 0;
  for (uint32_t s = 0; s < cfg.sessions; ++s) {
    generator.generate(s, payloads[s], generator.jittered_size(s, cfg.payload_size));
    total_bytes += payloads[s].size();
  }

  DigestSink sink(cfg.seed);
  std::vector<md5mux::Digest> digests(cfg.sessions);
  std::atomic<bool> failed{false};
  std::optional<AppError> error;
  std::mutex err_mu;

  auto set_error = [&](AppError e) {
    std::scoped_lock lock(err_mu);
    if (!error.has_value()) {
      error = std::move(e);
      failed.store(true, std::memory_order_release);
    }
  };

  const auto t0 = Clock::now();
  std::vector<std::thread> sessions;
  sessions.reserve(cfg.sessions);
  for (uint32_t s = 0; s < cfg.sessions; ++s) {
    sessions.emplace_back([&, s]() {
      try {
        md5mux::Md5Stream stream(*engine);
        std::span<const uint8_t> rest(payloads[s]);
        while (!rest.empty() && !failed.load(std::memory_order_acquire)) {
          const size_t n = std::min(cfg.chunk_size, rest.size());
          stream.write(rest.first(n));
          rest = rest.subspan(n);
        }
        if (failed.load(std::memory_order_acquire)) {
          return;
        }
        digests[s] = stream.sum();
        sink.consume(s, digests[s]);
      } catch (const AppError& e) {
        set_error(e);
      }
    });
  }
  for (auto& t : sessions) {
    t.join();
  }
  const double wall_sec = std::chrono::duration<double>(Clock::now() - t0).count();

  (*engine)->stop();
  if (error.has_value()) {
    return std::unexpected(*error);
  }

  if (cfg.verify) {
    for (uint32_t s = 0; s < cfg.sessions; ++s) {
      if (md5mux::md5_reference(payloads[s]) != digests[s]) {
        return std::unexpected(AppError{
            ErrorCode::Internal, std::format("session {} digest differs from reference MD5", s)});
      }
    }
  }

  BenchResult out{};
  out.repeat = repeat;
  out.wall_sec = wall_sec;
  out.bytes = total_bytes;
  out.fingerprint = sink.fingerprint();
  out.engine = (*engine)->stats();
  return out;
}

}  // namespace md5mux::app

int run_cli_impl(int argc, char** argv) {
  auto cfg = md5mux::app::parse_args(argc, argv);
  if (!cfg) {
    std::cerr << "error: " << cfg.error().what() << "\n";
    return 2;
  }

  auto run = cfg->command == Command::Sum ? run_sum(*cfg) : run_bench(*cfg);
  if (!run) {
    std::cerr << "run error: " << run.error().what() << "\n";
    return 1;
  }
  return *run;
}

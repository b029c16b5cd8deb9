#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iostream>
#include <latch>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "md5mux/core/error.hpp"
#include "md5mux/hash/md5.hpp"
#include "md5mux/scheduler/scheduler.hpp"

namespace {

std::vector<uint8_t> padded(std::string_view text) {
  const auto* p = reinterpret_cast<const uint8_t *>(text.data());
  const size_t whole = text.size() - text.size() % md5mux::kBlockSize;
  return md5mux::pad_final_block(std::span<const uint8_t>(p + whole, text.size() - whole),
                                 text.size());
}

std::vector<uint8_t> message_bytes(size_t len, uint8_t salt) {
  std::vector<uint8_t> out(len);
  for (size_t i = 0; i < len; ++i) {
    out[i] = static_cast<uint8_t>((i * 31) ^ salt);
  }
  return out;
}

// Hashes `msg` through the engine block by block.
md5mux::Digest hash_through(md5mux::ILaneScheduler &sched, md5mux::Uid uid,
                            const std::vector<uint8_t> &msg) {
  const size_t whole = msg.size() - msg.size() % md5mux::kBlockSize;
  for (size_t off = 0; off < whole; off += md5mux::kBlockSize) {
    sched.submit(uid, std::vector<uint8_t>(msg.begin() + off,
                                           msg.begin() + off + md5mux::kBlockSize));
  }
  auto last = md5mux::pad_final_block(std::span<const uint8_t>(msg).subspan(whole), msg.size());
  return sched.finalize(uid, std::move(last));
}

bool test_invalid_factory_args() {
  md5mux::SchedulerConfig bad_inbox{};
  bad_inbox.inbox_depth = 0;

  bool bad_inbox_rejected = false;
  try {
    static_cast<void>(md5mux::make_scheduler(bad_inbox));
  } catch (const md5mux::Error &e) {
    bad_inbox_rejected = (e.code() == md5mux::ErrorCode::InvalidArgument);
  }
  if (!bad_inbox_rejected) {
    std::cerr << std::format("expected invalid argument for inbox_depth=0\n");
    return false;
  }

  md5mux::SchedulerConfig bad_timeout{};
  bad_timeout.flush_timeout = std::chrono::microseconds{0};

  bool bad_timeout_rejected = false;
  try {
    static_cast<void>(md5mux::make_scheduler(bad_timeout));
  } catch (const md5mux::Error &e) {
    bad_timeout_rejected = (e.code() == md5mux::ErrorCode::InvalidArgument);
  }
  if (!bad_timeout_rejected) {
    std::cerr << std::format("expected invalid argument for flush_timeout=0\n");
    return false;
  }
  return true;
}

bool test_scheduler_lifecycle() {
  auto sched = md5mux::make_scheduler(md5mux::SchedulerConfig{});

  bool submit_before_start_failed = false;
  try {
    sched->submit(8, std::vector<uint8_t>(md5mux::kBlockSize, 0));
  } catch (const md5mux::Error &e) {
    submit_before_start_failed = (e.code() == md5mux::ErrorCode::InvalidArgument);
  }
  if (!submit_before_start_failed) {
    std::cerr << std::format("submit before start should fail\n");
    return false;
  }

  sched->start();
  const auto digest = md5mux::to_hex(sched->finalize(8, padded("abc")));
  if (digest != "900150983cd24fb0d6963f7d28e17f72") {
    std::cerr << std::format("md5(\"abc\") = {}\n", digest);
    return false;
  }

  bool rejected_block = false;
  try {
    sched->submit(9, std::vector<uint8_t>(10, 0));
  } catch (const md5mux::Error &e) {
    rejected_block = (e.code() == md5mux::ErrorCode::InvalidArgument);
  }
  if (!rejected_block) {
    std::cerr << std::format("a 10-byte block should be rejected\n");
    return false;
  }

  sched->stop();

  bool submit_after_stop_failed = false;
  try {
    sched->submit(8, std::vector<uint8_t>(md5mux::kBlockSize, 0));
  } catch (const md5mux::Error &e) {
    submit_after_stop_failed = (e.code() == md5mux::ErrorCode::EngineStopped);
  }
  if (!submit_after_stop_failed) {
    std::cerr << std::format("submit after stop should report a stopped engine\n");
    return false;
  }

  // reset after stop is a no-op, stop is idempotent.
  sched->reset(8);
  sched->stop();
  return true;
}

bool test_full_batch_of_concurrent_sessions() {
  md5mux::SchedulerConfig cfg{};
  cfg.flush_timeout = std::chrono::milliseconds{500};
  auto sched = md5mux::make_scheduler(cfg);
  sched->start();

  std::vector<std::string> digests(md5mux::kLaneCount);
  std::latch go(md5mux::kLaneCount);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < md5mux::kLaneCount; ++i) {
    threads.emplace_back([&, i]() {
      go.arrive_and_wait();
      try {
        digests[i] = md5mux::to_hex(sched->finalize(16 + i, padded("")));
      } catch (const md5mux::Error &e) {
        digests[i] = e.what();
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  sched->stop();

  for (size_t i = 0; i < digests.size(); ++i) {
    if (digests[i] != "d41d8cd98f00b204e9800998ecf8427e") {
      std::cerr << std::format("session {}: {}\n", i, digests[i]);
      return false;
    }
  }
  const auto st = sched->stats();
  if (st.batches != 1 || st.flush_full != 1 || st.digests != md5mux::kLaneCount) {
    std::cerr << std::format("expected one full batch, got batches={} full={} digests={}\n",
                             st.batches, st.flush_full, st.digests);
    return false;
  }
  return true;
}

bool test_lone_session_flushes_on_timeout() {
  md5mux::SchedulerConfig cfg{};
  cfg.flush_timeout = std::chrono::milliseconds{1};
  auto sched = md5mux::make_scheduler(cfg);
  sched->start();

  const auto msg = message_bytes(1000, 5);
  const auto got = hash_through(*sched, 8, msg);
  sched->stop();

  if (got != md5mux::md5_reference(msg)) {
    std::cerr << std::format("lone session digest {}\n", md5mux::to_hex(got));
    return false;
  }
  const auto st = sched->stats();
  if (st.flush_timeout == 0 || st.live_states != 0) {
    std::cerr << std::format("expected timeout flushes and no live state, got timeout={} live={}\n",
                             st.flush_timeout, st.live_states);
    return false;
  }
  return true;
}

// Sessions sharing batches must produce the same digests as sessions hashed
// alone, for every kernel and batching mode.
bool test_batches_keep_sessions_independent() {
  const std::vector<size_t> lengths{0, 1, 55, 56, 63, 64, 65, 127, 128, 500, 4096, 10000};
  std::vector<std::vector<uint8_t>> messages;
  for (size_t i = 0; i < lengths.size(); ++i) {
    messages.push_back(message_bytes(lengths[i], static_cast<uint8_t>(i)));
  }

  for (const auto kernel : {md5mux::KernelKind::Lanes, md5mux::KernelKind::Scalar}) {
    for (const auto mode : {md5mux::BatchMode::Masked, md5mux::BatchMode::Uniform}) {
      for (const auto policy : {md5mux::SlotPolicy::LowBits, md5mux::SlotPolicy::Mixed}) {
        md5mux::SchedulerConfig cfg{};
        cfg.kernel = kernel;
        cfg.batching = mode;
        cfg.slot_policy = policy;
        cfg.flush_timeout = std::chrono::microseconds{200};
        auto sched = md5mux::make_scheduler(cfg);
        sched->start();

        std::vector<md5mux::Digest> got(messages.size());
        std::vector<std::thread> threads;
        for (size_t i = 0; i < messages.size(); ++i) {
          threads.emplace_back([&, i]() {
            got[i] = hash_through(*sched, 100 + i, messages[i]);
          });
        }
        for (auto &t : threads) {
          t.join();
        }
        sched->stop();

        for (size_t i = 0; i < messages.size(); ++i) {
          if (got[i] != md5mux::md5_reference(messages[i])) {
            std::cerr << std::format("kernel={} batching={} slots={} length={}: {}\n",
                                     md5mux::kernel_kind_name(kernel),
                                     md5mux::batch_mode_name(mode),
                                     md5mux::slot_policy_name(policy), lengths[i],
                                     md5mux::to_hex(got[i]));
            return false;
          }
        }
      }
    }
  }
  return true;
}

bool test_reset_is_idempotent() {
  md5mux::SchedulerConfig cfg{};
  cfg.flush_timeout = std::chrono::microseconds{100};
  auto sched = md5mux::make_scheduler(cfg);
  sched->start();

  sched->reset(4242);
  sched->submit(9, std::vector<uint8_t>(md5mux::kBlockSize * 3, 0x5a));
  sched->reset(9);
  sched->reset(9);

  // A reset uid starts again from the initial state.
  const auto digest = md5mux::to_hex(sched->finalize(9, padded("abc")));
  sched->stop();
  if (digest != "900150983cd24fb0d6963f7d28e17f72") {
    std::cerr << std::format("session reused after reset gave {}\n", digest);
    return false;
  }
  const auto st = sched->stats();
  if (st.resets != 3 || st.live_states != 0) {
    std::cerr << std::format("expected 3 resets and no live state, got resets={} live={}\n",
                             st.resets, st.live_states);
    return false;
  }
  return true;
}

bool test_stop_flushes_pending_blocks() {
  md5mux::SchedulerConfig cfg{};
  cfg.flush_timeout = std::chrono::seconds{10};
  auto sched = md5mux::make_scheduler(cfg);
  sched->start();

  sched->submit(8, std::vector<uint8_t>(md5mux::kBlockSize, 1));
  sched->submit(9, std::vector<uint8_t>(md5mux::kBlockSize, 2));
  sched->stop();

  const auto st = sched->stats();
  if (st.flush_stop != 1 || st.blocks != 2 || st.live_states != 2) {
    std::cerr << std::format("stop should flush pending blocks: stop={} blocks={} live={}\n",
                             st.flush_stop, st.blocks, st.live_states);
    return false;
  }
  return true;
}

} // namespace

int main() {
  if (!test_invalid_factory_args()) {
    return 1;
  }
  if (!test_scheduler_lifecycle()) {
    return 1;
  }
  if (!test_full_batch_of_concurrent_sessions()) {
    return 1;
  }
  if (!test_lone_session_flushes_on_timeout()) {
    return 1;
  }
  if (!test_batches_keep_sessions_independent()) {
    return 1;
  }
  if (!test_reset_is_idempotent()) {
    return 1;
  }
  if (!test_stop_flushes_pending_blocks()) {
    return 1;
  }
  return 0;
}

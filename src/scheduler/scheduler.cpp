#include "md5mux/scheduler/scheduler.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <format>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include "md5mux/core/error.hpp"
#include "scheduler/lane_batch.hpp"

namespace md5mux {
namespace {

struct Message {
  enum class Kind { Submit, Finalize, Reset };

  Kind kind{Kind::Submit};
  Uid uid{kNoSession};
  std::vector<uint8_t> block{};
  std::optional<std::promise<Digest>> result{};
};

void check_block(Uid uid, const std::vector<uint8_t>& block) {
  if (uid == kNoSession) {
    throw Error{ErrorCode::InvalidArgument, "uid 0 is reserved"};
  }
  if (block.empty() || !is_block_multiple(block.size())) {
    throw Error{ErrorCode::InvalidArgument,
                std::format("block of {} bytes is not a positive multiple of {}", block.size(),
                            kBlockSize)};
  }
}

// Single actor thread owning every lane slot and interim state. Callers only
// touch the inbox.
class LaneScheduler final : public ILaneScheduler {
 public:
  explicit LaneScheduler(SchedulerConfig cfg)
      : cfg_(cfg),
        kernel_(make_kernel(cfg.kernel)),
        batch_(*kernel_, cfg.batching, cfg.slot_policy, cfg.verify_kernel) {}

  ~LaneScheduler() override {
    try {
      stop();
    } catch (const std::exception& e) {
      std::cerr << std::format("[error] md5mux: stopping lane scheduler failed: {}\n", e.what());
    }
  }

  void start() override {
    std::scoped_lock lock(mu_);
    if (started_) {
      return;
    }
    if (stopping_) {
      throw Error{ErrorCode::EngineStopped, "lane scheduler cannot be restarted"};
    }
    actor_ = std::thread([this]() { this->actor_loop(); });
    started_ = true;
  }

  void submit(Uid uid, std::vector<uint8_t> block) override {
    check_block(uid, block);
    enqueue(Message{Message::Kind::Submit, uid, std::move(block), std::nullopt});
  }

  Digest finalize(Uid uid, std::vector<uint8_t> block) override {
    check_block(uid, block);
    std::promise<Digest> result;
    auto digest = result.get_future();
    enqueue(Message{Message::Kind::Finalize, uid, std::move(block), std::move(result)});
    return digest.get();
  }

  void reset(Uid uid) override {
    std::unique_lock lock(mu_);
    if (!started_ || stopping_ || fault_.has_value()) {
      return;
    }
    cv_not_full_.wait(lock, [this]() { return queue_.size() < inbox_depth() || stopping_; });
    if (stopping_) {
      return;
    }
    queue_.push_back(Message{Message::Kind::Reset, uid, {}, std::nullopt});
    cv_not_empty_.notify_one();
  }

  void stop() override {
    std::thread actor;
    {
      std::scoped_lock lock(mu_);
      stopping_ = true;
      actor.swap(actor_);
    }

    cv_not_empty_.notify_all();
    cv_not_full_.notify_all();

    if (actor.joinable()) {
      actor.join();
    }
  }

  SchedulerStats stats() const override {
    std::scoped_lock lock(mu_);
    return published_;
  }

  const SchedulerConfig& config() const noexcept override { return cfg_; }

 private:
  size_t inbox_depth() const noexcept { return cfg_.inbox_depth; }

  void enqueue(Message msg) {
    std::unique_lock lock(mu_);
    if (!started_) {
      throw Error{ErrorCode::InvalidArgument, "lane scheduler has not started"};
    }
    if (fault_.has_value()) {
      throw *fault_;
    }
    cv_not_full_.wait(lock, [this]() { return queue_.size() < inbox_depth() || stopping_; });
    if (stopping_) {
      throw Error{ErrorCode::EngineStopped, "lane scheduler is stopped"};
    }

    queue_.push_back(std::move(msg));
    cv_not_empty_.notify_one();
  }

  void actor_loop() {
    for (;;) {
      std::optional<Message> msg;
      bool stopping = false;
      {
        std::unique_lock lock(mu_);
        published_ = batch_.stats();

        const auto ready = [this]() { return stopping_ || !queue_.empty(); };
        if (const auto oldest = batch_.oldest_pending()) {
          cv_not_empty_.wait_until(lock, *oldest + cfg_.flush_timeout, ready);
        } else {
          cv_not_empty_.wait(lock, ready);
        }

        if (!queue_.empty()) {
          msg = std::move(queue_.front());
          queue_.pop_front();
          cv_not_full_.notify_one();
        } else {
          stopping = stopping_;
        }
      }

      try {
        if (msg.has_value()) {
          handle(std::move(*msg));
        } else if (stopping) {
          batch_.flush(sched::FlushCause::Stop);
          std::scoped_lock lock(mu_);
          published_ = batch_.stats();
          return;
        } else if (const auto oldest = batch_.oldest_pending();
                   oldest && sched::LaneBatch::Clock::now() >= *oldest + cfg_.flush_timeout) {
          batch_.flush(sched::FlushCause::Timeout);
        }
      } catch (const Error& e) {
        enter_fault(e);
        if (stopping) {
          return;
        }
      }
    }
  }

  void handle(Message msg) {
    std::optional<Error> fault;
    {
      std::scoped_lock lock(mu_);
      fault = fault_;
    }
    if (fault.has_value()) {
      if (msg.result.has_value()) {
        msg.result->set_exception(std::make_exception_ptr(*fault));
      }
      return;
    }

    switch (msg.kind) {
      case Message::Kind::Reset:
        batch_.reset(msg.uid);
        break;
      case Message::Kind::Submit:
      case Message::Kind::Finalize:
        batch_.accept(msg.uid, std::move(msg.block), std::move(msg.result));
        break;
    }
  }

  // A failed batch leaves no trustworthy interim state, so the engine refuses
  // all further work.
  void enter_fault(const Error& e) {
    std::cerr << std::format("[error] md5mux: lane scheduler faulted ({}): {}\n",
                             error_code_name(e.code()), e.what());
    const Error fault{ErrorCode::KernelFault, std::format("lane scheduler faulted: {}", e.what())};
    batch_.abandon(fault);

    std::scoped_lock lock(mu_);
    fault_ = fault;
    published_ = batch_.stats();
    cv_not_full_.notify_all();
  }

  SchedulerConfig cfg_{};
  std::unique_ptr<IKernel> kernel_;
  sched::LaneBatch batch_;

  mutable std::mutex mu_;
  std::condition_variable cv_not_empty_;
  std::condition_variable cv_not_full_;

  std::deque<Message> queue_;
  std::thread actor_;
  SchedulerStats published_{};
  std::optional<Error> fault_{};

  bool started_{false};
  bool stopping_{false};
};

}  // namespace

std::unique_ptr<ILaneScheduler> make_scheduler(const SchedulerConfig& cfg) {
  if (cfg.inbox_depth == 0) {
    throw Error{ErrorCode::InvalidArgument, "inbox_depth must be > 0"};
  }
  if (cfg.flush_timeout.count() <= 0) {
    throw Error{ErrorCode::InvalidArgument, "flush_timeout must be > 0"};
  }
  return std::make_unique<LaneScheduler>(cfg);
}

}  // namespace md5mux

#include "md5mux/hash/md5_stream.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <format>
#include <iostream>
#include <utility>
#include <vector>

#include "md5mux/core/error.hpp"
#include "md5mux/hash/md5.hpp"

namespace md5mux {
namespace {

// Starts at the lane count so the first id is never mistaken for kNoSession.
std::atomic<Uid> g_uid_counter{kLaneCount};

}  // namespace

Uid next_uid() noexcept {
  return g_uid_counter.fetch_add(1, std::memory_order_relaxed);
}

Md5Stream::Md5Stream(std::shared_ptr<ILaneScheduler> scheduler)
    : scheduler_(std::move(scheduler)), uid_(next_uid()) {
  if (!scheduler_) {
    throw Error{ErrorCode::InvalidArgument, "md5 stream needs a lane scheduler"};
  }
}

Md5Stream::~Md5Stream() {
  if (!submitted_ || final_) {
    return;
  }
  try {
    scheduler_->reset(uid_);
  } catch (const Error& e) {
    std::cerr << std::format("[warn] md5mux: releasing session {} failed: {}\n", uid_, e.what());
  }
}

void Md5Stream::write(std::span<const uint8_t> data) {
  if (final_) {
    throw Error{ErrorCode::AlreadyFinalized,
                "md5 stream already finalized; reset it before writing again"};
  }

  len_ += data.size();
  if (nbuf_ > 0) {
    const size_t n = std::min(kBlockSize - nbuf_, data.size());
    std::memcpy(buf_.data() + nbuf_, data.data(), n);
    nbuf_ += n;
    data = data.subspan(n);
    if (nbuf_ == kBlockSize) {
      scheduler_->submit(uid_, std::vector<uint8_t>(buf_.begin(), buf_.end()));
      submitted_ = true;
      nbuf_ = 0;
    }
  }

  if (data.size() >= kBlockSize) {
    const size_t n = data.size() - data.size() % kBlockSize;
    scheduler_->submit(uid_, std::vector<uint8_t>(data.begin(), data.begin() + n));
    submitted_ = true;
    data = data.subspan(n);
  }

  if (!data.empty()) {
    std::memcpy(buf_.data(), data.data(), data.size());
    nbuf_ = data.size();
  }
}

Digest Md5Stream::sum() {
  if (final_) {
    throw Error{ErrorCode::AlreadyFinalized, "md5 stream already finalized"};
  }

  auto last = pad_final_block(std::span<const uint8_t>(buf_.data(), nbuf_), len_);
  nbuf_ = 0;
  final_ = true;
  return scheduler_->finalize(uid_, std::move(last));
}

void Md5Stream::reset() {
  scheduler_->reset(uid_);
  nbuf_ = 0;
  len_ = 0;
  submitted_ = false;
  final_ = false;
}

}  // namespace md5mux

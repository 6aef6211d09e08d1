#include "cancellation.hpp"

#include <algorithm>
#include <thread>

#include "internal/util/errors.hpp"

namespace avatarpool::runtime {

bool CancellationToken::IsCancelled() const {
  if (!state_) return false;
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

void CancellationToken::ThrowIfCancelled(const std::string& what) const {
  if (IsCancelled()) {
    throw avatarpool::util::Cancelled(what + ": operation cancelled");
  }
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
  // waits convert to nanoseconds internally; keep each one well inside that range
  constexpr std::chrono::milliseconds kMaxSlice = std::chrono::hours(1);

  auto remaining = duration;
  while (remaining > std::chrono::milliseconds::zero()) {
    const auto slice = std::min(remaining, kMaxSlice);
    if (!state_) {
      std::this_thread::sleep_for(slice);
    } else {
      std::unique_lock lock(state_->mutex);
      if (state_->cv.wait_for(lock, slice, [&] { return state_->cancelled; })) {
        return false;
      }
    }
    remaining -= slice;
  }
  return !IsCancelled();
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {
}

CancellationToken CancellationSource::Token() const {
  return CancellationToken(state_);
}

void CancellationSource::Cancel() {
  {
    std::lock_guard lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationSource::IsCancelled() const {
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

} // namespace avatarpool::runtime

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace avatarpool::runtime {

/*
  Cooperative cancellation.

  A CancellationSource owns the shared state; tokens are cheap copies handed
  to long-running operations. Operations poll the token at I/O suspension
  points (copy chunks, directory entries) and throw util::Cancelled.

  A default-constructed token is never cancelled.
*/
class CancellationToken {
 public:
  CancellationToken() = default;

  bool IsCancelled() const;

  // Throws util::Cancelled with `what` as context if cancelled.
  void ThrowIfCancelled(const std::string& what) const;

  // Sleeps up to `duration`; returns false if cancelled first.
  bool WaitFor(std::chrono::milliseconds duration) const;

 private:
  friend class CancellationSource;

  struct State {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    cancelled = false;
  };

  explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {
  }

  std::shared_ptr<State> state_;
};

class CancellationSource {
 public:
  CancellationSource();

  CancellationToken Token() const;

  void Cancel();

  bool IsCancelled() const;

 private:
  std::shared_ptr<CancellationToken::State> state_;
};

} // namespace avatarpool::runtime

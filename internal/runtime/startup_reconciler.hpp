#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "cancellation.hpp"

namespace avatarpool::service {
class AvatarService;
}

namespace avatarpool::runtime {

/*
  Background startup pass.

  Waits for the configured delay (interruptible), then runs validation and,
  if enabled, orphan collection. Failures are logged; nothing escapes the
  worker thread.
*/
class StartupReconciler {
 public:
  StartupReconciler(std::shared_ptr<avatarpool::service::AvatarService> service, std::chrono::milliseconds delay, bool collect_orphans = true);
  ~StartupReconciler();

  StartupReconciler(const StartupReconciler&)            = delete;
  StartupReconciler& operator=(const StartupReconciler&) = delete;

  void Start();

  // Cancels the delay or the running pass and joins.
  void Stop();

  // True once the pass has finished, failed or been cancelled.
  bool Finished() const {
    return finished_.load();
  }

 private:
  void Run();

  std::shared_ptr<avatarpool::service::AvatarService> service_;
  std::chrono::milliseconds                            delay_;
  bool                                                 collect_orphans_;

  CancellationSource cancel_;
  std::thread        thread_;
  std::atomic<bool>  finished_{false};
};

} // namespace avatarpool::runtime

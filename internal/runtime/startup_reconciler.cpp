#include "startup_reconciler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/service/avatar_service.hpp"
#include "internal/util/errors.hpp"

namespace avatarpool::runtime {

using avatarpool::observability::IntField;
using avatarpool::observability::StringField;

StartupReconciler::StartupReconciler(std::shared_ptr<avatarpool::service::AvatarService> service, std::chrono::milliseconds delay,
                                     bool collect_orphans)
    : service_(std::move(service)), delay_(delay), collect_orphans_(collect_orphans) {
  if (!service_) {
    throw avatarpool::util::InvariantViolation("startup reconciler requires a service");
  }
}

StartupReconciler::~StartupReconciler() {
  Stop();
}

void StartupReconciler::Start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread(&StartupReconciler::Run, this);
}

void StartupReconciler::Stop() {
  cancel_.Cancel();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void StartupReconciler::Run() {
  const auto token = cancel_.Token();

  try {
    AVATARPOOL_LOG_INFO("Startup reconciliation scheduled", {IntField("delay_ms", static_cast<int64_t>(delay_.count()))});
    if (!token.WaitFor(delay_)) {
      AVATARPOOL_LOG_INFO("Startup reconciliation cancelled before it started");
      finished_ = true;
      return;
    }

    const auto report = service_->ValidateWithReport(token);

    uint64_t deleted = 0;
    if (collect_orphans_) {
      deleted = service_->CollectOrphans(token);
    }

    AVATARPOOL_LOG_INFO("Startup reconciliation completed",
                        {IntField("checked", static_cast<int64_t>(report.checked)), IntField("repaired", static_cast<int64_t>(report.repaired)),
                         IntField("removed", static_cast<int64_t>(report.removed)), IntField("orphans_deleted", static_cast<int64_t>(deleted))});
  } catch (const avatarpool::util::Cancelled& e) {
    AVATARPOOL_LOG_WARN("Startup reconciliation cancelled", {StringField("error", e.what())});
  } catch (const std::exception& e) {
    AVATARPOOL_LOG_ERROR("Startup reconciliation failed", {StringField("error", e.what())});
  }
  finished_ = true;
}

} // namespace avatarpool::runtime

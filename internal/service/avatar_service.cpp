#include "avatar_service.hpp"

#include <chrono>
#include <mutex>
#include <type_traits>

#include "internal/binding/binding_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace avatarpool::service {

namespace {

template <typename Fn>
auto ObserveRoute(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&started_at]() {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      AVATARPOOL_LOG_DEBUG("Route completed", {avatarpool::observability::StringField("route", route),
                                               avatarpool::observability::IntField("elapsed_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      AVATARPOOL_LOG_DEBUG("Route completed", {avatarpool::observability::StringField("route", route),
                                               avatarpool::observability::IntField("elapsed_ms", elapsed_ms())});
      return result;
    }
  } catch (const avatarpool::util::NotFound& ex) {
    AVATARPOOL_LOG_INFO("Route target not found",
                        {avatarpool::observability::StringField("route", route), avatarpool::observability::StringField("error", ex.what())});
    throw;
  } catch (const avatarpool::util::ValidationFailure& ex) {
    AVATARPOOL_LOG_WARN("Route rejected input",
                        {avatarpool::observability::StringField("route", route), avatarpool::observability::StringField("error", ex.what())});
    throw;
  } catch (const std::exception& ex) {
    AVATARPOOL_LOG_ERROR("Route failed", {avatarpool::observability::StringField("route", route), avatarpool::observability::StringField("error", ex.what()),
                                          avatarpool::observability::IntField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

} // namespace

AvatarService::AvatarService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.pool || !ctx_.bindings || !ctx_.identity || !ctx_.binder || !ctx_.reconciler) {
    throw avatarpool::util::InvariantViolation("avatar service requires a fully populated service context");
  }
  process_lock_path_ = avatarpool::storage::common::ServiceLockFile(ctx_.binder->ProfilesRoot());
}

avatarpool::storage::FileLock AvatarService::LockAcrossProcesses(avatarpool::storage::FileLock::Mode mode) const {
  return avatarpool::storage::FileLock(process_lock_path_, mode);
}

std::vector<avatarpool::db::model::AvatarRecord> AvatarService::ListAvatars() {
  return ObserveRoute("ListAvatars", [&]() { return ctx_.pool->List(); });
}

avatarpool::db::model::AvatarRecord AvatarService::AddAvatar(const std::string& original_filename, const std::vector<uint8_t>& bytes) {
  return ObserveRoute("AddAvatar", [&]() {
    std::shared_lock lock(maintenance_mutex_);
    auto             process_lock = LockAcrossProcesses(avatarpool::storage::FileLock::Mode::kShared);
    return ctx_.pool->Add(original_filename, bytes);
  });
}

bool AvatarService::RemoveAvatar(const std::string& avatar_id) {
  return ObserveRoute("RemoveAvatar", [&]() {
    std::shared_lock lock(maintenance_mutex_);
    auto             process_lock = LockAcrossProcesses(avatarpool::storage::FileLock::Mode::kShared);
    return ctx_.pool->Remove(avatar_id);
  });
}

avatarpool::pool::ResolvedAvatar AvatarService::Resolve(const std::string& avatar_id) {
  return ObserveRoute("Resolve", [&]() { return ctx_.pool->Resolve(avatar_id); });
}

avatarpool::core::MaterializedProfileImage AvatarService::Bind(const std::string& user_id, const std::string& avatar_id,
                                                               const avatarpool::runtime::CancellationToken& cancel) {
  return ObserveRoute("Bind", [&]() {
    std::shared_lock lock(maintenance_mutex_);
    auto             process_lock = LockAcrossProcesses(avatarpool::storage::FileLock::Mode::kShared);
    return ctx_.binder->Bind(user_id, avatar_id, cancel);
  });
}

bool AvatarService::Unbind(const std::string& user_id) {
  return ObserveRoute("Unbind", [&]() {
    std::shared_lock lock(maintenance_mutex_);
    auto             process_lock = LockAcrossProcesses(avatarpool::storage::FileLock::Mode::kShared);
    return ctx_.binder->Unbind(user_id);
  });
}

std::optional<std::string> AvatarService::GetBinding(const std::string& user_id) {
  return ObserveRoute("GetBinding", [&]() { return ctx_.bindings->Get(user_id); });
}

uint64_t AvatarService::Validate(const avatarpool::runtime::CancellationToken& cancel) {
  return ValidateWithReport(cancel).repaired;
}

avatarpool::reconcile::ValidationReport AvatarService::ValidateWithReport(const avatarpool::runtime::CancellationToken& cancel) {
  return ObserveRoute("Validate", [&]() {
    std::unique_lock lock(maintenance_mutex_);
    auto             process_lock = LockAcrossProcesses(avatarpool::storage::FileLock::Mode::kExclusive);
    return ctx_.reconciler->Validate(cancel);
  });
}

uint64_t AvatarService::CollectOrphans(const avatarpool::runtime::CancellationToken& cancel) {
  return ObserveRoute("CollectOrphans", [&]() {
    std::unique_lock lock(maintenance_mutex_);
    auto             process_lock = LockAcrossProcesses(avatarpool::storage::FileLock::Mode::kExclusive);
    return ctx_.reconciler->CollectOrphans(cancel);
  });
}

} // namespace avatarpool::service

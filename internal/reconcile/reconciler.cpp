#include "reconciler.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "internal/binding/binding_store.hpp"
#include "internal/core/profile_image_binder.hpp"
#include "internal/identity/identity_provider.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pool/pool_store.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/file_io.hpp"
#include "internal/util/errors.hpp"

namespace avatarpool::reconcile {

using avatarpool::observability::IntField;
using avatarpool::observability::StringField;

Reconciler::Reconciler(std::shared_ptr<avatarpool::pool::PoolStore> pool, std::shared_ptr<avatarpool::binding::BindingStore> bindings,
                       std::shared_ptr<avatarpool::identity::IdentityProvider> identity,
                       std::shared_ptr<avatarpool::core::ProfileImageBinder>   binder)
    : pool_(std::move(pool)),
      bindings_(std::move(bindings)),
      identity_(std::move(identity)),
      binder_(std::move(binder)),
      remove_file_(avatarpool::storage::RemoveFile) {
  if (!pool_ || !bindings_ || !identity_ || !binder_) {
    throw avatarpool::util::InvariantViolation("reconciler requires pool, bindings, identity and binder");
  }
}

void Reconciler::SetFileRemover(FileRemover remover) {
  remove_file_ = remover ? std::move(remover) : FileRemover(avatarpool::storage::RemoveFile);
}

void Reconciler::ClearPointerQuietly(const std::string& user_id) {
  try {
    binder_->ClearPointer(user_id);
  } catch (const std::exception& e) {
    AVATARPOOL_LOG_WARN("Could not clear profile image reference", {StringField("user_id", user_id), StringField("error", e.what())});
  }
}

ValidationReport Reconciler::Validate(const avatarpool::runtime::CancellationToken& cancel) {
  ValidationReport         report;
  std::vector<std::string> dropped;
  bool                     cancelled = false;

  for (const auto& binding : bindings_->List()) {
    if (cancel.IsCancelled()) {
      cancelled = true;
      break;
    }
    ++report.checked;

    try {
      const auto user   = identity_->GetUser(binding.user_id);
      const auto avatar = pool_->Get(binding.avatar_id);

      if (!user.has_value() || !avatar.has_value()) {
        AVATARPOOL_LOG_INFO("Dropping stale binding", {StringField("user_id", binding.user_id), StringField("avatar_id", binding.avatar_id),
                                                       StringField("reason", user.has_value() ? "avatar missing" : "user missing")});
        if (user.has_value()) {
          ClearPointerQuietly(binding.user_id);
        }
        dropped.push_back(binding.user_id);
        continue;
      }

      if (user->profile_image_path.has_value() && !user->profile_image_path->empty() &&
          avatarpool::storage::IsReadableFile(*user->profile_image_path)) {
        continue;
      }

      try {
        binder_->Bind(binding.user_id, binding.avatar_id, cancel);
        ++report.repaired;
      } catch (const avatarpool::util::Cancelled&) {
        cancelled = true;
        break;
      } catch (const std::exception& e) {
        AVATARPOOL_LOG_WARN("Re-binding failed; dropping binding",
                            {StringField("user_id", binding.user_id), StringField("avatar_id", binding.avatar_id), StringField("error", e.what())});
        ClearPointerQuietly(binding.user_id);
        dropped.push_back(binding.user_id);
      }
    } catch (const std::exception& e) {
      AVATARPOOL_LOG_ERROR("Failed to validate binding", {StringField("user_id", binding.user_id), StringField("error", e.what())});
    }
  }

  if (!dropped.empty()) {
    bindings_->ClearMany(dropped);
    report.removed = dropped.size();
  }

  AVATARPOOL_LOG_INFO("Validated avatar bindings", {IntField("checked", static_cast<int64_t>(report.checked)),
                                                    IntField("repaired", static_cast<int64_t>(report.repaired)),
                                                    IntField("removed", static_cast<int64_t>(report.removed))});

  if (cancelled) {
    cancel.ThrowIfCancelled("validate");
  }
  return report;
}

uint64_t Reconciler::CollectOrphans(const avatarpool::runtime::CancellationToken& cancel) {
  uint64_t deleted = 0;

  for (const auto& user : identity_->ListUsers()) {
    cancel.ThrowIfCancelled("collect orphans");

    try {
      const auto directory = binder_->ProfileDirectory(user.id);

      std::error_code ec;
      if (!std::filesystem::is_directory(directory, ec)) {
        continue;
      }

      std::filesystem::path current;
      if (user.profile_image_path.has_value() && !user.profile_image_path->empty()) {
        current = std::filesystem::path(*user.profile_image_path).lexically_normal();
      }

      for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        cancel.ThrowIfCancelled("collect orphans");

        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
          continue;
        }
        if (!avatarpool::storage::common::IsProfileImageFileName(entry.path().filename().string())) {
          continue;
        }
        if (!current.empty() && entry.path().lexically_normal() == current) {
          continue;
        }

        try {
          if (remove_file_(entry.path())) {
            ++deleted;
            AVATARPOOL_LOG_DEBUG("Deleted orphaned profile image", {StringField("path", entry.path().string())});
          }
        } catch (const std::exception& e) {
          AVATARPOOL_LOG_WARN("Could not delete orphaned profile image", {StringField("path", entry.path().string()), StringField("error", e.what())});
        }
      }
    } catch (const avatarpool::util::Cancelled&) {
      throw;
    } catch (const std::exception& e) {
      AVATARPOOL_LOG_WARN("Skipping user during orphan collection", {StringField("user_id", user.id), StringField("error", e.what())});
    }
  }

  AVATARPOOL_LOG_INFO("Collected orphaned profile images", {IntField("deleted", static_cast<int64_t>(deleted))});
  return deleted;
}

} // namespace avatarpool::reconcile

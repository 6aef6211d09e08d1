#include "profile_image_binder.hpp"

#include <stdexcept>

#include "internal/binding/binding_store.hpp"
#include "internal/identity/identity_provider.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pool/pool_store.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/file_io.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace avatarpool::core {

using avatarpool::observability::BoolField;
using avatarpool::observability::StringField;

namespace common = avatarpool::storage::common;

ProfileImageBinder::ProfileImageBinder(std::shared_ptr<avatarpool::pool::PoolStore>            pool,
                                       std::shared_ptr<avatarpool::binding::BindingStore>      bindings,
                                       std::shared_ptr<avatarpool::identity::IdentityProvider> identity,
                                       std::filesystem::path                                   profiles_root)
    : pool_(std::move(pool)), bindings_(std::move(bindings)), identity_(std::move(identity)), profiles_root_(std::move(profiles_root)) {
}

void ProfileImageBinder::EnsureInitialized(const char* operation) const {
  if (pool_ && bindings_ && identity_ && !profiles_root_.empty()) {
    return;
  }
  AVATARPOOL_LOG_ERROR("Profile image binder used before initialization",
                       {StringField("operation", operation), BoolField("pool", pool_ != nullptr), BoolField("bindings", bindings_ != nullptr),
                        BoolField("identity", identity_ != nullptr)});
  throw avatarpool::util::InvariantViolation(std::string(operation) + ": binder is missing a collaborator");
}

std::filesystem::path ProfileImageBinder::ProfileDirectory(const std::string& user_id) const {
  return common::UserProfileDirectory(profiles_root_, user_id);
}

avatarpool::storage::FileLock ProfileImageBinder::LockUserAcrossProcesses(const std::string& user_id) const {
  return avatarpool::storage::FileLock(common::UserLockFile(profiles_root_, user_id), avatarpool::storage::FileLock::Mode::kExclusive);
}

void ProfileImageBinder::RollbackCopy(const std::filesystem::path& target, const std::string& user_id) {
  try {
    avatarpool::storage::RemoveFile(target);
    AVATARPOOL_LOG_INFO("Rolled back copied profile image", {StringField("user_id", user_id), StringField("path", target.string())});
  } catch (const std::exception& e) {
    // not referenced by any pointer, so the next orphan collection reclaims it
    AVATARPOOL_LOG_ERROR("Could not roll back copied profile image",
                         {StringField("user_id", user_id), StringField("path", target.string()), StringField("error", e.what())});
  }
}

MaterializedProfileImage ProfileImageBinder::Bind(const std::string& user_id, const std::string& avatar_id,
                                                  const avatarpool::runtime::CancellationToken& cancel) {
  EnsureInitialized("bind");
  auto user_lock      = user_locks_.Acquire(user_id);
  auto user_file_lock = LockUserAcrossProcesses(user_id);

  AVATARPOOL_LOG_DEBUG("Bind requested", {StringField("user_id", user_id), StringField("avatar_id", avatar_id)});

  // 1. avatar
  const auto avatar = pool_->Resolve(avatar_id);

  // 2. user
  auto user = identity_->GetUser(user_id);
  if (!user.has_value()) {
    throw avatarpool::util::UserNotFound("bind: unknown user " + user_id);
  }

  // 3. previous pointer; deleted only after the new one is committed
  std::optional<std::filesystem::path> previous_path;
  if (user->profile_image_path.has_value() && !user->profile_image_path->empty()) {
    previous_path = std::filesystem::path(*user->profile_image_path);
  }

  // 4. new distinct target
  const auto directory = ProfileDirectory(user_id);
  const auto extension = common::LowercaseExtension(avatar.path);

  std::filesystem::path target;
  do {
    target = directory / common::ProfileImageFileName(avatar_id, avatarpool::util::NextDistinctToken(), extension);
  } while (previous_path.has_value() && target == *previous_path);

  // 5. copy
  {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
      throw avatarpool::util::CopyFailed("bind: create profile directory '" + directory.string() + "': " + ec.message());
    }
  }
  if (std::error_code exists_ec; std::filesystem::exists(target, exists_ec)) {
    AVATARPOOL_LOG_WARN("Replacing leftover profile image from an earlier attempt", {StringField("path", target.string())});
  }
  try {
    avatarpool::storage::CopyFile(avatar.path, target, cancel);
  } catch (const avatarpool::util::IOFailure& e) {
    AVATARPOOL_LOG_ERROR("Copy to profile slot failed", {StringField("user_id", user_id), StringField("error", e.what())});
    throw avatarpool::util::CopyFailed(std::string("bind: ") + e.what());
  }

  // 6. commit the pointer
  if (cancel.IsCancelled()) {
    RollbackCopy(target, user_id);
    cancel.ThrowIfCancelled("bind");
  }
  user->profile_image_path = target.string();
  try {
    identity_->PersistUser(*user);
  } catch (const std::exception& e) {
    AVATARPOOL_LOG_ERROR("Failed to persist profile image pointer",
                         {StringField("user_id", user_id), StringField("path", target.string()), StringField("error", e.what())});
    RollbackCopy(target, user_id);
    throw avatarpool::util::PointerUpdateFailed(std::string("bind: persist user pointer: ") + e.what());
  }

  MaterializedProfileImage result;
  result.user_id       = user_id;
  result.avatar_id     = avatar_id;
  result.path          = target;
  result.previous_path = previous_path;

  // 7. old file, best effort
  if (previous_path.has_value() && *previous_path != target) {
    try {
      avatarpool::storage::RemoveFile(*previous_path);
      result.previous_removed = true;
      AVATARPOOL_LOG_DEBUG("Deleted previous profile image", {StringField("path", previous_path->string())});
    } catch (const std::exception& e) {
      AVATARPOOL_LOG_WARN("Could not delete previous profile image; left for orphan collection",
                          {StringField("path", previous_path->string()), StringField("error", e.what())});
    }
  }

  // 8. bookkeeping
  try {
    bindings_->Set(user_id, avatar_id);
  } catch (const std::exception& e) {
    AVATARPOOL_LOG_ERROR("Profile image committed but binding was not recorded",
                         {StringField("user_id", user_id), StringField("avatar_id", avatar_id), StringField("error", e.what())});
    throw;
  }

  AVATARPOOL_LOG_INFO("Bound avatar to user", {StringField("user_id", user_id), StringField("avatar_id", avatar_id),
                                               StringField("path", target.string())});
  return result;
}

bool ProfileImageBinder::Unbind(const std::string& user_id) {
  EnsureInitialized("unbind");
  auto user_lock      = user_locks_.Acquire(user_id);
  auto user_file_lock = LockUserAcrossProcesses(user_id);

  auto user = identity_->GetUser(user_id);
  if (!user.has_value()) {
    throw avatarpool::util::UserNotFound("unbind: unknown user " + user_id);
  }

  const auto had_binding = bindings_->Get(user_id).has_value();

  std::optional<std::filesystem::path> previous_path;
  if (user->profile_image_path.has_value()) {
    if (!user->profile_image_path->empty()) {
      previous_path = std::filesystem::path(*user->profile_image_path);
    }

    user->profile_image_path.reset();
    try {
      identity_->PersistUser(*user);
    } catch (const std::exception& e) {
      throw avatarpool::util::PointerUpdateFailed(std::string("unbind: persist user pointer: ") + e.what());
    }
  }

  if (previous_path.has_value()) {
    try {
      avatarpool::storage::RemoveFile(*previous_path);
    } catch (const std::exception& e) {
      AVATARPOOL_LOG_WARN("Could not delete profile image on unbind; left for orphan collection",
                          {StringField("path", previous_path->string()), StringField("error", e.what())});
    }
  }

  bindings_->Clear(user_id);

  AVATARPOOL_LOG_INFO("Removed avatar assignment", {StringField("user_id", user_id), BoolField("had_binding", had_binding)});
  return had_binding || previous_path.has_value();
}

bool ProfileImageBinder::ClearPointer(const std::string& user_id) {
  EnsureInitialized("clear pointer");
  auto user_lock      = user_locks_.Acquire(user_id);
  auto user_file_lock = LockUserAcrossProcesses(user_id);

  auto user = identity_->GetUser(user_id);
  if (!user.has_value() || !user->profile_image_path.has_value()) {
    return false;
  }

  user->profile_image_path.reset();
  try {
    identity_->PersistUser(*user);
  } catch (const std::exception& e) {
    throw avatarpool::util::PointerUpdateFailed(std::string("clear pointer: persist user: ") + e.what());
  }

  AVATARPOOL_LOG_INFO("Cleared profile image reference", {StringField("user_id", user_id)});
  return true;
}

} // namespace avatarpool::core

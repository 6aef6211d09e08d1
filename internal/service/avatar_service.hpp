#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/core/profile_image_binder.hpp"
#include "internal/db/model/avatar_record.hpp"
#include "internal/pool/pool_store.hpp"
#include "internal/reconcile/reconciler.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/storage/file_io.hpp"
#include "service_context.hpp"

namespace avatarpool::service {

/*
  Transport-facing operations.

  Bind/Unbind/AddAvatar/RemoveAvatar run concurrently with each other;
  Validate and CollectOrphans run alone. The exclusion holds for every
  process sharing the profiles root (daemon and avatarctl alike) through an
  flock on <profiles root>/.avatar-pool.lock, taken after the in-process
  mutex.
*/
class AvatarService {
 public:
  explicit AvatarService(ServiceContext ctx);

  std::vector<avatarpool::db::model::AvatarRecord> ListAvatars();

  avatarpool::db::model::AvatarRecord AddAvatar(const std::string& original_filename, const std::vector<uint8_t>& bytes);

  bool RemoveAvatar(const std::string& avatar_id);

  avatarpool::pool::ResolvedAvatar Resolve(const std::string& avatar_id);

  avatarpool::core::MaterializedProfileImage Bind(const std::string& user_id, const std::string& avatar_id,
                                                  const avatarpool::runtime::CancellationToken& cancel = {});

  bool Unbind(const std::string& user_id);

  std::optional<std::string> GetBinding(const std::string& user_id);

  // Returns the number of repaired bindings.
  uint64_t Validate(const avatarpool::runtime::CancellationToken& cancel = {});

  avatarpool::reconcile::ValidationReport ValidateWithReport(const avatarpool::runtime::CancellationToken& cancel = {});

  // Returns the number of deleted files.
  uint64_t CollectOrphans(const avatarpool::runtime::CancellationToken& cancel = {});

 private:
  avatarpool::storage::FileLock LockAcrossProcesses(avatarpool::storage::FileLock::Mode mode) const;

  ServiceContext        ctx_;
  std::filesystem::path process_lock_path_;
  std::shared_mutex     maintenance_mutex_;
};

} // namespace avatarpool::service

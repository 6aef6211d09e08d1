#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/user_lock_table.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/storage/file_io.hpp"

namespace avatarpool::pool {
class PoolStore;
}
namespace avatarpool::binding {
class BindingStore;
}
namespace avatarpool::identity {
class IdentityProvider;
}

namespace avatarpool::core {

struct MaterializedProfileImage {
  std::string                          user_id;
  std::string                          avatar_id;
  std::filesystem::path                path;
  std::optional<std::filesystem::path> previous_path;
  // false if the previous file could not be deleted and was left for GC
  bool previous_removed = false;
};

/*
  Binds pool avatars to users' profile images.

  Bind protocol (each step a commit point, all under the user's lock):
    1. resolve avatar                      AvatarNotFound
    2. resolve user                        UserNotFound
    3. remember the current pointer as previous
    4. pick a new distinct target path in the user's directory
    5. copy pool file -> target            CopyFailed, nothing committed
    6. point the user at target, persist   PointerUpdateFailed, copy rolled back
    7. delete previous file                failure logged, left for GC
    8. record the binding

  The identity pointer is authoritative; the binding table is bookkeeping for
  reconciliation.
*/
class ProfileImageBinder {
 public:
  ProfileImageBinder(std::shared_ptr<avatarpool::pool::PoolStore> pool, std::shared_ptr<avatarpool::binding::BindingStore> bindings,
                     std::shared_ptr<avatarpool::identity::IdentityProvider> identity, std::filesystem::path profiles_root);

  MaterializedProfileImage Bind(const std::string& user_id, const std::string& avatar_id,
                                const avatarpool::runtime::CancellationToken& cancel = {});

  // Clears pointer, deletes the referenced file (best effort) and the binding.
  // Returns false if the user had neither a pointer nor a binding.
  bool Unbind(const std::string& user_id);

  // Clears the user's pointer without touching files or bindings; the old file
  // becomes an orphan. Returns false if the user is unknown or had no pointer.
  bool ClearPointer(const std::string& user_id);

  std::filesystem::path ProfileDirectory(const std::string& user_id) const;

  const std::filesystem::path& ProfilesRoot() const {
    return profiles_root_;
  }

 private:
  void EnsureInitialized(const char* operation) const;

  // user_locks_ covers threads of this process; this covers other processes
  // working on the same profiles root.
  avatarpool::storage::FileLock LockUserAcrossProcesses(const std::string& user_id) const;

  void RollbackCopy(const std::filesystem::path& target, const std::string& user_id);

  std::shared_ptr<avatarpool::pool::PoolStore>            pool_;
  std::shared_ptr<avatarpool::binding::BindingStore>      bindings_;
  std::shared_ptr<avatarpool::identity::IdentityProvider> identity_;
  std::filesystem::path                                   profiles_root_;

  UserLockTable user_locks_;
};

} // namespace avatarpool::core

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "internal/runtime/cancellation.hpp"

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
class ProfileImageBinder;
}

namespace avatarpool::reconcile {

struct ValidationReport {
  uint64_t checked  = 0;
  uint64_t repaired = 0;
  uint64_t removed  = 0;
};

/*
  Repairs drift between bindings, the pool and users' profile images.

  Validate:
    - user or avatar gone          -> drop binding, clear pointer
    - pointer names a readable file -> consistent
    - otherwise re-bind; a failed re-bind drops the binding and clears the pointer
  Dropped bindings are removed in one batch at the end (also when cancelled).

  CollectOrphans deletes every profile_* file in a user's directory other than
  the one the user's pointer names.

  Per-entry failures are logged and skipped. Callers must keep concurrent
  binds out while either pass runs.
*/
class Reconciler {
 public:
  Reconciler(std::shared_ptr<avatarpool::pool::PoolStore> pool, std::shared_ptr<avatarpool::binding::BindingStore> bindings,
             std::shared_ptr<avatarpool::identity::IdentityProvider> identity, std::shared_ptr<avatarpool::core::ProfileImageBinder> binder);

  ValidationReport Validate(const avatarpool::runtime::CancellationToken& cancel = {});

  uint64_t CollectOrphans(const avatarpool::runtime::CancellationToken& cancel = {});

  // Deletes one orphan; returns false if it was already gone, throws on failure.
  // Defaults to storage::RemoveFile.
  using FileRemover = std::function<bool(const std::filesystem::path& path)>;

  void SetFileRemover(FileRemover remover);

 private:
  void ClearPointerQuietly(const std::string& user_id);

  std::shared_ptr<avatarpool::pool::PoolStore>            pool_;
  std::shared_ptr<avatarpool::binding::BindingStore>      bindings_;
  std::shared_ptr<avatarpool::identity::IdentityProvider> identity_;
  std::shared_ptr<avatarpool::core::ProfileImageBinder>   binder_;
  FileRemover                                             remove_file_;
};

} // namespace avatarpool::reconcile

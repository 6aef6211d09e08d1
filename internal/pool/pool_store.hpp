#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/avatar_record.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace avatarpool::pool {

struct ResolvedAvatar {
  avatarpool::db::model::AvatarRecord record;
  std::filesystem::path               path;
  std::string                         mime_type;
};

/*
  Durable directory of avatar files plus their metadata records.

  - Add writes the file before the record exists; a failed write leaves no record.
  - Remove is idempotent (false for unknown ids) and notifies the removal hook
    so bindings pointing at the avatar can be cleared.
  - Add/Remove are serialized by a single writer lock.
*/
class PoolStore {
 public:
  using RemovalHook = std::function<void(const std::string& avatar_id)>;

  PoolStore(std::filesystem::path directory, std::shared_ptr<avatarpool::db::Repository> repository,
            uint64_t max_avatar_bytes = avatarpool::storage::common::kMaxAvatarBytes);

  void SetRemovalHook(RemovalHook hook);

  avatarpool::db::model::AvatarRecord Add(const std::string& original_filename, const std::vector<uint8_t>& bytes);

  bool Remove(const std::string& avatar_id);

  // Throws util::AvatarNotFound if the record or its file is missing.
  ResolvedAvatar Resolve(const std::string& avatar_id);

  std::optional<avatarpool::db::model::AvatarRecord> Get(const std::string& avatar_id);

  std::vector<avatarpool::db::model::AvatarRecord> List();

  const std::filesystem::path& Directory() const {
    return directory_;
  }

  uint64_t MaxAvatarBytes() const {
    return max_avatar_bytes_;
  }

 private:
  std::filesystem::path                      directory_;
  std::shared_ptr<avatarpool::db::Repository> repository_;
  uint64_t                                   max_avatar_bytes_;

  std::mutex write_mutex_;

  std::mutex  hook_mutex_;
  RemovalHook removal_hook_;
};

} // namespace avatarpool::pool

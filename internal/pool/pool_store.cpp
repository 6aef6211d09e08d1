#include "pool_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/file_io.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace avatarpool::pool {

using avatarpool::db::model::AvatarRecord;
using avatarpool::observability::IntField;
using avatarpool::observability::StringField;

namespace common = avatarpool::storage::common;

namespace {

void ThrowIfDbError(const avatarpool::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.Describe(context);
  switch (result.code) {
    case avatarpool::db::ErrorCode::NotFound:
      throw avatarpool::util::AvatarNotFound(message);
    default:
      throw avatarpool::util::IOFailure(message);
  }
}

} // namespace

PoolStore::PoolStore(std::filesystem::path directory, std::shared_ptr<avatarpool::db::Repository> repository,
                     uint64_t max_avatar_bytes)
    : directory_(std::move(directory)),
      repository_(std::move(repository)),
      max_avatar_bytes_(max_avatar_bytes == 0 || max_avatar_bytes > common::kMaxAvatarBytes ? common::kMaxAvatarBytes
                                                                                             : max_avatar_bytes) {
  if (!repository_) {
    throw avatarpool::util::InvariantViolation("pool store requires a repository");
  }

  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    AVATARPOOL_LOG_ERROR("Failed to create avatar pool directory",
                         {StringField("path", directory_.string()), StringField("error", ec.message())});
    throw avatarpool::util::IOFailure("create pool directory '" + directory_.string() + "': " + ec.message());
  }
  AVATARPOOL_LOG_INFO("Avatar pool directory ready", {StringField("path", directory_.string())});
}

void PoolStore::SetRemovalHook(RemovalHook hook) {
  std::lock_guard lock(hook_mutex_);
  removal_hook_ = std::move(hook);
}

AvatarRecord PoolStore::Add(const std::string& original_filename, const std::vector<uint8_t>& bytes) {
  const std::filesystem::path original(original_filename);
  const auto                  extension = common::LowercaseExtension(original.filename());

  if (!common::IsAllowedImageExtension(extension)) {
    throw avatarpool::util::ValidationFailure("add avatar: invalid file type '" + extension +
                                              "'; allowed: .jpg .jpeg .png .gif .webp");
  }
  if (bytes.empty()) {
    throw avatarpool::util::ValidationFailure("add avatar: file is empty");
  }
  if (bytes.size() > max_avatar_bytes_) {
    throw avatarpool::util::ValidationFailure("add avatar: file size " + std::to_string(bytes.size()) + " exceeds limit of " +
                                              std::to_string(max_avatar_bytes_) + " bytes");
  }

  AvatarRecord record;
  record.id              = avatarpool::util::GenerateUUIDString();
  record.name            = original.filename().stem().string();
  record.stored_filename = record.id + extension;
  record.created_at_ms   = avatarpool::util::ToUnixMillis(avatarpool::util::Now());

  const auto path = common::AvatarPath(directory_, record.stored_filename);

  std::lock_guard lock(write_mutex_);

  // file first: a record must never exist without its backing file
  avatarpool::storage::WriteFileAtomic(path, bytes);

  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertAvatar(*tx, record), "add avatar");
    tx->Commit();
  } catch (const std::exception& e) {
    AVATARPOOL_LOG_ERROR("Failed to persist avatar record; removing written file",
                         {StringField("avatar_id", record.id), StringField("error", e.what())});
    try {
      avatarpool::storage::RemoveFile(path);
    } catch (const std::exception& cleanup) {
      AVATARPOOL_LOG_WARN("Could not remove avatar file after failed insert",
                          {StringField("path", path.string()), StringField("error", cleanup.what())});
    }
    throw;
  }

  AVATARPOOL_LOG_INFO("Saved avatar", {StringField("avatar_id", record.id), StringField("name", record.name),
                                       IntField("size_bytes", static_cast<int64_t>(bytes.size()))});
  return record;
}

bool PoolStore::Remove(const std::string& avatar_id) {
  {
    std::lock_guard lock(write_mutex_);

    auto tx     = repository_->Begin();
    auto record = repository_->GetAvatar(*tx, avatar_id);
    if (!record.has_value()) {
      tx->Rollback();
      AVATARPOOL_LOG_WARN("Avatar not found for removal", {StringField("avatar_id", avatar_id)});
      return false;
    }

    const auto path = common::AvatarPath(directory_, record->stored_filename);
    if (avatarpool::storage::RemoveFile(path)) {
      AVATARPOOL_LOG_INFO("Deleted avatar file", {StringField("path", path.string())});
    } else {
      AVATARPOOL_LOG_WARN("Avatar file already missing; dropping record", {StringField("path", path.string())});
    }

    ThrowIfDbError(repository_->DeleteAvatar(*tx, avatar_id), "remove avatar");
    tx->Commit();

    AVATARPOOL_LOG_INFO("Removed avatar from pool", {StringField("avatar_id", avatar_id), StringField("name", record->name)});
  }

  RemovalHook hook;
  {
    std::lock_guard lock(hook_mutex_);
    hook = removal_hook_;
  }
  if (hook) {
    try {
      hook(avatar_id);
    } catch (const std::exception& e) {
      // dangling bindings are dropped by the next Validate() pass
      AVATARPOOL_LOG_ERROR("Failed to clear bindings for removed avatar",
                           {StringField("avatar_id", avatar_id), StringField("error", e.what())});
    }
  }
  return true;
}

ResolvedAvatar PoolStore::Resolve(const std::string& avatar_id) {
  auto record = Get(avatar_id);
  if (!record.has_value()) {
    throw avatarpool::util::AvatarNotFound("resolve avatar: unknown avatar " + avatar_id);
  }

  ResolvedAvatar resolved;
  resolved.path      = common::AvatarPath(directory_, record->stored_filename);
  resolved.mime_type = common::MimeTypeForExtension(common::LowercaseExtension(resolved.path));
  resolved.record    = std::move(*record);

  if (!avatarpool::storage::IsReadableFile(resolved.path)) {
    throw avatarpool::util::AvatarNotFound("resolve avatar: file missing for avatar " + avatar_id);
  }
  return resolved;
}

std::optional<AvatarRecord> PoolStore::Get(const std::string& avatar_id) {
  if (!avatarpool::util::IsCanonicalUUID(avatar_id)) {
    return std::nullopt;
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetAvatar(*tx, avatar_id);
  tx->Commit();
  return record;
}

std::vector<AvatarRecord> PoolStore::List() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListAvatars(*tx);
  tx->Commit();
  return records;
}

} // namespace avatarpool::pool

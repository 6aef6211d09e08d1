#include "binding_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace avatarpool::binding {

using avatarpool::observability::IntField;
using avatarpool::observability::StringField;

namespace {

void ThrowIfDbError(const avatarpool::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.Describe(context);
  switch (result.code) {
    case avatarpool::db::ErrorCode::NotFound:
      throw avatarpool::util::NotFound(message);
    default:
      throw avatarpool::util::IOFailure(message);
  }
}

} // namespace

BindingStore::BindingStore(std::shared_ptr<avatarpool::db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw avatarpool::util::InvariantViolation("binding store requires a repository");
  }
}

std::optional<std::string> BindingStore::Get(const std::string& user_id) {
  auto tx      = repository_->Begin();
  auto binding = repository_->GetBinding(*tx, user_id);
  tx->Commit();

  if (!binding.has_value()) return std::nullopt;
  return binding->avatar_id;
}

void BindingStore::Set(const std::string& user_id, const std::string& avatar_id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertBinding(*tx, {user_id, avatar_id}), "set binding");
  tx->Commit();
}

void BindingStore::Clear(const std::string& user_id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteBinding(*tx, user_id), "clear binding");
  tx->Commit();
}

uint64_t BindingStore::ClearAllFor(const std::string& avatar_id) {
  uint64_t removed = 0;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteBindingsForAvatar(*tx, avatar_id, &removed), "clear bindings for avatar");
  tx->Commit();

  if (removed > 0) {
    AVATARPOOL_LOG_WARN("Cleared bindings of removed avatar; users keep their current profile image",
                        {StringField("avatar_id", avatar_id), IntField("bindings", static_cast<int64_t>(removed))});
  }
  return removed;
}

void BindingStore::ClearMany(const std::vector<std::string>& user_ids) {
  if (user_ids.empty()) return;

  auto tx = repository_->Begin();
  for (const auto& user_id : user_ids) {
    ThrowIfDbError(repository_->DeleteBinding(*tx, user_id), "clear binding batch");
  }
  tx->Commit();
}

std::vector<avatarpool::db::model::BindingRecord> BindingStore::List() {
  auto tx       = repository_->Begin();
  auto bindings = repository_->ListBindings(*tx);
  tx->Commit();
  return bindings;
}

} // namespace avatarpool::binding

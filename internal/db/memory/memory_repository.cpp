#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace avatarpool::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static auto FindAvatar(std::vector<model::AvatarRecord>& avatars, const std::string& id) {
  return std::find_if(avatars.begin(), avatars.end(), [&](const model::AvatarRecord& r) { return r.id == id; });
}

Result MemoryRepository::InsertAvatar(Transaction& t, const model::AvatarRecord& r) {
  auto& s = TX(t).Mutable();
  if (FindAvatar(s.avatars, r.id) != s.avatars.end()) return Result::Err(ErrorCode::AlreadyExists);
  s.avatars.push_back(r);
  return Result::Ok();
}

std::optional<model::AvatarRecord> MemoryRepository::GetAvatar(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = FindAvatar(s.avatars, id);
  if (it == s.avatars.end()) return std::nullopt;
  return *it;
}

std::vector<model::AvatarRecord> MemoryRepository::ListAvatars(Transaction& t) {
  return TX(t).View().avatars;
}

Result MemoryRepository::DeleteAvatar(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = FindAvatar(s.avatars, id);
  if (it == s.avatars.end()) return Result::Err(ErrorCode::NotFound);
  s.avatars.erase(it);
  return Result::Ok();
}

Result MemoryRepository::UpsertBinding(Transaction& t, const model::BindingRecord& r) {
  TX(t).Mutable().bindings[r.user_id] = r;
  return Result::Ok();
}

std::optional<model::BindingRecord> MemoryRepository::GetBinding(Transaction& t, const std::string& user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.bindings.find(user_id);
  if (it == s.bindings.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BindingRecord> MemoryRepository::ListBindings(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::BindingRecord> records;
  records.reserve(s.bindings.size());
  for (const auto& [_, record] : s.bindings) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(),
            [](const model::BindingRecord& a, const model::BindingRecord& b) { return a.user_id < b.user_id; });
  return records;
}

Result MemoryRepository::DeleteBinding(Transaction& t, const std::string& user_id) {
  TX(t).Mutable().bindings.erase(user_id);
  return Result::Ok();
}

Result MemoryRepository::DeleteBindingsForAvatar(Transaction& t, const std::string& avatar_id, uint64_t* removed) {
  auto&    s     = TX(t).Mutable();
  uint64_t count = 0;
  for (auto it = s.bindings.begin(); it != s.bindings.end();) {
    if (it->second.avatar_id == avatar_id) {
      it = s.bindings.erase(it);
      ++count;
      continue;
    }
    ++it;
  }
  if (removed) *removed = count;
  return Result::Ok();
}

} // namespace avatarpool::db::memory

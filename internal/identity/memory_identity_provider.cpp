#include "memory_identity_provider.hpp"

#include "internal/util/errors.hpp"

namespace avatarpool::identity {

std::optional<User> MemoryIdentityProvider::GetUser(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            it = users_.find(id);
  if (it == users_.end()) return std::nullopt;
  return it->second;
}

std::vector<User> MemoryIdentityProvider::ListUsers() {
  std::lock_guard   lock(mutex_);
  std::vector<User> out;
  out.reserve(users_.size());
  for (const auto& [_, user] : users_) {
    out.push_back(user);
  }
  return out;
}

void MemoryIdentityProvider::PersistUser(const User& user) {
  std::lock_guard lock(mutex_);
  auto            it = users_.find(user.id);
  if (it == users_.end()) {
    throw avatarpool::util::UserNotFound("persist user: unknown user " + user.id);
  }
  it->second = user;
}

void MemoryIdentityProvider::AddUser(const User& user) {
  std::lock_guard lock(mutex_);
  users_[user.id] = user;
}

void MemoryIdentityProvider::RemoveUser(const std::string& id) {
  std::lock_guard lock(mutex_);
  users_.erase(id);
}

} // namespace avatarpool::identity

#pragma once

#include <map>
#include <mutex>

#include "identity_provider.hpp"

namespace avatarpool::identity {

/*
  In-process identity store. Used by tests and by deployments without a
  host user database.
*/
class MemoryIdentityProvider final : public IdentityProvider {
 public:
  std::optional<User> GetUser(const std::string& id) override;
  std::vector<User>   ListUsers() override;
  void                PersistUser(const User& user) override;

  // Adds or replaces a user.
  void AddUser(const User& user);
  void RemoveUser(const std::string& id);

 private:
  std::mutex                  mutex_;
  std::map<std::string, User> users_;
};

} // namespace avatarpool::identity

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace avatarpool::identity {

/*
  A user as seen through the host's identity subsystem.

  profile_image_path is the authoritative pointer to the user's current
  profile image; the binder writes the file and asks the provider to persist
  the pointer, but the provider owns it.
*/
struct User {
  std::string                id;
  std::string                name;
  std::optional<std::string> profile_image_path;
};

/*
  Identity collaborator consumed by the core.

  Implementations must be safe to call from multiple threads.
*/
class IdentityProvider {
 public:
  virtual ~IdentityProvider() = default;

  virtual std::optional<User> GetUser(const std::string& id) = 0;

  virtual std::vector<User> ListUsers() = 0;

  // Persists the user's fields. Throws on failure.
  virtual void PersistUser(const User& user) = 0;
};

} // namespace avatarpool::identity

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/binding_record.hpp"

namespace avatarpool::binding {

/*
  Durable user -> avatar mapping, unique by user id.

  Every mutation commits before returning, so a reported success survives an
  immediate crash. The referenced avatar is not validated here.
*/
class BindingStore {
 public:
  explicit BindingStore(std::shared_ptr<avatarpool::db::Repository> repository);

  std::optional<std::string> Get(const std::string& user_id);

  void Set(const std::string& user_id, const std::string& avatar_id);

  void Clear(const std::string& user_id);

  // Returns the number of bindings removed.
  uint64_t ClearAllFor(const std::string& avatar_id);

  // Removes all listed users' bindings in one transaction.
  void ClearMany(const std::vector<std::string>& user_ids);

  std::vector<avatarpool::db::model::BindingRecord> List();

 private:
  std::shared_ptr<avatarpool::db::Repository> repository_;
};

} // namespace avatarpool::binding

#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace avatarpool::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertAvatar(Transaction&, const model::AvatarRecord&) override;
  std::optional<model::AvatarRecord> GetAvatar(Transaction&, const std::string&) override;
  std::vector<model::AvatarRecord> ListAvatars(Transaction&) override;
  Result DeleteAvatar(Transaction&, const std::string&) override;

  Result UpsertBinding(Transaction&, const model::BindingRecord&) override;
  std::optional<model::BindingRecord> GetBinding(Transaction&, const std::string&) override;
  std::vector<model::BindingRecord> ListBindings(Transaction&) override;
  Result DeleteBinding(Transaction&, const std::string&) override;
  Result DeleteBindingsForAvatar(Transaction&, const std::string& avatar_id, uint64_t* removed) override;

private:
  friend class MemoryTransaction;

  struct State {
    // insertion order is the pool's list order
    std::vector<model::AvatarRecord> avatars;
    std::unordered_map<std::string, model::BindingRecord> bindings;
  };

  // held for the lifetime of a transaction, like sqlite's BEGIN IMMEDIATE
  std::mutex writer_mutex_;

  std::mutex mutex_;
  State committed_;
};

}

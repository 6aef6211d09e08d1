#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/avatar_record.hpp"
#include "internal/db/model/binding_record.hpp"

namespace avatarpool::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A committed transaction survives a crash immediately after Commit()
  - ListAvatars returns insertion order

  The DB is the source of truth for:
    the pool list
    the binding list
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Pool
  // ---------------------------------------------------------------------

  virtual Result InsertAvatar(Transaction&, const model::AvatarRecord&) = 0;

  virtual std::optional<model::AvatarRecord> GetAvatar(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::AvatarRecord> ListAvatars(Transaction&) = 0;

  // NotFound if the id is unknown.
  virtual Result DeleteAvatar(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Bindings
  // ---------------------------------------------------------------------

  virtual Result UpsertBinding(Transaction&, const model::BindingRecord&) = 0;

  virtual std::optional<model::BindingRecord> GetBinding(Transaction&, const std::string& user_id) = 0;

  virtual std::vector<model::BindingRecord> ListBindings(Transaction&) = 0;

  // OK even if no binding exists.
  virtual Result DeleteBinding(Transaction&, const std::string& user_id) = 0;

  // Removes every binding referencing avatar_id; `removed` receives the count.
  virtual Result DeleteBindingsForAvatar(Transaction&, const std::string& avatar_id, uint64_t* removed) = 0;
};

} // namespace avatarpool::db

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/avatar_record.hpp"
#include "internal/db/model/binding_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/identity/sqlite_identity_provider.hpp"
#include "internal/util/errors.hpp"

namespace {

using avatarpool::db::ErrorCode;
using avatarpool::db::Repository;
using avatarpool::db::memory::MemoryRepository;
using avatarpool::db::model::AvatarRecord;
using avatarpool::db::model::BindingRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

AvatarRecord MakeAvatar(const std::string& id, const std::string& name) {
  return AvatarRecord{id, name, id + ".png", NowMs()};
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

void VerifyAvatarInsertGetDelete(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const auto avatar = MakeAvatar(prefix + "-avatar", "Sunset");
  assert(repo.InsertAvatar(*tx, avatar));

  auto read = repo.GetAvatar(*tx, avatar.id);
  assert(read.has_value());
  assert(read->name == "Sunset");
  assert(read->stored_filename == avatar.stored_filename);
  assert(read->created_at_ms == avatar.created_at_ms);

  auto duplicate = repo.InsertAvatar(*tx, avatar);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists || duplicate.code == ErrorCode::ConstraintViolation);

  assert(repo.DeleteAvatar(*tx, avatar.id));
  assert(!repo.GetAvatar(*tx, avatar.id).has_value());

  auto missing = repo.DeleteAvatar(*tx, avatar.id);
  assert(missing.code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyListKeepsInsertionOrder(Repository& repo, const std::string& prefix) {
  const std::vector<std::string> ids = {prefix + "-z", prefix + "-a", prefix + "-m"};
  {
    auto tx = repo.Begin();
    for (const auto& id : ids) {
      assert(repo.InsertAvatar(*tx, MakeAvatar(id, "same-name")));
    }
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto listed = repo.ListAvatars(*tx);
  tx->Commit();

  std::vector<std::string> ours;
  for (const auto& record : listed) {
    if (record.id.rfind(prefix, 0) == 0) ours.push_back(record.id);
  }
  assert(ours == ids);
}

void VerifyBindingUpsertAndDelete(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const auto user = prefix + "-user";
  assert(repo.UpsertBinding(*tx, BindingRecord{user, "a1"}));
  assert(repo.UpsertBinding(*tx, BindingRecord{user, "a2"}));

  auto read = repo.GetBinding(*tx, user);
  assert(read.has_value());
  assert(read->avatar_id == "a2");

  assert(repo.DeleteBinding(*tx, user));
  assert(!repo.GetBinding(*tx, user).has_value());
  assert(repo.DeleteBinding(*tx, user));

  tx->Commit();
}

void VerifyDeleteBindingsForAvatar(Repository& repo, const std::string& prefix) {
  const auto target = prefix + "-shared-avatar";

  auto tx = repo.Begin();
  assert(repo.UpsertBinding(*tx, BindingRecord{prefix + "-u1", target}));
  assert(repo.UpsertBinding(*tx, BindingRecord{prefix + "-u2", target}));
  assert(repo.UpsertBinding(*tx, BindingRecord{prefix + "-u3", prefix + "-other"}));

  uint64_t removed = 0;
  assert(repo.DeleteBindingsForAvatar(*tx, target, &removed));
  assert(removed == 2);

  removed = 99;
  assert(repo.DeleteBindingsForAvatar(*tx, target, &removed));
  assert(removed == 0);

  assert(repo.GetBinding(*tx, prefix + "-u3").has_value());
  assert(repo.DeleteBinding(*tx, prefix + "-u3"));
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertAvatar(*tx, MakeAvatar(prefix + "-rolled-back", "x")));
    assert(repo.UpsertBinding(*tx, BindingRecord{prefix + "-rolled-back-user", "x"}));
    tx->Rollback();
  }
  {
    // destructor rolls back an unfinished transaction
    auto tx = repo.Begin();
    assert(repo.InsertAvatar(*tx, MakeAvatar(prefix + "-abandoned", "x")));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetAvatar(*check_tx, prefix + "-rolled-back").has_value());
  assert(!repo.GetAvatar(*check_tx, prefix + "-abandoned").has_value());
  assert(!repo.GetBinding(*check_tx, prefix + "-rolled-back-user").has_value());
  check_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertAvatar(*tx, MakeAvatar(prefix + "-first", "first")));
    assert(repo->InsertAvatar(*tx, MakeAvatar(prefix + "-second", "second")));
    assert(repo->UpsertBinding(*tx, BindingRecord{prefix + "-user", prefix + "-second"}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx      = repo->Begin();
  auto avatars = repo->ListAvatars(*tx);
  assert(avatars.size() >= 2);
  assert(avatars[avatars.size() - 2].id == prefix + "-first");
  assert(avatars[avatars.size() - 1].id == prefix + "-second");

  auto binding = repo->GetBinding(*tx, prefix + "-user");
  assert(binding.has_value());
  assert(binding->avatar_id == prefix + "-second");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("avatar_pool_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<avatarpool::db::sqlite::SqliteDB>(db_path);
    avatarpool::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<avatarpool::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart =
          [make_repo](std::shared_ptr<Repository>& repo) {
            repo.reset();
            repo = make_repo();
          },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  auto repo = backend.make_repository();

  VerifyAvatarInsertGetDelete(*repo, backend.name + "-crud");
  VerifyListKeepsInsertionOrder(*repo, backend.name + "-order");
  VerifyBindingUpsertAndDelete(*repo, backend.name + "-binding");
  VerifyDeleteBindingsForAvatar(*repo, backend.name + "-cascade");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");

  repo.reset();
  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

// Identity table sharing the repository's database file, as the factory wires it
// when both paths are equal.
void VerifySqliteIdentityProvider() {
  const auto db_path = (std::filesystem::temp_directory_path() / ("avatar_pool_integration_identity_" + std::to_string(NowMs()) + ".db")).string();

  {
    auto db = std::make_shared<avatarpool::db::sqlite::SqliteDB>(db_path);
    avatarpool::db::sqlite::BootstrapSchema(*db);
    avatarpool::db::sqlite::SqliteRepository     repo(db);
    avatarpool::identity::SqliteIdentityProvider identity(db);

    identity.UpsertUser({"bob", "Bob", std::nullopt});
    identity.UpsertUser({"alice", "Alice", std::string("/profiles/alice/profile_avatar_x_1.png")});

    auto alice = identity.GetUser("alice");
    assert(alice.has_value());
    assert(alice->name == "Alice");
    assert(alice->profile_image_path == std::optional<std::string>("/profiles/alice/profile_avatar_x_1.png"));

    alice->profile_image_path.reset();
    identity.PersistUser(*alice);
    assert(!identity.GetUser("alice")->profile_image_path.has_value());

    bool threw = false;
    try {
      identity.PersistUser({"mallory", "Mallory", std::nullopt});
    } catch (const avatarpool::util::UserNotFound&) {
      threw = true;
    }
    assert(threw);
    assert(!identity.GetUser("mallory").has_value());

    // repository transactions and identity writes interleave on one handle
    auto tx = repo.Begin();
    assert(repo.UpsertBinding(*tx, BindingRecord{"bob", "a1"}));
    tx->Commit();
    identity.PersistUser({"bob", "Robert", std::string("/profiles/bob/p.png")});
  }

  auto                                         db = std::make_shared<avatarpool::db::sqlite::SqliteDB>(db_path);
  avatarpool::identity::SqliteIdentityProvider identity(db);

  const auto users = identity.ListUsers();
  assert(users.size() == 2);
  assert(users[0].id == "alice" && users[1].id == "bob");
  assert(users[1].name == "Robert");
  assert(users[1].profile_image_path == std::optional<std::string>("/profiles/bob/p.png"));

  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifySqliteIdentityProvider();

  std::cout << "avatar_pool_integration_repository_parity: pass\n";
  return 0;
}

#include "internal/core/profile_image_binder.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/binding/binding_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/identity/memory_identity_provider.hpp"
#include "internal/pool/pool_store.hpp"
#include "internal/storage/file_io.hpp"
#include "internal/util/errors.hpp"

namespace {

using avatarpool::binding::BindingStore;
using avatarpool::core::ProfileImageBinder;
using avatarpool::db::memory::MemoryRepository;
using avatarpool::identity::IdentityProvider;
using avatarpool::identity::MemoryIdentityProvider;
using avatarpool::identity::User;
using avatarpool::pool::PoolStore;

// Delegates to an in-memory provider; PersistUser fails while fail_persist is set.
class FlakyIdentityProvider : public IdentityProvider {
 public:
  std::optional<User> GetUser(const std::string& id) override {
    return inner.GetUser(id);
  }

  std::vector<User> ListUsers() override {
    return inner.ListUsers();
  }

  void PersistUser(const User& user) override {
    if (fail_persist.load()) {
      throw std::runtime_error("user database is read-only");
    }
    inner.PersistUser(user);
  }

  MemoryIdentityProvider inner;
  std::atomic<bool>      fail_persist{false};
};

struct Fixture {
  explicit Fixture(const std::string& test_name) {
    root = std::filesystem::temp_directory_path() / "avatar_pool_binder_tests" / test_name;
    std::filesystem::remove_all(root);

    repository = std::make_shared<MemoryRepository>();
    pool       = std::make_shared<PoolStore>(root / "pool", repository);
    bindings   = std::make_shared<BindingStore>(repository);
    identity   = std::make_shared<FlakyIdentityProvider>();
    binder     = std::make_shared<ProfileImageBinder>(pool, bindings, identity, root / "users");

    auto weak = std::weak_ptr<BindingStore>(bindings);
    pool->SetRemovalHook([weak](const std::string& avatar_id) {
      if (auto store = weak.lock()) store->ClearAllFor(avatar_id);
    });
  }

  std::string AddAvatar(const std::string& filename, uint8_t fill, size_t size = 4096) {
    return pool->Add(filename, std::vector<uint8_t>(size, fill)).id;
  }

  void AddUser(const std::string& id) {
    identity->inner.AddUser(User{id, id, std::nullopt});
  }

  std::optional<std::string> Pointer(const std::string& user_id) {
    return identity->GetUser(user_id)->profile_image_path;
  }

  std::vector<std::filesystem::path> ProfileFiles(const std::string& user_id) {
    std::vector<std::filesystem::path> files;
    const auto                         dir = root / "users" / user_id;
    if (!std::filesystem::exists(dir)) return files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
      if (entry.is_regular_file()) files.push_back(entry.path());
    }
    return files;
  }

  std::filesystem::path                  root;
  std::shared_ptr<MemoryRepository>      repository;
  std::shared_ptr<PoolStore>             pool;
  std::shared_ptr<BindingStore>          bindings;
  std::shared_ptr<FlakyIdentityProvider> identity;
  std::shared_ptr<ProfileImageBinder>    binder;
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestBindMaterializesIdenticalCopy() {
  Fixture    f("bind_copy");
  const auto avatar_id = f.AddAvatar("Cat.JPG", 0x42);
  f.AddUser("alice");

  const auto image = f.binder->Bind("alice", avatar_id);

  assert(f.binder->ProfilesRoot() == f.root / "users");
  assert(image.path.parent_path() == f.binder->ProfileDirectory("alice"));
  assert(image.path.filename().string().rfind("profile_avatar_" + avatar_id + "_", 0) == 0);
  assert(image.path.extension() == ".jpg");
  assert(!image.previous_path.has_value());

  const auto pool_bytes = avatarpool::storage::ReadFile(f.pool->Resolve(avatar_id).path);
  assert(avatarpool::storage::ReadFile(image.path) == pool_bytes);

  assert(f.Pointer("alice") == std::optional<std::string>(image.path.string()));
  assert(f.bindings->Get("alice") == std::optional<std::string>(avatar_id));
}

void TestRebindSameAvatarReplacesFile() {
  Fixture    f("rebind_same");
  const auto avatar_id = f.AddAvatar("a.png", 0x01);
  f.AddUser("alice");

  const auto first  = f.binder->Bind("alice", avatar_id);
  const auto second = f.binder->Bind("alice", avatar_id);

  assert(second.path != first.path);
  assert(second.previous_path == std::optional<std::filesystem::path>(first.path));
  assert(second.previous_removed);
  assert(!std::filesystem::exists(first.path));

  const auto files = f.ProfileFiles("alice");
  assert(files.size() == 1 && files[0] == second.path);
  assert(f.Pointer("alice") == std::optional<std::string>(second.path.string()));
  assert(f.bindings->Get("alice") == std::optional<std::string>(avatar_id));
}

void TestRebindSwitchesAvatar() {
  Fixture    f("rebind_other");
  const auto first_id  = f.AddAvatar("a.png", 0x01);
  const auto second_id = f.AddAvatar("b.gif", 0x02, 100);
  f.AddUser("alice");

  f.binder->Bind("alice", first_id);
  const auto image = f.binder->Bind("alice", second_id);

  assert(image.path.extension() == ".gif");
  assert(avatarpool::storage::ReadFile(image.path) == std::vector<uint8_t>(100, 0x02));
  assert(f.ProfileFiles("alice").size() == 1);
  assert(f.bindings->Get("alice") == std::optional<std::string>(second_id));
}

void TestUnknownAvatarOrUserHasNoSideEffects() {
  Fixture    f("unknown");
  const auto avatar_id = f.AddAvatar("a.png", 0x01);
  f.AddUser("alice");

  assert(Throws<avatarpool::util::AvatarNotFound>([&]() { f.binder->Bind("alice", "no-such-avatar"); }));
  assert(Throws<avatarpool::util::UserNotFound>([&]() { f.binder->Bind("mallory", avatar_id); }));

  assert(f.ProfileFiles("alice").empty());
  assert(f.ProfileFiles("mallory").empty());
  assert(!f.Pointer("alice").has_value());
  assert(f.bindings->List().empty());
}

void TestPointerUpdateFailureRollsBackCopy() {
  Fixture    f("pointer_rollback");
  const auto old_id = f.AddAvatar("a.png", 0x01);
  const auto new_id = f.AddAvatar("b.png", 0x02);
  f.AddUser("alice");

  const auto original = f.binder->Bind("alice", old_id);

  f.identity->fail_persist = true;
  assert(Throws<avatarpool::util::PointerUpdateFailed>([&]() { f.binder->Bind("alice", new_id); }));

  // exactly the original file remains and everything still points at it
  const auto files = f.ProfileFiles("alice");
  assert(files.size() == 1 && files[0] == original.path);
  assert(f.Pointer("alice") == std::optional<std::string>(original.path.string()));
  assert(f.bindings->Get("alice") == std::optional<std::string>(old_id));
}

void TestCancelledBindLeavesNothingBehind() {
  Fixture    f("cancelled");
  const auto avatar_id = f.AddAvatar("a.webp", 0x03, 300 * 1024);
  f.AddUser("alice");

  avatarpool::runtime::CancellationSource source;
  source.Cancel();

  assert(Throws<avatarpool::util::Cancelled>([&]() { f.binder->Bind("alice", avatar_id, source.Token()); }));
  assert(f.ProfileFiles("alice").empty());
  assert(!f.Pointer("alice").has_value());
  assert(!f.bindings->Get("alice").has_value());
}

void TestPreviousFileDeleteFailureIsNonFatal() {
  Fixture    f("previous_delete_failure");
  const auto avatar_id = f.AddAvatar("a.png", 0x01);
  f.AddUser("alice");

  // a non-empty directory cannot be removed as a file
  const auto stubborn = f.root / "host-managed";
  std::filesystem::create_directories(stubborn);
  std::ofstream(stubborn / "keep.txt") << "x";
  f.identity->inner.AddUser(User{"alice", "alice", stubborn.string()});

  const auto image = f.binder->Bind("alice", avatar_id);
  assert(!image.previous_removed);
  assert(std::filesystem::exists(stubborn));
  assert(f.Pointer("alice") == std::optional<std::string>(image.path.string()));
  assert(f.bindings->Get("alice") == std::optional<std::string>(avatar_id));
}

void TestUnbindClearsEverything() {
  Fixture    f("unbind");
  const auto avatar_id = f.AddAvatar("a.png", 0x01);
  f.AddUser("alice");

  const auto image = f.binder->Bind("alice", avatar_id);

  assert(f.binder->Unbind("alice"));
  assert(!f.Pointer("alice").has_value());
  assert(!std::filesystem::exists(image.path));
  assert(!f.bindings->Get("alice").has_value());

  assert(!f.binder->Unbind("alice"));
  assert(Throws<avatarpool::util::UserNotFound>([&]() { f.binder->Unbind("mallory"); }));
}

void TestUnbindPersistFailureKeepsState() {
  Fixture    f("unbind_failure");
  const auto avatar_id = f.AddAvatar("a.png", 0x01);
  f.AddUser("alice");

  const auto image = f.binder->Bind("alice", avatar_id);

  f.identity->fail_persist = true;
  assert(Throws<avatarpool::util::PointerUpdateFailed>([&]() { f.binder->Unbind("alice"); }));
  assert(std::filesystem::exists(image.path));
  assert(f.Pointer("alice") == std::optional<std::string>(image.path.string()));
  assert(f.bindings->Get("alice") == std::optional<std::string>(avatar_id));
}

void TestPoolRemovalDoesNotCascade() {
  Fixture    f("removal_non_cascade");
  const auto avatar_id = f.AddAvatar("a.png", 0x01);
  f.AddUser("alice");

  const auto image = f.binder->Bind("alice", avatar_id);

  assert(f.pool->Remove(avatar_id));
  assert(!f.bindings->Get("alice").has_value());
  assert(f.Pointer("alice") == std::optional<std::string>(image.path.string()));
  assert(std::filesystem::exists(image.path));
}

void TestUninitializedBinderIsRejected() {
  Fixture            f("uninitialized");
  ProfileImageBinder broken(f.pool, f.bindings, nullptr, f.root / "users");

  assert(Throws<avatarpool::util::InvariantViolation>([&]() { broken.Bind("alice", "a"); }));
  assert(Throws<avatarpool::util::InvariantViolation>([&]() { broken.Unbind("alice"); }));
}

void TestUnsafeUserIdIsRejected() {
  Fixture    f("unsafe_user_id");
  const auto avatar_id = f.AddAvatar("a.png", 0x01);
  f.identity->inner.AddUser(User{"../escape", "Escape", std::nullopt});
  f.identity->inner.AddUser(User{"team/alice", "Alice", std::nullopt});

  assert(Throws<avatarpool::util::ValidationFailure>([&]() { f.binder->Bind("../escape", avatar_id); }));
  assert(Throws<avatarpool::util::ValidationFailure>([&]() { f.binder->Bind("team/alice", avatar_id); }));
  assert(Throws<avatarpool::util::ValidationFailure>([&]() { f.binder->Unbind("team/alice"); }));

  assert(!std::filesystem::exists(f.root / "escape"));
  assert(!std::filesystem::exists(f.root / "users" / "team"));
  assert(!f.identity->GetUser("team/alice")->profile_image_path.has_value());
  assert(f.bindings->List().empty());
}

} // namespace

int main() {
  TestBindMaterializesIdenticalCopy();
  TestRebindSameAvatarReplacesFile();
  TestRebindSwitchesAvatar();
  TestUnknownAvatarOrUserHasNoSideEffects();
  TestPointerUpdateFailureRollsBackCopy();
  TestCancelledBindLeavesNothingBehind();
  TestPreviousFileDeleteFailureIsNonFatal();
  TestUnbindClearsEverything();
  TestUnbindPersistFailureKeepsState();
  TestPoolRemovalDoesNotCascade();
  TestUninitializedBinderIsRejected();
  TestUnsafeUserIdIsRejected();

  std::cout << "avatar_pool_unit_profile_image_binder: pass\n";
  return 0;
}

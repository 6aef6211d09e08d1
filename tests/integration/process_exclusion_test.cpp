#include <sys/wait.h>
#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/identity/sqlite_identity_provider.hpp"
#include "internal/service/avatar_service.hpp"
#include "internal/storage/file_io.hpp"

namespace {

using avatarpool::storage::FileLock;

constexpr int kRounds = 300;

std::filesystem::path FreshRoot(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "avatar_pool_process_tests" / test_name;
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);
  return root;
}

// Daemon and avatarctl build the same graph from the same file.
avatarpool::runtime::config::RuntimeConfig SharedConfig(const std::filesystem::path& root) {
  const auto db = (root / "avatar-pool.db").string();
  return avatarpool::config::ConfigLoader::LoadFromString("pool:\n"
                                                          "  directory: \"" + (root / "pool").string() + "\"\n"
                                                          "profiles:\n"
                                                          "  root: \"" + (root / "users").string() + "\"\n"
                                                          "database:\n"
                                                          "  sqlite:\n"
                                                          "    path: \"" + db + "\"\n"
                                                          "identity:\n"
                                                          "  sqlite:\n"
                                                          "    path: \"" + db + "\"\n"
                                                          "reconcile:\n"
                                                          "  enabled: false\n");
}

int WaitForChild(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

void TestFileLockExcludesOtherProcesses() {
  const auto root      = FreshRoot("file_lock");
  const auto lock_path = root / "service.lock";
  const auto marker    = root / "released";

  int ready[2];
  assert(::pipe(ready) == 0);

  const pid_t child = ::fork();
  assert(child >= 0);
  if (child == 0) {
    ::close(ready[0]);
    {
      FileLock lock(lock_path, FileLock::Mode::kExclusive);
      const char byte = 'x';
      if (::write(ready[1], &byte, 1) != 1) ::_exit(1);
      ::usleep(200 * 1000);
      std::ofstream(marker) << "done";
    }
    ::_exit(0);
  }

  ::close(ready[1]);
  char byte = 0;
  assert(::read(ready[0], &byte, 1) == 1);
  ::close(ready[0]);

  {
    // granted only after the child wrote the marker and let go
    FileLock lock(lock_path, FileLock::Mode::kShared);
    assert(std::filesystem::exists(marker));
  }
  assert(WaitForChild(child) == 0);
}

void TestSharedFileLocksCoexist() {
  const auto root      = FreshRoot("file_lock_shared");
  const auto lock_path = root / "nested" / "service.lock";

  FileLock first(lock_path, FileLock::Mode::kShared);
  FileLock second(lock_path, FileLock::Mode::kShared);
  assert(std::filesystem::exists(lock_path));
}

void TestCollectionInOtherProcessNeverEatsFreshBind() {
  const auto root   = FreshRoot("gc_vs_bind");
  const auto config = SharedConfig(root);

  std::string avatar_id;
  {
    auto app      = avatarpool::factory::Build(config);
    auto identity = std::dynamic_pointer_cast<avatarpool::identity::SqliteIdentityProvider>(app.identity);
    assert(identity);
    identity->UpsertUser({"alice", "Alice", std::nullopt});
    avatar_id = app.service->AddAvatar("a.png", std::vector<uint8_t>(16 * 1024, 0x5a)).id;
  }

  // the child opens its own connections, like a second avatarctl would
  const pid_t child = ::fork();
  assert(child >= 0);
  if (child == 0) {
    int rc = 0;
    try {
      auto app = avatarpool::factory::Build(config);
      for (int i = 0; i < kRounds; ++i) {
        (void)app.service->CollectOrphans();
      }
    } catch (const std::exception& e) {
      std::cerr << "collector failed: " << e.what() << "\n";
      rc = 1;
    }
    ::_exit(rc);
  }

  int  lost = 0;
  auto app  = avatarpool::factory::Build(config);
  for (int i = 0; i < kRounds; ++i) {
    const auto image = app.service->Bind("alice", avatar_id);
    if (!std::filesystem::exists(image.path)) {
      std::cerr << "committed profile image gone: " << image.path << "\n";
      ++lost;
    }
  }

  assert(WaitForChild(child) == 0);
  assert(lost == 0);

  const auto pointer = app.identity->GetUser("alice")->profile_image_path;
  assert(pointer.has_value() && avatarpool::storage::IsReadableFile(*pointer));
}

} // namespace

int main() {
  TestFileLockExcludesOtherProcesses();
  TestSharedFileLocksCoexist();
  TestCollectionInOtherProcessNeverEatsFreshBind();

  std::cout << "avatar_pool_integration_process_exclusion: pass\n";
  return 0;
}

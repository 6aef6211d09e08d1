#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/identity/identity_provider.hpp"
#include "internal/identity/sqlite_identity_provider.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/avatar_service.hpp"
#include "internal/storage/file_io.hpp"
#include "internal/util/errors.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  avatarctl --config <config.yaml> list\n"
            << "  avatarctl --config <config.yaml> add <file>\n"
            << "  avatarctl --config <config.yaml> remove <avatar_id>\n"
            << "  avatarctl --config <config.yaml> resolve <avatar_id>\n"
            << "  avatarctl --config <config.yaml> bind <user_id> <avatar_id>\n"
            << "  avatarctl --config <config.yaml> unbind <user_id>\n"
            << "  avatarctl --config <config.yaml> binding <user_id>\n"
            << "  avatarctl --config <config.yaml> users\n"
            << "  avatarctl --config <config.yaml> add-user <user_id> [name]\n"
            << "  avatarctl --config <config.yaml> validate\n"
            << "  avatarctl --config <config.yaml> gc\n";
}

static int Run(avatarpool::service::AvatarService& service, avatarpool::identity::IdentityProvider& identity, const std::string& cmd,
               const std::vector<std::string>& args) {
  // ------------------------------------------------------------

  if (cmd == "list") {
    for (const auto& avatar : service.ListAvatars()) {
      std::cout << avatar.id << "\t" << avatar.name << "\t" << avatar.stored_filename << "\t" << avatar.created_at_ms << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add") {
    if (args.size() < 1) return 1;

    const std::filesystem::path file(args[0]);
    const auto                  record = service.AddAvatar(file.filename().string(), avatarpool::storage::ReadFile(file));

    std::cout << record.id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "remove") {
    if (args.size() < 1) return 1;

    if (!service.RemoveAvatar(args[0])) {
      std::cerr << "no such avatar: " << args[0] << "\n";
      return 2;
    }
    std::cout << "removed\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resolve") {
    if (args.size() < 1) return 1;

    const auto resolved = service.Resolve(args[0]);
    std::cout << "path=" << resolved.path.string() << " mime=" << resolved.mime_type << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "bind") {
    if (args.size() < 2) return 1;

    const auto image = service.Bind(args[0], args[1]);
    std::cout << "path=" << image.path.string() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "unbind") {
    if (args.size() < 1) return 1;

    std::cout << (service.Unbind(args[0]) ? "unbound" : "nothing to unbind") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "binding") {
    if (args.size() < 1) return 1;

    const auto avatar_id = service.GetBinding(args[0]);
    if (!avatar_id.has_value()) {
      std::cerr << "no binding for user: " << args[0] << "\n";
      return 2;
    }
    std::cout << *avatar_id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "users") {
    for (const auto& user : identity.ListUsers()) {
      std::cout << user.id << "\t" << user.name << "\t" << user.profile_image_path.value_or("-") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-user") {
    if (args.size() < 1) return 1;

    // only a persistent user table outlives this process
    auto* sqlite_identity = dynamic_cast<avatarpool::identity::SqliteIdentityProvider*>(&identity);
    if (sqlite_identity == nullptr) {
      std::cerr << "add-user requires identity.sqlite in the config\n";
      return 2;
    }

    auto user = identity.GetUser(args[0]).value_or(avatarpool::identity::User{args[0], args[0], std::nullopt});
    if (args.size() > 1) user.name = args[1];
    sqlite_identity->UpsertUser(user);
    std::cout << "user " << user.id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "validate") {
    const auto report = service.ValidateWithReport();
    std::cout << "checked=" << report.checked << " repaired=" << report.repaired << " removed=" << report.removed << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "gc") {
    std::cout << "deleted=" << service.CollectOrphans() << "\n";
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  const std::string        cmd         = argv[3];
  std::vector<std::string> args(argv + 4, argv + argc);

  try {
    auto config = avatarpool::config::ConfigLoader::LoadFromYaml(config_path);
    if (config.logging().level().empty()) {
      config.mutable_logging()->set_level("warn");
    }
    avatarpool::observability::InitializeLogging(config);

    auto app = avatarpool::factory::Build(config);

    const int rc = Run(*app.service, *app.identity, cmd, args);
    if (rc == 1) {
      Usage();
    }
    avatarpool::observability::ShutdownLogging();
    return rc;
  } catch (const avatarpool::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
  } catch (const avatarpool::util::ValidationFailure& e) {
    std::cerr << "invalid: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
  }
  avatarpool::observability::ShutdownLogging();
  return 2;
}

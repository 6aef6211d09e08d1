#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/binding/binding_store.hpp"
#include "internal/core/profile_image_binder.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/identity/memory_identity_provider.hpp"
#include "internal/identity/sqlite_identity_provider.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pool/pool_store.hpp"
#include "internal/reconcile/reconciler.hpp"
#include "internal/runtime/startup_reconciler.hpp"
#include "internal/service/avatar_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace avatarpool::factory {

using namespace avatarpool;

namespace {

constexpr std::chrono::milliseconds kDefaultStartupDelay{5000};

// One connection per database file; the repository and the identity provider
// share it when both point at the same path.
class SqliteConnections {
 public:
  std::shared_ptr<db::sqlite::SqliteDB> Open(const std::string& path) {
    if (db_ && db_->Path() == path) {
      return db_;
    }
    auto opened = std::make_shared<db::sqlite::SqliteDB>(path);
    if (!db_) {
      db_ = opened;
    }
    return opened;
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

std::shared_ptr<db::Repository> BuildRepository(const avatarpool::runtime::config::RuntimeConfig& config, SqliteConnections& connections) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is empty");
    }
    auto sqlite_db = connections.Open(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    AVATARPOOL_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  AVATARPOOL_LOG_WARN("No database configured; avatar records and bindings will not survive a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<identity::IdentityProvider> BuildIdentity(const avatarpool::runtime::config::RuntimeConfig& config,
                                                          SqliteConnections&                                connections) {
  const auto& identity_config = config.identity();
  if (identity_config.has_sqlite()) {
    if (identity_config.sqlite().path().empty()) {
      throw std::runtime_error("identity.sqlite.path is empty");
    }
    AVATARPOOL_LOG_INFO("Using sqlite identity provider", {observability::StringField("path", identity_config.sqlite().path())});
    return std::make_shared<identity::SqliteIdentityProvider>(connections.Open(identity_config.sqlite().path()));
  }

  AVATARPOOL_LOG_WARN("No identity backend configured; using an empty in-memory user set");
  return std::make_shared<identity::MemoryIdentityProvider>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const avatarpool::runtime::config::RuntimeConfig& config) {
  Application       app;
  SqliteConnections connections;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config, connections);
  app.identity   = BuildIdentity(config, connections);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const uint64_t max_bytes = config.pool().max_avatar_bytes() == 0 ? storage::common::kMaxAvatarBytes : config.pool().max_avatar_bytes();

  app.pool     = std::make_shared<pool::PoolStore>(config.pool().directory(), app.repository, max_bytes);
  app.bindings = std::make_shared<binding::BindingStore>(app.repository);

  // Removing an avatar clears its bindings; profile images stay with the users.
  std::weak_ptr<binding::BindingStore> weak_bindings = app.bindings;
  app.pool->SetRemovalHook([weak_bindings](const std::string& avatar_id) {
    if (auto bindings = weak_bindings.lock()) {
      bindings->ClearAllFor(avatar_id);
    }
  });

  app.binder     = std::make_shared<core::ProfileImageBinder>(app.pool, app.bindings, app.identity, config.profiles().root());
  app.reconciler = std::make_shared<reconcile::Reconciler>(app.pool, app.bindings, app.identity, app.binder);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.pool       = app.pool;
  ctx.bindings   = app.bindings;
  ctx.identity   = app.identity;
  ctx.binder     = app.binder;
  ctx.reconciler = app.reconciler;

  app.service = std::make_shared<service::AvatarService>(ctx);

  // ------------------------------------------------------------------
  // Startup reconciliation
  // ------------------------------------------------------------------
  const auto& reconcile = config.reconcile();
  if (!reconcile.has_enabled() || reconcile.enabled()) {
    const auto delay = reconcile.startup_delay().empty() ? kDefaultStartupDelay : util::ParseDuration(reconcile.startup_delay());
    const bool collect_orphans = !reconcile.has_collect_orphans() || reconcile.collect_orphans();
    app.startup_reconciler     = std::make_shared<runtime::StartupReconciler>(app.service, delay, collect_orphans);
  }

  return app;
}

} // namespace avatarpool::factory

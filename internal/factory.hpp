#pragma once

#include <memory>

#include "config/config.pb.h"

namespace avatarpool::db {
class Repository;
}
namespace avatarpool::pool {
class PoolStore;
}
namespace avatarpool::binding {
class BindingStore;
}
namespace avatarpool::identity {
class IdentityProvider;
}
namespace avatarpool::core {
class ProfileImageBinder;
}
namespace avatarpool::reconcile {
class Reconciler;
}
namespace avatarpool::service {
class AvatarService;
}
namespace avatarpool::runtime {
class StartupReconciler;
}

namespace avatarpool::factory {

/*
  Application

  Owns every long-lived component. Everything here lives for the lifetime of
  the process.
*/
struct Application {
  std::shared_ptr<avatarpool::db::Repository>             repository;
  std::shared_ptr<avatarpool::pool::PoolStore>            pool;
  std::shared_ptr<avatarpool::binding::BindingStore>      bindings;
  std::shared_ptr<avatarpool::identity::IdentityProvider> identity;
  std::shared_ptr<avatarpool::core::ProfileImageBinder>   binder;
  std::shared_ptr<avatarpool::reconcile::Reconciler>      reconciler;
  std::shared_ptr<avatarpool::service::AvatarService>     service;

  // Null when reconcile.enabled is false. Not started by Build.
  std::shared_ptr<avatarpool::runtime::StartupReconciler> startup_reconciler;
};

/*
  Build

  Composition root: the only place that knows concrete repository and
  identity types.
*/
Application Build(const avatarpool::runtime::config::RuntimeConfig& config);

} // namespace avatarpool::factory

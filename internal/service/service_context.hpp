#pragma once

#include <memory>

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

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<avatarpool::pool::PoolStore>            pool;
  std::shared_ptr<avatarpool::binding::BindingStore>      bindings;
  std::shared_ptr<avatarpool::identity::IdentityProvider> identity;
  std::shared_ptr<avatarpool::core::ProfileImageBinder>   binder;
  std::shared_ptr<avatarpool::reconcile::Reconciler>      reconciler;
};

} // namespace avatarpool::service

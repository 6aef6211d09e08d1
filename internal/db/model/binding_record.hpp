#pragma once

#include <string>

namespace avatarpool::db::model {

/*
  User -> avatar selection. At most one row per user.

  avatar_id is not a foreign key; the referenced pool entry may be gone.
*/

struct BindingRecord {
  std::string user_id;
  std::string avatar_id;
};

}

#pragma once

#include <cstdint>
#include <string>

namespace avatarpool::db::model {

/*
  Persistent pool entry.

  - id is a random UUID, immutable for the record's lifetime.
  - name is a display label and may collide across records.
  - stored_filename is id + lowercase extension, unique in the pool directory.
*/

struct AvatarRecord {
  std::string id;
  std::string name;
  std::string stored_filename;

  uint64_t created_at_ms = 0;
};

}

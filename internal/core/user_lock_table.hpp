#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace avatarpool::core {

/*
  Per-user mutual exclusion.

  Entries are created on first use and dropped once no thread holds or waits
  for them, so the table does not grow with the number of users ever seen.
*/
class UserLockTable {
  struct Entry {
    std::mutex mutex;
    size_t     holders = 0; // guarded by UserLockTable::guard_
  };

 public:
  class Guard {
   public:
    Guard(UserLockTable& table, std::string key, std::shared_ptr<Entry> entry);
    ~Guard();

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

   private:
    UserLockTable&         table_;
    std::string            key_;
    std::shared_ptr<Entry> entry_;
  };

  // Blocks until the user's lock is held.
  Guard Acquire(const std::string& user_id);

  // Number of users currently locked or waited on.
  size_t Size() const;

 private:
  void Release(const std::string& key, const std::shared_ptr<Entry>& entry);

  mutable std::mutex                                      guard_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace avatarpool::core

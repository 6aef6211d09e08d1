#include "user_lock_table.hpp"

namespace avatarpool::core {

UserLockTable::Guard::Guard(UserLockTable& table, std::string key, std::shared_ptr<Entry> entry)
    : table_(table), key_(std::move(key)), entry_(std::move(entry)) {
  entry_->mutex.lock();
}

UserLockTable::Guard::~Guard() {
  entry_->mutex.unlock();
  table_.Release(key_, entry_);
}

UserLockTable::Guard UserLockTable::Acquire(const std::string& user_id) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard lock(guard_);
    auto&           slot = entries_[user_id];
    if (!slot) {
      slot = std::make_shared<Entry>();
    }
    ++slot->holders;
    entry = slot;
  }
  return Guard(*this, user_id, std::move(entry));
}

size_t UserLockTable::Size() const {
  std::lock_guard lock(guard_);
  return entries_.size();
}

void UserLockTable::Release(const std::string& key, const std::shared_ptr<Entry>& entry) {
  std::lock_guard lock(guard_);
  if (--entry->holders == 0) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second == entry) {
      entries_.erase(it);
    }
  }
}

} // namespace avatarpool::core

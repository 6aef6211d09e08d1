#pragma once

namespace avatarpool::db {

/*
  Unit of work against a Repository.

  - Begin() blocks until no other transaction is open on the same store;
    never call Begin() twice on one thread without finishing the first.
  - Writes become visible to other transactions only after Commit().
  - Commit() returns only once the change is durable.
  - Destroying an unfinished transaction rolls it back.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  // No-op if already finished.
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}

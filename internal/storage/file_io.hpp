#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/runtime/cancellation.hpp"

namespace avatarpool::storage {

/*
  Durable file primitives used by the pool and the binder.

  All writers fsync before returning. Failures throw util::IOFailure and leave
  no partial target behind; cancellation throws util::Cancelled, also without
  leaving a partial target.
*/

// Atomic write: tmp file -> fsync -> rename.
void WriteFileAtomic(const std::filesystem::path& path, const std::vector<uint8_t>& bytes);

// Chunked copy of `source` to `target`. An existing `target` is replaced.
// The token is checked between chunks.
void CopyFile(const std::filesystem::path& source, const std::filesystem::path& target,
              const avatarpool::runtime::CancellationToken& cancel = {});

std::vector<uint8_t> ReadFile(const std::filesystem::path& path);

// True if `path` names an existing regular file this process can open.
bool IsReadableFile(const std::filesystem::path& path);

// Returns false if the file did not exist. Throws util::IOFailure on failure.
bool RemoveFile(const std::filesystem::path& path);

/*
  Advisory flock(2) lock, held from construction to destruction.

  The lock file (and its directory) is created if missing. Every instance
  opens its own descriptor, so two instances on the same path exclude each
  other whether they live in different processes or in different threads of
  one process. Blocks until granted; throws util::IOFailure.
*/
class FileLock {
 public:
  enum class Mode { kShared, kExclusive };

  FileLock(const std::filesystem::path& path, Mode mode);
  ~FileLock();

  FileLock(const FileLock&)            = delete;
  FileLock& operator=(const FileLock&) = delete;

 private:
  int fd_ = -1;
};

} // namespace avatarpool::storage

#include "file_io.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/util/errors.hpp"

namespace avatarpool::storage {

using avatarpool::util::IOFailure;

namespace {

constexpr size_t kCopyChunkBytes = 64 * 1024;

std::string ErrnoMessage(const std::string& what, const std::filesystem::path& path, int err) {
  return what + " '" + path.string() + "': " + std::strerror(err);
}

// Closes on scope exit.
class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {
  }
  ~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const {
    return fd_;
  }

  int Release() {
    const int fd = fd_;
    fd_          = -1;
    return fd;
  }

  // Returns errno of a failed close, 0 otherwise.
  int Close() {
    int rc = ::close(fd_);
    fd_    = -1;
    return rc == 0 ? 0 : errno;
  }

 private:
  int fd_;
};

int WriteAll(int fd, const uint8_t* data, size_t size) {
  size_t written = 0;
  while (written < size) {
    ssize_t n = ::write(fd, data + written, size - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      return errno;
    }
    written += static_cast<size_t>(n);
  }
  return 0;
}

void DiscardPartial(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

void WriteFileAtomic(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
  const auto tmp_path = std::filesystem::path(path.string() + ".tmp");

  {
    FileDescriptor fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (fd.get() < 0) {
      throw IOFailure(ErrnoMessage("open for write", tmp_path, errno));
    }

    if (int err = WriteAll(fd.get(), bytes.data(), bytes.size()); err != 0) {
      DiscardPartial(tmp_path);
      throw IOFailure(ErrnoMessage("write", tmp_path, err));
    }
    if (::fsync(fd.get()) != 0) {
      const int err = errno;
      DiscardPartial(tmp_path);
      throw IOFailure(ErrnoMessage("fsync", tmp_path, err));
    }
    if (int err = fd.Close(); err != 0) {
      DiscardPartial(tmp_path);
      throw IOFailure(ErrnoMessage("close", tmp_path, err));
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    DiscardPartial(tmp_path);
    throw IOFailure("rename '" + tmp_path.string() + "' -> '" + path.string() + "': " + ec.message());
  }
}

void CopyFile(const std::filesystem::path& source, const std::filesystem::path& target,
              const avatarpool::runtime::CancellationToken& cancel) {
  FileDescriptor in(::open(source.c_str(), O_RDONLY));
  if (in.get() < 0) {
    throw IOFailure(ErrnoMessage("open for read", source, errno));
  }

  FileDescriptor out(::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (out.get() < 0) {
    throw IOFailure(ErrnoMessage("open for write", target, errno));
  }

  std::vector<uint8_t> buffer(kCopyChunkBytes);
  while (true) {
    if (cancel.IsCancelled()) {
      (void)out.Close();
      DiscardPartial(target);
      cancel.ThrowIfCancelled("copy '" + source.string() + "'");
    }

    ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      (void)out.Close();
      DiscardPartial(target);
      throw IOFailure(ErrnoMessage("read", source, err));
    }
    if (n == 0) break;

    if (int err = WriteAll(out.get(), buffer.data(), static_cast<size_t>(n)); err != 0) {
      (void)out.Close();
      DiscardPartial(target);
      throw IOFailure(ErrnoMessage("write", target, err));
    }
  }

  if (::fsync(out.get()) != 0) {
    const int err = errno;
    (void)out.Close();
    DiscardPartial(target);
    throw IOFailure(ErrnoMessage("fsync", target, err));
  }
  if (int err = out.Close(); err != 0) {
    DiscardPartial(target);
    throw IOFailure(ErrnoMessage("close", target, err));
  }
}

std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
  FileDescriptor fd(::open(path.c_str(), O_RDONLY));
  if (fd.get() < 0) {
    throw IOFailure(ErrnoMessage("open for read", path, errno));
  }

  std::vector<uint8_t> out;
  std::vector<uint8_t> buffer(kCopyChunkBytes);
  while (true) {
    ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      throw IOFailure(ErrnoMessage("read", path, errno));
    }
    if (n == 0) break;
    out.insert(out.end(), buffer.begin(), buffer.begin() + n);
  }
  return out;
}

bool IsReadableFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    return false;
  }
  return ::access(path.c_str(), R_OK) == 0;
}

bool RemoveFile(const std::filesystem::path& path) {
  std::error_code ec;
  const bool      removed = std::filesystem::remove(path, ec);
  if (ec) {
    throw IOFailure("remove '" + path.string() + "': " + ec.message());
  }
  return removed;
}

FileLock::FileLock(const std::filesystem::path& path, Mode mode) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw IOFailure("create lock directory '" + path.parent_path().string() + "': " + ec.message());
    }
  }

  FileDescriptor fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
  if (fd.get() < 0) {
    throw IOFailure(ErrnoMessage("open lock file", path, errno));
  }

  const int operation = mode == Mode::kShared ? LOCK_SH : LOCK_EX;
  while (::flock(fd.get(), operation) != 0) {
    if (errno == EINTR) continue;
    throw IOFailure(ErrnoMessage("flock", path, errno));
  }

  fd_ = fd.Release();
}

FileLock::~FileLock() {
  (void)::flock(fd_, LOCK_UN);
  (void)::close(fd_);
}

} // namespace avatarpool::storage

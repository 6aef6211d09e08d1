#pragma once

#include <stdexcept>
#include <string>

namespace avatarpool::util {

/*
  Central error types.

  The transport layer maps these to status codes:
    NotFound          -> 404
    ValidationFailure -> 400
    everything else   -> 500
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AvatarNotFound : public NotFound {
 public:
  explicit AvatarNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class UserNotFound : public NotFound {
 public:
  explicit UserNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class ValidationFailure : public std::runtime_error {
 public:
  explicit ValidationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IOFailure : public std::runtime_error {
 public:
  explicit IOFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Copying the pool file into the profile slot failed; nothing was committed.
class CopyFailed : public IOFailure {
 public:
  explicit CopyFailed(const std::string& msg) : IOFailure(msg) {
  }
};

// Persisting the identity pointer failed; the copied file was rolled back.
class PointerUpdateFailed : public IOFailure {
 public:
  explicit PointerUpdateFailed(const std::string& msg) : IOFailure(msg) {
  }
};

class InvariantViolation : public std::runtime_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace avatarpool::util

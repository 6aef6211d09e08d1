#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace avatarpool::storage::common {

inline constexpr uint64_t kMaxAvatarBytes = 5ull * 1024 * 1024;

inline constexpr std::string_view kProfileImagePrefix = "profile_";

// Advisory lock files under the profiles root; neither matches kProfileImagePrefix.
inline constexpr std::string_view kServiceLockFileName = ".avatar-pool.lock";
inline constexpr std::string_view kUserLockDirectory   = ".locks";

inline constexpr std::array<std::string_view, 5> kAllowedImageExtensions = {".jpg", ".jpeg", ".png", ".gif", ".webp"};

// Ids end up as path components; reject anything that could escape a directory.
inline void ValidatePathComponent(const std::string& component, const char* what) {
  if (component.empty()) {
    throw avatarpool::util::ValidationFailure(std::string(what) + " must not be empty");
  }
  for (char c : component) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw avatarpool::util::ValidationFailure(std::string(what) + " contains invalid character");
    }
  }
  if (component == "." || component == "..") {
    throw avatarpool::util::ValidationFailure(std::string(what) + " must not be a relative path component");
  }
}

// ".PNG" -> ".png"; empty if the name has no extension.
inline std::string LowercaseExtension(const std::filesystem::path& filename) {
  auto ext = filename.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

inline bool IsAllowedImageExtension(std::string_view lowercase_ext) {
  return std::find(kAllowedImageExtensions.begin(), kAllowedImageExtensions.end(), lowercase_ext) != kAllowedImageExtensions.end();
}

inline std::string MimeTypeForExtension(std::string_view lowercase_ext) {
  if (lowercase_ext == ".jpg" || lowercase_ext == ".jpeg") return "image/jpeg";
  if (lowercase_ext == ".png") return "image/png";
  if (lowercase_ext == ".gif") return "image/gif";
  if (lowercase_ext == ".webp") return "image/webp";
  return "application/octet-stream";
}

inline std::filesystem::path AvatarPath(const std::filesystem::path& pool_root, const std::string& stored_filename) {
  ValidatePathComponent(stored_filename, "avatar filename");
  return pool_root / stored_filename;
}

inline std::filesystem::path UserProfileDirectory(const std::filesystem::path& profiles_root, const std::string& user_id) {
  ValidatePathComponent(user_id, "user id");
  return profiles_root / user_id;
}

inline std::filesystem::path ServiceLockFile(const std::filesystem::path& profiles_root) {
  return profiles_root / kServiceLockFileName;
}

inline std::filesystem::path UserLockFile(const std::filesystem::path& profiles_root, const std::string& user_id) {
  ValidatePathComponent(user_id, "user id");
  return profiles_root / kUserLockDirectory / (user_id + ".lock");
}

// profile_avatar_<avatar id>_<token><ext>
inline std::string ProfileImageFileName(const std::string& avatar_id, uint64_t token, const std::string& lowercase_ext) {
  ValidatePathComponent(avatar_id, "avatar id");
  return std::string(kProfileImagePrefix) + "avatar_" + avatar_id + "_" + std::to_string(token) + lowercase_ext;
}

inline bool IsProfileImageFileName(const std::string& filename) {
  return filename.size() > kProfileImagePrefix.size() && filename.compare(0, kProfileImagePrefix.size(), kProfileImagePrefix) == 0;
}

} // namespace avatarpool::storage::common

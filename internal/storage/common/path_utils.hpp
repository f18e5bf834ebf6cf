#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace localdisk::storage::common {

inline constexpr std::string_view kLeaseSuffix = ".lease";
inline constexpr std::string_view kLockSuffix  = ".lock";

inline bool EndsWith(const std::string& value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/*
  Blob names are relative paths inside the container: "a/b/c.json" is
  fine, absolute paths, "." / ".." components and the side file suffixes
  are not.
*/
inline void ValidateBlobName(const std::string& blob) {
  if (blob.empty()) {
    throw std::invalid_argument("blob name must not be empty");
  }
  for (char c : blob) {
    if (c == '\\' || c == '\0') {
      throw std::invalid_argument("blob name contains invalid character");
    }
  }
  if (blob.front() == '/' || blob.back() == '/') {
    throw std::invalid_argument("blob name must be a relative file path");
  }
  for (const auto& part : std::filesystem::path(blob)) {
    if (part == "." || part == ".." || part.empty()) {
      throw std::invalid_argument("blob name must not contain relative path components");
    }
  }
  if (EndsWith(blob, kLeaseSuffix) || EndsWith(blob, kLockSuffix)) {
    throw std::invalid_argument("blob name uses a reserved suffix");
  }
}

inline std::filesystem::path BlobPath(const std::filesystem::path& root, const std::string& blob) {
  ValidateBlobName(blob);
  return root / blob;
}

inline std::filesystem::path LeasePath(const std::filesystem::path& root, const std::string& blob) {
  ValidateBlobName(blob);
  return root / (blob + std::string(kLeaseSuffix));
}

inline std::filesystem::path LockPath(const std::filesystem::path& path) {
  auto marker = path;
  marker += std::string(kLockSuffix);
  return marker;
}

} // namespace localdisk::storage::common

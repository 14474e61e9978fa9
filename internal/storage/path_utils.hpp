#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace artifact::storage {

// Unit names carry a slash ("app/1"); directory names cannot.
inline std::string SanitizeOwnerId(const std::string& owner_id) {
  std::string sanitized = owner_id;
  for (auto& c : sanitized) {
    if (c == '/' || c == '\\') c = '-';
  }
  return sanitized;
}

inline void ValidateOwnerId(const std::string& owner_id) {
  if (owner_id.empty()) {
    throw std::invalid_argument("owner id must not be empty");
  }
  for (char c : owner_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("owner id contains invalid character");
    }
  }
  if (owner_id == "." || owner_id == "..") {
    throw std::invalid_argument("owner id must not be a relative path component");
  }
}

inline std::filesystem::path OwnerPath(const std::filesystem::path& root, const std::string& owner_id) {
  const auto sanitized = SanitizeOwnerId(owner_id);
  ValidateOwnerId(sanitized);
  return root / sanitized;
}

} // namespace artifact::storage

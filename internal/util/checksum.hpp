#pragma once

#include <filesystem>
#include <string>

namespace artifact::util {

// Lowercase hex SHA-256 of a file's contents.
std::string Sha256File(const std::filesystem::path& path);

std::string Sha256Hex(const std::string& data);

} // namespace artifact::util

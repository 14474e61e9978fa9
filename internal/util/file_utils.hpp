#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace artifact::util {

/*
  Atomic replace write:
      write tmp (same directory) -> fsync -> close -> rename

  Concurrent readers see either the old or the new content, never a prefix.
*/
void AtomicWriteFile(const std::filesystem::path& path, const std::string& content);

// Whole file, or nullopt if it does not exist.
std::optional<std::string> ReadFileIfExists(const std::filesystem::path& path);

std::string Trim(const std::string& value);

} // namespace artifact::util

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace artifact::fetch {

struct FetchResult {
  std::string               version;
  std::filesystem::path     installed_path;
  std::chrono::milliseconds duration{0};
  std::uint64_t             file_count = 0;
};

/*
  Collaborator that produces an extracted artifact set for a version.

  Called only by the install lock holder. Implementations install into
  target_dir and throw ArtifactFetchError on any failure; a partially
  populated target_dir is acceptable because the version marker is written
  only after verification.
*/
class ArtifactFetcher {
 public:
  virtual ~ArtifactFetcher() = default;

  virtual FetchResult Fetch(const std::string& version, const std::filesystem::path& target_dir) = 0;
};

using ArtifactFetcherPtr = std::shared_ptr<ArtifactFetcher>;

} // namespace artifact::fetch

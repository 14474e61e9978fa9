#pragma once

#include <filesystem>

#include "internal/fetch/artifact_fetcher.hpp"

namespace artifact::fetch {

/*
  Installs artifacts from a local (or separately mounted) release directory:

    source_root/{version}/...  ->  target_dir/...

  Files are first copied into a staging directory next to target_dir, then
  moved into place entry by entry, replacing existing entries. Replacing
  rather than overwriting avoids "text file busy" on running binaries.
  Entries of target_dir the release does not contain are removed afterwards.
  An empty release throws before target_dir is touched.
*/
class DirectoryArtifactFetcher final : public ArtifactFetcher {
 public:
  explicit DirectoryArtifactFetcher(std::filesystem::path source_root);

  FetchResult Fetch(const std::string& version, const std::filesystem::path& target_dir) override;

 private:
  std::filesystem::path source_root_;
};

} // namespace artifact::fetch

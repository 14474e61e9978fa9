#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace artifact::fetch {

struct VerificationResult {
  bool                     ok = true;
  std::vector<std::string> problems;

  std::string Summary() const;
};

/*
  Integrity check of an installed artifact set:
    - every required binary exists and is executable
    - every entry of the SHA256SUMS manifest ("<hex>  <relative path>")
      matches the file on disk

  A missing manifest fails only when require_manifest is set.
*/
class ArtifactVerifier {
 public:
  static constexpr const char* kManifestName = "SHA256SUMS";

  ArtifactVerifier(std::vector<std::string> required_binaries, bool require_manifest);

  VerificationResult Verify(const std::filesystem::path& artifact_dir) const;

  const std::vector<std::string>& required_binaries() const {
    return required_binaries_;
  }

 private:
  void CheckBinaries(const std::filesystem::path& artifact_dir, VerificationResult& result) const;
  void CheckManifest(const std::filesystem::path& artifact_dir, VerificationResult& result) const;

  std::vector<std::string> required_binaries_;
  bool                     require_manifest_;
};

} // namespace artifact::fetch

#include "artifact_verifier.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "internal/util/checksum.hpp"

namespace artifact::fetch {

std::string VerificationResult::Summary() const {
  if (ok) {
    return "ok";
  }
  std::ostringstream out;
  for (std::size_t i = 0; i < problems.size(); ++i) {
    if (i > 0) out << "; ";
    out << problems[i];
  }
  return out.str();
}

ArtifactVerifier::ArtifactVerifier(std::vector<std::string> required_binaries, bool require_manifest)
    : required_binaries_(std::move(required_binaries)), require_manifest_(require_manifest) {
}

VerificationResult ArtifactVerifier::Verify(const std::filesystem::path& artifact_dir) const {
  VerificationResult result;

  std::error_code ec;
  if (!std::filesystem::is_directory(artifact_dir, ec)) {
    result.ok = false;
    result.problems.push_back("artifact directory " + artifact_dir.string() + " is missing");
    return result;
  }

  CheckBinaries(artifact_dir, result);
  CheckManifest(artifact_dir, result);
  result.ok = result.problems.empty();
  return result;
}

void ArtifactVerifier::CheckBinaries(const std::filesystem::path& artifact_dir, VerificationResult& result) const {
  for (const auto& binary : required_binaries_) {
    const auto path = artifact_dir / binary;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      result.problems.push_back(binary + ": missing");
      continue;
    }
    if (::access(path.c_str(), X_OK) != 0) {
      result.problems.push_back(binary + ": not executable");
    }
  }
}

void ArtifactVerifier::CheckManifest(const std::filesystem::path& artifact_dir, VerificationResult& result) const {
  const auto manifest_path = artifact_dir / kManifestName;

  std::ifstream manifest(manifest_path);
  if (!manifest) {
    if (require_manifest_) {
      result.problems.push_back(std::string(kManifestName) + ": missing");
    }
    return;
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(manifest, line)) {
    ++line_number;
    if (line.empty() || line[0] == '#') continue;

    const auto split = line.find_first_of(" \t");
    if (split == std::string::npos || split != 64) {
      result.problems.push_back(std::string(kManifestName) + ":" + std::to_string(line_number) + ": malformed entry");
      continue;
    }

    auto expected = line.substr(0, split);
    std::transform(expected.begin(), expected.end(), expected.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto name_start = line.find_first_not_of(" \t", split);
    if (name_start == std::string::npos) {
      result.problems.push_back(std::string(kManifestName) + ":" + std::to_string(line_number) + ": malformed entry");
      continue;
    }
    auto name = line.substr(name_start);
    if (name[0] == '*') name.erase(0, 1);

    const std::filesystem::path relative(name);
    if (relative.is_absolute() || name.find("..") != std::string::npos) {
      result.problems.push_back(name + ": path escapes the artifact directory");
      continue;
    }

    const auto path = artifact_dir / relative;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      result.problems.push_back(name + ": listed in manifest but missing");
      continue;
    }

    try {
      if (util::Sha256File(path) != expected) {
        result.problems.push_back(name + ": checksum mismatch");
      }
    } catch (const std::exception& e) {
      result.problems.push_back(name + ": " + e.what());
    }
  }
}

} // namespace artifact::fetch

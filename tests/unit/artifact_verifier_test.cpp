#include <cassert>
#include <cctype>
#include <iostream>

#include "internal/fetch/artifact_verifier.hpp"
#include "internal/util/checksum.hpp"
#include "test_support.hpp"

namespace {

using artifact::fetch::ArtifactVerifier;
using artifact::testing::MakeRelease;
using artifact::testing::TempDir;
using artifact::testing::WriteFile;

void TestKnownDigest() {
  assert(artifact::util::Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(artifact::util::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  TempDir dir("checksum_file");
  WriteFile(dir.path() / "abc", "abc");
  assert(artifact::util::Sha256File(dir.path() / "abc") == artifact::util::Sha256Hex("abc"));
}

void TestValidReleasePasses() {
  TempDir dir("verify_ok");
  MakeRelease(dir.path(), "1.2.0");

  ArtifactVerifier verifier({"concourse", "gdn"}, true);
  const auto       result = verifier.Verify(dir.path() / "1.2.0");
  assert(result.ok);
  assert(result.Summary() == "ok");
}

void TestMissingAndNonExecutableBinaries() {
  TempDir dir("verify_binaries");
  WriteFile(dir.path() / "concourse", "#!/bin/sh\n", false);

  ArtifactVerifier verifier({"concourse", "gdn"}, false);
  const auto       result = verifier.Verify(dir.path());
  assert(!result.ok);
  assert(result.problems.size() == 2);
  assert(result.Summary().find("gdn: missing") != std::string::npos);
  assert(result.Summary().find("concourse: not executable") != std::string::npos);
}

void TestChecksumMismatch() {
  TempDir dir("verify_mismatch");
  MakeRelease(dir.path(), "1.2.0");
  WriteFile(dir.path() / "1.2.0" / "gdn", "tampered", true);

  ArtifactVerifier verifier({"concourse", "gdn"}, true);
  const auto       result = verifier.Verify(dir.path() / "1.2.0");
  assert(!result.ok);
  assert(result.Summary().find("gdn: checksum mismatch") != std::string::npos);
}

void TestManifestRules() {
  TempDir dir("verify_manifest");
  const auto root = dir.path();
  WriteFile(root / "concourse", "abc", true);

  // Uppercase hex, binary-mode marker and comments are accepted.
  std::string hex = artifact::util::Sha256Hex("abc");
  for (auto& c : hex) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  WriteFile(root / "SHA256SUMS", "# release manifest\n" + hex + " *concourse\n");
  assert(ArtifactVerifier({"concourse"}, true).Verify(root).ok);

  // Paths outside the artifact directory are refused.
  WriteFile(root / "SHA256SUMS", artifact::util::Sha256Hex("abc") + "  ../concourse\n");
  assert(!ArtifactVerifier({}, true).Verify(root).ok);

  WriteFile(root / "SHA256SUMS", "deadbeef  concourse\n");
  assert(ArtifactVerifier({}, true).Verify(root).Summary().find("malformed") != std::string::npos);

  // Manifest optional unless required.
  std::filesystem::remove(root / "SHA256SUMS");
  assert(ArtifactVerifier({"concourse"}, false).Verify(root).ok);
  assert(!ArtifactVerifier({"concourse"}, true).Verify(root).ok);
}

void TestMissingDirectory() {
  TempDir dir("verify_missing_dir");
  const auto result = ArtifactVerifier({}, false).Verify(dir.path() / "nope");
  assert(!result.ok);
}

} // namespace

int main() {
  TestKnownDigest();
  TestValidReleasePasses();
  TestMissingAndNonExecutableBinaries();
  TestChecksumMismatch();
  TestManifestRules();
  TestMissingDirectory();

  std::cout << "artifact_unit_artifact_verifier: pass\n";
  return 0;
}

#include "directory_fetcher.hpp"

#include <chrono>
#include <set>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace artifact::fetch {

using artifact::observability::IntField;
using artifact::observability::StringField;

namespace {

// Removes the staging directory on every exit path.
class StagingDir {
 public:
  explicit StagingDir(std::filesystem::path path) : path_(std::move(path)) {
    std::filesystem::create_directories(path_);
  }
  ~StagingDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
      ARTIFACT_LOG_WARN("Failed to remove staging directory", {StringField("path", path_.string()), StringField("error", ec.message())});
    }
  }

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

void ReplaceEntry(const std::filesystem::path& source, const std::filesystem::path& dest) {
  std::error_code ec;
  const auto      status = std::filesystem::symlink_status(dest, ec);
  if (!ec && std::filesystem::exists(status)) {
    if (std::filesystem::is_directory(status)) {
      std::filesystem::remove_all(dest);
    } else {
      std::filesystem::remove(dest);
    }
  }
  std::filesystem::rename(source, dest);
}

} // namespace

DirectoryArtifactFetcher::DirectoryArtifactFetcher(std::filesystem::path source_root) : source_root_(std::move(source_root)) {
}

FetchResult DirectoryArtifactFetcher::Fetch(const std::string& version, const std::filesystem::path& target_dir) {
  const auto started = std::chrono::steady_clock::now();
  const auto source  = source_root_ / version;

  std::error_code ec;
  if (!std::filesystem::is_directory(source, ec)) {
    throw util::ArtifactFetchError("release " + version + " not found at " + source.string());
  }

  ARTIFACT_LOG_INFO("Fetching artifacts", {StringField("version", version), StringField("source", source.string())});

  FetchResult result;
  result.version        = version;
  result.installed_path = target_dir;

  try {
    std::filesystem::create_directories(target_dir);
    StagingDir staging(target_dir.parent_path() / (".staging-" + util::ToString(util::GenerateUUID())));

    std::filesystem::copy(source, staging.path(), std::filesystem::copy_options::recursive | std::filesystem::copy_options::copy_symlinks);

    std::set<std::filesystem::path> names;
    for (const auto& entry : std::filesystem::directory_iterator(staging.path())) {
      names.insert(entry.path().filename());
    }
    if (names.empty()) {
      throw util::ArtifactFetchError("release " + version + " at " + source.string() + " is empty");
    }

    for (const auto& name : names) {
      ReplaceEntry(staging.path() / name, target_dir / name);
      ++result.file_count;
    }

    // The installed set is exactly the release; anything else belongs to an older one.
    std::vector<std::filesystem::path> dropped;
    for (const auto& entry : std::filesystem::directory_iterator(target_dir)) {
      if (names.count(entry.path().filename()) == 0) {
        dropped.push_back(entry.path());
      }
    }
    for (const auto& path : dropped) {
      std::filesystem::remove_all(path);
      ARTIFACT_LOG_INFO("Removed entry not in release", {StringField("version", version), StringField("path", path.string())});
    }
  } catch (const std::filesystem::filesystem_error& e) {
    throw util::ArtifactFetchError("failed to install release " + version + ": " + e.what());
  }

  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  ARTIFACT_LOG_INFO("Artifacts installed", {StringField("version", version), IntField("entries", static_cast<std::int64_t>(result.file_count)),
                                            IntField("duration_ms", result.duration.count())});
  return result;
}

} // namespace artifact::fetch

#include "shared_volume.hpp"

#include <sys/stat.h>
#include <sys/statfs.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_utils.hpp"

namespace artifact::storage {

using artifact::observability::BoolField;
using artifact::observability::StringField;

std::string FilesystemIdentity::ToString() const {
  std::ostringstream out;
  out << fsid << ':' << device << ':' << inode;
  return out.str();
}

SharedVolume::SharedVolume(std::filesystem::path root_path, bool shared) : root_path_(std::move(root_path)), shared_(shared) {
}

SharedVolume SharedVolume::Open(const std::filesystem::path& root_path) {
  std::error_code ec;
  const auto      status = std::filesystem::status(root_path, ec);
  if (ec || !std::filesystem::exists(status)) {
    throw util::StorageNotMounted("shared storage root " + root_path.string() + " does not exist; attach the shared volume");
  }
  if (!std::filesystem::is_directory(status)) {
    throw util::StorageNotMounted("shared storage root " + root_path.string() + " is not a directory");
  }

  SharedVolume volume(std::filesystem::absolute(root_path), true);
  volume.EnsureLayout();

  ARTIFACT_LOG_INFO("Shared volume opened",
                    {StringField("root", volume.root_path_.string()), StringField("filesystem_id", volume.filesystem_identity().ToString())});
  return volume;
}

SharedVolume SharedVolume::OpenLocal(const std::filesystem::path& root_path) {
  std::filesystem::create_directories(root_path);

  SharedVolume volume(std::filesystem::absolute(root_path), false);
  volume.EnsureLayout();

  ARTIFACT_LOG_INFO("Local volume opened", {StringField("root", volume.root_path_.string()), BoolField("shared", false)});
  return volume;
}

/*
  Idempotent: bin/, keys/ and worker/ are created if absent.
*/
void SharedVolume::EnsureLayout() {
  std::filesystem::create_directories(artifact_dir());
  std::filesystem::create_directories(keys_dir());
  std::filesystem::create_directories(worker_root());
}

std::string SharedVolume::ReadInstalledVersion() const {
  const auto content = util::ReadFileIfExists(version_marker_path());
  if (!content) {
    return kNoVersion;
  }

  const auto version = util::Trim(*content);
  return version.empty() ? std::string(kNoVersion) : version;
}

void SharedVolume::WriteInstalledVersion(const std::string& version) {
  const auto trimmed = util::Trim(version);
  if (trimmed.empty() || trimmed == kNoVersion) {
    throw std::invalid_argument("installed version must not be empty");
  }
  if (trimmed.find('\n') != std::string::npos) {
    throw std::invalid_argument("installed version must be a single line");
  }

  util::AtomicWriteFile(version_marker_path(), trimmed + "\n");
}

FilesystemIdentity SharedVolume::filesystem_identity() const {
  struct stat st {};
  if (::stat(root_path_.c_str(), &st) != 0) {
    throw util::StorageNotMounted("cannot stat shared storage root " + root_path_.string() + ": " + std::strerror(errno));
  }

  struct statfs sfs {};
  if (::statfs(root_path_.c_str(), &sfs) != 0) {
    throw util::StorageNotMounted("cannot statfs shared storage root " + root_path_.string() + ": " + std::strerror(errno));
  }

  int words[2];
  static_assert(sizeof(words) == sizeof(sfs.f_fsid));
  std::memcpy(words, &sfs.f_fsid, sizeof(words));

  std::ostringstream fsid;
  fsid << std::hex << std::setw(8) << std::setfill('0') << static_cast<unsigned int>(words[0]) << std::setw(8) << std::setfill('0')
       << static_cast<unsigned int>(words[1]);

  FilesystemIdentity identity;
  identity.device = static_cast<std::uint64_t>(st.st_dev);
  identity.inode  = static_cast<std::uint64_t>(st.st_ino);
  identity.fsid   = fsid.str();
  return identity;
}

bool SharedVolume::MatchesIdentity(const std::string& expected) const {
  return filesystem_identity().ToString() == expected;
}

bool SharedVolume::IsWritable() const {
  return ::access(root_path_.c_str(), W_OK) == 0;
}

StorageStats SharedVolume::CollectStats() const {
  StorageStats stats;

  std::error_code ec;
  for (auto it = std::filesystem::recursive_directory_iterator(root_path_, std::filesystem::directory_options::skip_permission_denied, ec);
       !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_regular_file(ec) && !it->is_symlink(ec)) {
      const auto size = it->file_size(ec);
      if (!ec) stats.disk_usage_bytes += size;
    }
  }
  if (ec) {
    ARTIFACT_LOG_WARN("Disk usage scan incomplete", {StringField("root", root_path_.string()), StringField("error", ec.message())});
    ec.clear();
  }

  for (const auto& entry : std::filesystem::directory_iterator(artifact_dir(), ec)) {
    (void)entry;
    ++stats.artifact_count;
  }
  ec.clear();

  for (const auto& entry : std::filesystem::directory_iterator(worker_root(), ec)) {
    if (entry.is_directory(ec)) ++stats.worker_count;
  }
  ec.clear();

  stats.provisioned = std::filesystem::exists(root_path_ / kProvisionedMarkerName, ec);
  return stats;
}

} // namespace artifact::storage

#include "lock_coordinator.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <sstream>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_utils.hpp"

namespace artifact::lock {

using artifact::observability::IntField;
using artifact::observability::StringField;

namespace {

std::optional<util::TimePoint> ModifiedAt(const std::filesystem::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    if (errno == ENOENT) {
      return std::nullopt;
    }
    throw std::system_error(errno, std::generic_category(), "stat " + path.string());
  }

  const auto since_epoch = std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec);
  return util::TimePoint(std::chrono::duration_cast<util::SystemClock::duration>(since_epoch));
}

std::string FieldValue(const std::string& content, const std::string& key) {
  std::istringstream in(content);
  std::string        line;
  while (std::getline(in, line)) {
    if (line.rfind(key + "=", 0) == 0) {
      return util::Trim(line.substr(key.size() + 1));
    }
  }
  return {};
}

} // namespace

// ------------------------------------------------------------------
// LockHandle
// ------------------------------------------------------------------

LockHandle::LockHandle(int fd, std::filesystem::path progress_marker_path, std::string holder_id, util::TimePoint acquired_at)
    : fd_(fd), progress_marker_path_(std::move(progress_marker_path)), holder_id_(std::move(holder_id)), acquired_at_(acquired_at) {
}

LockHandle::~LockHandle() {
  Release();
}

LockHandle::LockHandle(LockHandle&& other) noexcept
    : fd_(other.fd_),
      progress_marker_path_(std::move(other.progress_marker_path_)),
      holder_id_(std::move(other.holder_id_)),
      acquired_at_(other.acquired_at_) {
  other.fd_ = -1;
}

LockHandle& LockHandle::operator=(LockHandle&& other) noexcept {
  if (this != &other) {
    Release();
    fd_                   = other.fd_;
    progress_marker_path_ = std::move(other.progress_marker_path_);
    holder_id_            = std::move(other.holder_id_);
    acquired_at_          = other.acquired_at_;
    other.fd_             = -1;
  }
  return *this;
}

void LockHandle::MarkInProgress(const std::string& version) {
  if (!held()) {
    throw util::InvalidState("progress marker requires a held install lock");
  }

  std::ostringstream content;
  content << "started_at_ms=" << util::ToUnixMillis(util::SystemClock::now()) << '\n'
          << "holder=" << holder_id_ << '\n'
          << "version=" << version << '\n';
  util::AtomicWriteFile(progress_marker_path_, content.str());

  ARTIFACT_LOG_INFO("Download marked in progress", {StringField("node", holder_id_), StringField("version", version), StringField("lock", "held")});
}

void LockHandle::Release() noexcept {
  if (fd_ < 0) {
    return;
  }

  // The marker is ours: TryAcquire refuses to hand out the lock while one exists.
  std::error_code ec;
  std::filesystem::remove(progress_marker_path_, ec);
  if (ec) {
    ARTIFACT_LOG_ERROR("Failed to remove progress marker",
                       {StringField("node", holder_id_), StringField("path", progress_marker_path_.string()), StringField("error", ec.message())});
  }

  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;

  ARTIFACT_LOG_INFO("Install lock released", {StringField("node", holder_id_), StringField("lock", "free")});
}

// ------------------------------------------------------------------
// LockCoordinator
// ------------------------------------------------------------------

LockCoordinator::LockCoordinator(const storage::SharedVolume& volume, std::string holder_id, util::Duration stale_after,
                                 std::shared_ptr<util::Clock> clock)
    : lock_path_(volume.lock_path()),
      progress_marker_path_(volume.progress_marker_path()),
      holder_id_(std::move(holder_id)),
      stale_after_(stale_after),
      clock_(std::move(clock)) {
}

LockHandle LockCoordinator::TryAcquire() {
  int fd = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(), "open " + lock_path_.string());
  }

  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK) {
      ARTIFACT_LOG_INFO("Install lock held elsewhere", {StringField("node", holder_id_), StringField("lock", "busy")});
      throw util::LockAlreadyHeld("install lock " + lock_path_.string() + " is held by another node");
    }
    throw std::system_error(err, std::generic_category(), "flock " + lock_path_.string());
  }

  // flock granted. A progress marker means another holder on a filesystem that
  // does not share flock state, or a holder that died mid-operation.
  std::optional<util::Duration> age;
  std::optional<ProgressMarker> marker;
  try {
    age = ProgressMarkerAge();
    if (age) {
      marker = ReadProgressMarker();
    }
  } catch (...) {
    ::flock(fd, LOCK_UN);
    ::close(fd);
    throw;
  }

  if (age) {
    const auto holder = marker ? marker->holder_id : std::string("unknown");

    // Holder ids are unique per node, and this node holds the flock: the
    // marker was left by an earlier run of this node that died mid-install.
    if (marker && marker->holder_id == holder_id_) {
      std::error_code ec;
      std::filesystem::remove(progress_marker_path_, ec);
      if (ec) {
        ::flock(fd, LOCK_UN);
        ::close(fd);
        throw std::system_error(ec, "remove " + progress_marker_path_.string());
      }
      ARTIFACT_LOG_WARN("Reclaimed own abandoned progress marker", {StringField("node", holder_id_), StringField("version", marker->version),
                                                                    StringField("age", util::FormatDuration(*age))});
      ARTIFACT_LOG_INFO("Install lock acquired", {StringField("node", holder_id_), StringField("lock", "held")});
      return LockHandle(fd, progress_marker_path_, holder_id_, clock_->Now());
    }

    ::flock(fd, LOCK_UN);
    ::close(fd);

    if (*age > stale_after_) {
      throw util::StaleLockDetected("progress marker from " + holder + " is " + util::FormatDuration(*age) + " old (stale after " +
                                    util::FormatDuration(stale_after_) + ")");
    }
    ARTIFACT_LOG_INFO("Download in progress elsewhere", {StringField("node", holder_id_), StringField("holder", holder), StringField("lock", "busy")});
    throw util::LockAlreadyHeld("download in progress by " + holder);
  }

  ARTIFACT_LOG_INFO("Install lock acquired", {StringField("node", holder_id_), StringField("lock", "held")});
  return LockHandle(fd, progress_marker_path_, holder_id_, clock_->Now());
}

bool LockCoordinator::IsStale() const {
  const auto age = ProgressMarkerAge();
  return age && *age > stale_after_;
}

bool LockCoordinator::ReclaimStale() {
  const auto age = ProgressMarkerAge();
  if (!age || *age <= stale_after_) {
    return false;
  }

  const auto marker = ReadProgressMarker();
  std::error_code ec;
  const bool removed = std::filesystem::remove(progress_marker_path_, ec);
  if (ec) {
    throw std::system_error(ec, "remove " + progress_marker_path_.string());
  }

  if (removed) {
    ARTIFACT_LOG_WARN("Reclaimed stale progress marker", {StringField("node", holder_id_), StringField("previous_holder", marker ? marker->holder_id : ""),
                                                          StringField("version", marker ? marker->version : ""),
                                                          IntField("age_s", std::chrono::duration_cast<std::chrono::seconds>(*age).count())});
  }
  return removed;
}

bool LockCoordinator::IsDownloadInProgress() const {
  return ProgressMarkerAge().has_value();
}

std::optional<util::Duration> LockCoordinator::ProgressMarkerAge() const {
  const auto modified = ModifiedAt(progress_marker_path_);
  if (!modified) {
    return std::nullopt;
  }

  // Hosts may disagree on time; a marker "from the future" is fresh.
  const auto age = std::chrono::duration_cast<util::Duration>(clock_->Now() - *modified);
  return age < util::Duration::zero() ? util::Duration::zero() : age;
}

std::optional<ProgressMarker> LockCoordinator::ReadProgressMarker() const {
  const auto modified = ModifiedAt(progress_marker_path_);
  if (!modified) {
    return std::nullopt;
  }

  const auto content = util::ReadFileIfExists(progress_marker_path_);
  if (!content) {
    return std::nullopt;
  }

  ProgressMarker marker;
  marker.holder_id   = FieldValue(*content, "holder");
  marker.version     = FieldValue(*content, "version");
  marker.modified_at = *modified;
  return marker;
}

} // namespace artifact::lock

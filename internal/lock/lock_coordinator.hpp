#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "internal/storage/shared_volume.hpp"
#include "internal/util/time.hpp"

namespace artifact::lock {

struct ProgressMarker {
  std::string     holder_id;
  std::string     version;
  util::TimePoint modified_at;
};

/*
  Exclusive hold on the install lock.

  Move-only. Release() (or destruction) removes the progress marker, drops the
  flock and closes the descriptor, whether the guarded work succeeded or not.
*/
class LockHandle {
 public:
  LockHandle() = default;
  ~LockHandle();

  LockHandle(LockHandle&& other) noexcept;
  LockHandle& operator=(LockHandle&& other) noexcept;

  LockHandle(const LockHandle&)            = delete;
  LockHandle& operator=(const LockHandle&) = delete;

  bool held() const {
    return fd_ >= 0;
  }
  const std::string& holder_id() const {
    return holder_id_;
  }
  util::TimePoint acquired_at() const {
    return acquired_at_;
  }

  // Must be called before any long-running work under the lock.
  void MarkInProgress(const std::string& version);

  void Release() noexcept;

 private:
  friend class LockCoordinator;

  LockHandle(int fd, std::filesystem::path progress_marker_path, std::string holder_id, util::TimePoint acquired_at);

  int                   fd_ = -1;
  std::filesystem::path progress_marker_path_;
  std::string           holder_id_;
  util::TimePoint       acquired_at_{};
};

/*
  Advisory, non-blocking, cross-process lock over the artifact install
  critical section.

  flock(2) on .install.lock gives exclusion where the filesystem shares flock
  state between hosts. The progress marker (.download_in_progress, mtime is
  authoritative) covers filesystems where it does not, and lets the next
  acquirer detect a holder that died mid-operation.
*/
class LockCoordinator {
 public:
  LockCoordinator(const storage::SharedVolume& volume, std::string holder_id, util::Duration stale_after, std::shared_ptr<util::Clock> clock);

  // Never blocks. Throws LockAlreadyHeld, or StaleLockDetected when an
  // abandoned progress marker must be reclaimed first. A marker carrying this
  // node's own holder id is removed on the spot.
  LockHandle TryAcquire();

  bool IsStale() const;

  // Removes the progress marker if it is stale. Call only right before TryAcquire().
  bool ReclaimStale();

  bool                           IsDownloadInProgress() const;
  std::optional<util::Duration>  ProgressMarkerAge() const;
  std::optional<ProgressMarker>  ReadProgressMarker() const;

  const std::string& holder_id() const {
    return holder_id_;
  }
  util::Duration stale_after() const {
    return stale_after_;
  }

 private:
  std::filesystem::path        lock_path_;
  std::filesystem::path        progress_marker_path_;
  std::string                  holder_id_;
  util::Duration               stale_after_;
  std::shared_ptr<util::Clock> clock_;
};

} // namespace artifact::lock

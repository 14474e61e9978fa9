#pragma once

#include <stdexcept>
#include <string>

namespace artifact::util {

/*
  Central error types.

  Fatal ones (StorageNotMounted, RoleConflict, ArtifactFetchError,
  ArtifactIntegrityError, a failed restart after download) end up as the
  "blocked" node status. The rest are retried by the caller.
*/

class StorageNotMounted : public std::runtime_error {
 public:
  explicit StorageNotMounted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockAlreadyHeld : public std::runtime_error {
 public:
  explicit LockAlreadyHeld(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StaleLockDetected : public std::runtime_error {
 public:
  explicit StaleLockDetected(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ArtifactWaitTimeout : public std::runtime_error {
 public:
  explicit ArtifactWaitTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ArtifactFetchError : public std::runtime_error {
 public:
  explicit ArtifactFetchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ArtifactIntegrityError : public std::runtime_error {
 public:
  explicit ArtifactIntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RoleConflict : public std::runtime_error {
 public:
  explicit RoleConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ServiceOperationFailed : public std::runtime_error {
 public:
  explicit ServiceOperationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Distinct from ServiceOperationFailed so callers can choose retry or escalation.
class ServiceOperationTimeout : public ServiceOperationFailed {
 public:
  explicit ServiceOperationTimeout(const std::string& msg) : ServiceOperationFailed(msg) {
  }
};

class UpgradeTimeout : public std::runtime_error {
 public:
  explicit UpgradeTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UpgradeInProgress : public std::runtime_error {
 public:
  explicit UpgradeInProgress(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace artifact::util

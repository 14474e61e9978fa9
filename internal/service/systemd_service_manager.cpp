#include "systemd_service_manager.hpp"

#include "internal/observability/logging.hpp"
#include "internal/service/command_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace artifact::service {

using artifact::observability::IntField;
using artifact::observability::StringField;

namespace {

constexpr std::chrono::seconds kIsActiveTimeout{10};

} // namespace

SystemdServiceManager::SystemdServiceManager(std::string systemctl_path) : systemctl_path_(std::move(systemctl_path)) {
}

void SystemdServiceManager::Start(const std::string& service_name, std::chrono::milliseconds timeout) {
  if (IsActive(service_name)) {
    ARTIFACT_LOG_DEBUG("Service already running", {StringField("service", service_name)});
    return;
  }
  Run("start", service_name, timeout);
}

void SystemdServiceManager::Stop(const std::string& service_name, std::chrono::milliseconds timeout) {
  if (!IsActive(service_name)) {
    ARTIFACT_LOG_DEBUG("Service already stopped", {StringField("service", service_name)});
    return;
  }
  Run("stop", service_name, timeout);
}

void SystemdServiceManager::Restart(const std::string& service_name, std::chrono::milliseconds timeout) {
  Run("restart", service_name, timeout);
}

bool SystemdServiceManager::IsActive(const std::string& service_name) {
  const auto result = RunCommand({systemctl_path_, "is-active", "--quiet", service_name}, kIsActiveTimeout);
  if (result.timed_out) {
    throw util::ServiceOperationTimeout("systemctl is-active " + service_name + " timed out");
  }
  return result.exit_code == 0;
}

void SystemdServiceManager::Run(const std::string& verb, const std::string& service_name, std::chrono::milliseconds timeout) {
  ARTIFACT_LOG_INFO("Service operation", {StringField("op", verb), StringField("service", service_name), IntField("timeout_ms", timeout.count())});

  const auto result = RunCommand({systemctl_path_, verb, service_name}, timeout);
  if (result.timed_out) {
    throw util::ServiceOperationTimeout("systemctl " + verb + " " + service_name + " did not finish within " + util::FormatDuration(timeout));
  }
  if (result.exit_code != 0) {
    throw util::ServiceOperationFailed("systemctl " + verb + " " + service_name + " exited with " + std::to_string(result.exit_code) + ": " +
                                       result.output);
  }
}

} // namespace artifact::service

#pragma once

#include <string>

#include "internal/service/service_manager.hpp"

namespace artifact::service {

/*
  ServiceManager backed by systemctl.

  Stop and Start check is-active first so repeated calls are no-ops.
*/
class SystemdServiceManager final : public ServiceManager {
 public:
  explicit SystemdServiceManager(std::string systemctl_path = "systemctl");

  void Start(const std::string& service_name, std::chrono::milliseconds timeout) override;
  void Stop(const std::string& service_name, std::chrono::milliseconds timeout) override;
  void Restart(const std::string& service_name, std::chrono::milliseconds timeout) override;

  bool IsActive(const std::string& service_name) override;

 private:
  void Run(const std::string& verb, const std::string& service_name, std::chrono::milliseconds timeout);

  std::string systemctl_path_;
};

} // namespace artifact::service

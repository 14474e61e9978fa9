#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace artifact::service {

/*
  Start/stop contract for the long-running local process that upgrades pause.

  Every operation is idempotent: stopping a stopped service or starting a
  running one succeeds. Expiry of `timeout` throws ServiceOperationTimeout;
  any other failure throws ServiceOperationFailed.
*/
class ServiceManager {
 public:
  virtual ~ServiceManager() = default;

  virtual void Start(const std::string& service_name, std::chrono::milliseconds timeout)   = 0;
  virtual void Stop(const std::string& service_name, std::chrono::milliseconds timeout)    = 0;
  virtual void Restart(const std::string& service_name, std::chrono::milliseconds timeout) = 0;

  virtual bool IsActive(const std::string& service_name) = 0;
};

using ServiceManagerPtr = std::shared_ptr<ServiceManager>;

} // namespace artifact::service

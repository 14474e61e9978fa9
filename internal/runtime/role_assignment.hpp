#pragma once

#include <memory>

#include "internal/coordination/storage_coordinator.hpp"

namespace artifact::runtime {

/*
  Tells a node whether it is the primary. Leader election or operator choice
  lives behind this; the coordination code only consumes the answer.
*/
class RoleAssignment {
 public:
  virtual ~RoleAssignment() = default;

  virtual coordination::NodeRole Resolve() = 0;
};

class StaticRoleAssignment final : public RoleAssignment {
 public:
  explicit StaticRoleAssignment(coordination::NodeRole role) : role_(role) {
  }

  coordination::NodeRole Resolve() override {
    return role_;
  }

 private:
  coordination::NodeRole role_;
};

using RoleAssignmentPtr = std::shared_ptr<RoleAssignment>;

} // namespace artifact::runtime

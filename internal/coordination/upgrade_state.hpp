#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/relation/relation_data_accessor.hpp"
#include "internal/util/time.hpp"

namespace artifact::coordination {

// Relation keys. Application bag: written by the primary (leader).
namespace keys {
inline constexpr const char* kUpgradeState        = "upgrade-state";
inline constexpr const char* kTargetVersion       = "target-version";
inline constexpr const char* kInitiatedBy         = "initiated-by";
inline constexpr const char* kTimestamp           = "timestamp";
inline constexpr const char* kWorkerReadyCount    = "worker-ready-count";
inline constexpr const char* kExpectedWorkerCount = "expected-worker-count";
inline constexpr const char* kCycleId             = "cycle-id";

// Unit bags: written by each unit for itself.
inline constexpr const char* kUpgradeReady   = "upgrade-ready";
inline constexpr const char* kReadyTimestamp = "ready-timestamp";
inline constexpr const char* kReadyCycle     = "ready-cycle";  // cycle-id the ack belongs to
inline constexpr const char* kNodeStatus     = "node-status";
} // namespace keys

enum class UpgradePhase : std::uint8_t {
  kIdle        = 0,
  kPrepare     = 1,
  kDownloading = 2,
  kComplete    = 3,
};

/*
  One cycle is IDLE -> PREPARE -> DOWNLOADING -> COMPLETE -> IDLE.
  Re-writing the current phase is allowed (idempotent); the only backward
  edge is the terminal reset COMPLETE -> IDLE.
*/
constexpr bool CanTransition(UpgradePhase from, UpgradePhase to) {
  if (from == to) {
    return true;
  }
  if (from == UpgradePhase::kComplete) {
    return to == UpgradePhase::kIdle;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

std::string_view PhaseName(UpgradePhase phase);

// Throws InvalidState for unknown names. Empty means IDLE.
UpgradePhase ParsePhase(std::string_view name);

// True if `observed` (consecutive repeats allowed) is a subsequence of
// IDLE, PREPARE, DOWNLOADING, COMPLETE, IDLE in which the closing IDLE
// directly follows COMPLETE.
bool IsValidObservation(const std::vector<UpgradePhase>& observed);

/*
  View of the upgrade cycle reconstructed from the application bag.
  Never cached: build a fresh one for every coordination step.
*/
struct UpgradeState {
  UpgradePhase                   phase = UpgradePhase::kIdle;
  std::string                    target_version;
  std::string                    initiated_by;
  std::string                    cycle_id;  // new for every InitiateUpgrade
  std::optional<util::TimePoint> timestamp;
  std::uint32_t                  ready_count    = 0;
  std::uint32_t                  expected_count = 0;

  static UpgradeState FromRelationData(const relation::DataBag& application);

  // ready_count is clamped to expected_count.
  relation::DataBag ToRelationData() const;

  std::string DebugString() const;
};

} // namespace artifact::coordination

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/coordination/storage_coordinator.hpp"
#include "internal/coordination/upgrade_state.hpp"
#include "internal/relation/relation_data_accessor.hpp"
#include "internal/service/service_manager.hpp"
#include "internal/util/time.hpp"

namespace artifact::coordination {

struct UpgradeOptions {
  std::string    service_name;
  util::Duration service_timeout{std::chrono::seconds(30)};
  util::Duration ready_timeout{std::chrono::seconds(120)};
  util::Duration complete_grace_period{std::chrono::seconds(300)};
  util::Duration poll_initial{std::chrono::seconds(5)};
  util::Duration poll_max{std::chrono::seconds(20)};
  bool           require_full_consensus = false;
};

struct ReadinessReport {
  std::uint32_t            ready_count    = 0;
  std::uint32_t            expected_count = 0;
  std::vector<std::string> stragglers;
  bool                     timed_out = false;
};

enum class FollowerAction : std::uint8_t {
  kNone,
  kStopped,           // acknowledged PREPARE
  kStarted,           // acted on COMPLETE, or on a reset it missed
  kWaitingForMarker,  // COMPLETE seen, volume not there yet
};

/*
  Multi-phase upgrade across the coordination group.

  The primary (relation leader) drives:
      IDLE -> PREPARE -> DOWNLOADING -> COMPLETE -> IDLE
  Followers react through OnRelationChanged(): stop on PREPARE and
  acknowledge, start again on COMPLETE once the version marker on the volume
  confirms the install.

  Every cycle carries a fresh cycle-id. An acknowledgement counts only for
  the cycle whose id it echoes in "ready-cycle".

  State lives in the relation channel and is re-read for every step. A failed
  download or restart leaves the phase at DOWNLOADING; RetryUpgrade() resumes
  from there.
*/
class UpgradeCoordinator {
 public:
  UpgradeCoordinator(relation::RelationDataAccessorPtr relation, std::shared_ptr<StorageCoordinator> storage,
                     service::ServiceManagerPtr services, std::shared_ptr<util::Clock> clock, UpgradeOptions options);

  UpgradeState CurrentState() const;

  // ----- primary -----

  // IDLE -> PREPARE. Idempotent for the target already being prepared;
  // UpgradeInProgress for any other cycle in flight.
  UpgradeState InitiateUpgrade(const std::string& target_version);

  // Proceeds on timeout and reports stragglers, unless full consensus is
  // required (UpgradeTimeout).
  ReadinessReport WaitForFollowersReady();

  void MarkDownloading();
  void CompleteUpgrade();

  // COMPLETE -> IDLE once no follower is still acknowledged, or after the
  // grace period. Returns true if it reset.
  bool MaybeResetAfterComplete();

  UpgradeState RunPrimaryUpgrade(const std::string& target_version);

  // Operator retry of a cycle stuck at DOWNLOADING.
  UpgradeState RetryUpgrade();

  // ----- follower -----

  FollowerAction OnRelationChanged();

  void HandlePrepareSignal(const UpgradeState& state);
  bool HandleCompleteSignal(const UpgradeState& state);

  // Acknowledged the cycle currently in the application bag.
  bool IsAcknowledged() const;

  const std::vector<UpgradePhase>& observed_phases() const {
    return observed_;
  }

 private:
  void RequireLeader(const char* operation) const;
  void WritePhase(UpgradePhase next);
  void DownloadAndRestart(const std::string& target_version);

  bool           IsReadyFor(const std::string& unit, const UpgradeState& state) const;
  bool           HasStoppedForUpgrade() const;
  std::uint32_t  CountReady(const UpgradeState& state, std::vector<std::string>* stragglers) const;
  void           ClearAcknowledgement();
  FollowerAction ResumeAfterMissedComplete(const UpgradeState& state);
  void          RecordObserved(UpgradePhase phase);

  relation::RelationDataAccessorPtr   relation_;
  std::shared_ptr<StorageCoordinator> storage_;
  service::ServiceManagerPtr          services_;
  std::shared_ptr<util::Clock>        clock_;
  UpgradeOptions                      options_;

  std::vector<UpgradePhase> observed_;
};

} // namespace artifact::coordination

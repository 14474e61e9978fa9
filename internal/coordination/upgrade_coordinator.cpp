#include "upgrade_coordinator.hpp"

#include <algorithm>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/backoff.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace artifact::coordination {

using artifact::observability::BoolField;
using artifact::observability::IntField;
using artifact::observability::StringField;

namespace {

constexpr const char* kTrue  = "true";
constexpr const char* kFalse = "false";

std::string Join(const std::vector<std::string>& values) {
  std::ostringstream out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out << ",";
    out << values[i];
  }
  return out.str();
}

} // namespace

UpgradeCoordinator::UpgradeCoordinator(relation::RelationDataAccessorPtr relation, std::shared_ptr<StorageCoordinator> storage,
                                       service::ServiceManagerPtr services, std::shared_ptr<util::Clock> clock, UpgradeOptions options)
    : relation_(std::move(relation)),
      storage_(std::move(storage)),
      services_(std::move(services)),
      clock_(std::move(clock)),
      options_(std::move(options)) {
}

UpgradeState UpgradeCoordinator::CurrentState() const {
  return UpgradeState::FromRelationData(relation_->GetApplicationBag());
}

void UpgradeCoordinator::RequireLeader(const char* operation) const {
  if (!relation_->is_leader()) {
    throw util::InvalidState(std::string(operation) + " requires the primary; " + relation_->local_unit() + " is not the leader");
  }
}

void UpgradeCoordinator::WritePhase(UpgradePhase next) {
  auto state = CurrentState();
  if (!CanTransition(state.phase, next)) {
    throw util::InvalidState("illegal upgrade transition " + std::string(PhaseName(state.phase)) + " -> " + std::string(PhaseName(next)));
  }
  if (state.phase == next) {
    return;
  }

  const auto from = state.phase;
  state.phase     = next;
  state.timestamp = clock_->Now();
  if (next == UpgradePhase::kIdle) {
    state.ready_count = 0;
  }
  relation_->SetApplicationData(state.ToRelationData());

  ARTIFACT_LOG_INFO("Upgrade phase changed", {StringField("node", relation_->local_unit()), StringField("from", PhaseName(from)),
                                              StringField("to", PhaseName(next)), StringField("target", state.target_version)});
}

// ------------------------------------------------------------
// Primary
// ------------------------------------------------------------

UpgradeState UpgradeCoordinator::InitiateUpgrade(const std::string& target_version) {
  RequireLeader("InitiateUpgrade");

  auto state = CurrentState();
  if (state.phase == UpgradePhase::kPrepare && state.target_version == target_version) {
    return state;
  }
  if (state.phase != UpgradePhase::kIdle) {
    throw util::UpgradeInProgress("upgrade to " + state.target_version + " is in phase " + std::string(PhaseName(state.phase)));
  }

  const auto followers = relation_->GetPeerUnits();

  state.phase          = UpgradePhase::kPrepare;
  state.target_version = target_version;
  state.initiated_by   = relation_->local_unit();
  state.cycle_id       = util::ToString(util::GenerateUUID());
  state.timestamp      = clock_->Now();
  state.ready_count    = 0;
  state.expected_count = static_cast<std::uint32_t>(followers.size());
  relation_->SetApplicationData(state.ToRelationData());

  ARTIFACT_LOG_INFO("Upgrade initiated", {StringField("node", relation_->local_unit()), StringField("target", target_version),
                                          StringField("cycle", state.cycle_id),
                                          StringField("installed", storage_->volume().ReadInstalledVersion()),
                                          IntField("expected_followers", state.expected_count)});
  return state;
}

bool UpgradeCoordinator::IsReadyFor(const std::string& unit, const UpgradeState& state) const {
  return relation_->GetUnitData(unit, keys::kUpgradeReady).value_or(kFalse) == kTrue &&
         relation_->GetUnitData(unit, keys::kReadyCycle).value_or("") == state.cycle_id;
}

std::uint32_t UpgradeCoordinator::CountReady(const UpgradeState& state, std::vector<std::string>* stragglers) const {
  std::uint32_t ready = 0;
  for (const auto& unit : relation_->GetPeerUnits()) {
    if (IsReadyFor(unit, state)) {
      ++ready;
    } else if (stragglers) {
      stragglers->push_back(unit);
    }
  }
  return ready;
}

ReadinessReport UpgradeCoordinator::WaitForFollowersReady() {
  RequireLeader("WaitForFollowersReady");

  const auto state = CurrentState();
  if (state.phase != UpgradePhase::kPrepare) {
    throw util::InvalidState("followers are only awaited in phase prepare, not " + std::string(PhaseName(state.phase)));
  }

  ReadinessReport report;
  report.expected_count = state.expected_count;

  util::Backoff backoff(options_.poll_initial, options_.poll_max);
  const auto    deadline  = clock_->Now() + options_.ready_timeout;
  auto          published = state.ready_count;

  while (true) {
    report.stragglers.clear();
    report.ready_count = std::min(CountReady(state, &report.stragglers), report.expected_count);

    if (report.ready_count != published) {
      relation_->SetApplicationData(keys::kWorkerReadyCount, std::to_string(report.ready_count));
      published = report.ready_count;
      ARTIFACT_LOG_INFO("Follower readiness", {StringField("node", relation_->local_unit()), IntField("ready", report.ready_count),
                                               IntField("expected", report.expected_count)});
    }

    if (report.ready_count >= report.expected_count) {
      return report;
    }

    const auto now = clock_->Now();
    if (now >= deadline) {
      report.timed_out = true;
      ARTIFACT_LOG_WARN("Followers did not acknowledge upgrade",
                        {StringField("node", relation_->local_unit()), IntField("ready", report.ready_count),
                         IntField("expected", report.expected_count), StringField("stragglers", Join(report.stragglers)),
                         BoolField("full_consensus", options_.require_full_consensus)});
      if (options_.require_full_consensus) {
        throw util::UpgradeTimeout("only " + std::to_string(report.ready_count) + "/" + std::to_string(report.expected_count) +
                                   " followers ready after " + util::FormatDuration(options_.ready_timeout) + "; missing " +
                                   Join(report.stragglers));
      }
      return report;
    }

    const auto remaining = std::chrono::duration_cast<util::Duration>(deadline - now);
    clock_->SleepFor(std::min(backoff.Next(), remaining));
  }
}

void UpgradeCoordinator::MarkDownloading() {
  RequireLeader("MarkDownloading");
  WritePhase(UpgradePhase::kDownloading);
}

void UpgradeCoordinator::CompleteUpgrade() {
  RequireLeader("CompleteUpgrade");
  WritePhase(UpgradePhase::kComplete);
}

bool UpgradeCoordinator::MaybeResetAfterComplete() {
  RequireLeader("MaybeResetAfterComplete");

  const auto state = CurrentState();
  if (state.phase != UpgradePhase::kComplete) {
    return false;
  }

  std::vector<std::string> pending;
  for (const auto& unit : relation_->GetPeerUnits()) {
    if (IsReadyFor(unit, state)) {
      pending.push_back(unit);
    }
  }

  const bool grace_expired = state.timestamp && clock_->Now() - *state.timestamp >= options_.complete_grace_period;
  if (!pending.empty() && !grace_expired) {
    return false;
  }
  if (!pending.empty()) {
    ARTIFACT_LOG_WARN("Resetting upgrade with followers pending",
                      {StringField("node", relation_->local_unit()), StringField("pending", Join(pending))});
  }

  WritePhase(UpgradePhase::kIdle);
  return true;
}

void UpgradeCoordinator::DownloadAndRestart(const std::string& target_version) {
  storage_->RunPrimary(target_version);

  try {
    services_->Restart(options_.service_name, options_.service_timeout);
  } catch (const util::ServiceOperationFailed& e) {
    ARTIFACT_LOG_ERROR("Restart after upgrade failed; upgrades blocked until retried",
                       {StringField("node", relation_->local_unit()), StringField("service", options_.service_name),
                        StringField("target", target_version), StringField("error", e.what())});
    throw;
  }
}

UpgradeState UpgradeCoordinator::RunPrimaryUpgrade(const std::string& target_version) {
  InitiateUpgrade(target_version);

  const auto report = WaitForFollowersReady();
  ARTIFACT_LOG_INFO("Proceeding with upgrade", {StringField("node", relation_->local_unit()), StringField("target", target_version),
                                                IntField("ready", report.ready_count), IntField("expected", report.expected_count),
                                                BoolField("timed_out", report.timed_out)});

  MarkDownloading();
  DownloadAndRestart(target_version);
  CompleteUpgrade();
  return CurrentState();
}

UpgradeState UpgradeCoordinator::RetryUpgrade() {
  RequireLeader("RetryUpgrade");

  const auto state = CurrentState();
  if (state.phase != UpgradePhase::kDownloading) {
    throw util::InvalidState("no failed upgrade to retry (phase " + std::string(PhaseName(state.phase)) + ")");
  }

  ARTIFACT_LOG_INFO("Retrying upgrade", {StringField("node", relation_->local_unit()), StringField("target", state.target_version)});
  DownloadAndRestart(state.target_version);
  CompleteUpgrade();
  return CurrentState();
}

// ------------------------------------------------------------
// Follower
// ------------------------------------------------------------

bool UpgradeCoordinator::IsAcknowledged() const {
  return IsReadyFor(relation_->local_unit(), CurrentState());
}

bool UpgradeCoordinator::HasStoppedForUpgrade() const {
  return relation_->GetUnitData(relation_->local_unit(), keys::kUpgradeReady).value_or(kFalse) == kTrue;
}

void UpgradeCoordinator::ClearAcknowledgement() {
  relation_->SetUnitData(relation::DataBag{{keys::kUpgradeReady, kFalse}, {keys::kReadyTimestamp, ""}, {keys::kReadyCycle, ""}});
}

void UpgradeCoordinator::RecordObserved(UpgradePhase phase) {
  if (!observed_.empty() && observed_.back() == phase) {
    return;
  }
  observed_.push_back(phase);
  if (!IsValidObservation(observed_)) {
    ARTIFACT_LOG_WARN("Upgrade phases observed out of order", {StringField("node", relation_->local_unit()), StringField("phase", PhaseName(phase))});
    // A new cycle started without this node seeing the previous reset.
    observed_ = {phase};
  }
}

FollowerAction UpgradeCoordinator::OnRelationChanged() {
  const auto state = CurrentState();
  RecordObserved(state.phase);

  switch (state.phase) {
    case UpgradePhase::kIdle:
      if (HasStoppedForUpgrade()) {
        return ResumeAfterMissedComplete(state);
      }
      return FollowerAction::kNone;

    case UpgradePhase::kPrepare:
    case UpgradePhase::kDownloading:
      if (IsReadyFor(relation_->local_unit(), state)) {
        return FollowerAction::kNone;
      }
      HandlePrepareSignal(state);
      return FollowerAction::kStopped;

    case UpgradePhase::kComplete:
      if (!HasStoppedForUpgrade()) {
        return FollowerAction::kNone;
      }
      return HandleCompleteSignal(state) ? FollowerAction::kStarted : FollowerAction::kWaitingForMarker;
  }
  return FollowerAction::kNone;
}

void UpgradeCoordinator::HandlePrepareSignal(const UpgradeState& state) {
  ARTIFACT_LOG_INFO("Preparing for upgrade", {StringField("node", relation_->local_unit()), StringField("target", state.target_version),
                                              StringField("service", options_.service_name)});

  // Stopping is soft-fail: the primary must not wait on a service that will not stop.
  try {
    services_->Stop(options_.service_name, options_.service_timeout);
  } catch (const util::ServiceOperationFailed& e) {
    ARTIFACT_LOG_WARN("Service stop failed; acknowledging anyway",
                      {StringField("node", relation_->local_unit()), StringField("service", options_.service_name), StringField("error", e.what())});
  }

  relation_->SetUnitData(relation::DataBag{
      {keys::kUpgradeReady, kTrue}, {keys::kReadyTimestamp, util::FormatTimestamp(clock_->Now())}, {keys::kReadyCycle, state.cycle_id}});
}

bool UpgradeCoordinator::HandleCompleteSignal(const UpgradeState& state) {
  if (!storage_->IsInstalled(state.target_version)) {
    ARTIFACT_LOG_INFO("Upgrade complete signalled but volume not updated yet",
                      {StringField("node", relation_->local_unit()), StringField("target", state.target_version),
                       StringField("installed", storage_->volume().ReadInstalledVersion())});
    return false;
  }

  // Fast path (no polling): records the new version in this node's worker state.
  storage_->RunFollower(state.target_version);

  services_->Start(options_.service_name, options_.service_timeout);
  ClearAcknowledgement();

  ARTIFACT_LOG_INFO("Upgrade applied", {StringField("node", relation_->local_unit()), StringField("version", state.target_version)});
  return true;
}

// The primary reset the cycle (grace period) while this node was still
// stopped for it.
FollowerAction UpgradeCoordinator::ResumeAfterMissedComplete(const UpgradeState& state) {
  ARTIFACT_LOG_WARN("Upgrade cycle ended while stopped for it",
                    {StringField("node", relation_->local_unit()), StringField("target", state.target_version),
                     StringField("ready_cycle", relation_->GetUnitData(relation_->local_unit(), keys::kReadyCycle).value_or(""))});
  if (HandleCompleteSignal(state)) {
    return FollowerAction::kStarted;
  }

  services_->Start(options_.service_name, options_.service_timeout);
  ClearAcknowledgement();
  return FollowerAction::kNone;
}

} // namespace artifact::coordination

#include "upgrade_state.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <sstream>

#include "internal/util/errors.hpp"

namespace artifact::coordination {

namespace {

constexpr std::array<UpgradePhase, 5> kCycle = {
    UpgradePhase::kIdle, UpgradePhase::kPrepare, UpgradePhase::kDownloading, UpgradePhase::kComplete, UpgradePhase::kIdle,
};

std::uint32_t ParseCount(const relation::DataBag& bag, const char* key) {
  auto it = bag.find(key);
  if (it == bag.end() || it->second.empty()) {
    return 0;
  }

  std::uint32_t value = 0;
  const auto&   text  = it->second;
  auto [ptr, ec]      = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    throw util::InvalidState(std::string("relation key ") + key + " is not a count: " + text);
  }
  return value;
}

std::string Value(const relation::DataBag& bag, const char* key) {
  auto it = bag.find(key);
  return it == bag.end() ? std::string{} : it->second;
}

} // namespace

std::string_view PhaseName(UpgradePhase phase) {
  switch (phase) {
    case UpgradePhase::kIdle:
      return "idle";
    case UpgradePhase::kPrepare:
      return "prepare";
    case UpgradePhase::kDownloading:
      return "downloading";
    case UpgradePhase::kComplete:
      return "complete";
  }
  return "unknown";
}

UpgradePhase ParsePhase(std::string_view name) {
  if (name.empty() || name == "idle") return UpgradePhase::kIdle;
  if (name == "prepare") return UpgradePhase::kPrepare;
  if (name == "downloading") return UpgradePhase::kDownloading;
  if (name == "complete") return UpgradePhase::kComplete;
  throw util::InvalidState("unknown upgrade phase: " + std::string(name));
}

bool IsValidObservation(const std::vector<UpgradePhase>& observed) {
  int pos = -1;
  for (auto phase : observed) {
    if (pos >= 0 && kCycle[pos] == phase) {
      continue;
    }

    int next = pos + 1;
    while (next < static_cast<int>(kCycle.size()) && kCycle[next] != phase) {
      ++next;
    }
    if (next >= static_cast<int>(kCycle.size())) {
      return false;
    }
    // Middle phases may be missed; the closing IDLE only follows COMPLETE.
    if (pos >= 0 && next == static_cast<int>(kCycle.size()) - 1 && pos != next - 1) {
      return false;
    }
    pos = next;
  }
  return true;
}

UpgradeState UpgradeState::FromRelationData(const relation::DataBag& application) {
  UpgradeState state;
  state.phase          = ParsePhase(Value(application, keys::kUpgradeState));
  state.target_version = Value(application, keys::kTargetVersion);
  state.initiated_by   = Value(application, keys::kInitiatedBy);
  state.cycle_id       = Value(application, keys::kCycleId);
  state.timestamp      = util::ParseTimestamp(Value(application, keys::kTimestamp));
  state.expected_count = ParseCount(application, keys::kExpectedWorkerCount);
  state.ready_count    = std::min(ParseCount(application, keys::kWorkerReadyCount), state.expected_count);
  return state;
}

relation::DataBag UpgradeState::ToRelationData() const {
  relation::DataBag bag;
  bag[keys::kUpgradeState]        = std::string(PhaseName(phase));
  bag[keys::kTargetVersion]       = target_version;
  bag[keys::kInitiatedBy]         = initiated_by;
  bag[keys::kCycleId]             = cycle_id;
  bag[keys::kTimestamp]           = timestamp ? util::FormatTimestamp(*timestamp) : std::string{};
  bag[keys::kWorkerReadyCount]    = std::to_string(std::min(ready_count, expected_count));
  bag[keys::kExpectedWorkerCount] = std::to_string(expected_count);
  return bag;
}

std::string UpgradeState::DebugString() const {
  std::ostringstream out;
  out << "phase=" << PhaseName(phase) << " target=" << (target_version.empty() ? "-" : target_version) << " ready=" << ready_count << "/"
      << expected_count;
  if (!initiated_by.empty()) out << " by=" << initiated_by;
  if (!cycle_id.empty()) out << " cycle=" << cycle_id;
  return out.str();
}

} // namespace artifact::coordination

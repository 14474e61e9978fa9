#include "memory_relation_store.hpp"

#include "internal/util/errors.hpp"

namespace artifact::relation {

std::shared_ptr<MemoryRelationHub> MemoryRelationHub::Create() {
  return std::shared_ptr<MemoryRelationHub>(new MemoryRelationHub());
}

RelationDataAccessorPtr MemoryRelationHub::Join(const std::string& unit, bool leader) {
  {
    std::lock_guard lock(mutex_);
    units_.try_emplace(unit);
  }
  return std::make_shared<MemoryRelationAccessor>(shared_from_this(), unit, leader);
}

void MemoryRelationHub::SetUnitBag(const std::string& unit, const DataBag& values) {
  std::lock_guard lock(mutex_);
  MergeInto(units_[unit], values);
}

DataBag MemoryRelationHub::GetUnitBag(const std::string& unit) const {
  std::lock_guard lock(mutex_);
  auto            it = units_.find(unit);
  return it == units_.end() ? DataBag{} : it->second;
}

void MemoryRelationHub::SetApplicationBag(const DataBag& values) {
  std::lock_guard lock(mutex_);
  MergeInto(application_, values);
}

DataBag MemoryRelationHub::GetApplicationBag() const {
  std::lock_guard lock(mutex_);
  return application_;
}

std::vector<std::string> MemoryRelationHub::Units() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> units;
  units.reserve(units_.size());
  for (const auto& [unit, _] : units_) {
    units.push_back(unit);
  }
  return units;
}

// ------------------------------------------------------------
// Accessor
// ------------------------------------------------------------

MemoryRelationAccessor::MemoryRelationAccessor(std::shared_ptr<MemoryRelationHub> hub, std::string unit, bool leader)
    : hub_(std::move(hub)), unit_(std::move(unit)), leader_(leader) {
}

void MemoryRelationAccessor::SetUnitData(const DataBag& values) {
  hub_->SetUnitBag(unit_, values);
}

DataBag MemoryRelationAccessor::GetUnitBag(const std::string& unit) const {
  return hub_->GetUnitBag(unit);
}

std::vector<std::string> MemoryRelationAccessor::GetAllUnits() const {
  return hub_->Units();
}

void MemoryRelationAccessor::SetApplicationData(const DataBag& values) {
  if (!leader_) {
    throw util::InvalidState("unit " + unit_ + " is not the leader and cannot write application data");
  }
  hub_->SetApplicationBag(values);
}

DataBag MemoryRelationAccessor::GetApplicationBag() const {
  return hub_->GetApplicationBag();
}

} // namespace artifact::relation

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace artifact::relation {

using DataBag = std::map<std::string, std::string>;

/*
  Key/value channel shared by all units of one coordination group.

  Each unit writes only its own bag; the application bag is written by the
  leader only. Writing an empty value removes the key. Values are strings;
  callers own the encoding.

  Reads are never cached: every call reflects the latest published data.
*/
class RelationDataAccessor {
 public:
  virtual ~RelationDataAccessor() = default;

  virtual const std::string& local_unit() const = 0;
  virtual bool               is_leader() const  = 0;

  // Merges `values` into the local unit's bag.
  virtual void SetUnitData(const DataBag& values) = 0;

  virtual DataBag GetUnitBag(const std::string& unit) const = 0;

  // Every unit that joined the group, the local one included, sorted.
  virtual std::vector<std::string> GetAllUnits() const = 0;

  // Leader only; throws InvalidState otherwise.
  virtual void SetApplicationData(const DataBag& values) = 0;

  virtual DataBag GetApplicationBag() const = 0;

  void SetUnitData(const std::string& key, const std::string& value) {
    SetUnitData(DataBag{{key, value}});
  }

  void SetApplicationData(const std::string& key, const std::string& value) {
    SetApplicationData(DataBag{{key, value}});
  }

  std::optional<std::string> GetUnitData(const std::string& unit, const std::string& key) const {
    return Lookup(GetUnitBag(unit), key);
  }

  std::optional<std::string> GetApplicationData(const std::string& key) const {
    return Lookup(GetApplicationBag(), key);
  }

  // Units other than the local one.
  std::vector<std::string> GetPeerUnits() const {
    std::vector<std::string> peers;
    for (auto& unit : GetAllUnits()) {
      if (unit != local_unit()) peers.push_back(std::move(unit));
    }
    return peers;
  }

 private:
  static std::optional<std::string> Lookup(const DataBag& bag, const std::string& key) {
    auto it = bag.find(key);
    if (it == bag.end()) return std::nullopt;
    return it->second;
  }
};

using RelationDataAccessorPtr = std::shared_ptr<RelationDataAccessor>;

// Applies `values` to `bag`; empty values erase. Returns true if anything changed.
inline bool MergeInto(DataBag& bag, const DataBag& values) {
  bool changed = false;
  for (const auto& [key, value] : values) {
    if (value.empty()) {
      changed |= bag.erase(key) > 0;
      continue;
    }
    auto [it, inserted] = bag.try_emplace(key, value);
    if (!inserted && it->second != value) {
      it->second = value;
      changed    = true;
    }
    changed |= inserted;
  }
  return changed;
}

} // namespace artifact::relation

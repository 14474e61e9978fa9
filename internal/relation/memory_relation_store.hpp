#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/relation/relation_data_accessor.hpp"

namespace artifact::relation {

/*
  In-process relation channel. One hub per coordination group; every unit
  gets its own accessor from Join(). Thread-safe.
*/
class MemoryRelationHub : public std::enable_shared_from_this<MemoryRelationHub> {
 public:
  static std::shared_ptr<MemoryRelationHub> Create();

  RelationDataAccessorPtr Join(const std::string& unit, bool leader);

  // Raw access for tests and diagnostics; no leader check.
  void    SetUnitBag(const std::string& unit, const DataBag& values);
  DataBag GetUnitBag(const std::string& unit) const;
  void    SetApplicationBag(const DataBag& values);
  DataBag GetApplicationBag() const;

  std::vector<std::string> Units() const;

 private:
  MemoryRelationHub() = default;

  mutable std::mutex             mutex_;
  std::map<std::string, DataBag> units_;
  DataBag                        application_;
};

class MemoryRelationAccessor final : public RelationDataAccessor {
 public:
  MemoryRelationAccessor(std::shared_ptr<MemoryRelationHub> hub, std::string unit, bool leader);

  using RelationDataAccessor::SetApplicationData;
  using RelationDataAccessor::SetUnitData;

  const std::string& local_unit() const override {
    return unit_;
  }
  bool is_leader() const override {
    return leader_;
  }

  void                     SetUnitData(const DataBag& values) override;
  DataBag                  GetUnitBag(const std::string& unit) const override;
  std::vector<std::string> GetAllUnits() const override;
  void                     SetApplicationData(const DataBag& values) override;
  DataBag                  GetApplicationBag() const override;

 private:
  std::shared_ptr<MemoryRelationHub> hub_;
  std::string                        unit_;
  bool                               leader_;
};

} // namespace artifact::relation

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "artifact/coordination/v1.hpp"
#include "internal/relation/relation_data_accessor.hpp"

namespace artifact::relation {

/*
  Relation channel kept as files on the shared volume.

      {root}/application.json     leader writes
      {root}/units/{unit}.json    one writer per file, the unit itself

  Each file is a RelationBag in protobuf JSON, replaced atomically, so readers
  on other hosts see a whole bag or the previous one. Construction registers
  the local unit by creating its file.
*/
class FileRelationStore final : public RelationDataAccessor {
 public:
  static constexpr const char* kApplicationFileName = "application.json";
  static constexpr const char* kUnitsDirName        = "units";

  FileRelationStore(std::filesystem::path root, std::string local_unit, bool leader);

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

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path UnitPath(const std::string& unit) const;

  static artifact::coordination::v1::RelationBag ReadBag(const std::filesystem::path& path);
  static void WriteBag(const std::filesystem::path& path, const artifact::coordination::v1::RelationBag& bag);

  std::filesystem::path root_;
  std::string           unit_;
  bool                  leader_;
};

} // namespace artifact::relation

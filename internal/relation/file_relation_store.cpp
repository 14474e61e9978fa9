#include "file_relation_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_utils.hpp"

namespace artifact::relation {

using artifact::coordination::v1::RelationBag;
using artifact::observability::StringField;

namespace {

DataBag ToDataBag(const RelationBag& bag) {
  return DataBag(bag.data().begin(), bag.data().end());
}

} // namespace

FileRelationStore::FileRelationStore(std::filesystem::path root, std::string local_unit, bool leader)
    : root_(std::move(root)), unit_(std::move(local_unit)), leader_(leader) {
  std::filesystem::create_directories(root_ / kUnitsDirName);

  const auto path = UnitPath(unit_);
  if (!std::filesystem::exists(path)) {
    RelationBag bag;
    bag.set_unit(unit_);
    WriteBag(path, bag);
    ARTIFACT_LOG_INFO("Joined relation", {StringField("node", unit_), StringField("path", root_.string())});
  }
}

std::filesystem::path FileRelationStore::UnitPath(const std::string& unit) const {
  auto name = storage::SanitizeOwnerId(unit);
  storage::ValidateOwnerId(name);
  return root_ / kUnitsDirName / (name + ".json");
}

RelationBag FileRelationStore::ReadBag(const std::filesystem::path& path) {
  RelationBag bag;

  const auto content = util::ReadFileIfExists(path);
  if (!content || util::Trim(*content).empty()) {
    return bag;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(*content, &bag, options);
  if (!status.ok()) {
    throw util::InvalidState("corrupt relation data " + path.string() + ": " + std::string(status.message()));
  }
  return bag;
}

void FileRelationStore::WriteBag(const std::filesystem::path& path, const RelationBag& bag) {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  auto status = google::protobuf::util::MessageToJsonString(bag, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize relation data: " + std::string(status.message()));
  }
  util::AtomicWriteFile(path, json);
}

void FileRelationStore::SetUnitData(const DataBag& values) {
  const auto path = UnitPath(unit_);

  auto bag  = ReadBag(path);
  auto data = ToDataBag(bag);
  if (!MergeInto(data, values) && !bag.unit().empty()) {
    return;
  }

  RelationBag updated;
  updated.set_unit(unit_);
  updated.mutable_data()->insert(data.begin(), data.end());
  WriteBag(path, updated);
}

DataBag FileRelationStore::GetUnitBag(const std::string& unit) const {
  return ToDataBag(ReadBag(UnitPath(unit)));
}

std::vector<std::string> FileRelationStore::GetAllUnits() const {
  std::vector<std::string> units;

  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(root_ / kUnitsDirName, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
    // Skip in-flight temp files from AtomicWriteFile.
    if (entry.path().filename().string().front() == '.') continue;

    const auto bag = ReadBag(entry.path());
    units.push_back(bag.unit().empty() ? entry.path().stem().string() : bag.unit());
  }
  if (ec) {
    throw std::system_error(ec, "list " + (root_ / kUnitsDirName).string());
  }

  std::sort(units.begin(), units.end());
  return units;
}

void FileRelationStore::SetApplicationData(const DataBag& values) {
  if (!leader_) {
    throw util::InvalidState("unit " + unit_ + " is not the leader and cannot write application data");
  }

  const auto path = root_ / kApplicationFileName;
  auto       data = ToDataBag(ReadBag(path));
  if (!MergeInto(data, values)) {
    return;
  }

  RelationBag updated;
  updated.mutable_data()->insert(data.begin(), data.end());
  WriteBag(path, updated);
}

DataBag FileRelationStore::GetApplicationBag() const {
  return ToDataBag(ReadBag(root_ / kApplicationFileName));
}

} // namespace artifact::relation

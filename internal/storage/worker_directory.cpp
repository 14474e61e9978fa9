#include "worker_directory.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_utils.hpp"
#include "internal/util/time.hpp"

namespace artifact::storage {

using artifact::coordination::v1::WorkerState;
using artifact::observability::StringField;

WorkerDirectory::WorkerDirectory(std::string owner_id, std::filesystem::path path, bool read_only)
    : owner_id_(std::move(owner_id)), path_(std::move(path)), read_only_(read_only) {
}

WorkerDirectory WorkerDirectory::ForOwner(const SharedVolume& volume, const std::string& owner_id) {
  WorkerDirectory dir(SanitizeOwnerId(owner_id), OwnerPath(volume.worker_root(), owner_id), false);

  const bool created = std::filesystem::create_directories(dir.path_);
  std::filesystem::create_directories(dir.work_dir());

  if (created) {
    ARTIFACT_LOG_INFO("Worker directory created", {StringField("node", owner_id), StringField("path", dir.path_.string())});
  }
  return dir;
}

WorkerDirectory WorkerDirectory::OpenReadOnly(const SharedVolume& volume, const std::string& owner_id) {
  return WorkerDirectory(SanitizeOwnerId(owner_id), OwnerPath(volume.worker_root(), owner_id), true);
}

bool WorkerDirectory::Exists() const {
  std::error_code ec;
  return std::filesystem::is_directory(path_, ec);
}

WorkerState WorkerDirectory::ReadState() const {
  WorkerState state;

  const auto content = util::ReadFileIfExists(state_file());
  if (!content || util::Trim(*content).empty()) {
    state.set_owner_id(owner_id_);
    return state;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(*content, &state, options);
  if (!status.ok()) {
    throw util::InvalidState("corrupt worker state " + state_file().string() + ": " + std::string(status.message()));
  }
  return state;
}

void WorkerDirectory::WriteState(const WorkerState& state) {
  if (read_only_) {
    throw util::InvalidState("worker directory " + path_.string() + " is read-only for this node");
  }

  WorkerState stamped = state;
  stamped.set_owner_id(owner_id_);
  *stamped.mutable_updated_at() = util::ToProto(util::SystemClock::now());

  std::string                                json;
  google::protobuf::util::JsonPrintOptions   options;
  options.add_whitespace = true;

  auto status = google::protobuf::util::MessageToJsonString(stamped, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize worker state: " + std::string(status.message()));
  }

  util::AtomicWriteFile(state_file(), json);
}

std::optional<std::string> WorkerDirectory::Get(const std::string& key) const {
  const auto state = ReadState();
  const auto it    = state.entries().find(key);
  if (it == state.entries().end()) {
    return std::nullopt;
  }
  return it->second;
}

bool WorkerDirectory::Put(const std::string& key, const std::string& value) {
  auto state = ReadState();
  auto it    = state.entries().find(key);
  if (it != state.entries().end() && it->second == value) {
    return false;
  }

  (*state.mutable_entries())[key] = value;
  WriteState(state);
  return true;
}

} // namespace artifact::storage

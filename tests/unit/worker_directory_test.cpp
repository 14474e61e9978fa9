#include <sys/stat.h>

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/storage/shared_volume.hpp"
#include "internal/storage/worker_directory.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using artifact::storage::SharedVolume;
using artifact::storage::WorkerDirectory;
using artifact::testing::TempDir;
using artifact::testing::WriteFile;

void TestOwnerPathIsSanitized() {
  TempDir dir("worker_path");
  auto    volume = SharedVolume::Open(dir.path());

  auto worker = WorkerDirectory::ForOwner(volume, "concourse-ci/1");
  assert(worker.owner_id() == "concourse-ci-1");
  assert(worker.path() == volume.worker_root() / "concourse-ci-1");
  assert(std::filesystem::is_directory(worker.path()));
  assert(std::filesystem::is_directory(worker.work_dir()));
  assert(!worker.read_only());
}

void TestStateRoundTripAndPersistence() {
  TempDir dir("worker_state");
  auto    volume = SharedVolume::Open(dir.path());

  {
    auto worker = WorkerDirectory::ForOwner(volume, "node-b");
    assert(worker.ReadState().entries().empty());
    assert(worker.ReadState().owner_id() == "node-b");
    assert(!worker.Get("installed_version"));

    assert(worker.Put("installed_version", "1.2.0"));
    assert(worker.Put("role", "follower"));
  }

  // Persists across a restart of the same node.
  auto worker = WorkerDirectory::ForOwner(volume, "node-b");
  assert(worker.Get("installed_version") == "1.2.0");
  assert(worker.Get("role") == "follower");

  const auto state = worker.ReadState();
  assert(state.owner_id() == "node-b");
  assert(state.has_updated_at());
}

void TestUnchangedPutDoesNotWrite() {
  TempDir dir("worker_put");
  auto    volume = SharedVolume::Open(dir.path());
  auto    worker = WorkerDirectory::ForOwner(volume, "node-a");

  assert(worker.Put("installed_version", "1.2.0"));

  struct stat before {};
  assert(::stat(worker.state_file().c_str(), &before) == 0);

  assert(!worker.Put("installed_version", "1.2.0"));

  struct stat after {};
  assert(::stat(worker.state_file().c_str(), &after) == 0);
  assert(before.st_ino == after.st_ino);
  assert(before.st_mtim.tv_sec == after.st_mtim.tv_sec && before.st_mtim.tv_nsec == after.st_mtim.tv_nsec);

  assert(worker.Put("installed_version", "1.3.0"));
  assert(worker.Get("installed_version") == "1.3.0");
}

void TestReadOnlyHandleRefusesWrites() {
  TempDir dir("worker_read_only");
  auto    volume = SharedVolume::Open(dir.path());

  auto owner = WorkerDirectory::ForOwner(volume, "node-a");
  owner.Put("installed_version", "1.2.0");

  auto reader = WorkerDirectory::OpenReadOnly(volume, "node-a");
  assert(reader.read_only());
  assert(reader.Exists());
  assert(reader.Get("installed_version") == "1.2.0");

  bool threw = false;
  try {
    reader.Put("installed_version", "9.9.9");
  } catch (const artifact::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(owner.Get("installed_version") == "1.2.0");

  // Opening a read-only handle never creates anything.
  auto missing = WorkerDirectory::OpenReadOnly(volume, "node-z");
  assert(!missing.Exists());
}

void TestCorruptStateIsReported() {
  TempDir dir("worker_corrupt");
  auto    volume = SharedVolume::Open(dir.path());
  auto    worker = WorkerDirectory::ForOwner(volume, "node-a");

  WriteFile(worker.state_file(), "{not json");

  bool threw = false;
  try {
    (void)worker.ReadState();
  } catch (const artifact::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidOwnerRejected() {
  TempDir dir("worker_invalid");
  auto    volume = SharedVolume::Open(dir.path());

  bool threw = false;
  try {
    (void)WorkerDirectory::ForOwner(volume, "..");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestOwnerPathIsSanitized();
  TestStateRoundTripAndPersistence();
  TestUnchangedPutDoesNotWrite();
  TestReadOnlyHandleRefusesWrites();
  TestCorruptStateIsReported();
  TestInvalidOwnerRejected();

  std::cout << "artifact_unit_worker_directory: pass\n";
  return 0;
}

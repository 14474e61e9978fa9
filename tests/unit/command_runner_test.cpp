#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/service/command_runner.hpp"
#include "internal/service/systemd_service_manager.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;

using artifact::service::RunCommand;
using artifact::service::SystemdServiceManager;
using artifact::testing::TempDir;
using artifact::testing::WriteFile;

void TestCapturesOutputAndExitCode() {
  auto ok = RunCommand({"/bin/sh", "-c", "echo hello; echo oops >&2"}, 5s);
  assert(ok.ok());
  assert(ok.exit_code == 0);
  assert(ok.output.find("hello") != std::string::npos);
  assert(ok.output.find("oops") != std::string::npos);

  auto failed = RunCommand({"/bin/sh", "-c", "exit 3"}, 5s);
  assert(!failed.ok());
  assert(failed.exit_code == 3);
  assert(!failed.timed_out);
}

void TestMissingExecutable() {
  auto result = RunCommand({"/nonexistent/artifact-coordinator-test-binary"}, 5s);
  assert(result.exit_code == 127);
}

void TestTimeoutKillsChild() {
  const auto started = std::chrono::steady_clock::now();
  auto       result  = RunCommand({"/bin/sh", "-c", "sleep 30"}, 200ms);
  assert(result.timed_out);
  assert(!result.ok());
  assert(std::chrono::steady_clock::now() - started < 10s);
}

// Fake systemctl: keeps unit state in a file next to the script.
std::filesystem::path WriteFakeSystemctl(const std::filesystem::path& dir) {
  const auto script = dir / "systemctl";
  WriteFile(script,
            "#!/bin/sh\n"
            "state=\"" + (dir / "state").string() + "\"\n"
            "echo \"$*\" >> \"" + (dir / "calls").string() + "\"\n"
            "case \"$1\" in\n"
            "  is-active) [ \"$(cat \"$state\" 2>/dev/null)\" = active ] ;;\n"
            "  start|restart) echo active > \"$state\" ;;\n"
            "  stop) echo inactive > \"$state\" ;;\n"
            "  *) echo \"unknown verb $1\" >&2; exit 1 ;;\n"
            "esac\n",
            true);
  return script;
}

int CountCalls(const std::filesystem::path& dir, const std::string& verb) {
  std::ifstream in(dir / "calls");
  std::string   line;
  int           n = 0;
  while (std::getline(in, line)) {
    if (line.rfind(verb + " ", 0) == 0) ++n;
  }
  return n;
}

void TestSystemdManagerIsIdempotent() {
  TempDir dir("fake_systemctl");
  SystemdServiceManager manager(WriteFakeSystemctl(dir.path()).string());

  assert(!manager.IsActive("concourse-worker"));
  manager.Stop("concourse-worker", 5s);  // already stopped: no stop issued
  assert(CountCalls(dir.path(), "stop") == 0);

  manager.Start("concourse-worker", 5s);
  assert(manager.IsActive("concourse-worker"));
  manager.Start("concourse-worker", 5s);  // already running
  assert(CountCalls(dir.path(), "start") == 1);

  manager.Restart("concourse-worker", 5s);
  assert(CountCalls(dir.path(), "restart") == 1);

  manager.Stop("concourse-worker", 5s);
  manager.Stop("concourse-worker", 5s);
  assert(CountCalls(dir.path(), "stop") == 1);
  assert(!manager.IsActive("concourse-worker"));
}

void TestSystemdManagerErrors() {
  TempDir dir("failing_systemctl");
  const auto failing = dir.path() / "systemctl";
  WriteFile(failing, "#!/bin/sh\n[ \"$1\" = is-active ] && exit 3\n[ \"$1\" = start ] && sleep 30\necho \"unit masked\" >&2\nexit 1\n", true);

  SystemdServiceManager manager(failing.string());

  bool timed_out = false;
  try {
    manager.Start("svc", 200ms);
  } catch (const artifact::util::ServiceOperationTimeout&) {
    timed_out = true;
  }
  assert(timed_out);

  bool failed = false;
  try {
    manager.Restart("svc", 5s);
  } catch (const artifact::util::ServiceOperationTimeout&) {
    assert(false && "restart failure is not a timeout");
  } catch (const artifact::util::ServiceOperationFailed& e) {
    failed = std::string(e.what()).find("unit masked") != std::string::npos;
  }
  assert(failed);
}

} // namespace

int main() {
  TestCapturesOutputAndExitCode();
  TestMissingExecutable();
  TestTimeoutKillsChild();
  TestSystemdManagerIsIdempotent();
  TestSystemdManagerErrors();

  std::cout << "artifact_unit_command_runner: pass\n";
  return 0;
}

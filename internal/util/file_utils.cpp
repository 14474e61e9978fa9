#include "file_utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/util/uuid.hpp"

namespace artifact::util {

namespace {

[[noreturn]] void ThrowErrno(const std::string& what, const std::filesystem::path& path) {
  throw std::system_error(errno, std::generic_category(), what + " " + path.string());
}

class FdCloser {
 public:
  explicit FdCloser(int fd) : fd_(fd) {
  }
  ~FdCloser() {
    if (fd_ >= 0) ::close(fd_);
  }

  int Release() {
    int fd = fd_;
    fd_    = -1;
    return fd;
  }

 private:
  int fd_;
};

} // namespace

void AtomicWriteFile(const std::filesystem::path& path, const std::string& content) {
  // Unique per writer: nodes on different hosts may share a pid.
  const auto tmp_path = path.parent_path() / ("." + path.filename().string() + ".tmp." + ToString(GenerateUUID()));

  int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) ThrowErrno("open", tmp_path);
  FdCloser closer(fd);

  const char* data      = content.data();
  std::size_t remaining = content.size();
  while (remaining > 0) {
    const auto written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) continue;
      const int saved = errno;
      ::unlink(tmp_path.c_str());
      errno = saved;
      ThrowErrno("write", tmp_path);
    }
    data += written;
    remaining -= static_cast<std::size_t>(written);
  }

  if (::fsync(fd) != 0) {
    const int saved = errno;
    ::unlink(tmp_path.c_str());
    errno = saved;
    ThrowErrno("fsync", tmp_path);
  }

  if (::close(closer.Release()) != 0) {
    const int saved = errno;
    ::unlink(tmp_path.c_str());
    errno = saved;
    ThrowErrno("close", tmp_path);
  }

  if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
    const int saved = errno;
    ::unlink(tmp_path.c_str());
    errno = saved;
    ThrowErrno("rename", path);
  }
}

std::optional<std::string> ReadFileIfExists(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      return std::nullopt;
    }
    throw std::runtime_error("cannot read " + path.string());
  }

  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

} // namespace artifact::util

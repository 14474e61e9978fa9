#include "time.hpp"

#include <ctime>
#include <thread>

namespace artifact::util {

TimePoint RealClock::Now() const {
  return SystemClock::now();
}

void RealClock::SleepFor(Duration d) {
  std::this_thread::sleep_for(d);
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<SystemClock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

Duration FromProto(const google::protobuf::Duration& d, Duration fallback) {
  const auto value = std::chrono::duration_cast<Duration>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
  if (value <= Duration::zero()) {
    return fallback;
  }
  return value;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatTimestamp(TimePoint tp) {
  const std::time_t t = SystemClock::to_time_t(tp);
  std::tm           tm{};
  gmtime_r(&t, &tm);

  char buffer[32];
  const auto n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buffer, n);
}

std::optional<TimePoint> ParseTimestamp(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::tm     tm{};
  const char* end = strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
  if (end == nullptr) {
    return std::nullopt;
  }
  // Accept a trailing "Z" or "+00:00"; anything else is not UTC.
  const std::string rest(end);
  if (!rest.empty() && rest != "Z" && rest != "+00:00") {
    return std::nullopt;
  }

  return SystemClock::from_time_t(timegm(&tm));
}

std::string FormatDuration(Duration d) {
  const auto ms = d.count();
  if (ms % 1000 == 0) {
    return std::to_string(ms / 1000) + "s";
  }
  return std::to_string(ms) + "ms";
}

} // namespace artifact::util

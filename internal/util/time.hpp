#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace artifact::util {

/*
  Time utilities. Every wait in the coordination code goes through Clock so
  tests can drive time and count sleeps.
*/

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;
using Duration    = std::chrono::milliseconds;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const           = 0;
  virtual void      SleepFor(Duration d) = 0;
};

class RealClock final : public Clock {
 public:
  TimePoint Now() const override;
  void      SleepFor(Duration d) override;
};

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// Falls back to `fallback` when the proto duration is unset or zero.
Duration FromProto(const google::protobuf::Duration& d, Duration fallback);

uint64_t ToUnixMillis(TimePoint tp);

// RFC 3339 UTC, second precision: 2026-10-19T12:00:00Z
std::string              FormatTimestamp(TimePoint tp);
std::optional<TimePoint> ParseTimestamp(const std::string& text);

std::string FormatDuration(Duration d);

} // namespace artifact::util

#pragma once

#include <algorithm>
#include <chrono>

#include "internal/util/time.hpp"

namespace artifact::util {

/*
  Poll interval that doubles after every attempt up to a cap.
  Default schedule: 5s, 10s, 20s, 20s, ...
*/
class Backoff {
 public:
  Backoff() = default;
  Backoff(Duration initial, Duration max) : initial_(initial), max_(std::max(initial, max)), next_(initial) {
  }

  Duration Next() {
    const auto current = next_;
    next_              = std::min(next_ * 2, max_);
    return current;
  }

  void Reset() {
    next_ = initial_;
  }

  Duration initial() const {
    return initial_;
  }

  Duration max() const {
    return max_;
  }

 private:
  Duration initial_{std::chrono::seconds(5)};
  Duration max_{std::chrono::seconds(20)};
  Duration next_{std::chrono::seconds(5)};
};

} // namespace artifact::util

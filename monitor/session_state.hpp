#pragma once
#include <cstdint>
#include <optional>
#include "../common/clock.hpp"
#include "sample.hpp"

namespace battlog {

// Mutable state of one session. Only LoopController writes to it.
struct SessionState {
  TimePoint start_time{};
  std::optional<Sample> last_sample;
  long long ticks = 0;
  std::optional<std::uintmax_t> log_bytes;
};

} // namespace battlog

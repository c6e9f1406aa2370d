#pragma once
#include <chrono>

namespace battlog {

using TimePoint = std::chrono::system_clock::time_point;

// Time source for the sampling loop. The loop never touches the system
// clock directly so tests can advance time without sleeping.
class Clock {
public:
  virtual ~Clock() = default;
  virtual TimePoint now() = 0;
  virtual void sleep_for(std::chrono::seconds d) = 0;
};

class SystemClock : public Clock {
public:
  TimePoint now() override;
  void sleep_for(std::chrono::seconds d) override;
};

// Whole seconds from `from` to `to`, never negative.
long long elapsed_seconds(TimePoint from, TimePoint to);

} // namespace battlog

#pragma once
#include <ostream>
#include "../common/clock.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "sensor_reader.hpp"
#include "session_state.hpp"

namespace battlog {

// LoopController drives one session: every tick it reads the battery,
// appends a record when logging is on, redraws the display when it is on,
// then sleeps for the configured interval.
// The session ends on its own only when a maximum runtime is set.
class LoopController {
  const Config cfg_;
  SensorReader& reader_;
  Clock& clock_;
  Logger& log_;
  std::ostream& out_;
  SessionState state_;
  bool running_ = false;
public:
  LoopController(const Config& C, SensorReader& reader, Clock& clock, Logger& log, std::ostream& out)
  : cfg_(C), reader_(reader), clock_(clock), log_(log), out_(out) {}

  // Records the start time and enters the running state.
  void start();
  // One full read/log/render/sleep cycle. Returns false once the session
  // has terminated, in which case nothing was read or written.
  bool tick();
  // start() followed by tick() until termination.
  void run();

  bool running() const { return running_; }
  const SessionState& state() const { return state_; }
};

} // namespace battlog

#pragma once
#include <optional>
#include <string>
#include "../common/clock.hpp"
#include "sample.hpp"
#include "temperature_source.hpp"

namespace battlog {

// Reads the power_supply attributes of one battery directory. Every
// attribute is read on its own; a failure only blanks that field.
class SensorReader {
  TemperatureSource& temp_;
  Clock& clock_;
public:
  SensorReader(TemperatureSource& temp, Clock& clock) : temp_(temp), clock_(clock) {}

  Sample read(const std::string& battery_path);
};

// Contents of a sysfs attribute with surrounding whitespace removed, or
// nothing if the file is missing, unreadable or empty.
std::optional<std::string> read_attribute(const std::string& path);

// Attribute parsed as a base-10 integer; non-numeric content is unavailable.
std::optional<long long> read_integer_attribute(const std::string& path);

} // namespace battlog

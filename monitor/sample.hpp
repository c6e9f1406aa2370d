#pragma once
#include <optional>
#include <string>
#include "../common/clock.hpp"

namespace battlog {

// One reading of the power supply. An empty optional means the attribute
// could not be read this tick, which is distinct from a reading of zero.
struct Sample {
  TimePoint timestamp{};
  std::optional<long long> current_uA;
  std::optional<long long> voltage_uV;
  std::optional<long long> capacity_pct;
  std::optional<long long> charge_uAh;
  std::optional<double> temperature_c;
  std::string status = "Unknown";

  bool is_charging() const { return status == "Charging"; }
};

} // namespace battlog

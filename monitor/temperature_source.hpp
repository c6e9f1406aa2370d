#pragma once
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace battlog {

struct Config;

// Supplies the host temperature in degrees Celsius, or nothing when the
// platform facility is missing or returns something unparseable.
class TemperatureSource {
public:
  virtual ~TemperatureSource() = default;
  virtual std::optional<double> read_celsius() = 0;
};

// Runs `acpi -t` and reads the first thermal line.
class AcpiTemperatureSource : public TemperatureSource {
public:
  std::optional<double> read_celsius() override;
};

// Reads <zone>/temp, reported by the kernel in millidegrees.
class ThermalZoneTemperatureSource : public TemperatureSource {
  std::string zone_;
public:
  explicit ThermalZoneTemperatureSource(std::string zone) : zone_(std::move(zone)) {}
  std::optional<double> read_celsius() override;
};

class NullTemperatureSource : public TemperatureSource {
public:
  std::optional<double> read_celsius() override { return std::nullopt; }
};

// "Thermal 0: ok, 45.0 degrees C" -> 45.0 (fourth whitespace field of the first line).
std::optional<double> parse_acpi_temperature(const std::string& output);

std::unique_ptr<TemperatureSource> make_temperature_source(const Config& C);

} // namespace battlog

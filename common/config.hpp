#pragma once
#include <optional>
#include <string>

namespace battlog {

// Output path that means "no log requested".
inline const char* const kDefaultLogFile = "battery_log.csv";
inline const char* const kPowerSupplyRoot = "/sys/class/power_supply";
inline const char* const kDefaultThermalZone = "/sys/class/thermal/thermal_zone0";

struct Config {
  // Logging policy: unset when the user did not name an output file.
  std::optional<std::string> log_path;
  // Sampling policy
  int interval_s = 60;
  long long max_runtime_s = 0; // 0 = run until interrupted
  // Sensors
  std::string battery_path;
  std::string temperature_source = "acpi"; // acpi | thermal | none
  std::string thermal_zone = kDefaultThermalZone;
  // Output
  bool display_enabled = true;
  std::optional<std::string> diagnostics_log;
  bool verbose = false;

  bool logging_enabled() const { return log_path.has_value(); }
};

// Settings as written by the user, before the logging gate and battery
// autodetection are applied. JSON fills it first, CLI flags override.
struct Settings {
  std::string output = kDefaultLogFile;
  int interval_s = 60;
  long long max_runtime_s = 0;
  std::string battery; // empty = autodetect
  bool display_enabled = true;
  std::string temperature_source = "acpi";
  std::string thermal_zone = kDefaultThermalZone;
  std::string diagnostics_log;
  bool verbose = false;
};

bool load_config_json(const std::string& path, Settings& S, std::string& err);

// First BAT* entry under `root` in name order, or empty if none.
std::string autodetect_battery(const std::string& root = kPowerSupplyRoot);

// Applies the logging gate and autodetection, then checks the startup
// preconditions. Fails without touching the log file.
bool resolve_config(const Settings& S, Config& C, std::string& err);

} // namespace battlog

#include "temperature_source.hpp"
#include "../common/config.hpp"
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace battlog {

static std::optional<double> parse_real(const std::string& tok){
  if(tok.empty()) return std::nullopt;
  errno = 0;
  char* stop = nullptr;
  double v = std::strtod(tok.c_str(), &stop);
  if(*stop!='\0' || errno==ERANGE) return std::nullopt;
  return v;
}

std::optional<double> parse_acpi_temperature(const std::string& output){
  std::istringstream lines(output);
  std::string first;
  if(!std::getline(lines, first)) return std::nullopt;
  std::istringstream fields(first);
  std::string tok;
  for(int i=0;i<4;i++){
    if(!(fields>>tok)) return std::nullopt;
  }
  return parse_real(tok);
}

std::optional<double> AcpiTemperatureSource::read_celsius(){
  // `command -v` keeps a missing acpi binary from printing to our terminal.
  FILE* pipe = popen("command -v acpi >/dev/null 2>&1 && acpi -t 2>/dev/null", "r");
  if(!pipe) return std::nullopt;
  std::string output;
  std::array<char, 256> buf{};
  while(std::fgets(buf.data(), (int)buf.size(), pipe) != nullptr) output += buf.data();
  int rc = pclose(pipe);
  if(rc != 0) return std::nullopt;
  return parse_acpi_temperature(output);
}

std::optional<double> ThermalZoneTemperatureSource::read_celsius(){
  std::ifstream f(zone_ + "/temp");
  if(!f) return std::nullopt;
  std::string tok;
  if(!(f>>tok)) return std::nullopt;
  auto milli = parse_real(tok);
  if(!milli) return std::nullopt;
  return *milli / 1000.0;
}

std::unique_ptr<TemperatureSource> make_temperature_source(const Config& C){
  if(C.temperature_source=="thermal") return std::make_unique<ThermalZoneTemperatureSource>(C.thermal_zone);
  if(C.temperature_source=="none") return std::make_unique<NullTemperatureSource>();
  return std::make_unique<AcpiTemperatureSource>();
}

} // namespace battlog

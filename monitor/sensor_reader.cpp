#include "sensor_reader.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace battlog {

std::optional<std::string> read_attribute(const std::string& path){
  std::ifstream f(path);
  if(!f) return std::nullopt;
  std::ostringstream ss; ss<<f.rdbuf();
  std::string s = ss.str();
  size_t b = 0, e = s.size();
  while(b<e && std::isspace((unsigned char)s[b])) b++;
  while(e>b && std::isspace((unsigned char)s[e-1])) e--;
  if(b==e) return std::nullopt;
  return s.substr(b, e-b);
}

std::optional<long long> read_integer_attribute(const std::string& path){
  auto text = read_attribute(path);
  if(!text) return std::nullopt;
  errno = 0;
  char* stop = nullptr;
  long long v = std::strtoll(text->c_str(), &stop, 10);
  if(*stop!='\0' || errno==ERANGE) return std::nullopt;
  return v;
}

Sample SensorReader::read(const std::string& battery_path){
  Sample s;
  s.timestamp = clock_.now();
  const std::string dir = battery_path + "/";
  s.current_uA   = read_integer_attribute(dir + "current_now");
  s.voltage_uV   = read_integer_attribute(dir + "voltage_now");
  s.capacity_pct = read_integer_attribute(dir + "capacity");
  s.charge_uAh   = read_integer_attribute(dir + "charge_now");
  s.temperature_c = temp_.read_celsius();
  if(auto status = read_attribute(dir + "status")) s.status = *status;
  return s;
}

} // namespace battlog

#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace battlog {

// Locates the value that follows "key": and returns its offset, or npos.
static size_t find_value(const std::string& s, const std::string& key){
  auto pos = s.find("\""+key+"\"");
  if(pos==std::string::npos) return pos;
  pos = s.find(":", pos);
  if(pos==std::string::npos) return pos;
  pos++;
  while(pos<s.size() && std::isspace((unsigned char)s[pos])) pos++;
  return pos;
}

// Missing keys leave `out` alone and succeed; a present but malformed value fails.
static bool parse_integer(const std::string& s, const std::string& key, long long& out, std::string& err){
  size_t pos = find_value(s, key);
  if(pos==std::string::npos) return true;
  size_t end=pos;
  if(end<s.size() && (s[end]=='-' || s[end]=='+')) end++;
  while(end<s.size() && std::isdigit((unsigned char)s[end])) end++;
  std::string tok = s.substr(pos, end-pos);
  errno = 0;
  char* stop = nullptr;
  long long v = std::strtoll(tok.c_str(), &stop, 10);
  if(tok.empty() || *stop!='\0' || errno==ERANGE){
    err = "Config key '"+key+"' is not an integer";
    return false;
  }
  out = v;
  return true;
}

static bool parse_bool(const std::string& s, const std::string& key, bool& out, std::string& err){
  size_t pos = find_value(s, key);
  if(pos==std::string::npos) return true;
  if(s.compare(pos,4,"true")==0){ out=true; return true; }
  if(s.compare(pos,5,"false")==0){ out=false; return true; }
  err = "Config key '"+key+"' is not a boolean";
  return false;
}

static bool parse_string(const std::string& s, const std::string& key, std::string& out, std::string& err){
  size_t pos = find_value(s, key);
  if(pos==std::string::npos) return true;
  if(pos>=s.size() || s[pos]!='"'){ err = "Config key '"+key+"' is not a string"; return false; }
  pos++;
  size_t end = s.find("\"", pos);
  if(end==std::string::npos){ err = "Config key '"+key+"' has an unterminated string"; return false; }
  out = s.substr(pos, end-pos);
  return true;
}

bool load_config_json(const std::string& path, Settings& S, std::string& err){
  std::ifstream f(path);
  if(!f){ err="Could not open config: "+path; return false; }
  std::ostringstream ss; ss<<f.rdbuf();
  std::string s=ss.str();

  long long interval = S.interval_s;
  long long max_time = S.max_runtime_s;
  if(!parse_string(s,"output", S.output, err)) return false;
  if(!parse_integer(s,"interval", interval, err)) return false;
  if(!parse_string(s,"battery", S.battery, err)) return false;
  if(!parse_integer(s,"time", max_time, err)) return false;
  if(!parse_bool(s,"interface", S.display_enabled, err)) return false;
  if(!parse_string(s,"temperature_source", S.temperature_source, err)) return false;
  if(!parse_string(s,"thermal_zone", S.thermal_zone, err)) return false;
  if(!parse_string(s,"diagnostics_log", S.diagnostics_log, err)) return false;
  if(!parse_bool(s,"verbose", S.verbose, err)) return false;

  if(interval <= 0 || interval > 86400*365){ err="Config key 'interval' must be a positive number of seconds"; return false; }
  if(max_time < 0){ err="Config key 'time' must not be negative"; return false; }
  S.interval_s = (int)interval;
  S.max_runtime_s = max_time;
  return true;
}

std::string autodetect_battery(const std::string& root){
  std::error_code ec;
  if(!fs::is_directory(root, ec)) return "";
  std::vector<std::string> found;
  for(fs::directory_iterator it(root, ec), end; !ec && it!=end; it.increment(ec)){
    std::string name = it->path().filename().string();
    if(name.compare(0, 3, "BAT")==0) found.push_back(it->path().string());
  }
  if(found.empty()) return "";
  std::sort(found.begin(), found.end());
  return found.front();
}

bool resolve_config(const Settings& S, Config& C, std::string& err){
  if(S.interval_s <= 0){ err="Interval must be a positive number of seconds"; return false; }
  if(S.max_runtime_s < 0){ err="Maximum runtime must not be negative"; return false; }
  if(S.temperature_source!="acpi" && S.temperature_source!="thermal" && S.temperature_source!="none"){
    err="Unknown temperature source: "+S.temperature_source;
    return false;
  }

  Config out;
  out.battery_path = S.battery.empty() ? autodetect_battery() : S.battery;
  std::error_code ec;
  if(out.battery_path.empty() || !fs::is_directory(out.battery_path, ec)){
    err="Battery path '"+out.battery_path+"' not found!";
    return false;
  }

  // Logging stays off unless the user named a file other than the default.
  if(!S.output.empty() && S.output!=kDefaultLogFile) out.log_path = S.output;
  out.interval_s = S.interval_s;
  out.max_runtime_s = S.max_runtime_s;
  out.display_enabled = S.display_enabled;
  out.temperature_source = S.temperature_source;
  out.thermal_zone = S.thermal_zone;
  if(!S.diagnostics_log.empty()) out.diagnostics_log = S.diagnostics_log;
  out.verbose = S.verbose;
  C = out;
  return true;
}

} // namespace battlog

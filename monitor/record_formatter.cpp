#include "record_formatter.hpp"
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace battlog {

std::string format_timestamp(TimePoint t){
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char tb[32];
  std::strftime(tb, sizeof(tb), "%Y-%m-%d %H:%M:%S", &tm);
  return tb;
}

static std::string field(const std::optional<long long>& v){
  return v ? std::to_string(*v) : kUnavailable;
}

static std::string field(const std::optional<double>& v){
  if(!v) return kUnavailable;
  char b[32];
  std::snprintf(b, sizeof(b), "%.1f", *v);
  return b;
}

std::string format_record(const Sample& s){
  std::ostringstream os;
  os<<format_timestamp(s.timestamp)<<','
    <<field(s.current_uA)<<','
    <<field(s.voltage_uV)<<','
    <<field(s.capacity_pct)<<','
    <<field(s.charge_uAh)<<','
    <<field(s.temperature_c)<<','
    <<(s.is_charging() ? '1' : '0');
  return os.str();
}

bool ensure_header(const std::string& path, std::string& err){
  std::error_code ec;
  if(fs::exists(path, ec)) return true;
  if(ec){ err="Could not stat log file "+path+": "+ec.message(); return false; }
  std::ofstream f(path, std::ios::binary);
  if(!f){ err="Could not create log file: "+path; return false; }
  f<<kLogHeader<<'\n';
  f.flush();
  if(!f){ err="Could not write header to: "+path; return false; }
  return true;
}

bool append_record(const std::string& path, const Sample& s, std::string& err){
  std::ofstream f(path, std::ios::binary | std::ios::app);
  if(!f){ err="Could not open log file for append: "+path; return false; }
  f<<format_record(s)<<'\n';
  f.flush();
  if(!f){ err="Could not append record to: "+path; return false; }
  return true;
}

std::optional<std::uintmax_t> log_file_size(const std::string& path){
  std::error_code ec;
  auto n = fs::file_size(path, ec);
  if(ec) return std::nullopt;
  return n;
}

} // namespace battlog

#include "display_renderer.hpp"
#include "record_formatter.hpp"
#include <cmath>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace battlog {

static const char* const kBanner = "========================= BATTERY LOGGER =========================";
static const char* const kDataBanner = "======================== Current Battery Data =====================";
static const char* const kRule = "==================================================================";

std::string progress_bar(long long elapsed_s, long long max_runtime_s){
  long long filled = 0;
  if(max_runtime_s > 0 && elapsed_s > 0) filled = (elapsed_s * kProgressCells) / max_runtime_s;
  if(filled > kProgressCells) filled = kProgressCells;
  return std::string((size_t)filled, '#') + std::string((size_t)(kProgressCells - filled), ' ');
}

std::string format_mmss(long long seconds){
  if(seconds < 0) seconds = 0;
  char b[32];
  std::snprintf(b, sizeof(b), "%02lld:%02lld", seconds / 60, seconds % 60);
  return b;
}

std::string human_size(std::uintmax_t bytes){
  static const char units[] = {'K','M','G','T','P'};
  if(bytes < 1024) return std::to_string(bytes) + "B";
  double v = (double)bytes;
  int u = -1;
  while(v >= 1024.0 && u < 4){ v /= 1024.0; u++; }
  char b[32];
  // du rounds up rather than to nearest.
  if(v < 10.0) std::snprintf(b, sizeof(b), "%.1f%c", std::ceil(v * 10.0) / 10.0, units[u]);
  else std::snprintf(b, sizeof(b), "%.0f%c", std::ceil(v), units[u]);
  return b;
}

static std::string start_time_text(TimePoint t){
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char tb[64];
  std::strftime(tb, sizeof(tb), "%a %b %d %H:%M:%S %Y", &tm);
  return tb;
}

template<typename T>
static std::string value_or_na(const std::optional<T>& v){
  if(!v) return kUnavailable;
  std::ostringstream os; os<<*v;
  return os.str();
}

static std::string temperature_text(const std::optional<double>& v){
  if(!v) return kUnavailable;
  char b[32];
  std::snprintf(b, sizeof(b), "%.1f", *v);
  return b;
}

std::string render_display(const Config& C, const SessionState& S, const Sample& s,
                           long long elapsed_s, long long max_runtime_s){
  std::ostringstream os;
  os<<kBanner<<"\n";
  os<<"Log File: "<<(C.log_path ? *C.log_path : std::string("disabled"))<<"\n";
  os<<"Interval: "<<C.interval_s<<" seconds\n";
  os<<"Battery Path: "<<C.battery_path<<"\n";
  os<<"Start Time: "<<start_time_text(S.start_time)<<"\n";

  if(C.logging_enabled() && S.log_bytes){
    os<<kRule<<"\n";
    os<<"Current Log File Size: "<<human_size(*S.log_bytes)<<"\n";
  }

  os<<"\n";
  os<<kDataBanner<<"\n";
  os<<"current_now      : "<<value_or_na(s.current_uA)<<" \xC2\xB5""A\n";
  os<<"charge_now       : "<<value_or_na(s.charge_uAh)<<" \xC2\xB5""Ah\n";
  os<<"capacity         : "<<value_or_na(s.capacity_pct)<<" %\n";
  os<<"voltage_now      : "<<value_or_na(s.voltage_uV)<<" \xC2\xB5""V\n";
  os<<"temperature      : "<<temperature_text(s.temperature_c)<<" \xC2\xB0""C\n";
  os<<"charging status  : "<<s.status<<"\n";
  os<<kRule<<"\n";

  if(max_runtime_s > 0){
    os<<"Progress: |"<<progress_bar(elapsed_s, max_runtime_s)<<"| Remaining Time: "
      <<format_mmss(max_runtime_s - elapsed_s)<<"\n";
  } else {
    os<<"Running indefinitely... Press CTRL+C to stop.\n";
  }
  return os.str();
}

} // namespace battlog

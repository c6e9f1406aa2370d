#pragma once
#include <cstdio>
#include <cstdarg>
#include <string>
#include <mutex>
#include <chrono>
#include <ctime>

namespace battlog {

enum class LogLevel { INFO, WARN, ERROR, DEBUG };

inline const char* level_str(LogLevel L) {
  switch(L){
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR:return "ERROR";
    case LogLevel::DEBUG:return "DEBUG";
  }
  return "INFO";
}

// Diagnostics sink. Writes to stderr until open() succeeds, then appends to
// the file so diagnostics from earlier sessions are kept.
class Logger {
  std::mutex m_;
  FILE* fp_{nullptr};
  bool debug_{false};
public:
  Logger() = default;
  ~Logger(){ if(fp_) std::fclose(fp_); }
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  bool open(const std::string& path){
    std::lock_guard<std::mutex> lk(m_);
    if(fp_) std::fclose(fp_);
    fp_ = std::fopen(path.c_str(), "a");
    return fp_ != nullptr;
  }

  void set_debug(bool on){ debug_ = on; }

  void log(LogLevel L, const char* fmt, ...){
    if(L==LogLevel::DEBUG && !debug_) return;
    std::lock_guard<std::mutex> lk(m_);
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    char tb[64];
    std::strftime(tb, sizeof(tb), "%Y-%m-%d %H:%M:%S", std::localtime(&t));
    FILE* out = fp_ ? fp_ : stderr;
    std::fprintf(out, "[%s] [%s] ", tb, level_str(L));
    va_list args; va_start(args, fmt);
    std::vfprintf(out, fmt, args);
    va_end(args);
    std::fprintf(out, "\n");
    std::fflush(out);
  }
};

} // namespace battlog

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "sample.hpp"

namespace battlog {

inline const char* const kLogHeader =
  "Timestamp,Current (\xC2\xB5""A),Voltage (\xC2\xB5""V),Capacity (%),"
  "Charge (\xC2\xB5""Ah),Temperature (\xC2\xB0""C),Charging";

// Token written in place of any field that could not be read.
inline const char* const kUnavailable = "N/A";

// "YYYY-MM-DD HH:MM:SS" in local time.
std::string format_timestamp(TimePoint t);

// One CSV line without the trailing newline.
std::string format_record(const Sample& s);

// Creates the log with its header if it does not exist yet. Safe to call
// before every append: an existing file is left untouched.
bool ensure_header(const std::string& path, std::string& err);

// Appends one record and flushes it before returning.
bool append_record(const std::string& path, const Sample& s, std::string& err);

// Size of the log on disk, if it exists.
std::optional<std::uintmax_t> log_file_size(const std::string& path);

} // namespace battlog

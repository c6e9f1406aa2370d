#pragma once
#include <cstdint>
#include <string>
#include "../common/config.hpp"
#include "sample.hpp"
#include "session_state.hpp"

namespace battlog {

inline constexpr int kProgressCells = 40;

// Cursor home + erase display. Written before every snapshot.
inline const char* const kClearScreen = "\033[H\033[2J";

// Full snapshot of the session for the terminal. Pure: the same inputs
// always give the same text.
std::string render_display(const Config& C, const SessionState& S, const Sample& s,
                           long long elapsed_s, long long max_runtime_s);

// "|####    |" body of the progress bar, kProgressCells wide.
std::string progress_bar(long long elapsed_s, long long max_runtime_s);

// MM:SS, minutes are not wrapped at 60.
std::string format_mmss(long long seconds);

// Size in the style of `du -h`: 512B, 4.0K, 1.2M, 12M.
std::string human_size(std::uintmax_t bytes);

} // namespace battlog

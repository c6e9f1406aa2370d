#include "clock.hpp"
#include <thread>

namespace battlog {

TimePoint SystemClock::now(){
  return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(std::chrono::seconds d){
  std::this_thread::sleep_for(d);
}

long long elapsed_seconds(TimePoint from, TimePoint to){
  if(to <= from) return 0;
  return std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
}

} // namespace battlog

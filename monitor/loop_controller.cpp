#include "loop_controller.hpp"
#include "display_renderer.hpp"
#include "record_formatter.hpp"

namespace battlog {

void LoopController::start(){
  state_ = SessionState{};
  state_.start_time = clock_.now();
  running_ = true;
  log_.log(LogLevel::INFO, "Session started: battery=%s interval=%ds max=%llds logging=%s display=%s",
           cfg_.battery_path.c_str(), cfg_.interval_s, cfg_.max_runtime_s,
           cfg_.log_path ? cfg_.log_path->c_str() : "off",
           cfg_.display_enabled ? "on" : "off");
}

bool LoopController::tick(){
  if(!running_) return false;

  long long elapsed = elapsed_seconds(state_.start_time, clock_.now());

  if(cfg_.max_runtime_s > 0 && elapsed >= cfg_.max_runtime_s){
    if(cfg_.display_enabled){
      out_<<"Reached maximum runtime of "<<cfg_.max_runtime_s<<" seconds. Exiting.\n";
      out_.flush();
    }
    log_.log(LogLevel::INFO, "Reached maximum runtime of %lld seconds after %lld ticks.",
             cfg_.max_runtime_s, state_.ticks);
    running_ = false;
    return false;
  }

  Sample s = reader_.read(cfg_.battery_path);

  if(cfg_.log_path){
    std::string err;
    if(!ensure_header(*cfg_.log_path, err) || !append_record(*cfg_.log_path, s, err)){
      log_.log(LogLevel::WARN, "Tick %lld not logged: %s", state_.ticks, err.c_str());
    }
    state_.log_bytes = log_file_size(*cfg_.log_path);
  }

  state_.last_sample = s;
  state_.ticks++;
  log_.log(LogLevel::DEBUG, "Tick %lld at +%llds: status=%s", state_.ticks, elapsed, s.status.c_str());

  if(cfg_.display_enabled){
    out_<<kClearScreen<<render_display(cfg_, state_, s, elapsed, cfg_.max_runtime_s);
    out_.flush();
  }

  clock_.sleep_for(std::chrono::seconds(cfg_.interval_s));
  return true;
}

void LoopController::run(){
  start();
  while(tick()){}
}

} // namespace battlog

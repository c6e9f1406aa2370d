// battlog: samples /sys/class/power_supply battery telemetry on a fixed
// interval, appends it to a CSV log and shows a live terminal view.
// Build: cmake -S . -B build && cmake --build build; run: ./battlog -o run.csv -t 3600
#include <iostream>
#include <memory>
#include "../common/clock.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "cli.hpp"
#include "loop_controller.hpp"
#include "sensor_reader.hpp"
#include "temperature_source.hpp"

using battlog::Logger; using battlog::LogLevel;

int main(int argc, char** argv){
  const std::string prog = argc>0 ? argv[0] : "battlog";

  battlog::Settings S; std::string err;
  switch(battlog::parse_args(argc, argv, S, err)){
    case battlog::CliAction::HELP:
      battlog::print_usage(std::cout, prog);
      return 0;
    case battlog::CliAction::FAIL:
      std::cerr<<err<<"\n";
      battlog::print_usage(std::cerr, prog);
      return 2;
    case battlog::CliAction::RUN:
      break;
  }

  battlog::Config C;
  if(!battlog::resolve_config(S, C, err)){
    std::cerr<<"Error: "<<err<<"\n";
    return 1;
  }

  Logger log;
  log.set_debug(C.verbose);
  if(C.diagnostics_log && !log.open(*C.diagnostics_log)){
    std::cerr<<"Error: could not open diagnostics log "<<*C.diagnostics_log<<"\n";
    return 1;
  }

  battlog::SystemClock clock;
  std::unique_ptr<battlog::TemperatureSource> temp = battlog::make_temperature_source(C);
  battlog::SensorReader reader(*temp, clock);
  battlog::LoopController loop(C, reader, clock, log, std::cout);

  loop.run();

  log.log(LogLevel::INFO, "Session finished after %lld ticks.", loop.state().ticks);
  return 0;
}

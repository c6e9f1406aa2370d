#include "cli.hpp"
#include <cerrno>
#include <cstdlib>

namespace battlog {

void print_usage(std::ostream& os, const std::string& prog){
  os<<"Usage: "<<prog<<" [-o OUTPUT_FILE] [-i INTERVAL] [-b BATTERY_PATH] [-t MAX_TIME] [--no-interface]\n"
    <<"\n"
    <<"  -o, --output       Specify the output file (default: "<<kDefaultLogFile<<", which disables logging)\n"
    <<"  -i, --interval     Specify the logging interval in seconds (default: 60)\n"
    <<"  -b, --battery      Specify the battery path (default: autodetected)\n"
    <<"  -t, --time         Specify the maximum runtime in seconds (default: indefinite)\n"
    <<"      --no-interface Disable the terminal interface (default: enabled)\n"
    <<"  -c, --config       Read defaults from a JSON file; flags override it\n"
    <<"      --temp-source  Temperature facility: acpi, thermal or none (default: acpi)\n"
    <<"      --thermal-zone Thermal zone directory for --temp-source thermal\n"
    <<"                     (default: "<<kDefaultThermalZone<<")\n"
    <<"      --log-file     Write diagnostics to a file instead of stderr\n"
    <<"  -v, --verbose      Log every tick to the diagnostics log\n"
    <<"  -h, --help         Display this help message\n";
}

static bool parse_count(const std::string& flag, const std::string& text, long long& out, std::string& err){
  errno = 0;
  char* stop = nullptr;
  long long v = std::strtoll(text.c_str(), &stop, 10);
  if(text.empty() || *stop!='\0' || errno==ERANGE){
    err = "Invalid value for "+flag+": '"+text+"'";
    return false;
  }
  out = v;
  return true;
}

static bool takes_value(const std::string& a){
  return a=="-o" || a=="--output" || a=="-i" || a=="--interval" || a=="-b" || a=="--battery"
      || a=="-t" || a=="--time" || a=="-c" || a=="--config" || a=="--temp-source"
      || a=="--thermal-zone" || a=="--log-file";
}

CliAction parse_args(int argc, const char* const* argv, Settings& S, std::string& err){
  // The config file supplies defaults, so it is loaded before any other flag applies.
  for(int i=1;i<argc;i++){
    std::string a=argv[i];
    if(a=="-h" || a=="--help") return CliAction::HELP;
    if(!takes_value(a)) continue;
    if(i+1>=argc){ err="Missing value for "+a; return CliAction::FAIL; }
    if(a=="-c" || a=="--config"){
      if(!load_config_json(argv[i+1], S, err)) return CliAction::FAIL;
    }
    i++;
  }

  for(int i=1;i<argc;i++){
    std::string a=argv[i];
    if(a=="--no-interface"){ S.display_enabled=false; continue; }
    if(a=="-v" || a=="--verbose"){ S.verbose=true; continue; }
    if(!takes_value(a)){ err="Unknown option: "+a; return CliAction::FAIL; }
    std::string v=argv[++i];
    if(a=="-o" || a=="--output") S.output=v;
    else if(a=="-b" || a=="--battery") S.battery=v;
    else if(a=="--temp-source") S.temperature_source=v;
    else if(a=="--thermal-zone") S.thermal_zone=v;
    else if(a=="--log-file") S.diagnostics_log=v;
    else if(a=="-i" || a=="--interval"){
      long long n=0;
      if(!parse_count(a, v, n, err)) return CliAction::FAIL;
      if(n<=0 || n>86400LL*365){ err="Interval must be a positive number of seconds"; return CliAction::FAIL; }
      S.interval_s=(int)n;
    }
    else if(a=="-t" || a=="--time"){
      long long n=0;
      if(!parse_count(a, v, n, err)) return CliAction::FAIL;
      if(n<0){ err="Maximum runtime must not be negative"; return CliAction::FAIL; }
      S.max_runtime_s=n;
    }
  }
  return CliAction::RUN;
}

} // namespace battlog

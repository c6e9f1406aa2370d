#include "monitor/record_formatter.hpp"

#include <string>

#include "helpers.hpp"

#include <boost/ut.hpp>

namespace battlog {
namespace {
Sample full_sample()
{
  Sample sample;
  sample.timestamp = TimePoint{} + std::chrono::seconds(1'700'000'000);
  sample.current_uA = 1500000;
  sample.voltage_uV = 12400000;
  sample.capacity_pct = 87;
  sample.charge_uAh = 4200000;
  sample.temperature_c = 45.0;
  sample.status = "Charging";
  return sample;
}

// Everything after the timestamp column.
std::string values_of(std::string const& p_record)
{
  return p_record.substr(p_record.find(',') + 1);
}
}  // namespace

void record_formatter_test()
{
  using namespace boost::ut;

  "header has the seven fixed columns"_test = []() {
    expect(that % std::string("Timestamp,Current (µA),Voltage (µV),Capacity "
                              "(%),Charge (µAh),Temperature (°C),Charging") ==
           std::string(kLogHeader));
  };

  "timestamp is YYYY-MM-DD HH:MM:SS"_test = []() {
    auto text = format_timestamp(TimePoint{} + std::chrono::seconds(1'700'000'000));

    expect(that % 19U == text.size());
    expect(that % '-' == text[4]);
    expect(that % '-' == text[7]);
    expect(that % ' ' == text[10]);
    expect(that % ':' == text[13]);
    expect(that % ':' == text[16]);
  };

  "record carries every value and the charging flag"_test = []() {
    auto sample = full_sample();

    auto record = format_record(sample);

    expect(that % format_timestamp(sample.timestamp) ==
           record.substr(0, record.find(',')));
    expect(that % std::string("1500000,12400000,87,4200000,45.0,1") ==
           values_of(record));
  };

  "unavailable fields render as N/A"_test = []() {
    auto sample = full_sample();
    sample.capacity_pct = std::nullopt;
    sample.temperature_c = std::nullopt;
    sample.status = "Discharging";

    auto record = format_record(sample);

    expect(that % std::string("1500000,12400000,N/A,4200000,N/A,0") ==
           values_of(record));
  };

  "ensure_header writes the header once"_test = []() {
    // Setup
    test::temp_dir dir;
    auto const path = dir.file("log.csv");
    std::string err;

    // Exercise
    expect(ensure_header(path, err));
    expect(ensure_header(path, err));

    // Verify
    auto lines = test::read_lines(path);
    expect(that % 1U == lines.size());
    expect(that % std::string(kLogHeader) == lines[0]);
  };

  "ensure_header leaves an existing file alone"_test = []() {
    test::temp_dir dir;
    auto const path = dir.file("log.csv");
    test::write_file(path, "custom first line\nrow\n");
    std::string err;

    expect(ensure_header(path, err));

    auto lines = test::read_lines(path);
    expect(that % 2U == lines.size());
    expect(that % std::string("custom first line") == lines[0]);
  };

  "appends keep a single header on line one"_test = []() {
    // Setup
    test::temp_dir dir;
    auto const path = dir.file("log.csv");
    auto sample = full_sample();
    std::string err;

    // Exercise
    for (int i = 0; i < 3; i++) {
      expect(ensure_header(path, err));
      expect(append_record(path, sample, err));
    }

    // Verify
    auto lines = test::read_lines(path);
    expect(that % 4U == lines.size());
    expect(that % std::string(kLogHeader) == lines[0]);
    for (std::size_t i = 1; i < lines.size(); i++) {
      expect(that % format_record(sample) == lines[i]);
    }
    expect(log_file_size(path).has_value());
  };

  "append to an unwritable path reports an error"_test = []() {
    test::temp_dir dir;
    std::string err;

    auto ok = append_record(dir.file("missing_dir/log.csv"), full_sample(), err);

    expect(!ok);
    expect(!err.empty());
    expect(!log_file_size(dir.file("missing_dir/log.csv")).has_value());
  };
}
}  // namespace battlog

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "common/clock.hpp"
#include "monitor/temperature_source.hpp"

namespace battlog::test {

// Scratch directory removed when the test scope ends.
class temp_dir
{
public:
  temp_dir()
  {
    static int counter = 0;
    m_path = std::filesystem::temp_directory_path() /
             ("battlog_test_" + std::to_string(::getpid()) + "_" +
              std::to_string(counter++));
    std::filesystem::remove_all(m_path);
    std::filesystem::create_directories(m_path);
  }
  ~temp_dir()
  {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
  }
  temp_dir(temp_dir const&) = delete;
  temp_dir& operator=(temp_dir const&) = delete;

  [[nodiscard]] std::string path() const
  {
    return m_path.string();
  }
  [[nodiscard]] std::string file(std::string const& p_name) const
  {
    return (m_path / p_name).string();
  }

private:
  std::filesystem::path m_path;
};

inline void write_file(std::string const& p_path, std::string const& p_content)
{
  std::ofstream f(p_path, std::ios::binary | std::ios::trunc);
  f << p_content;
}

inline std::vector<std::string> read_lines(std::string const& p_path)
{
  std::ifstream f(p_path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(f, line)) {
    lines.push_back(line);
  }
  return lines;
}

// Populates a power_supply-like directory. Pass std::nullopt to leave an
// attribute file out.
struct battery_files
{
  std::optional<std::string> current_now = "1500000\n";
  std::optional<std::string> voltage_now = "12400000\n";
  std::optional<std::string> capacity = "87\n";
  std::optional<std::string> charge_now = "4200000\n";
  std::optional<std::string> status = "Charging\n";

  void write_to(std::string const& p_dir) const
  {
    auto put = [&](char const* p_name, std::optional<std::string> const& p_v) {
      if (p_v) {
        write_file(p_dir + "/" + p_name, *p_v);
      }
    };
    put("current_now", current_now);
    put("voltage_now", voltage_now);
    put("capacity", capacity);
    put("charge_now", charge_now);
    put("status", status);
  }
};

// Clock whose time only moves when the loop sleeps or the test advances it.
class fake_clock : public battlog::Clock
{
public:
  battlog::TimePoint m_now =
    battlog::TimePoint{} + std::chrono::seconds(1'700'000'000);
  int m_sleeps = 0;
  std::chrono::seconds m_last_sleep{ 0 };

  battlog::TimePoint now() override
  {
    return m_now;
  }
  void sleep_for(std::chrono::seconds p_duration) override
  {
    m_sleeps++;
    m_last_sleep = p_duration;
    m_now += p_duration;
  }
  void advance(std::chrono::seconds p_duration)
  {
    m_now += p_duration;
  }
};

class fake_temperature_source : public battlog::TemperatureSource
{
public:
  std::optional<double> m_value;
  int m_reads = 0;

  explicit fake_temperature_source(std::optional<double> p_value)
    : m_value(p_value)
  {
  }
  std::optional<double> read_celsius() override
  {
    m_reads++;
    return m_value;
  }
};

}  // namespace battlog::test

#pragma once
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace peerlink {

// Receives everything the connector has to report. Injected at construction so
// the core keeps no process-wide logging or timing state.
class Observer {
public:
  virtual ~Observer() = default;

  virtual void log(spdlog::level::level_enum level, const std::string& msg) = 0;
  virtual void timing(const std::string& name, double ms) = 0;
  virtual void connection_lost(const std::string& reason) = 0;
};

struct Measurement {
  std::string name;
  double ms{0.0};
};

struct LogEntry {
  spdlog::level::level_enum level;
  std::string message;
};

// spdlog-backed observer that also collects timings. Messages go to the sinks
// of the given logger and to an in-memory ring of the last `history` entries.
class LogObserver final : public Observer {
public:
  // nullptr: use spdlog's default logger
  explicit LogObserver(std::shared_ptr<spdlog::logger> logger = nullptr,
                       std::size_t history = 1024);

  void log(spdlog::level::level_enum level, const std::string& msg) override;
  void timing(const std::string& name, double ms) override;
  void connection_lost(const std::string& reason) override;

  // Open-ended timers. stop_timer returns the elapsed ms, or -1 for an unknown id.
  int start_timer(const std::string& name);
  double stop_timer(int id);

  // Drains the collected measurements, oldest first. Timers running longer than
  // stale_timeout are stopped and included.
  std::vector<Measurement> report();

  // report() as {"Measurements": [{"Name": ..., "Time": ms}, ...]}.
  // indent < 0 gives the compact form.
  std::string report_json(int indent = -1);

  // Entries that passed the logger's level, oldest first. limit 0 means all kept.
  std::vector<LogEntry> recent_log(std::size_t limit = 0) const;

  void set_stale_timeout(std::chrono::milliseconds t) { stale_timeout_ = t; }

private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> history_;
  std::shared_ptr<spdlog::logger> logger_;
  std::mutex mu_;
  std::vector<Measurement> measurements_;
  std::map<int, std::pair<std::string, spdlog::stopwatch>> timers_;
  int next_id_{0};
  std::chrono::milliseconds stale_timeout_{1000};
};

// Records one measurement when it goes out of scope.
class ScopedTiming {
public:
  ScopedTiming(Observer& obs, std::string name) : obs_(obs), name_(std::move(name)) {}
  ~ScopedTiming() {
    obs_.timing(name_, std::chrono::duration<double, std::milli>(sw_.elapsed()).count());
  }
  ScopedTiming(const ScopedTiming&) = delete;
  ScopedTiming& operator=(const ScopedTiming&) = delete;

private:
  Observer& obs_;
  std::string name_;
  spdlog::stopwatch sw_;
};

} // namespace peerlink

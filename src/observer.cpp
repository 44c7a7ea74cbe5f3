#include "peerlink/observer.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace peerlink {

LogObserver::LogObserver(std::shared_ptr<spdlog::logger> logger, std::size_t history)
  : history_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(history)) {
  std::shared_ptr<spdlog::logger> base = logger ? std::move(logger) : spdlog::default_logger();
  std::vector<spdlog::sink_ptr> sinks = base->sinks();
  sinks.push_back(history_);
  logger_ = std::make_shared<spdlog::logger>(base->name(), sinks.begin(), sinks.end());
  logger_->set_level(base->level());
  logger_->flush_on(base->flush_level());
}

void LogObserver::log(spdlog::level::level_enum level, const std::string& msg) {
  logger_->log(level, msg);
}

void LogObserver::timing(const std::string& name, double ms) {
  logger_->trace("{} took {:.3f} ms", name, ms);
  std::lock_guard<std::mutex> lk(mu_);
  measurements_.push_back({name, ms});
}

void LogObserver::connection_lost(const std::string& reason) {
  logger_->error("connection lost: {}", reason);
}

int LogObserver::start_timer(const std::string& name) {
  std::lock_guard<std::mutex> lk(mu_);
  int id = ++next_id_;
  timers_.emplace(id, std::make_pair(name, spdlog::stopwatch()));
  return id;
}

double LogObserver::stop_timer(int id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = timers_.find(id);
  if (it == timers_.end()) return -1.0;
  double ms = std::chrono::duration<double, std::milli>(it->second.second.elapsed()).count();
  measurements_.push_back({it->second.first, ms});
  timers_.erase(it);
  return ms;
}

std::vector<Measurement> LogObserver::report() {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto it = timers_.begin(); it != timers_.end();) {
    auto elapsed = it->second.second.elapsed();
    if (elapsed > stale_timeout_) {
      measurements_.push_back({it->second.first, std::chrono::duration<double, std::milli>(elapsed).count()});
      it = timers_.erase(it);
    } else {
      ++it;
    }
  }
  std::vector<Measurement> out;
  out.swap(measurements_);
  return out;
}

std::string LogObserver::report_json(int indent) {
  nlohmann::json list = nlohmann::json::array();
  for (const Measurement& m : report())
    list.push_back({{"Name", m.name}, {"Time", m.ms}});
  nlohmann::json doc;
  doc["Measurements"] = std::move(list);
  return doc.dump(indent);
}

std::vector<LogEntry> LogObserver::recent_log(std::size_t limit) const {
  std::vector<LogEntry> out;
  for (const spdlog::details::log_msg_buffer& m : history_->last_raw(limit))
    out.push_back({m.level, std::string(m.payload.data(), m.payload.size())});
  return out;
}

} // namespace peerlink

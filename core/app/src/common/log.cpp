#include "tradeflow/common/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace tradeflow {
namespace log {

namespace {

std::mutex& sink_mutex() {
  static std::mutex mutex;
  return mutex;
}

Sink& sink_slot() {
  static Sink sink;
  return sink;
}

std::atomic<bool>& installed() {
  static std::atomic<bool> flag{false};
  return flag;
}

std::atomic<int>& threshold() {
  static std::atomic<int> value{static_cast<int>(Level::Info)};
  return value;
}

}  // namespace

const char* to_string(Level level) {
  switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
  }
  return "UNKNOWN";
}

void set_sink(Sink sink) {
  std::lock_guard lock(sink_mutex());
  sink_slot() = std::move(sink);
  installed().store(static_cast<bool>(sink_slot()));
}

void init_console() {
  set_sink([](Level level, const std::string& component,
              const std::string& message) {
    std::ostream& out = (level >= Level::Warn) ? std::cerr : std::cout;
    out << "[" << component << "] ";
    if (level >= Level::Warn) {
      out << to_string(level) << ": ";
    }
    out << message << "\n";
  });
}

void reset() { set_sink(Sink{}); }

void set_level(Level level) { threshold().store(static_cast<int>(level)); }

bool enabled(Level level) {
  return installed().load() && static_cast<int>(level) >= threshold().load();
}

void write(Level level, const std::string& component,
           const std::string& message) {
  std::lock_guard lock(sink_mutex());
  if (sink_slot()) {
    sink_slot()(level, component, message);
  }
}

}  // namespace log
}  // namespace tradeflow

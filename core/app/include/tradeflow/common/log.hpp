#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <utility>

namespace tradeflow {
namespace log {

enum class Level {
  Debug,
  Info,
  Warn,
  Error,
};

const char* to_string(Level level);

// -----------------------------------------------------------------------------
// Sink
// -----------------------------------------------------------------------------
// @brief  Process-wide receiver of log records.
//
// @details
// Every component writes "[Component] message" lines. Where those lines go is
// decided once per process by installing a sink:
//   - init_console() installs the default sink (info to std::cout, warnings
//     and errors to std::cerr).
//   - set_sink() installs any callable (tests capture records this way).
//
// Until a sink is installed every log call is a no-op, so library code never
// assumes somebody is listening.
//
// Thread-safety: set_sink()/init_console() are meant to be called once during
// start-up; write() may be called from any thread. The installed sink is
// invoked under an internal mutex so lines never interleave.
// -----------------------------------------------------------------------------
using Sink =
    std::function<void(Level, const std::string& component, const std::string&)>;

void set_sink(Sink sink);
void init_console();
void reset();

void set_level(Level level);
bool enabled(Level level);

void write(Level level, const std::string& component, const std::string& message);

template <typename... Args>
void emit(Level level, const std::string& component, Args&&... args) {
  if (!enabled(level)) {
    return;
  }
  std::ostringstream out;
  (out << ... << std::forward<Args>(args));
  write(level, component, out.str());
}

template <typename... Args>
void debug(const std::string& component, Args&&... args) {
  emit(Level::Debug, component, std::forward<Args>(args)...);
}

template <typename... Args>
void info(const std::string& component, Args&&... args) {
  emit(Level::Info, component, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(const std::string& component, Args&&... args) {
  emit(Level::Warn, component, std::forward<Args>(args)...);
}

template <typename... Args>
void error(const std::string& component, Args&&... args) {
  emit(Level::Error, component, std::forward<Args>(args)...);
}

}  // namespace log
}  // namespace tradeflow

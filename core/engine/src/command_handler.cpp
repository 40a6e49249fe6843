#include "tradeflow/engine/command_handler.hpp"

#include "tradeflow/codec/json.hpp"
#include "tradeflow/common/error.hpp"
#include "tradeflow/common/log.hpp"

#include <cctype>
#include <utility>
#include <vector>

namespace tradeflow {

namespace {

std::string trim(const std::string& text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

Json error_reply(const std::string& message) {
  return Json{{"status", "error"}, {"message", message}};
}

std::vector<EngineEvent> decode_events(const std::string& text) {
  Json j;
  try {
    j = Json::parse(text);
  } catch (const Json::parse_error& e) {
    throw ValidationError(std::string("unknown command or malformed JSON: ") + e.what());
  }

  std::vector<EngineEvent> events;
  try {
    if (j.is_array()) {
      events.reserve(j.size());
      for (const auto& entry : j) {
        events.push_back(decode_engine_event(entry));
      }
    } else {
      events.push_back(decode_engine_event(j));
    }
  } catch (const Json::exception& e) {
    throw ValidationError(std::string("invalid engine event: ") + e.what());
  }
  return events;
}

}  // namespace

IpcServer::CommandHandler make_command_handler(System& system) {
  return [&system](const std::string& request) -> std::string {
    const std::string command = trim(request);
    Json response;

    if (command == "PING") {
      response = Json{{"status", "ok"}, {"response", "PONG"}};
    } else if (command == "STATUS") {
      const SystemStats stats = system.stats();
      response = Json{{"status", "ok"},
                      {"mode", to_string(stats.mode)},
                      {"started", stats.started},
                      {"terminated", stats.terminated},
                      {"events_sent", stats.events_sent},
                      {"feed_pending", stats.feed_pending},
                      {"market_forwarded", stats.market_forwarded},
                      {"market_skipped", stats.market_skipped}};
    } else if (command == "HALT") {
      if (system.setTradingEnabled(false)) {
        log::warn("CommandHandler", "HALT received; trading disabled.");
        response = Json{{"status", "ok"}, {"response", "Trading disabled"}};
      } else {
        response = error_reply("engine is no longer accepting events");
      }
    } else {
      try {
        std::vector<EngineEvent> events = decode_events(command);
        const std::size_t requested = events.size();
        const std::size_t accepted = system.feedEvents(std::move(events));
        if (accepted == requested) {
          response = Json{{"status", "ok"}, {"accepted", accepted}};
        } else {
          response = error_reply("engine stopped after " + std::to_string(accepted) +
                                 " of " + std::to_string(requested) + " events");
        }
      } catch (const ValidationError& e) {
        log::warn("CommandHandler", "rejected command: ", e.what());
        response = error_reply(e.what());
      }
    }

    return response.dump();
  };
}

}  // namespace tradeflow

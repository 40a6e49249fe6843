#include "tradeflow/config/system_config.hpp"

#include "tradeflow/codec/json.hpp"
#include "tradeflow/common/error.hpp"
#include "tradeflow/common/log.hpp"

#include <fstream>
#include <set>
#include <sstream>

namespace tradeflow {

domain::ExchangeId execution_exchange(const ExecutionConfig& config) {
  return std::visit([](const auto& c) { return c.exchange; }, config);
}

// -----------------------------------------------------------------------------
// Risk setters
// -----------------------------------------------------------------------------
void SystemConfig::set_global_risk_limits(std::optional<domain::RiskLimits> limits) {
  risk.set_global_limits(std::move(limits));
}

void SystemConfig::set_instrument_risk_limits(domain::InstrumentIndex index,
                                              std::optional<domain::RiskLimits> limits) {
  risk.set_instrument_limits(index, std::move(limits), instruments.size());
}

const domain::RiskLimits* SystemConfig::instrument_limits(
    domain::InstrumentIndex index) const {
  return risk.instrument_limits(index);
}

void SystemConfig::validate() const {
  if (instruments.empty()) {
    throw ValidationError("system config has no instruments");
  }
  for (const auto& instrument : instruments) {
    instrument.validate();
  }

  std::set<domain::ExchangeId> seen;
  for (const auto& execution : executions) {
    std::visit([](const auto& c) { c.validate(); }, execution);
    const domain::ExchangeId exchange = execution_exchange(execution);
    if (!seen.insert(exchange).second) {
      throw ValidationError(std::string("duplicate execution config for exchange ") +
                            domain::to_string(exchange));
    }
  }

  risk.validate(instruments.size());
}

// -----------------------------------------------------------------------------
// Decoding
// -----------------------------------------------------------------------------
namespace {

MockBalance decode_mock_balance(const Json& j) {
  MockBalance balance;
  balance.asset = j.at("asset").get<std::string>();
  balance.balance = j.at("balance").get<domain::Balance>();
  balance.time_exchange = detail::optional_time_field(j, "time_exchange");
  return balance;
}

MockExecutionConfig decode_mock_execution(const Json& j) {
  MockExecutionConfig config;
  if (j.contains("mocked_exchange")) {
    config.exchange = j.at("mocked_exchange").get<domain::ExchangeId>();
  } else if (j.contains("exchange")) {
    config.exchange = j.at("exchange").get<domain::ExchangeId>();
  }
  config.latency_ms = j.value("latency_ms", std::uint64_t{0});
  config.fees_percent = j.value("fees_percent", Json("0")).get<Decimal>();

  const Json* balances = nullptr;
  if (j.contains("balances")) {
    balances = &j.at("balances");
  } else if (j.contains("initial_state") && j.at("initial_state").contains("balances")) {
    balances = &j.at("initial_state").at("balances");
  }
  if (balances != nullptr) {
    for (const auto& entry : *balances) {
      config.balances.push_back(decode_mock_balance(entry));
    }
  }

  if (j.contains("initial_state") && j.at("initial_state").contains("instruments")) {
    for (const auto& instrument : j.at("initial_state").at("instruments")) {
      if (!instrument.value("orders", Json::array()).empty()) {
        throw ValidationError("mock execution does not accept pre-existing orders");
      }
    }
  }
  return config;
}

ExecutionConfig decode_execution(const Json& j) {
  // Tagged ({"Mock": {...}}) or untagged.
  if (j.is_object() && j.size() == 1) {
    const auto tagged = detail::tagged(j, "execution config");
    if (detail::tag_is(tagged.first, "Mock")) {
      return decode_mock_execution(*tagged.second);
    }
  }
  return decode_mock_execution(j);
}

SystemConfig decode_system_config(const Json& j) {
  SystemConfig config;
  config.instruments = j.at("instruments").get<std::vector<domain::InstrumentConfig>>();

  if (j.contains("executions")) {
    for (const auto& execution : j.at("executions")) {
      config.executions.push_back(decode_execution(execution));
    }
  }

  config.risk_free_return = detail::optional_field<Decimal>(j, "risk_free_return");

  if (j.contains("risk") && !j.at("risk").is_null()) {
    const Json& risk = j.at("risk");
    config.set_global_risk_limits(detail::optional_field<domain::RiskLimits>(risk, "global"));
    for (const auto& entry : risk.value("instruments", Json::array())) {
      config.set_instrument_risk_limits(entry.at("index").get<domain::InstrumentIndex>(),
                                        entry.at("limits").get<domain::RiskLimits>());
    }
  }

  config.validate();
  return config;
}

}  // namespace

SystemConfig parse_system_config(const Json& j) {
  try {
    return decode_system_config(j);
  } catch (const Json::exception& e) {
    throw ValidationError(std::string("invalid system config: ") + e.what());
  }
}

SystemConfig parse_system_config_text(std::string_view text) {
  Json j;
  try {
    j = Json::parse(text.begin(), text.end());
  } catch (const Json::parse_error& e) {
    throw ValidationError(std::string("malformed system config JSON: ") + e.what());
  }
  return parse_system_config(j);
}

SystemConfig load_system_config(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw ValidationError("cannot open system config '" + path + "'");
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  SystemConfig config = parse_system_config_text(buffer.str());
  log::info("Config", "loaded ", path, ": ", config.instruments.size(),
            " instruments, ", config.executions.size(), " executions.");
  return config;
}

// -----------------------------------------------------------------------------
// Encoding
// -----------------------------------------------------------------------------
Json encode_system_config(const SystemConfig& config) {
  Json executions = Json::array();
  for (const auto& execution : config.executions) {
    const auto& mock = std::get<MockExecutionConfig>(execution);
    Json balances = Json::array();
    for (const auto& entry : mock.balances) {
      balances.push_back(Json{{"asset", entry.asset},
                              {"balance", entry.balance},
                              {"time_exchange", detail::optional_time(entry.time_exchange)}});
    }
    executions.push_back(Json{{"mocked_exchange", mock.exchange},
                              {"latency_ms", mock.latency_ms},
                              {"fees_percent", mock.fees_percent},
                              {"balances", std::move(balances)}});
  }

  return Json{{"risk_free_return", detail::optional_json(config.risk_free_return)},
              {"instruments", config.instruments},
              {"executions", std::move(executions)},
              {"risk", config.risk}};
}

}  // namespace tradeflow

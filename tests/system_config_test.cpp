// =============================================================================
// system_config_test.cpp
// =============================================================================
// Unit tests for SystemConfig loading and validation.
// =============================================================================

#include "tradeflow/config/system_config.hpp"

#include "tradeflow/common/error.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <variant>

using namespace tradeflow;

namespace {

const char* kMinimal = R"({
  "instruments": [
    {"exchange": "kraken", "name_exchange": "XBTUSD",
     "underlying": {"base": "btc", "quote": "usd"}, "kind": "spot"}
  ]
})";

std::string data_path(const char* name) {
  return std::string(TRADEFLOW_TEST_DATA_DIR) + "/" + name;
}

}  // namespace

TEST(SystemConfigTest, LoadsExampleFile) {
  const SystemConfig config = load_system_config(data_path("system_config.json"));

  ASSERT_EQ(config.instruments.size(), 2u);
  EXPECT_EQ(config.instruments[1].name_exchange, "ETHUSDT");
  ASSERT_TRUE(config.risk_free_return.has_value());
  EXPECT_EQ(*config.risk_free_return, Decimal::parse("0.05"));

  ASSERT_EQ(config.executions.size(), 1u);
  const auto& mock = std::get<MockExecutionConfig>(config.executions[0]);
  EXPECT_EQ(mock.exchange, domain::ExchangeId::BinanceSpot);
  EXPECT_EQ(mock.fees_percent, Decimal::parse("0.001"));
  ASSERT_EQ(mock.balances.size(), 2u);
  EXPECT_EQ(mock.balances[0].asset, "usdt");
  EXPECT_EQ(mock.balances[0].balance.total, Decimal{100000});

  ASSERT_TRUE(config.risk.global().has_value());
  EXPECT_EQ(config.risk.global()->max_leverage, std::optional<Decimal>(Decimal{3}));
  ASSERT_NE(config.instrument_limits(1), nullptr);
  EXPECT_EQ(config.instrument_limits(0), nullptr);
}

TEST(SystemConfigTest, MinimalConfigHasDefaults) {
  const SystemConfig config = parse_system_config_text(kMinimal);
  EXPECT_EQ(config.instruments.size(), 1u);
  EXPECT_TRUE(config.executions.empty());
  EXPECT_FALSE(config.risk_free_return.has_value());
  EXPECT_FALSE(config.risk.global().has_value());
}

TEST(SystemConfigTest, TaggedMockExecution) {
  const SystemConfig config = parse_system_config_text(R"({
    "instruments": [
      {"exchange": "kraken", "name_exchange": "XBTUSD",
       "underlying": {"base": "btc", "quote": "usd"}, "kind": "spot"}
    ],
    "executions": [
      {"Mock": {"mocked_exchange": "kraken", "latency_ms": 5,
                "balances": [{"asset": "usd", "balance": {"total": "10", "free": "4"}}]}}
    ]
  })");
  const auto& mock = std::get<MockExecutionConfig>(config.executions.at(0));
  EXPECT_EQ(mock.exchange, domain::ExchangeId::Kraken);
  EXPECT_EQ(mock.latency_ms, 5u);
  EXPECT_EQ(mock.balances.at(0).balance.used(), Decimal{6});
}

TEST(SystemConfigTest, RejectsInvalidConfigs) {
  // Not JSON.
  EXPECT_THROW(parse_system_config_text("{"), ValidationError);
  // No instruments.
  EXPECT_THROW(parse_system_config_text(R"({"instruments": []})"), ValidationError);
  // Missing required field.
  EXPECT_THROW(parse_system_config_text(R"({"executions": []})"), ValidationError);
  // Two executions for one exchange.
  EXPECT_THROW(parse_system_config_text(R"({
    "instruments": [{"exchange": "kraken", "name_exchange": "XBTUSD",
                     "underlying": {"base": "btc", "quote": "usd"}, "kind": "spot"}],
    "executions": [{"mocked_exchange": "kraken"}, {"mocked_exchange": "kraken"}]
  })"),
               ValidationError);
  // Free above total.
  EXPECT_THROW(parse_system_config_text(R"({
    "instruments": [{"exchange": "kraken", "name_exchange": "XBTUSD",
                     "underlying": {"base": "btc", "quote": "usd"}, "kind": "spot"}],
    "executions": [{"mocked_exchange": "kraken",
                    "balances": [{"asset": "usd", "balance": {"total": "1", "free": "2"}}]}]
  })"),
               ValidationError);
  // Risk override for an instrument that does not exist.
  EXPECT_THROW(parse_system_config_text(R"({
    "instruments": [{"exchange": "kraken", "name_exchange": "XBTUSD",
                     "underlying": {"base": "btc", "quote": "usd"}, "kind": "spot"}],
    "risk": {"instruments": [{"index": 3, "limits": {}}]}
  })"),
               ValidationError);
  // Exposure above 100%.
  EXPECT_THROW(parse_system_config_text(R"({
    "instruments": [{"exchange": "kraken", "name_exchange": "XBTUSD",
                     "underlying": {"base": "btc", "quote": "usd"}, "kind": "spot"}],
    "risk": {"global": {"max_exposure_percent": "2"}}
  })"),
               ValidationError);
}

TEST(SystemConfigTest, MissingFileIsValidationError) {
  EXPECT_THROW(load_system_config(data_path("does_not_exist.json")), ValidationError);
}

TEST(SystemConfigTest, EncodeThenParseKeepsMeaning) {
  const SystemConfig original = load_system_config(data_path("system_config.json"));
  const SystemConfig copy = parse_system_config(encode_system_config(original));

  EXPECT_EQ(encode_system_config(copy).dump(), encode_system_config(original).dump());
}

TEST(SystemConfigTest, RiskSettersAreBoundsChecked) {
  SystemConfig config = parse_system_config_text(kMinimal);
  domain::RiskLimits limits;
  limits.max_position_quantity = Decimal{1};
  config.set_instrument_risk_limits(0, limits);
  EXPECT_NE(config.instrument_limits(0), nullptr);
  EXPECT_THROW(config.set_instrument_risk_limits(1, limits), ValidationError);

  config.set_instrument_risk_limits(0, std::nullopt);
  EXPECT_EQ(config.instrument_limits(0), nullptr);
}

#include "tradeflow/domain/identifiers.hpp"

#include "tradeflow/common/error.hpp"

#include <array>
#include <random>

namespace tradeflow {
namespace domain {

namespace {

struct ExchangeName {
  ExchangeId id;
  const char* name;
};

constexpr std::array<ExchangeName, 42> kExchangeNames{{
    {ExchangeId::Other, "other"},
    {ExchangeId::Simulated, "simulated"},
    {ExchangeId::Mock, "mock"},
    {ExchangeId::BinanceFuturesCoin, "binance_futures_coin"},
    {ExchangeId::BinanceFuturesUsd, "binance_futures_usd"},
    {ExchangeId::BinanceOptions, "binance_options"},
    {ExchangeId::BinancePortfolioMargin, "binance_portfolio_margin"},
    {ExchangeId::BinanceSpot, "binance_spot"},
    {ExchangeId::BinanceUs, "binance_us"},
    {ExchangeId::Bitazza, "bitazza"},
    {ExchangeId::Bitfinex, "bitfinex"},
    {ExchangeId::Bitflyer, "bitflyer"},
    {ExchangeId::Bitget, "bitget"},
    {ExchangeId::Bitmart, "bitmart"},
    {ExchangeId::BitmartFuturesUsd, "bitmart_futures_usd"},
    {ExchangeId::Bitmex, "bitmex"},
    {ExchangeId::Bitso, "bitso"},
    {ExchangeId::Bitstamp, "bitstamp"},
    {ExchangeId::Bitvavo, "bitvavo"},
    {ExchangeId::Bithumb, "bithumb"},
    {ExchangeId::BybitPerpetualsUsd, "bybit_perpetuals_usd"},
    {ExchangeId::BybitSpot, "bybit_spot"},
    {ExchangeId::Cexio, "cexio"},
    {ExchangeId::Coinbase, "coinbase"},
    {ExchangeId::CoinbaseInternational, "coinbase_international"},
    {ExchangeId::Cryptocom, "cryptocom"},
    {ExchangeId::Deribit, "deribit"},
    {ExchangeId::GateioFuturesBtc, "gateio_futures_btc"},
    {ExchangeId::GateioFuturesUsd, "gateio_futures_usd"},
    {ExchangeId::GateioOptions, "gateio_options"},
    {ExchangeId::GateioPerpetualsBtc, "gateio_perpetuals_btc"},
    {ExchangeId::GateioPerpetualsUsd, "gateio_perpetuals_usd"},
    {ExchangeId::GateioSpot, "gateio_spot"},
    {ExchangeId::Gemini, "gemini"},
    {ExchangeId::Hitbtc, "hitbtc"},
    {ExchangeId::Htx, "htx"},
    {ExchangeId::Kraken, "kraken"},
    {ExchangeId::Kucoin, "kucoin"},
    {ExchangeId::Liquid, "liquid"},
    {ExchangeId::Mexc, "mexc"},
    {ExchangeId::Okx, "okx"},
    {ExchangeId::Poloniex, "poloniex"},
}};

}  // namespace

const char* to_string(ExchangeId exchange) {
  for (const auto& entry : kExchangeNames) {
    if (entry.id == exchange) {
      return entry.name;
    }
  }
  return "other";
}

std::optional<ExchangeId> try_parse_exchange_id(std::string_view text) {
  for (const auto& entry : kExchangeNames) {
    if (text == entry.name) {
      return entry.id;
    }
  }
  return std::nullopt;
}

ExchangeId parse_exchange_id(std::string_view text) {
  auto exchange = try_parse_exchange_id(text);
  if (!exchange) {
    throw ValidationError("unknown exchange identifier: '" +
                          std::string(text) + "'");
  }
  return *exchange;
}

void ensure_non_empty_id(const std::string& value, const char* kind) {
  if (value.empty()) {
    throw ValidationError(std::string(kind) + " must not be empty");
  }
}

ClientOrderId random_client_order_id() {
  static constexpr char kAlphabet[] =
      "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);
  std::string id;
  id.reserve(20);
  for (int i = 0; i < 20; ++i) {
    id.push_back(kAlphabet[pick(rng)]);
  }
  return ClientOrderId(std::move(id));
}

}  // namespace domain
}  // namespace tradeflow

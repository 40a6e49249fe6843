#pragma once

namespace tradeflow {

// Builds a std::visit visitor out of lambdas.
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace tradeflow

#pragma once

#include "tradeflow/domain/order.hpp"
#include "tradeflow/instrument/instrument_filter.hpp"

#include <variant>
#include <vector>

namespace tradeflow {

struct SendOpenRequests {
  std::vector<domain::OrderRequestOpen> requests;
};

struct SendCancelRequests {
  std::vector<domain::OrderRequestCancel> requests;
};

// Cancel every open or in-flight order on the matching instruments.
struct CancelOrders {
  InstrumentFilter filter;
};

// Flatten every non-zero position on the matching instruments.
struct ClosePositions {
  InstrumentFilter filter;
};

using Command =
    std::variant<SendOpenRequests, SendCancelRequests, CancelOrders, ClosePositions>;

// "SendOpenRequests", "SendCancelRequests", "CancelOrders", "ClosePositions"
const char* command_name(const Command& command);

}  // namespace tradeflow

#pragma once

#include "tradeflow/concurrent/thread_safe_queue.hpp"
#include "tradeflow/events/engine_event.hpp"

#include <memory>

namespace tradeflow {

// The engine's single input queue. Market streams, order routing threads
// and the control surface all push into one shared instance; only the
// engine thread pops.
using EngineFeed = ThreadSafeQueue<EngineEvent>;
using EngineFeedPtr = std::shared_ptr<EngineFeed>;

}  // namespace tradeflow

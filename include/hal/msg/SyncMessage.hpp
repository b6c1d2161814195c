#pragma once

#include "hal/msg/Message.hpp"

namespace hal::msg {

/**
 * A message whose sole purpose is to jam up the queue until everything before it is processed.
 * Carries no payload; recipients should treat it as a no-op. Use sparingly.
 */
class SyncMessage : public Message {
public:
  SyncMessage(ILogger &logger, const Module &source);
  ~SyncMessage() override = default;
};

}  // namespace hal::msg

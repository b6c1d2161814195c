#include "hal/msg/SyncMessage.hpp"

#include "hal/msg/MessageTypeRegistry.hpp"

namespace hal::msg {

SyncMessage::SyncMessage(ILogger &logger, const Module &source)
  : Message(logger, source, types::SYNC, {}, true) { }

}  // namespace hal::msg

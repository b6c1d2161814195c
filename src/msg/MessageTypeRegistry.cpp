#include "hal/msg/MessageTypeRegistry.hpp"

#include "hal/msg/exceptions.hpp"

#include <iterator>

namespace hal::msg {

namespace {

  /**
   * Core/general messages known to every module.
   */
  constexpr const char *BUILTIN_TYPES[] = {
    "add to ui",
    "close event",
    "configure1",
    "configure2",
    "current parameters",
    "module",
    "new directory",
    "new parameters file",
    "new shutters file",
    "start",
    types::SYNC,
  };

}  // namespace

MessageTypeRegistry &MessageTypeRegistry::instance() {
  static MessageTypeRegistry registry;
  return registry;
}

MessageTypeRegistry::MessageTypeRegistry()
  : types_(std::begin(BUILTIN_TYPES), std::end(BUILTIN_TYPES)) { }

void MessageTypeRegistry::register_type(const std::string &name, const bool failIfExists) {
  std::scoped_lock lck{mtx_};

  const bool inserted = types_.insert(name).second;
  if(!inserted && failIfExists) {
    throw DuplicateMessageType(name);
  }
}

bool MessageTypeRegistry::contains(std::string_view name) const {
  std::scoped_lock lck{mtx_};
  return types_.find(name) != types_.end();
}

std::size_t MessageTypeRegistry::size() const {
  std::scoped_lock lck{mtx_};
  return types_.size();
}

}  // namespace hal::msg

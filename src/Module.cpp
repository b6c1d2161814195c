#include "hal/Module.hpp"

#include "hal/msg/Message.hpp"

namespace hal {

Module::Module(ILogger &logger, std::string_view name) : logger_{logger}, name_{name} {
  std::string str("Creating module: ");
  str += name_;
  logger_.debug(str);
}

const std::string &Module::name() const noexcept { return name_; }

void Module::process_message([[maybe_unused]] msg::Message &message) {
  /* no-op */
}

}  // namespace hal

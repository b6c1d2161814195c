#pragma once

#include "hal/ILogger.hpp"

#include <string>
#include <string_view>

namespace hal {

namespace msg {
  class Message;
}  // namespace msg

/**
 * An independently-loaded unit of the application. Modules are both the sources of messages and
 * their recipients.
 */
class Module {
public:
  Module(ILogger &logger, std::string_view name);

  virtual ~Module() = default;

  Module(const Module &)            = delete;
  Module &operator=(const Module &) = delete;
  Module(Module &&)                 = delete;
  Module &operator=(Module &&)      = delete;

  /**
   * Returns the name of the module. Stable for the module's lifetime.
   */
  const std::string &name() const noexcept;

  /**
   * Invoked by the dispatcher, possibly on a thread other than the one that created the module,
   * once for every message delivered to this module. Implementations may inspect the message and
   * append errors and/or responses to it, but must not keep a reference to it after returning.
   *
   * An exception escaping this function is recorded on the message as a fatal error.
   *
   * The default implementation is a no-op.
   */
  virtual void process_message(msg::Message &message);

protected:
  ILogger &logger_;

private:
  const std::string name_;
};
}  // namespace hal

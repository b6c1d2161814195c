#include "hal/msg/MessageError.hpp"

#include <utility>

namespace hal::msg {

MessageError::MessageError(std::string source, std::string message, std::exception_ptr exception)
  : source_{std::move(source)}, message_{std::move(message)}, exception_{std::move(exception)} { }

const std::string &MessageError::source() const noexcept { return source_; }

const std::string &MessageError::message() const noexcept { return message_; }

std::exception_ptr MessageError::exception() const noexcept { return exception_; }

bool MessageError::has_exception() const noexcept { return static_cast<bool>(exception_); }

void MessageError::rethrow() const {
  if(has_exception()) {
    std::rethrow_exception(exception_);
  }
}

}  // namespace hal::msg

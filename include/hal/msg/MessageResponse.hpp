#pragma once

#include "hal/msg/Payload.hpp"

#include <string>

namespace hal::msg {

/**
 * Attached to a Message by a recipient that wants to send information back to the sender. The
 * sender reads it once the message has been finalized.
 */
class MessageResponse {
public:
  MessageResponse(std::string source, Payload data = {});

  /**
   * Name of the module that added the response.
   */
  const std::string &source() const noexcept;

  const Payload &data() const noexcept;

private:
  std::string source_;
  Payload     data_;
};

}  // namespace hal::msg

#include "hal/msg/MessageResponse.hpp"

#include <utility>

namespace hal::msg {

MessageResponse::MessageResponse(std::string source, Payload data)
  : source_{std::move(source)}, data_{std::move(data)} { }

const std::string &MessageResponse::source() const noexcept { return source_; }

const Payload &MessageResponse::data() const noexcept { return data_; }

}  // namespace hal::msg

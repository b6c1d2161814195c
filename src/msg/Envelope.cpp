#include "hal/msg/Envelope.hpp"

#include <utility>

namespace hal::msg {

Envelope::Envelope(const Module &source, std::string type)
  : source_{source}, type_{std::move(type)} { }

const Module &Envelope::source() const noexcept { return source_; }

const std::string &Envelope::source_name() const noexcept { return source_.name(); }

const std::string &Envelope::type() const noexcept { return type_; }

}  // namespace hal::msg

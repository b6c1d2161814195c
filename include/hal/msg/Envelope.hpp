#pragma once

#include "hal/Module.hpp"

#include <string>

namespace hal::msg {

/**
 * The parts every message carries: what kind of message it is, and which module sent it.
 *
 * N.B. that the source is borrowed; the Envelope does not control the source module's lifetime,
 * and the module must outlive every message it sends.
 */
class Envelope {
public:
  Envelope(const Module &source, std::string type);
  virtual ~Envelope() = default;

  const Module &source() const noexcept;

  /**
   * Convenience accessor for source().name().
   */
  const std::string &source_name() const noexcept;

  const std::string &type() const noexcept;

private:
  const Module     &source_;
  const std::string type_;
};

}  // namespace hal::msg

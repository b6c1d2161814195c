#pragma once

#include <exception>
#include <string>

namespace hal::msg {

/**
 * Attached to a Message by a recipient that had a problem with it.
 *
 * If an exception is attached, the source module could not proceed and the failure is fatal; the
 * dispatcher propagates it to the sender. Otherwise the error is only a warning, which is logged
 * and otherwise ignored.
 */
class MessageError {
public:
  /**
   * @param source
   *   Name of the module that created the error.
   *
   * @param message
   *   Human-readable description of the problem.
   *
   * @param exception
   *   The exception to raise if the problem can't be handled, or nullptr for a warning.
   */
  MessageError(std::string source, std::string message, std::exception_ptr exception = nullptr);

  const std::string &source() const noexcept;

  const std::string &message() const noexcept;

  std::exception_ptr exception() const noexcept;

  bool has_exception() const noexcept;

  /**
   * Rethrows the attached exception; has no effect for warnings.
   */
  void rethrow() const;

private:
  std::string        source_;
  std::string        message_;
  std::exception_ptr exception_;
};

}  // namespace hal::msg

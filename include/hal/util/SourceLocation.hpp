#pragma once

#if defined(HAL_COMPILER_CLANG_CL)
/**
 * clang-cl lacks std::source_location, so we provide a shim that reports empty fields. Verbose log
 * output will contain some blank space where the location would otherwise appear.
 */
namespace hal::util {

class SourceLocation {
public:
  const char                 *file_name() const noexcept { return ""; }
  const char                 *line() const noexcept { return ""; }
  const char                 *function_name() const noexcept { return ""; }
  static const SourceLocation current() noexcept { return {}; }
};

}  // namespace hal::util
#else
#include <source_location>
namespace hal::util {
using SourceLocation = std::source_location;
}  // namespace hal::util
#endif

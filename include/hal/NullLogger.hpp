#pragma once

#include "hal/ILogger.hpp"

namespace hal {

/**
 * Discards everything; for contexts where log output is noise (e.g. stress tests).
 */
class NullLogger : public ILogger {
public:
  ~NullLogger() override = default;

  using ILogger::critical;
  using ILogger::debug;
  using ILogger::error;
  using ILogger::info;
  using ILogger::trace;
  using ILogger::warn;

  void critical(
    [[maybe_unused]] const char * const         msg,
    [[maybe_unused]] const util::SourceLocation location = util::SourceLocation::current()) override {
  }
  void error(
    [[maybe_unused]] const char * const         msg,
    [[maybe_unused]] const util::SourceLocation location = util::SourceLocation::current()) override {
  }
  void warn(
    [[maybe_unused]] const char * const         msg,
    [[maybe_unused]] const util::SourceLocation location = util::SourceLocation::current()) override {
  }
  void info(
    [[maybe_unused]] const char * const         msg,
    [[maybe_unused]] const util::SourceLocation location = util::SourceLocation::current()) override {
  }
  void debug(
    [[maybe_unused]] const char * const         msg,
    [[maybe_unused]] const util::SourceLocation location = util::SourceLocation::current()) override {
  }
  void trace(
    [[maybe_unused]] const char * const         msg,
    [[maybe_unused]] const util::SourceLocation location = util::SourceLocation::current()) override {
  }

  void set_level([[maybe_unused]] LogLevel level) override { }
};
}  // namespace hal

#pragma once

#include "hal/ILogger.hpp"
#include "hal/util/Pimpl.hpp"

namespace hal {
class SpdlogLogger : public ILogger {
public:
  explicit SpdlogLogger(const LogLevel  initialLevel = LogLevel::INFO,
                        const Verbosity verbosity    = Verbosity::CONCISE);
  ~SpdlogLogger() override;

  SpdlogLogger(const SpdlogLogger &)            = delete;
  SpdlogLogger &operator=(const SpdlogLogger &) = delete;
  SpdlogLogger(SpdlogLogger &&)                 = default;
  SpdlogLogger &operator=(SpdlogLogger &&)      = default;

  using ILogger::critical;
  using ILogger::debug;
  using ILogger::error;
  using ILogger::info;
  using ILogger::trace;
  using ILogger::warn;

  void critical(const char * const msg, const util::SourceLocation location) override;
  void error(const char * const msg, const util::SourceLocation location) override;
  void warn(const char * const msg, const util::SourceLocation location) override;
  void info(const char * const msg, const util::SourceLocation location) override;
  void debug(const char * const msg, const util::SourceLocation location) override;
  void trace(const char * const msg, const util::SourceLocation location) override;

  void set_level(LogLevel level) override;

  void set_verbosity(Verbosity verbosity) noexcept;

private:
  // spdlog.h takes a while to compile; using pimpl here keeps it out of every client TU.
  struct Impl_;
  util::Pimpl<Impl_> impl_;

  Verbosity verbosity_;
};
}  // namespace hal

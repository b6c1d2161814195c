#include "hal/SpdlogLogger.hpp"

#include <fmt/color.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

using fmt::terminal_color;

namespace {
constexpr const char * const CONCISE_FMTSTR = "{}";
constexpr const char * const VERBOSE_FMTSTR = "{}:{} ({}): {}";

constexpr const char * const LOGGER_NAME = "hal";

auto colorize_string(const terminal_color color, const char * const msg) {
  return fmt::format(fmt::fg(color), "{}", msg);
}

}  // namespace

namespace hal {

struct SpdlogLogger::Impl_ {
  Impl_()
    : logger(std::make_shared<spdlog::logger>(
      LOGGER_NAME, std::make_shared<spdlog::sinks::stdout_color_sink_mt>())) { }

  ~Impl_() = default;

  void log(const spdlog::level::level_enum level,
           const Verbosity                 verbosity,
           const terminal_color            color,
           const char * const              msg,
           const util::SourceLocation      location) {
    if(verbosity == Verbosity::VERBOSE) {
      logger->log(level,
                  VERBOSE_FMTSTR,
                  location.file_name(),
                  location.line(),
                  location.function_name(),
                  msg);
    }
    else {
      logger->log(level, CONCISE_FMTSTR, colorize_string(color, msg));
    }
  }

  // Unregistered with spdlog's global registry, so multiple SpdlogLoggers can coexist.
  std::shared_ptr<spdlog::logger> logger;
};

SpdlogLogger::SpdlogLogger(const ILogger::LogLevel initialLevel, const ILogger::Verbosity verbosity)
  : verbosity_(verbosity) {
  impl_->logger->set_pattern("%D:%H:%M:%S:%f [TID: %t][%l]: %v");
  set_level(initialLevel);
}

SpdlogLogger::~SpdlogLogger() { impl_->logger->flush(); }

void SpdlogLogger::critical(const char * const msg, const util::SourceLocation location) {
  impl_->log(
    spdlog::level::critical, verbosity_, terminal_color::bright_magenta, msg, location);
}

void SpdlogLogger::error(const char * const msg, const util::SourceLocation location) {
  impl_->log(spdlog::level::err, verbosity_, terminal_color::bright_red, msg, location);
}

void SpdlogLogger::warn(const char * const msg, const util::SourceLocation location) {
  impl_->log(spdlog::level::warn, verbosity_, terminal_color::bright_yellow, msg, location);
}

void SpdlogLogger::info(const char * const msg, const util::SourceLocation location) {
  impl_->log(spdlog::level::info, verbosity_, terminal_color::cyan, msg, location);
}

void SpdlogLogger::debug(const char * const msg, const util::SourceLocation location) {
  impl_->log(spdlog::level::debug, verbosity_, terminal_color::bright_white, msg, location);
}

void SpdlogLogger::trace(const char * const msg, const util::SourceLocation location) {
  impl_->log(spdlog::level::trace, verbosity_, terminal_color::white, msg, location);
}

void SpdlogLogger::set_level(ILogger::LogLevel level) {
  switch(level) {
    case ILogger::LogLevel::OFF:
      impl_->logger->set_level(spdlog::level::off);
      break;

    case ILogger::LogLevel::CRITICAL:
      impl_->logger->set_level(spdlog::level::critical);
      break;

    case ILogger::LogLevel::ERR:
      impl_->logger->set_level(spdlog::level::err);
      break;

    case ILogger::LogLevel::WARN:
      impl_->logger->set_level(spdlog::level::warn);
      break;

    case ILogger::LogLevel::INFO:
      impl_->logger->set_level(spdlog::level::info);
      break;

    case ILogger::LogLevel::DEBUG:
      impl_->logger->set_level(spdlog::level::debug);
      break;

    case ILogger::LogLevel::TRACE:
      impl_->logger->set_level(spdlog::level::trace);
      break;

    default:
      break;
  }
}

void SpdlogLogger::set_verbosity(const Verbosity verbosity) noexcept { verbosity_ = verbosity; }

}  // namespace hal

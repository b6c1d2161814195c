#pragma once

/**
 * "PrimitiveIO" functions are intended for use in situations where conventional IO functionality
 * cannot be guaranteed (i.e. during early application initialization, handling a catastrophic
 * error, etc.). They do not go through ILogger.
 */
namespace hal::PrimitiveIO {

/**
 * Log to stdout
 */
void log_msg(const char *msg);

/**
 * Log to stderr
 */
void log_err(const char *msg);

/**
 * Log to stderr with an alert banner, so that the message stands out in a console that is also
 * receiving regular log output.
 */
void alert_err(const char *msg);

} /* namespace hal::PrimitiveIO */

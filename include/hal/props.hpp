#pragma once

namespace hal {
class PropertyMap;
}  // namespace hal

/**
 * String keys for various application properties.
 */
namespace hal::props {

/**
 * Logger threshold; one of off, critical, error, warn, info, debug, trace.
 */
constexpr auto LOG_LEVEL = "log.level";

/**
 * If true, prefix log output with the file, line and function of the call site.
 */
constexpr auto LOG_VERBOSE = "log.verbose";

/**
 * If true, Dispatcher::send rejects messages whose type is not in the MessageTypeRegistry.
 */
constexpr auto VALIDATE_TYPES = "dispatch.validate_types";

/**
 * Create every property above with its default value. Existing entries are left untouched.
 */
void install_defaults(PropertyMap &propertyMap);

}  // namespace hal::props

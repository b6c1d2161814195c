#pragma once

#include "hal/ILogger.hpp"
#include "hal/PropertyMap.hpp"

/**
 * Class which parses out command line args.
 */
namespace hal::util {
class CLIParser {
public:
  explicit CLIParser(ILogger &logger, PropertyMap &propertyMap);

  /**
   * Parses command line args and stores the parsed arguments into propertyMap. Switches that were
   * not given on the command line leave the corresponding property untouched.
   */
  void parse_args(const int argc, const char **argv);

private:
  ILogger     &logger_;
  PropertyMap &propertyMap_;
};
}  // namespace hal::util

#include "hal/util/CLIParser.hpp"

#include "hal/props.hpp"

#include <docopt/docopt.h>

#include <map>
#include <string>
#include <string_view>

namespace {

/**
 * Maps CLI switches to internal property names, and whether the switch's boolean value has to be
 * negated before being stored.
 */
struct PropMapping {
  std::string_view prop;
  bool             negate;
};

const std::map<std::string_view, PropMapping> cliArgToProp{
  {"--verbose",       {hal::props::LOG_VERBOSE, false}   },
  {"--log-level",     {hal::props::LOG_LEVEL, false}     },
  {"--no-type-check", {hal::props::VALIDATE_TYPES, true} },
};

/**
 * Docopt magic string; see docopt.org for an explanation.
 *
 * N.B. that, because we are adding the -h/--help flags, docopt will cause our app to exit
 * prematurely and print the help message if either flag is provided.
 */
constexpr auto USAGE = R"(
Usage: hal_demo [--help] [--verbose] [--log-level=<level>] [--no-type-check]

--help                Show this help
--verbose             Prefix log output with the file, line and function it came from
--log-level=<level>   One of off, critical, error, warn, info, debug, trace [default: info]
--no-type-check       Accept messages whose type was never registered
)";
}  // namespace

namespace hal::util {
CLIParser::CLIParser(ILogger &logger, PropertyMap &propertyMap)
  : logger_(logger), propertyMap_(propertyMap) { }

void CLIParser::parse_args(const int argc, const char **argv) {
  auto docparsemap = docopt::docopt(USAGE, {argv + 1, argv + argc});

  for(const auto &[k, v] : docparsemap) {
    // This is a magic switch entirely managed by docopt.cpp
    if(k == "--help") {
      continue;
    }

    auto cliArgToPropEntry = cliArgToProp.find(k);
    if(cliArgToPropEntry != cliArgToProp.end()) {
      const std::string propName = std::string(cliArgToPropEntry->second.prop);
      const bool        negate   = cliArgToPropEntry->second.negate;

      if(v.isBool()) {
        // Flags that weren't passed keep whatever value the property already has
        if(v.asBool()) {
          propertyMap_.set_prop_variant(propName, !negate);
        }
      }
      else if(v.isLong()) {
        propertyMap_.set_prop_variant(propName, static_cast<S64>(v.asLong()));
      }
      else if(v.isString()) {
        propertyMap_.set_prop_variant(propName, v.asString());
      }
      else {
        // Should never happen unless something is set up incorrectly in the USAGE string
        std::string msg = "Failed to parse arg: ";
        msg += k;
        logger_.warn(msg);
      }
    }
    else {
      std::string msg = "Unknown CLI switch received: ";
      msg += k;
      logger_.warn(msg);
    }
  }
}
}  // namespace hal::util

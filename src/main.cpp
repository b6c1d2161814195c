#include "hal/main.hpp"

#include "hal/Module.hpp"
#include "hal/PropertyMap.hpp"
#include "hal/SpdlogLogger.hpp"
#include "hal/msg/Dispatcher.hpp"
#include "hal/msg/Message.hpp"
#include "hal/msg/MessageTypeRegistry.hpp"
#include "hal/msg/SyncMessage.hpp"
#include "hal/props.hpp"
#include "hal/util/CLIParser.hpp"
#include "hal/util/exception_handler.hpp"

#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

namespace {

using hal::ILogger;
using hal::Module;
using hal::msg::Message;
using hal::msg::MessageError;
using hal::msg::MessageResponse;
using hal::msg::Params_t;

constexpr auto NEW_PARAMETERS_FILE = "new parameters file";
constexpr auto STATUS_REQUEST      = "status request";

ILogger::LogLevel to_log_level(const std::string &str) {
  static const std::map<std::string, ILogger::LogLevel, std::less<>> levels{
    {"off",      ILogger::LogLevel::OFF     },
    {"critical", ILogger::LogLevel::CRITICAL},
    {"error",    ILogger::LogLevel::ERR     },
    {"warn",     ILogger::LogLevel::WARN    },
    {"info",     ILogger::LogLevel::INFO    },
    {"debug",    ILogger::LogLevel::DEBUG   },
    {"trace",    ILogger::LogLevel::TRACE   },
  };

  auto it = levels.find(str);
  return it == levels.end() ? ILogger::LogLevel::INFO : it->second;
}

/**
 * Answers a new parameters file with the path it will load.
 */
class SettingsModule : public Module {
public:
  explicit SettingsModule(ILogger &logger) : Module(logger, "settings") { }

  void process_message(Message &message) override {
    if(message.type() == NEW_PARAMETERS_FILE) {
      const auto &params = message.data().get<Params_t>();
      const auto &path   = std::get<std::string>(params.at("path"));
      message.add_response(MessageResponse(name(), std::string("loading ") + path));
    }
  }
};

class CameraModule : public Module {
public:
  explicit CameraModule(ILogger &logger) : Module(logger, "camera") { }

  void process_message(Message &message) override {
    if(message.type() == NEW_PARAMETERS_FILE || message.type() == STATUS_REQUEST) {
      message.add_response(MessageResponse(name(), std::string("idle")));
    }
  }
};

/**
 * Doesn't know how to configure itself from a parameters file, which is only worth a warning.
 */
class ShuttersModule : public Module {
public:
  explicit ShuttersModule(ILogger &logger) : Module(logger, "shutters") { }

  void process_message(Message &message) override {
    if(message.type() == NEW_PARAMETERS_FILE) {
      message.add_error(MessageError(name(), "no shutter sequence in parameters file"));
    }
  }
};

/**
 * The module that sends everything in the demo; it does not respond to anything itself.
 */
class CoreModule : public Module {
public:
  explicit CoreModule(ILogger &logger) : Module(logger, "hal") { }
};

void report(ILogger &logger, const Message &message) {
  for(const auto &response : message.responses()) {
    std::stringstream ss;
    ss << "'" << message.type() << "' response from " << response.source() << ": "
       << response.data().get<std::string>();
    logger.info(ss);
  }
}

}  // namespace

namespace hal {

int hal_main(const int argc, const char **argv) {
  try {
    SpdlogLogger logger;
    PropertyMap  propertyMap(logger);
    props::install_defaults(propertyMap);

    util::CLIParser cliparser(logger, propertyMap);
    cliparser.parse_args(argc, argv);

    logger.set_level(to_log_level(propertyMap.get_prop<std::string>(props::LOG_LEVEL).get()));
    if(propertyMap.get_prop<bool>(props::LOG_VERBOSE).get()) {
      logger.set_verbosity(ILogger::Verbosity::VERBOSE);
    }

    msg::MessageTypeRegistry::instance().register_type(STATUS_REQUEST);

    CoreModule     core(logger);
    SettingsModule settings(logger);
    CameraModule   camera(logger);
    ShuttersModule shutters(logger);

    msg::Dispatcher dispatcher(logger, propertyMap);
    dispatcher.add_module(settings);
    dispatcher.add_module(camera);
    dispatcher.add_module(shutters);

    auto paramsMsg = std::make_shared<Message>(
      logger,
      core,
      NEW_PARAMETERS_FILE,
      Params_t{{"path", std::string("/cfg.xml")}},
      false,
      msg::level::GENERAL,
      [&logger] { logger.info("parameters file processed by all modules"); });

    auto statusMsg = std::make_shared<Message>(logger, core, STATUS_REQUEST);

    dispatcher.send(paramsMsg);
    dispatcher.send(std::make_shared<msg::SyncMessage>(logger, core));
    dispatcher.send(statusMsg);
    dispatcher.dispatch();

    report(logger, *paramsMsg);
    report(logger, *statusMsg);

    if(paramsMsg->has_errors()) {
      std::stringstream ss;
      ss << paramsMsg->errors().size() << " module(s) reported problems with the parameters file";
      logger.warn(ss);
    }
  }

  // Top level exception handler
  catch(...) {
    hal::util::exception_handler();
  }

  return 0;
}
}  // namespace hal

int main(const int argc, const char **argv) { return hal::hal_main(argc, argv); }

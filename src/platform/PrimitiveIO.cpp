#include "hal/PrimitiveIO.hpp"

#include <iostream>

namespace hal::PrimitiveIO {

void log_msg(const char *msg) { std::cout << msg << std::endl; }

void log_err(const char *msg) { std::cerr << msg << std::endl; }

void alert_err(const char *msg) {
  std::cerr << "hal: ERROR\n";
  log_err(msg);
}

} /* namespace hal::PrimitiveIO */

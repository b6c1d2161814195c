#include "hal/util/exception_handler.hpp"

#include "hal/PrimitiveIO.hpp"
#include "hal/msg/exceptions.hpp"

#include <cstdlib>
#include <exception>
#include <new>
#include <string>

void hal::util::exception_handler() noexcept {
  try {
    try {
      if(auto eptr = std::current_exception()) {
        std::rethrow_exception(eptr);
      }

      // should never happen
      else {
        hal::PrimitiveIO::alert_err(
          "Global exception handler called without an active exception...");
      }
    }

    catch([[maybe_unused]] const std::bad_alloc &e) {
      hal::PrimitiveIO::alert_err(
        "Memory allocation failed. This indicates that there is either not "
        "enough RAM installed on your system, or there are too many other programs "
        "running in the background.\n");
    }
    catch(const hal::msg::MessageTypeError &e) {
      // Almost always a typo in a message type string, or a module registering its types twice.
      std::string msgText = "A message type error occurred; Details:\n";
      msgText += e.what();
      hal::PrimitiveIO::alert_err(msgText.c_str());
    }
    catch(const std::exception &e) {
      std::string msgText = "An unexpected exception occurred; Details:\n";
      msgText += e.what();
      hal::PrimitiveIO::alert_err(msgText.c_str());
    }
    catch(...) {
      hal::PrimitiveIO::alert_err("An unknown exception occurred...");
    }
  }
  // Double fault; something is very wrong if we get here!
  catch(...) {
    hal::PrimitiveIO::alert_err("Fault occurred in exception_handler!");
    std::abort();
  }

  /**
   * Finally, attempt proper program cleanup with a call to std::exit rather than
   * std::terminate or std::abort. N.B. that std::abort will be called anyway if something
   * goes wrong in std::exit.
   */
  std::exit(EXIT_FAILURE);
}

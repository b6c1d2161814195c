#pragma once

#include <stdexcept>
#include <string>

namespace hal::msg {

/**
 * Base for errors concerning message type strings. These are caller errors raised synchronously;
 * they are never used to report a recipient's failure to process a message (see MessageError for
 * that).
 */
class MessageTypeError : public std::runtime_error {
public:
  MessageTypeError(const std::string &what, const std::string &typeName)
    : std::runtime_error(what), typeName_(typeName) { }

  const std::string &type_name() const noexcept { return typeName_; }

private:
  std::string typeName_;
};

/**
 * Thrown by a strict registration of a message type that is already registered.
 */
class DuplicateMessageType : public MessageTypeError {
public:
  explicit DuplicateMessageType(const std::string &typeName)
    : MessageTypeError("Message type '" + typeName + "' already exists!", typeName) { }
};

/**
 * Thrown when a message with an unregistered type is sent while type validation is enabled.
 */
class UnknownMessageType : public MessageTypeError {
public:
  explicit UnknownMessageType(const std::string &typeName)
    : MessageTypeError("Invalid message type '" + typeName + "'", typeName) { }
};

/**
 * Thrown when a Payload is read as a different type than the one it holds.
 */
class PayloadTypeMismatch : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

}  // namespace hal::msg

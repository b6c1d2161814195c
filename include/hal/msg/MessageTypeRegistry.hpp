#pragma once

#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

namespace hal::msg {

/**
 * Message types with special meaning to the dispatcher.
 */
namespace types {
  constexpr auto SYNC = "sync";
}  // namespace types

/**
 * The process-wide set of recognized message type strings. Message types should be space separated
 * lower case strings, e.g. "new parameters file".
 *
 * The set starts out holding a fixed collection of built-in types, and modules add their own at
 * initialization via register_type(). Types can never be removed. This is a guard against typos in
 * type strings rather than a type system.
 *
 * Threadsafe; all access LOCKS mtx_.
 */
class MessageTypeRegistry {
public:
  /**
   * Returns the process-wide registry, creating it (with the built-in types) on first use.
   */
  static MessageTypeRegistry &instance();

  MessageTypeRegistry(const MessageTypeRegistry &)            = delete;
  MessageTypeRegistry &operator=(const MessageTypeRegistry &) = delete;
  MessageTypeRegistry(MessageTypeRegistry &&)                 = delete;
  MessageTypeRegistry &operator=(MessageTypeRegistry &&)      = delete;

  /**
   * Adds name to the set of recognized types.
   *
   * If failIfExists is true and name is already present, DuplicateMessageType is thrown. Otherwise
   * re-registering an existing name is silently accepted and leaves the set unchanged.
   */
  void register_type(const std::string &name, const bool failIfExists = true);

  bool contains(std::string_view name) const;

  std::size_t size() const;

private:
  MessageTypeRegistry();

  // std::less<> allows lookups by string_view without building a temporary std::string
  std::set<std::string, std::less<>> types_;

  mutable std::mutex mtx_;
};

}  // namespace hal::msg

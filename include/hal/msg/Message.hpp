#pragma once

#include "hal/ILogger.hpp"
#include "hal/hal_types.hpp"
#include "hal/msg/Envelope.hpp"
#include "hal/msg/MessageError.hpp"
#include "hal/msg/MessageResponse.hpp"
#include "hal/msg/Payload.hpp"
#include "hal/util/Spinlock.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace hal::msg {

using Level_t = S32;

/**
 * Conventional message levels. Most messages are GENERAL; a message that there will be a lot of,
 * and that is only relevant to one or two modules, should use another level so that uninterested
 * modules can ignore it quickly. Only GENERAL messages are logged when created and destroyed. Any
 * other value, negative ones included, is passed through unchecked.
 */
namespace level {
  constexpr Level_t GENERAL   = 1;
  constexpr Level_t NEW_FRAME = 2;
  constexpr Level_t DRAG      = 3;
}  // namespace level

/**
 * A function with no arguments to call once the message has been processed by all recipients.
 */
using FinalizerFn_t = std::function<void()>;

/**
 * The message passed between modules. Carries a payload plus the lifecycle state needed to deliver
 * it to many recipients concurrently:
 *
 *  - recipients append MessageErrors and MessageResponses, which the sender reads afterwards;
 *  - a pending count tracks how many recipients have yet to finish; the release() that brings the
 *    count from 1 to 0 finalizes the message, which invokes the finalizer exactly once.
 *
 * Messages are shared between the sender and the dispatcher via std::shared_ptr, so a message is
 * only destroyed once finalization has run and the sender is done with its outcome.
 */
class Message : public Envelope {
public:
  /**
   * @param logger
   *   Receives "created"/"destroyed" lifecycle events for GENERAL messages.
   *
   * @param source
   *   The sending module. Must outlive the message.
   *
   * @param type
   *   A type string from the MessageTypeRegistry.
   *
   * @param data
   *   The payload. Recipients can only read it.
   *
   * @param synchronous
   *   If true, every message sent before this one is finalized before this one is delivered, and
   *   this one is finalized before any message sent after it is delivered.
   *
   * @param level
   *   See hal::msg::level.
   *
   * @param finalizer
   *   Invoked once at finalization, if provided. An exception escaping it is recorded on the
   *   message as a fatal MessageError attributed to the source module.
   */
  Message(ILogger      &logger,
          const Module &source,
          std::string   type,
          Payload       data        = {},
          const bool    synchronous = false,
          const Level_t level       = level::GENERAL,
          FinalizerFn_t finalizer   = nullptr);

  ~Message() override = default;

  Message(const Message &)            = delete;
  Message &operator=(const Message &) = delete;
  Message(Message &&)                 = delete;
  Message &operator=(Message &&)      = delete;

  /**
   * Process-unique identity, used in lifecycle log events.
   */
  U64 id() const noexcept;

  const Payload &data() const noexcept;

  bool synchronous() const noexcept;

  Level_t level() const noexcept;

  /**
   * Append-only; safe to call concurrently from multiple recipients. The source string is not
   * validated.
   *
   * LOCKS outcomeLock_.
   */
  void add_error(MessageError error);
  void add_response(MessageResponse response);

  /**
   * Snapshots of the outcome sequences, in the order they were appended.
   *
   * LOCKS outcomeLock_.
   */
  std::vector<MessageError>    errors() const;
  std::vector<MessageResponse> responses() const;

  bool has_errors() const;
  bool has_responses() const;

  /**
   * Increment the pending count by n. Dispatchers must acquire a reference for every recipient
   * BEFORE delivering to any of them; otherwise a fast recipient could bring the count to zero
   * while later recipients are still being delivered to.
   */
  void acquire(const std::size_t n = 1) noexcept;

  /**
   * Atomically decrement the pending count. If this call brought the count to zero, finalize()
   * is invoked on the calling thread before returning true; otherwise returns false. Exactly one
   * release() can observe the transition to zero.
   *
   * Throws std::runtime_error, leaving the count unchanged, if the count is already zero.
   */
  bool release();

  std::size_t pending() const noexcept;

  /**
   * Marks the message as handed to a dispatcher. Returns false if it already was, since a message
   * can only be delivered once.
   */
  bool mark_dispatched() noexcept;

  /**
   * Logs the "destroyed" event for GENERAL messages, then invokes and releases the finalizer (if
   * any). Normally called by release(); calling it more than once is a caller error.
   *
   * Never throws because of the finalizer; see the constructor.
   */
  void finalize();

private:
  void log_event_(const char * const eventName);

  ILogger &logger_;

  const U64     id_;
  const Payload data_;
  const bool    synchronous_;
  const Level_t level_;

  FinalizerFn_t finalizer_;

  std::atomic_size_t refCount_;
  std::atomic_bool   dispatched_;

  std::vector<MessageError>    errors_;
  std::vector<MessageResponse> responses_;

  /**
   * Guards errors_ and responses_. Appends are short, so a spinlock suffices.
   */
  mutable util::Spinlock outcomeLock_;
};

}  // namespace hal::msg

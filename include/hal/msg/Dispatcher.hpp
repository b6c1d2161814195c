#pragma once

#include "hal/ILogger.hpp"
#include "hal/Module.hpp"
#include "hal/PropertyMap.hpp"
#include "hal/msg/DeliveryWorker.hpp"
#include "hal/msg/Message.hpp"
#include "hal/msg/MessageError.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <vector>

namespace hal::msg {

/**
 * Delivers messages from senders to every registered module.
 *
 * Each module gets its own DeliveryWorker, so recipients process a message concurrently while each
 * module still sees messages in the order they were sent. For every delivered message the
 * dispatcher acquires one reference per module plus one of its own, hands the message to every
 * worker, then releases its own reference. The last release finalizes the message.
 *
 * Synchronous messages act as barriers: dispatch() waits for everything in flight to finalize
 * before delivering one, and for the synchronous message itself to finalize before moving on.
 */
class Dispatcher {
public:
  /**
   * Installs the default properties (see hal::props) into propertyMap if they are missing.
   */
  Dispatcher(ILogger &logger, PropertyMap &propertyMap);

  /**
   * Finishes delivering whatever has already been handed to modules; messages that were sent but
   * never dispatched are dropped with a warning.
   */
  ~Dispatcher();

  Dispatcher(const Dispatcher &)            = delete;
  Dispatcher &operator=(const Dispatcher &) = delete;
  Dispatcher(Dispatcher &&)                 = delete;
  Dispatcher &operator=(Dispatcher &&)      = delete;

  /**
   * Register a recipient. Modules receive each message in the order they were added. Adding the
   * same module twice has no effect beyond a warning.
   *
   * LOCKS workersMtx_.
   */
  void add_module(Module &module);

  /**
   * Queue a message for delivery by the next call to dispatch().
   *
   * Throws std::invalid_argument for a null message or one that was already sent (to this or any
   * other dispatcher), and UnknownMessageType if type validation is enabled and the message's type
   * is not registered.
   *
   * LOCKS mtx_.
   */
  void send(std::shared_ptr<Message> message);

  /**
   * Deliver every queued message in send order, honoring synchronous barriers, and block until
   * all of them have been finalized.
   *
   * If any message finalized since the last call carried fatal errors, the first of them is
   * rethrown here once everything is idle (all of them have already been logged).
   *
   * Should only be called from one thread at a time; concurrent calls are serialized.
   */
  void dispatch();

  /**
   * Number of messages delivered but not yet finalized.
   *
   * LOCKS mtx_.
   */
  std::size_t in_flight() const;

  /**
   * Number of messages sent but not yet delivered.
   *
   * LOCKS mtx_.
   */
  std::size_t num_queued() const;

  std::size_t num_modules() const;

private:
  void deliver_(const std::shared_ptr<Message> &message);

  /**
   * Bookkeeping for a message that has just been finalized: logs its errors, collects fatal ones
   * and wakes up anybody waiting for the dispatcher to become idle.
   *
   * May be invoked from any DeliveryWorker thread. LOCKS mtx_.
   */
  void on_finalized_(const Message &message);

  /**
   * Blocks until no delivered message is waiting to be finalized.
   */
  void wait_for_idle_();

  ILogger &logger_;

  PropertyValue<bool> &validateTypes_;

  std::vector<std::unique_ptr<DeliveryWorker>> workers_;
  mutable std::mutex                           workersMtx_;

  /**
   * Guards queue_, inFlight_ and fatalErrors_.
   */
  mutable std::mutex      mtx_;
  std::condition_variable idleCV_;

  std::queue<std::shared_ptr<Message>> queue_;
  std::size_t                          inFlight_;
  std::vector<MessageError>            fatalErrors_;

  std::mutex dispatchMtx_;
};

}  // namespace hal::msg

#pragma once

#include "hal/Module.hpp"
#include "hal/msg/Message.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>

namespace hal::msg {

/**
 * Delivers messages to a single Module on a dedicated thread, in the order they were handed to
 * deliver().
 *
 * For every message, the worker invokes Module::process_message, records an escaping exception as
 * a fatal MessageError, releases the reference the dispatcher acquired on the module's behalf, and
 * then reports back through the OnDone_t callback.
 */
class DeliveryWorker {
public:
  /**
   * Invoked on the worker's thread after each message is released; finalized is true if that
   * release finalized the message.
   */
  using OnDone_t = std::function<void(const std::shared_ptr<Message> &message, bool finalized)>;

  DeliveryWorker(Module &module, OnDone_t onDone);

  /**
   * Finishes delivering any messages that are already queued, then joins the underlying thread.
   */
  ~DeliveryWorker();

  DeliveryWorker(const DeliveryWorker &)            = delete;
  DeliveryWorker &operator=(const DeliveryWorker &) = delete;
  DeliveryWorker(DeliveryWorker &&)                 = delete;
  DeliveryWorker &operator=(DeliveryWorker &&)      = delete;

  /**
   * Queue a message for the module. The caller must already have acquired a reference on the
   * message for this delivery.
   *
   * LOCKS mtx_.
   */
  void deliver(std::shared_ptr<Message> message);

  Module &module() const noexcept;

  /**
   * Number of messages waiting to be processed, not counting one currently being processed.
   *
   * LOCKS mtx_.
   */
  std::size_t num_queued() const;

private:
  void process_(const std::shared_ptr<Message> &message);

  void thrd_proc_(std::stop_token stoken);

  Module  &module_;
  OnDone_t onDone_;

  std::queue<std::shared_ptr<Message>> queue_;

  mutable std::mutex          mtx_;
  std::condition_variable_any cv_;

  // N.B. since the thread uses the this pointer, keep this as the last member so that everything
  // else is initialized before the thread starts.
  std::jthread thrd_;
};

}  // namespace hal::msg

#include "hal/msg/DeliveryWorker.hpp"

#include "hal/util/exception_handler.hpp"

#include <exception>
#include <utility>

namespace hal::msg {

DeliveryWorker::DeliveryWorker(Module &module, OnDone_t onDone)
  : module_{module},
    onDone_{std::move(onDone)},
    thrd_{[this](std::stop_token stoken) { thrd_proc_(stoken); }} { }

DeliveryWorker::~DeliveryWorker() {
  thrd_.request_stop();

  if(thrd_.joinable()) {
    thrd_.join();
  }
}

void DeliveryWorker::deliver(std::shared_ptr<Message> message) {
  {
    std::scoped_lock lck{mtx_};
    queue_.push(std::move(message));
  }

  cv_.notify_one();
}

Module &DeliveryWorker::module() const noexcept { return module_; }

std::size_t DeliveryWorker::num_queued() const {
  std::scoped_lock lck{mtx_};
  return queue_.size();
}

void DeliveryWorker::process_(const std::shared_ptr<Message> &message) {
  try {
    module_.process_message(*message);
  }
  catch(const std::exception &e) {
    message->add_error(MessageError(module_.name(), e.what(), std::current_exception()));
  }
  catch(...) {
    message->add_error(
      MessageError(module_.name(), "An unknown exception occurred", std::current_exception()));
  }

  const bool finalized = message->release();
  onDone_(message, finalized);
}

void DeliveryWorker::thrd_proc_(std::stop_token stoken) {
  // Wrap each thread in its own exception handler
  try {
    while(true) {
      std::shared_ptr<Message> message;
      {
        std::unique_lock lck{mtx_};

        // Returns early if a stop is requested, in which case whatever is still queued is drained
        // before the thread exits.
        cv_.wait(lck, stoken, [this] { return !queue_.empty(); });
        if(queue_.empty()) {
          break;
        }

        message = std::move(queue_.front());
        queue_.pop();
      }

      process_(message);
    }
  }
  catch(...) {
    util::exception_handler();
  }
}

}  // namespace hal::msg

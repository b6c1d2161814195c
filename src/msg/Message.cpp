#include "hal/msg/Message.hpp"

#include <exception>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace hal::msg {

namespace {
  std::atomic<U64> nextMessageId{1};
}  // namespace

Message::Message(ILogger      &logger,
                 const Module &source,
                 std::string   type,
                 Payload       data,
                 const bool    synchronous,
                 const Level_t level,
                 FinalizerFn_t finalizer)
  : Envelope(source, std::move(type)),
    logger_{logger},
    id_{nextMessageId.fetch_add(1, std::memory_order_relaxed)},
    data_{std::move(data)},
    synchronous_{synchronous},
    level_{level},
    finalizer_{std::move(finalizer)},
    refCount_{0},
    dispatched_{false} {
  if(level_ == level::GENERAL) {
    log_event_("created");
  }
}

U64 Message::id() const noexcept { return id_; }

const Payload &Message::data() const noexcept { return data_; }

bool Message::synchronous() const noexcept { return synchronous_; }

Level_t Message::level() const noexcept { return level_; }

void Message::add_error(MessageError error) {
  std::scoped_lock lck{outcomeLock_};
  errors_.push_back(std::move(error));
}

void Message::add_response(MessageResponse response) {
  std::scoped_lock lck{outcomeLock_};
  responses_.push_back(std::move(response));
}

std::vector<MessageError> Message::errors() const {
  std::scoped_lock lck{outcomeLock_};
  return errors_;
}

std::vector<MessageResponse> Message::responses() const {
  std::scoped_lock lck{outcomeLock_};
  return responses_;
}

bool Message::has_errors() const {
  std::scoped_lock lck{outcomeLock_};
  return !errors_.empty();
}

bool Message::has_responses() const {
  std::scoped_lock lck{outcomeLock_};
  return !responses_.empty();
}

void Message::acquire(const std::size_t n) noexcept {
  refCount_.fetch_add(n, std::memory_order_acq_rel);
}

bool Message::release() {
  std::size_t count = refCount_.load(std::memory_order_acquire);

  // The zero check and the decrement have to happen as one step, otherwise two recipients
  // finishing at once could both see a count of 1.
  do {
    if(count == 0) {
      std::stringstream ss;
      ss << "Message::release called on message " << id_ << " (" << type()
         << ") which has no pending recipients";
      throw std::runtime_error(ss.str());
    }
  } while(!refCount_.compare_exchange_weak(
    count, count - 1, std::memory_order_acq_rel, std::memory_order_acquire));

  if(count == 1) {
    finalize();
    return true;
  }

  return false;
}

std::size_t Message::pending() const noexcept { return refCount_.load(std::memory_order_acquire); }

bool Message::mark_dispatched() noexcept {
  return !dispatched_.exchange(true, std::memory_order_acq_rel);
}

void Message::finalize() {
  if(level_ == level::GENERAL) {
    log_event_("destroyed");
  }

  // The message only holds on to the finalizer until it runs.
  FinalizerFn_t finalizer = std::exchange(finalizer_, nullptr);
  if(!finalizer) {
    return;
  }

  // Finalization runs on whichever thread released last, which has no way to report back to the
  // sender other than through the message itself.
  try {
    finalizer();
  }
  catch(const std::exception &e) {
    add_error(MessageError(source_name(), e.what(), std::current_exception()));
  }
  catch(...) {
    add_error(MessageError(
      source_name(), "An unknown exception occurred in a finalizer", std::current_exception()));
  }
}

void Message::log_event_(const char * const eventName) {
  std::stringstream ss;
  ss << eventName << ',' << id_ << ',' << source_name() << ',' << type();
  logger_.info(ss);
}

}  // namespace hal::msg

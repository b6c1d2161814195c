#include "hal/msg/Dispatcher.hpp"

#include "hal/msg/MessageTypeRegistry.hpp"
#include "hal/msg/exceptions.hpp"
#include "hal/props.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace hal::msg {

namespace {
  PropertyValue<bool> &validate_types_prop(PropertyMap &propertyMap) {
    props::install_defaults(propertyMap);
    return propertyMap.get_prop<bool>(props::VALIDATE_TYPES);
  }
}  // namespace

Dispatcher::Dispatcher(ILogger &logger, PropertyMap &propertyMap)
  : logger_{logger}, validateTypes_{validate_types_prop(propertyMap)}, inFlight_{0} { }

Dispatcher::~Dispatcher() {
  {
    std::scoped_lock lck{mtx_};
    if(!queue_.empty()) {
      std::stringstream ss;
      ss << "Dispatcher destroyed with " << queue_.size()
         << " undelivered message(s); they will be dropped";
      logger_.warn(ss);
    }
  }

  // Destroy the workers while the rest of the dispatcher is still intact, since draining their
  // queues calls back into on_finalized_.
  std::scoped_lock lck{workersMtx_};
  workers_.clear();
}

void Dispatcher::add_module(Module &module) {
  std::scoped_lock lck{workersMtx_};

  const bool alreadyAdded = std::any_of(workers_.begin(), workers_.end(), [&](const auto &worker) {
    return &(worker->module()) == &module;
  });

  if(alreadyAdded) {
    std::stringstream ss;
    ss << "Attempted to add module '" << module.name()
       << "' to the Dispatcher more than once; it will still only receive each message once";
    logger_.warn(ss);
    return;
  }

  workers_.emplace_back(std::make_unique<DeliveryWorker>(
    module, [this](const std::shared_ptr<Message> &message, const bool finalized) {
      if(finalized) {
        on_finalized_(*message);
      }
    }));
}

void Dispatcher::send(std::shared_ptr<Message> message) {
  if(!message) {
    throw std::invalid_argument("Attempted to send a null message");
  }

  if(validateTypes_.get() && !MessageTypeRegistry::instance().contains(message->type())) {
    throw UnknownMessageType(message->type());
  }

  if(!message->mark_dispatched()) {
    std::stringstream ss;
    ss << "Attempted to send message " << message->id() << " (" << message->type()
       << ") more than once";
    throw std::invalid_argument(ss.str());
  }

  std::scoped_lock lck{mtx_};
  queue_.push(std::move(message));
}

void Dispatcher::dispatch() {
  std::scoped_lock dispatchLck{dispatchMtx_};

  while(true) {
    std::shared_ptr<Message> message;
    {
      std::scoped_lock lck{mtx_};
      if(queue_.empty()) {
        break;
      }

      message = std::move(queue_.front());
      queue_.pop();
    }

    if(message->synchronous()) {
      wait_for_idle_();
      deliver_(message);
      wait_for_idle_();
    }
    else {
      deliver_(message);
    }
  }

  wait_for_idle_();

  std::vector<MessageError> fatalErrors;
  {
    std::scoped_lock lck{mtx_};
    fatalErrors.swap(fatalErrors_);
  }

  if(!fatalErrors.empty()) {
    fatalErrors.front().rethrow();
  }
}

std::size_t Dispatcher::in_flight() const {
  std::scoped_lock lck{mtx_};
  return inFlight_;
}

std::size_t Dispatcher::num_queued() const {
  std::scoped_lock lck{mtx_};
  return queue_.size();
}

std::size_t Dispatcher::num_modules() const {
  std::scoped_lock lck{workersMtx_};
  return workers_.size();
}

void Dispatcher::deliver_(const std::shared_ptr<Message> &message) {
  {
    std::scoped_lock lck{mtx_};
    ++inFlight_;
  }

  std::scoped_lock lck{workersMtx_};

  // Every recipient's reference has to be acquired up front; the extra reference is ours, and
  // keeps the message from finalizing while we're still handing it out.
  message->acquire(workers_.size() + 1);

  for(auto &worker : workers_) {
    worker->deliver(message);
  }

  // With no modules registered, this is where the message gets finalized.
  if(message->release()) {
    on_finalized_(*message);
  }
}

void Dispatcher::on_finalized_(const Message &message) {
  std::vector<MessageError> fatalErrors;

  for(const MessageError &error : message.errors()) {
    std::stringstream ss;
    ss << error.source() << ": " << error.message();

    if(error.has_exception()) {
      ss << " (fatal, while processing '" << message.type() << "' from " << message.source_name()
         << ")";
      logger_.error(ss);
      fatalErrors.push_back(error);
    }
    else {
      logger_.warn(ss);
    }
  }

  {
    std::scoped_lock lck{mtx_};
    fatalErrors_.insert(fatalErrors_.end(), fatalErrors.begin(), fatalErrors.end());
    --inFlight_;
  }

  idleCV_.notify_all();
}

void Dispatcher::wait_for_idle_() {
  std::unique_lock lck{mtx_};
  idleCV_.wait(lck, [this] { return inFlight_ == 0; });
}

}  // namespace hal::msg

#include "hal/msg/DeliveryWorker.hpp"

#include "hal/Module.hpp"
#include "hal/NullLogger.hpp"
#include "hal/msg/Message.hpp"

#include <gtest/gtest.h>

#include <latch>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using hal::NullLogger;
using hal::U64;
using hal::msg::DeliveryWorker;
using hal::msg::Message;

namespace {

/**
 * Records the id of every message it receives, and throws on "close event".
 */
class RecordingModule : public hal::Module {
public:
  explicit RecordingModule(hal::ILogger &logger) : Module(logger, "recorder") { }

  void process_message(Message &message) override {
    received.push_back(message.id());

    if(message.type() == "close event") {
      throw std::runtime_error("refusing to close");
    }
  }

  // Only touched from the worker's thread until the test has synchronized with it
  std::vector<U64> received;
};

}  // namespace

TEST(DeliveryWorker_test, deliversInOrder) {
  NullLogger      logger;
  RecordingModule module(logger);

  constexpr int NUM_MESSAGES = 8;

  std::latch       doneSignal(NUM_MESSAGES);
  std::vector<U64> sent;
  int              numFinalized = 0;

  DeliveryWorker worker(module, [&](const std::shared_ptr<Message> &, const bool finalized) {
    if(finalized) {
      ++numFinalized;
    }
    doneSignal.count_down();
  });

  EXPECT_EQ(&module, &(worker.module())) << "A DeliveryWorker should know which module it serves";

  for(int i = 0; i < NUM_MESSAGES; ++i) {
    auto message = std::make_shared<Message>(logger, module, "start");
    message->acquire();
    sent.push_back(message->id());
    worker.deliver(message);
  }

  doneSignal.wait();

  EXPECT_EQ(sent, module.received)
    << "A DeliveryWorker should hand messages to its module in the order they were delivered";
  EXPECT_EQ(NUM_MESSAGES, numFinalized)
    << "A DeliveryWorker should release the reference held on behalf of its module";
  EXPECT_EQ(0, worker.num_queued()) << "A DeliveryWorker should drain its queue";
}

TEST(DeliveryWorker_test, recordsEscapingExceptions) {
  NullLogger      logger;
  RecordingModule module(logger);

  std::latch doneSignal(1);
  bool       wasFinalized = true;

  DeliveryWorker worker(module, [&](const std::shared_ptr<Message> &, const bool finalized) {
    wasFinalized = finalized;
    doneSignal.count_down();
  });

  auto message = std::make_shared<Message>(logger, module, "close event");

  // Hold an extra reference, as a dispatcher would
  message->acquire(2);
  worker.deliver(message);
  doneSignal.wait();

  EXPECT_FALSE(wasFinalized)
    << "A DeliveryWorker should not finalize a message that other recipients still hold";
  EXPECT_EQ(1, message->pending()) << "A DeliveryWorker should release exactly one reference";

  const auto errors = message->errors();
  ASSERT_EQ(1, errors.size()) << "An exception escaping a module should be recorded on the message";
  EXPECT_EQ("recorder", errors.front().source())
    << "An escaping exception should be attributed to the module that threw it";
  EXPECT_EQ("refusing to close", errors.front().message())
    << "An escaping exception should be described by its what() string";
  EXPECT_TRUE(errors.front().has_exception()) << "An escaping exception should be a fatal error";
  EXPECT_THROW(errors.front().rethrow(), std::runtime_error)
    << "The original exception should be preserved";

  EXPECT_TRUE(message->release());
}

TEST(DeliveryWorker_test, drainsQueueOnDestruction) {
  NullLogger      logger;
  RecordingModule module(logger);

  int numDone = 0;

  {
    DeliveryWorker worker(module, [&](const std::shared_ptr<Message> &, const bool) { ++numDone; });

    for(int i = 0; i < 3; ++i) {
      auto message = std::make_shared<Message>(logger, module, "start");
      message->acquire();
      worker.deliver(message);
    }
  }

  EXPECT_EQ(3, numDone)
    << "A DeliveryWorker should finish delivering queued messages before it is destroyed";
  EXPECT_EQ(3, module.received.size())
    << "A DeliveryWorker should finish delivering queued messages before it is destroyed";
}

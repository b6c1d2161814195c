#include "hal/msg/MessageTypeRegistry.hpp"

#include "hal/msg/exceptions.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using hal::msg::DuplicateMessageType;
using hal::msg::MessageTypeError;
using hal::msg::MessageTypeRegistry;

TEST(MessageTypeRegistry_test, builtinTypes) {
  const auto &registry = MessageTypeRegistry::instance();

  for(const auto *name : {"add to ui",
                          "close event",
                          "configure1",
                          "configure2",
                          "current parameters",
                          "module",
                          "new directory",
                          "new parameters file",
                          "new shutters file",
                          "start",
                          "sync"}) {
    EXPECT_TRUE(registry.contains(name))
      << "The registry should start out with the built-in type '" << name << "'";
  }

  EXPECT_FALSE(registry.contains("new paramters file"))
    << "The registry should not contain types that were never registered";
  EXPECT_EQ(&registry, &MessageTypeRegistry::instance())
    << "There should only be one registry per process";
}

TEST(MessageTypeRegistry_test, strictRegistration) {
  auto &registry = MessageTypeRegistry::instance();

  constexpr auto NAME = "registry test strict";

  const auto sizeBefore = registry.size();
  registry.register_type(NAME);
  EXPECT_TRUE(registry.contains(NAME)) << "register_type should add new types to the registry";
  EXPECT_EQ(sizeBefore + 1, registry.size()) << "register_type should add exactly one entry";

  EXPECT_THROW(registry.register_type(NAME), DuplicateMessageType)
    << "Registering an existing type should throw by default";

  try {
    registry.register_type("start");
    FAIL() << "Registering a built-in type should throw by default";
  }
  catch(const MessageTypeError &e) {
    EXPECT_EQ("start", e.type_name()) << "Message type errors should name the offending type";
    EXPECT_STREQ("Message type 'start' already exists!", e.what())
      << "DuplicateMessageType should describe the problem";
  }

  EXPECT_EQ(sizeBefore + 1, registry.size())
    << "A rejected registration should leave the registry unchanged";
}

TEST(MessageTypeRegistry_test, lenientRegistration) {
  auto &registry = MessageTypeRegistry::instance();

  constexpr auto NAME = "registry test lenient";

  registry.register_type(NAME, false);
  const auto sizeBefore = registry.size();

  EXPECT_NO_THROW(registry.register_type(NAME, false))
    << "Re-registering a type should be accepted when failIfExists is false";
  EXPECT_NO_THROW(registry.register_type("configure1", false))
    << "Re-registering a built-in type should be accepted when failIfExists is false";
  EXPECT_EQ(sizeBefore, registry.size())
    << "Re-registering a type should leave the registry unchanged";
}

TEST(MessageTypeRegistry_test, concurrentRegistration) {
  auto &registry = MessageTypeRegistry::instance();

  constexpr auto NAME        = "registry test concurrent";
  constexpr int  NUM_THREADS = 8;

  std::atomic_int successes = 0;
  std::atomic_int failures  = 0;

  {
    std::vector<std::jthread> threads;
    for(int i = 0; i < NUM_THREADS; ++i) {
      threads.emplace_back([&] {
        try {
          registry.register_type(NAME);
          ++successes;
        }
        catch(const DuplicateMessageType &) {
          ++failures;
        }
      });
    }
  }

  EXPECT_EQ(1, successes.load())
    << "Exactly one of several concurrent strict registrations of a type should succeed";
  EXPECT_EQ(NUM_THREADS - 1, failures.load())
    << "Every other concurrent strict registration of a type should fail";
}

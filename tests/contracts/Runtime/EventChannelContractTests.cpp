// Repository: streamcore
// Component: EventChannel Contract Tests
// Purpose: Bounded FIFO delivery and drop-oldest overflow accounting.
// Copyright (c) 2025 StreamCore

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <string>
#include <thread>
#include <vector>

#include "streamcore/runtime/EventChannel.hpp"

using namespace streamcore::runtime;
using namespace streamcore::tests;

namespace {

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("Runtime", {"RT-010"});
  return true;
}();

class EventChannelContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "Runtime"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override { return {"RT-010"}; }
};

// Rule: RT-010 Events are delivered in order until taken.
TEST_F(EventChannelContractTest, RT_010_FifoUntilTaken) {
  EventChannel<int> channel(4);
  EXPECT_TRUE(channel.Empty());
  EXPECT_FALSE(channel.Poll().has_value());

  EXPECT_TRUE(channel.Push(1));
  EXPECT_TRUE(channel.Push(2));
  EXPECT_TRUE(channel.Push(3));
  EXPECT_EQ(channel.Size(), 3u);
  EXPECT_EQ(*channel.Poll(), 1);
  EXPECT_EQ(channel.Drain(), (std::vector<int>{2, 3}));
  EXPECT_TRUE(channel.Empty());
  EXPECT_EQ(channel.pushed_total(), 3u);
}

// Rule: RT-010 A full channel drops its oldest event and counts the overflow.
TEST_F(EventChannelContractTest, RT_010_OverflowDropsOldest) {
  EventChannel<std::string> channel(2);
  EXPECT_TRUE(channel.Push("a"));
  EXPECT_TRUE(channel.Push("b"));
  EXPECT_FALSE(channel.Push("c"));
  EXPECT_FALSE(channel.Push("d"));

  EXPECT_EQ(channel.overflow_total(), 2u);
  EXPECT_EQ(channel.Drain(), (std::vector<std::string>{"c", "d"}));

  EventChannel<int> tiny(0);
  EXPECT_EQ(tiny.capacity(), 1u);
}

// Rule: RT-010 A retain-all channel keeps every event past its capacity.
TEST_F(EventChannelContractTest, RT_010_RetainAllNeverDrops) {
  EventChannel<int> channel(2, OverflowPolicy::kRetainAll);
  EXPECT_TRUE(channel.Push(1));
  EXPECT_TRUE(channel.Push(2));
  EXPECT_FALSE(channel.Push(3));
  EXPECT_EQ(channel.Size(), 3u);
  EXPECT_EQ(channel.overflow_total(), 1u);
  EXPECT_EQ(channel.Drain(), (std::vector<int>{1, 2, 3}));
  EXPECT_STREQ(OverflowPolicyToString(channel.policy()), "retain_all");
}

// Rule: RT-010 Concurrent producers never lose count of what they pushed.
TEST_F(EventChannelContractTest, RT_010_ConcurrentProducers) {
  EventChannel<int> channel(64);
  std::vector<std::thread> producers;
  for (int p = 0; p < 4; ++p) {
    producers.emplace_back([&channel, p]() {
      for (int i = 0; i < 100; ++i) channel.Push(p * 1000 + i);
    });
  }
  for (auto& t : producers) t.join();

  EXPECT_EQ(channel.pushed_total(), 400u);
  EXPECT_EQ(channel.Size(), 64u);
  EXPECT_EQ(channel.overflow_total(), 400u - 64u);
}

}  // namespace

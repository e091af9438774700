/**
 * @file test_events.cpp
 * @brief Tests for AsyncEventPublisher (non-blocking enqueue, drop-on-full, drain on stop)
 *        and the event envelope.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <memory>

#include "rmon/events/async_publisher.hpp"
#include "rmon/events/event.hpp"
#include "rmon/events/log_sink.hpp"
#include "rmon/obs/observability.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using rmon::core::SetupError;
using rmon::events::AsyncEventPublisher;
using rmon::events::Event;
using rmon::events::Priority;
using rmon::test::RecordingSink;
using rmon::test::eventually;

namespace {

Event make_event(const std::string& key) {
  Event e;
  e.type         = rmon::events::kWanHealthChanged;
  e.priority     = Priority::Normal;
  e.source       = "test";
  e.timestamp    = std::chrono::system_clock::time_point{std::chrono::milliseconds{1500}};
  e.resource_key = key;
  e.payload      = {{"status", "DOWN"}};
  return e;
}

} // namespace

TEST(AsyncEventPublisher, Create_Validation) {
  auto no_sink = AsyncEventPublisher::create(nullptr);
  ASSERT_FALSE(no_sink);
  EXPECT_EQ(no_sink.error(), SetupError::MissingEventSink);

  auto zero = AsyncEventPublisher::create(std::make_shared<RecordingSink>(), 0);
  ASSERT_FALSE(zero);
  EXPECT_EQ(zero.error(), SetupError::InvalidConfig);
}

TEST(AsyncEventPublisher, Enqueue_DeliversInOrder) {
  auto sink = std::make_shared<RecordingSink>();
  auto pub  = AsyncEventPublisher::create(sink);
  ASSERT_TRUE(pub);

  for (int i = 0; i < 5; ++i) EXPECT_TRUE((*pub)->enqueue(make_event("k" + std::to_string(i))));
  ASSERT_TRUE(eventually([&] { return sink->events().size() == 5; }));

  const auto got = sink->events();
  for (int i = 0; i < 5; ++i) EXPECT_EQ(got[i].resource_key, "k" + std::to_string(i));
  ASSERT_TRUE(eventually([&] { return (*pub)->delivered() == 5; }));
  EXPECT_EQ((*pub)->failed(), 0u);
}

TEST(AsyncEventPublisher, SinkFailure_CountedNotPropagated) {
  auto sink = std::make_shared<RecordingSink>();
  sink->fail = true;
  auto obs = rmon::obs::make_simple_observer();
  auto pub = AsyncEventPublisher::create(sink, 16, obs);
  ASSERT_TRUE(pub);

  EXPECT_TRUE((*pub)->enqueue(make_event("a")));
  EXPECT_TRUE((*pub)->enqueue(make_event("b")));
  ASSERT_TRUE(eventually([&] { return (*pub)->failed() == 2; }));
  ASSERT_TRUE(eventually([&] { return obs->snapshot().publish_failures == 2; }));
}

TEST(AsyncEventPublisher, FullQueue_DropsNewEventWithoutBlocking) {
  auto sink = std::make_shared<RecordingSink>();
  sink->delay_ms = 200; // worker is stuck on the first event
  auto obs = rmon::obs::make_simple_observer();
  auto pub = AsyncEventPublisher::create(sink, 2, obs);
  ASSERT_TRUE(pub);

  EXPECT_TRUE((*pub)->enqueue(make_event("first")));
  ASSERT_TRUE(eventually([&] { return (*pub)->pending() == 0; })); // taken by the worker

  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_TRUE((*pub)->enqueue(make_event("q1")));
  EXPECT_TRUE((*pub)->enqueue(make_event("q2")));
  EXPECT_FALSE((*pub)->enqueue(make_event("overflow")));
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 150ms);

  EXPECT_EQ((*pub)->dropped(), 1u);
  EXPECT_EQ(obs->snapshot().events_dropped, 1u);
}

TEST(AsyncEventPublisher, Stop_DrainsQueued_ThenRejects) {
  auto sink = std::make_shared<RecordingSink>();
  sink->delay_ms = 10;
  auto pub = AsyncEventPublisher::create(sink, 64);
  ASSERT_TRUE(pub);

  for (int i = 0; i < 10; ++i) EXPECT_TRUE((*pub)->enqueue(make_event("k")));
  (*pub)->stop();
  EXPECT_EQ(sink->events().size(), 10u);
  EXPECT_EQ((*pub)->pending(), 0u);

  EXPECT_FALSE((*pub)->enqueue(make_event("late")));
  (*pub)->stop(); // idempotent
}

TEST(Event, ToJson_Envelope) {
  const auto j = rmon::events::to_json(make_event("r1:wan1"));
  EXPECT_EQ(j.at("type"), "wan.health.changed");
  EXPECT_EQ(j.at("priority"), "normal");
  EXPECT_EQ(j.at("source"), "test");
  EXPECT_EQ(j.at("timestamp_ms"), 1500);
  EXPECT_EQ(j.at("resource_key"), "r1:wan1");
  EXPECT_EQ(j.at("payload").at("status"), "DOWN");
}

TEST(Event, PriorityNames) {
  EXPECT_STREQ(rmon::events::to_string(Priority::Immediate), "immediate");
  EXPECT_STREQ(rmon::events::to_string(Priority::Critical), "critical");
  EXPECT_STREQ(rmon::events::to_string(Priority::Background), "background");
}

TEST(LogEventSink, PublishAlwaysSucceeds) {
  rmon::events::LogEventSink sink;
  EXPECT_TRUE(sink.publish(make_event("r1:wan1")));
  EXPECT_EQ(sink.published(), 1u);
}

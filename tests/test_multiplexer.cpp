/**
 * @file test_multiplexer.cpp
 * @brief Tests for PollingMultiplexer: session sharing, interval clamping, slow-consumer
 *        isolation, teardown on last unsubscribe and cancellation scopes.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "rmon/core/simulated_probe.hpp"
#include "rmon/events/async_publisher.hpp"
#include "rmon/obs/observability.hpp"
#include "rmon/telemetry/interface_stats.hpp"
#include "rmon/telemetry/traffic_stats.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using rmon::core::SetupError;
using rmon::core::SimInterfaceCounters;
using rmon::core::SimMode;
using rmon::core::SimulatedDeviceProbe;
using rmon::telemetry::InterfaceStatsMultiplexer;
using rmon::telemetry::MultiplexerConfig;
using rmon::telemetry::SubscribeError;
using rmon::test::RecordingSink;
using rmon::test::eventually;

namespace {

MultiplexerConfig fast_config(std::size_t capacity = 10) {
  MultiplexerConfig c;
  c.name             = "test";
  c.min_interval     = 10ms;
  c.default_interval = 20ms;
  c.max_interval     = 200ms;
  c.queue_capacity   = capacity;
  c.fetch_timeout    = 500ms;
  return c;
}

class MultiplexerTest : public ::testing::Test {
protected:
  void SetUp() override {
    device = std::make_shared<SimulatedDeviceProbe>();
    device->set_interface("r1", "ether1", SimInterfaceCounters{});
    device->set_interface_growth("r1", "ether1", SimInterfaceCounters{1000, 2000, 1, 2, 0, 0, 0, 0});
    device->set_interface("r1", "ether2", SimInterfaceCounters{});
    sink      = std::make_shared<RecordingSink>();
    observer  = rmon::obs::make_simple_observer();
    auto pub  = rmon::events::AsyncEventPublisher::create(sink, 4096, observer);
    ASSERT_TRUE(pub);
    publisher = *pub;
  }

  void TearDown() override {
    if (mux) mux->stop();
    publisher->stop();
  }

  void make(MultiplexerConfig cfg = fast_config()) {
    auto m = rmon::telemetry::make_interface_stats_multiplexer(cfg, device, publisher, observer);
    ASSERT_TRUE(m);
    mux = std::move(*m);
  }

  std::shared_ptr<SimulatedDeviceProbe>               device;
  std::shared_ptr<RecordingSink>                      sink;
  std::shared_ptr<rmon::obs::Observer>                observer;
  std::shared_ptr<rmon::events::AsyncEventPublisher>  publisher;
  std::unique_ptr<InterfaceStatsMultiplexer>          mux;
};

} // namespace

TEST_F(MultiplexerTest, Create_Validation) {
  auto no_probe = rmon::telemetry::make_interface_stats_multiplexer(fast_config(), nullptr, publisher);
  ASSERT_FALSE(no_probe);
  EXPECT_EQ(no_probe.error(), SetupError::MissingDeviceProbe);

  auto no_pub = rmon::telemetry::make_interface_stats_multiplexer(fast_config(), device, nullptr);
  ASSERT_FALSE(no_pub);
  EXPECT_EQ(no_pub.error(), SetupError::MissingPublisher);

  auto bad = fast_config();
  bad.min_interval = 300ms; // above max
  auto inverted = rmon::telemetry::make_interface_stats_multiplexer(bad, device, publisher);
  ASSERT_FALSE(inverted);
  EXPECT_EQ(inverted.error(), SetupError::InvalidConfig);

  auto zero_cap = rmon::telemetry::make_interface_stats_multiplexer(fast_config(0), device, publisher);
  ASSERT_FALSE(zero_cap);
  EXPECT_EQ(zero_cap.error(), SetupError::InvalidConfig);
}

TEST_F(MultiplexerTest, ClampInterval) {
  make();
  EXPECT_EQ(mux->clamp_interval(0ms), 20ms);
  EXPECT_EQ(mux->clamp_interval(-5ms), 20ms);
  EXPECT_EQ(mux->clamp_interval(1ms), 10ms);
  EXPECT_EQ(mux->clamp_interval(50ms), 50ms);
  EXPECT_EQ(mux->clamp_interval(10s), 200ms);
}

TEST_F(MultiplexerTest, Subscribe_InvalidKey) {
  make();
  auto r = mux->subscribe("ether1");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), SubscribeError::InvalidKey);
  EXPECT_EQ(mux->session_count(), 0u);
}

TEST_F(MultiplexerTest, Subscribe_CancelledScope) {
  make();
  std::stop_source scope;
  scope.request_stop();
  auto r = mux->subscribe("r1:ether1", 0ms, scope.get_token());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), SubscribeError::Cancelled);
  EXPECT_EQ(mux->session_count(), 0u);
}

TEST_F(MultiplexerTest, FirstFetchIsImmediate) {
  auto cfg = fast_config();
  cfg.max_interval = 60s;
  // Only the immediate fetch can arrive within the wait; repeat on fresh sessions so
  // the subscriber that opens the session never races its loop's first broadcast.
  for (int i = 0; i < 20; ++i) {
    make(cfg);
    auto f = mux->subscribe("r1:ether1", 30s);
    ASSERT_TRUE(f);
    auto p = (*f)->next_for(std::stop_token{}, 1s);
    ASSERT_TRUE(p.has_value()) << "iteration " << i;
    EXPECT_EQ((*p)->router_id, "r1");
    EXPECT_EQ((*p)->interface_id, "ether1");
    EXPECT_DOUBLE_EQ((*p)->tx_bytes_per_sec, 0.0);
    EXPECT_TRUE(mux->last_fetch("r1:ether1").has_value());
    mux->stop();
  }
}

TEST_F(MultiplexerTest, SubscribersShareOneSession) {
  make();
  auto a = mux->subscribe("r1:ether1", 50ms);
  auto b = mux->subscribe("r1:ether1", 10ms); // interval of the existing session wins
  ASSERT_TRUE(a && b);
  EXPECT_EQ(mux->session_count(), 1u);
  EXPECT_EQ(mux->subscriber_count(), 2u);
  EXPECT_EQ(mux->session_interval("r1:ether1").value_or(0ms), 50ms);
  ASSERT_TRUE(eventually([&] { return mux->running_loops() == 1; }));

  auto pa = (*a)->next_for(std::stop_token{}, 2s);
  auto pb = (*b)->next_for(std::stop_token{}, 2s);
  ASSERT_TRUE(pa && pb);
  EXPECT_EQ(pa->get(), pb->get()); // same immutable point
}

TEST_F(MultiplexerTest, RatesAfterSecondSample) {
  make();
  auto f = mux->subscribe("r1:ether1", 20ms);
  ASSERT_TRUE(f);
  ASSERT_TRUE((*f)->next_for(std::stop_token{}, 2s));
  auto second = (*f)->next_for(std::stop_token{}, 2s);
  ASSERT_TRUE(second);
  EXPECT_GT((*second)->tx_bytes_per_sec, 0.0);
  EXPECT_GT((*second)->rx_bytes_per_sec, (*second)->tx_bytes_per_sec);
}

TEST_F(MultiplexerTest, FailedTicksKeepSubscribers) {
  make();
  device->set_mode(SimMode::Error);
  auto f = mux->subscribe("r1:ether1", 10ms);
  ASSERT_TRUE(f);
  ASSERT_TRUE(eventually([&] { return observer->snapshot().probe_failures >= 3; }));
  EXPECT_FALSE((*f)->try_next().has_value());

  device->set_mode(SimMode::Empty);
  const auto failures = observer->snapshot().probe_failures;
  ASSERT_TRUE(eventually([&] { return observer->snapshot().probe_failures > failures; }));
  EXPECT_FALSE((*f)->try_next().has_value());
  EXPECT_FALSE((*f)->closed());
  EXPECT_EQ(mux->subscriber_count(), 1u);

  device->set_mode(SimMode::Normal);
  EXPECT_TRUE((*f)->next_for(std::stop_token{}, 2s).has_value());
}

TEST_F(MultiplexerTest, SlowConsumerDoesNotBlockOthers) {
  make(fast_config(10));
  auto slow = mux->subscribe("r1:ether1", 10ms);
  auto fast = mux->subscribe("r1:ether1");
  ASSERT_TRUE(slow && fast);

  int received = 0;
  const auto until = std::chrono::steady_clock::now() + 5s;
  while (received < 30 && std::chrono::steady_clock::now() < until) {
    if ((*fast)->next_for(std::stop_token{}, 200ms)) ++received;
  }
  EXPECT_GE(received, 30);
  EXPECT_EQ((*slow)->pending(), 10u); // full, never drained
  EXPECT_GT((*slow)->dropped(), 0u);
  EXPECT_GT(observer->snapshot().updates_dropped, 0u);
  EXPECT_EQ(mux->subscriber_count(), 2u);
}

TEST_F(MultiplexerTest, LastUnsubscribeStopsLoop) {
  make();
  auto a = mux->subscribe("r1:ether1");
  auto b = mux->subscribe("r1:ether1");
  ASSERT_TRUE(a && b);
  ASSERT_TRUE(eventually([&] { return mux->running_loops() == 1; }));

  EXPECT_TRUE(mux->unsubscribe("r1:ether1", *a));
  EXPECT_TRUE((*a)->closed());
  EXPECT_EQ(mux->session_count(), 1u);
  EXPECT_FALSE(mux->unsubscribe("r1:ether1", *a)); // already gone

  EXPECT_TRUE(mux->unsubscribe("r1:ether1", *b));
  EXPECT_EQ(mux->session_count(), 0u);
  EXPECT_EQ(mux->running_loops(), 0u); // joined before unsubscribe returns

  const auto calls = device->calls("/interface", "print");
  std::this_thread::sleep_for(60ms);
  EXPECT_EQ(device->calls("/interface", "print"), calls);

  auto again = mux->subscribe("r1:ether1");
  ASSERT_TRUE(again);
  EXPECT_TRUE((*again)->next_for(std::stop_token{}, 2s).has_value());
}

TEST_F(MultiplexerTest, ConcurrentChurnKeepsOneLoopPerKey) {
  make();
  std::atomic<bool> done{false};
  std::atomic<std::size_t> max_loops{0};
  std::jthread watcher([&] {
    while (!done.load()) {
      const auto n = mux->running_loops();
      if (n > max_loops.load()) max_loops.store(n);
      std::this_thread::sleep_for(1ms);
    }
  });

  std::vector<std::jthread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < 25; ++i) {
        auto f = mux->subscribe("r1:ether1");
        if (!f) continue;
        std::this_thread::sleep_for(2ms);
        mux->unsubscribe("r1:ether1", *f);
      }
    });
  }
  workers.clear();
  done.store(true);
  watcher.join();

  EXPECT_LE(max_loops.load(), 1u);
  EXPECT_EQ(mux->session_count(), 0u);
  EXPECT_EQ(mux->running_loops(), 0u);
}

TEST_F(MultiplexerTest, ScopeStopUnsubscribes) {
  make();
  std::stop_source scope;
  auto f = mux->subscribe("r1:ether1", 0ms, scope.get_token());
  ASSERT_TRUE(f);
  EXPECT_EQ(mux->subscriber_count(), 1u);

  scope.request_stop();
  EXPECT_TRUE((*f)->closed());
  EXPECT_EQ(mux->session_count(), 0u);
  EXPECT_EQ(mux->running_loops(), 0u);
}

TEST_F(MultiplexerTest, StopClosesFeedsAndRejectsSubscribe) {
  make();
  auto a = mux->subscribe("r1:ether1");
  auto b = mux->subscribe("r1:ether2");
  ASSERT_TRUE(a && b);

  mux->stop();
  EXPECT_TRUE((*a)->closed());
  EXPECT_TRUE((*b)->closed());
  EXPECT_EQ(mux->running_loops(), 0u);

  auto late = mux->subscribe("r1:ether1");
  ASSERT_FALSE(late);
  EXPECT_EQ(late.error(), SubscribeError::Stopped);
  mux->stop(); // idempotent
}

TEST_F(MultiplexerTest, ForwardsEventsAndCallsHook) {
  make();
  std::atomic<int> hooked{0};
  mux->set_point_hook([&](const std::string& key, const rmon::telemetry::InterfaceStatsPoint& p) {
    if (key == "r1:ether1" && p.interface_id == "ether1") ++hooked;
  });
  auto f = mux->subscribe("r1:ether1");
  ASSERT_TRUE(f);
  ASSERT_TRUE(eventually([&] { return sink->count(rmon::events::kInterfaceTrafficUpdate) >= 2; }));
  EXPECT_GE(hooked.load(), 1);

  const auto ev = sink->events().front();
  EXPECT_EQ(ev.resource_key, "r1:ether1");
  EXPECT_EQ(ev.priority, rmon::events::Priority::Background);
  EXPECT_EQ(ev.payload.at("interface_id"), "ether1");
}

TEST_F(MultiplexerTest, HookMayUnsubscribeLastFeed) {
  make();
  std::mutex mu;
  rmon::telemetry::InterfaceStatsMultiplexer::FeedPtr target;
  std::atomic<bool> detached{false};
  mux->set_point_hook([&](const std::string& key, const rmon::telemetry::InterfaceStatsPoint&) {
    rmon::telemetry::InterfaceStatsMultiplexer::FeedPtr f;
    {
      std::lock_guard<std::mutex> lk(mu);
      f = std::move(target);
      target.reset();
    }
    if (f && mux->unsubscribe(key, f)) detached = true;
  });
  auto f = mux->subscribe("r1:ether1");
  ASSERT_TRUE(f);
  {
    std::lock_guard<std::mutex> lk(mu);
    target = *f;
  }
  // The loop cannot join itself; it exits on its own after the tick.
  ASSERT_TRUE(eventually([&] { return detached.load(); }));
  ASSERT_TRUE(eventually([&] { return mux->session_count() == 0 && mux->running_loops() == 0; }));
  EXPECT_TRUE((*f)->closed());

  // The retired loop is reaped by the next subscribe on the same key.
  auto again = mux->subscribe("r1:ether1");
  ASSERT_TRUE(again);
  EXPECT_TRUE((*again)->next_for(std::stop_token{}, 2s).has_value());
  EXPECT_EQ(mux->session_count(), 1u);
}

TEST(ServiceTrafficMultiplexer, DeliversSummedCounters) {
  auto device = std::make_shared<SimulatedDeviceProbe>();
  device->set_service("svc-a", rmon::core::SimServiceCounters{100, 400, 1, 4});
  auto sink = std::make_shared<RecordingSink>();
  auto pub  = rmon::events::AsyncEventPublisher::create(sink);
  ASSERT_TRUE(pub);
  auto mux = rmon::telemetry::make_service_traffic_multiplexer(fast_config(), device, *pub);
  ASSERT_TRUE(mux);

  auto f = (*mux)->subscribe("svc-a");
  ASSERT_TRUE(f);
  auto p = (*f)->next_for(std::stop_token{}, 2s);
  ASSERT_TRUE(p);
  EXPECT_EQ((*p)->instance_id, "svc-a");
  EXPECT_EQ((*p)->tx_bytes, 100u);
  EXPECT_EQ((*p)->rx_bytes, 400u);
  ASSERT_TRUE(eventually([&] { return sink->count(rmon::events::kServiceTrafficUpdate) >= 1; }));

  (*mux)->stop();
  (*pub)->stop();
}

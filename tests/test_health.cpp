/**
 * @file test_health.cpp
 * @brief Tests for WAN health aggregation and HealthMonitor probe lifecycle.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <stop_token>
#include <thread>

#include "rmon/core/simulated_probe.hpp"
#include "rmon/events/async_publisher.hpp"
#include "rmon/health/health_monitor.hpp"
#include "rmon/obs/observability.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using rmon::core::SimMode;
using rmon::core::SimulatedDeviceProbe;
using rmon::health::HealthError;
using rmon::health::HealthLinkConfig;
using rmon::health::HealthMonitor;
using rmon::health::HealthVerdict;
using rmon::health::aggregate_health;
using rmon::test::RecordingSink;
using rmon::test::eventually;

namespace {

HealthLinkConfig link_of(std::vector<std::string> targets, uint32_t interval_sec = 60) {
  HealthLinkConfig c;
  c.enabled      = true;
  c.targets      = std::move(targets);
  c.interval_sec = interval_sec;
  return c;
}

class HealthMonitorTest : public ::testing::Test {
protected:
  void SetUp() override {
    device   = std::make_shared<SimulatedDeviceProbe>();
    sink     = std::make_shared<RecordingSink>();
    observer = rmon::obs::make_simple_observer();
    auto pub = rmon::events::AsyncEventPublisher::create(sink, 256, observer);
    ASSERT_TRUE(pub);
    publisher = *pub;
    rmon::health::HealthMonitorOptions opts;
    opts.command_timeout = 1s;
    auto m = HealthMonitor::create(device, publisher, observer, opts);
    ASSERT_TRUE(m);
    monitor = std::move(*m);
  }

  void TearDown() override {
    monitor->shutdown();
    publisher->stop();
  }

  std::size_t health_events() const { return sink->count(rmon::events::kWanHealthChanged); }

  std::shared_ptr<SimulatedDeviceProbe>              device;
  std::shared_ptr<RecordingSink>                     sink;
  std::shared_ptr<rmon::obs::Observer>               observer;
  std::shared_ptr<rmon::events::AsyncEventPublisher> publisher;
  std::unique_ptr<HealthMonitor>                     monitor;
};

} // namespace

TEST(AggregateHealth, OrderedRule) {
  EXPECT_EQ(aggregate_health(3, 3), HealthVerdict::Healthy);
  EXPECT_EQ(aggregate_health(2, 3), HealthVerdict::Degraded);
  EXPECT_EQ(aggregate_health(1, 3), HealthVerdict::Degraded);
  EXPECT_EQ(aggregate_health(0, 3), HealthVerdict::Down);
  EXPECT_EQ(aggregate_health(0, 0), HealthVerdict::Unknown);
}

TEST(AggregateHealth, Names) {
  EXPECT_STREQ(rmon::health::to_string(HealthVerdict::Degraded), "DEGRADED");
  EXPECT_STREQ(rmon::health::to_string(HealthError::MissingTargets), "missing_targets");
  EXPECT_EQ(rmon::health::probe_tag("r1:wan1"), "rmon-health:r1:wan1");
}

TEST(HealthMonitorCreate, Validation) {
  auto pub = rmon::events::AsyncEventPublisher::create(std::make_shared<RecordingSink>());
  ASSERT_TRUE(pub);
  EXPECT_FALSE(HealthMonitor::create(nullptr, *pub));
  EXPECT_FALSE(HealthMonitor::create(std::make_shared<SimulatedDeviceProbe>(), nullptr));
  rmon::health::HealthMonitorOptions zero;
  zero.command_timeout = 0ms;
  EXPECT_FALSE(HealthMonitor::create(std::make_shared<SimulatedDeviceProbe>(), *pub, nullptr, zero));
  (*pub)->stop();
}

TEST_F(HealthMonitorTest, UnconfiguredLinkIsUnknown) {
  EXPECT_EQ(monitor->get_health_status("r1:wan9"), HealthVerdict::Unknown);
  EXPECT_FALSE(monitor->link_status("r1:wan9").monitoring);
}

TEST_F(HealthMonitorTest, Configure_AddsTaggedProbes) {
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", link_of({"1.1.1.1", "8.8.8.8"})));
  const auto rows = device->netwatch("r1");
  ASSERT_EQ(rows.size(), 2u);
  for (const auto& r : rows) {
    EXPECT_EQ(r.at("comment"), "rmon-health:r1:wan1");
    EXPECT_EQ(r.at("interval"), "60s");
    EXPECT_EQ(r.at("timeout"), "2s");
    EXPECT_EQ(r.at("thr-loss-count"), "3");
  }
  EXPECT_EQ(monitor->monitored_links(), std::vector<std::string>{"r1:wan1"});
  EXPECT_TRUE(monitor->link_status("r1:wan1").monitoring);
  // No check has run yet.
  EXPECT_EQ(monitor->get_health_status("r1:wan1"), HealthVerdict::Unknown);
}

TEST_F(HealthMonitorTest, Reconfigure_ReplacesProbesWithoutDuplicates) {
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", link_of({"1.1.1.1", "8.8.8.8"})));
  ASSERT_TRUE(monitor->configure_health_check("r1:wan2", link_of({"9.9.9.9"})));
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", link_of({"4.4.4.4"})));

  const auto rows = device->netwatch("r1");
  ASSERT_EQ(rows.size(), 2u);
  std::size_t wan1 = 0;
  for (const auto& r : rows) {
    if (r.at("comment") == "rmon-health:r1:wan1") {
      ++wan1;
      EXPECT_EQ(r.at("host"), "4.4.4.4");
    }
  }
  EXPECT_EQ(wan1, 1u);
  EXPECT_EQ(monitor->monitored_links().size(), 2u);
}

TEST_F(HealthMonitorTest, CheckNow_Transitions) {
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", link_of({"a", "b", "c"})));

  auto v = monitor->check_now("r1:wan1");
  ASSERT_TRUE(v);
  EXPECT_EQ(*v, HealthVerdict::Healthy);

  device->set_host_reachable("b", false);
  EXPECT_EQ(monitor->check_now("r1:wan1").value_or(HealthVerdict::Unknown), HealthVerdict::Degraded);
  const auto st = monitor->link_status("r1:wan1");
  EXPECT_EQ(st.reachable, 2u);
  EXPECT_EQ(st.total, 3u);
  EXPECT_TRUE(st.last_check.has_value());

  device->set_host_reachable("a", false);
  device->set_host_reachable("c", false);
  EXPECT_EQ(monitor->check_now("r1:wan1").value_or(HealthVerdict::Unknown), HealthVerdict::Down);

  ASSERT_TRUE(eventually([&] { return health_events() == 3; }));
  const auto events = sink->events();
  EXPECT_EQ(events.back().payload.at("previous_status"), "DEGRADED");
  EXPECT_EQ(events.back().payload.at("status"), "DOWN");
  EXPECT_EQ(events.back().payload.at("wan_interface_id"), "wan1");
  EXPECT_EQ(events.back().resource_key, "r1:wan1");
  EXPECT_EQ(observer->snapshot().health_transitions, 3u);
}

TEST_F(HealthMonitorTest, SameVerdictEmitsNoEvent) {
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", link_of({"a"})));
  ASSERT_TRUE(monitor->check_now("r1:wan1"));
  ASSERT_TRUE(monitor->check_now("r1:wan1"));
  ASSERT_TRUE(monitor->check_now("r1:wan1"));
  ASSERT_TRUE(eventually([&] { return health_events() == 1; }));
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(health_events(), 1u);
}

TEST_F(HealthMonitorTest, LoopChecksOnInterval) {
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", link_of({"a"}, 1)));
  EXPECT_FALSE(monitor->link_status("r1:wan1").last_check.has_value());
  ASSERT_TRUE(eventually([&] { return monitor->get_health_status("r1:wan1") == HealthVerdict::Healthy; },
                         5s));
}

TEST_F(HealthMonitorTest, Disable_TearsDownToUnknown) {
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", link_of({"a", "b"})));
  ASSERT_TRUE(monitor->check_now("r1:wan1"));
  ASSERT_TRUE(eventually([&] { return health_events() == 1; }));

  HealthLinkConfig off;
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", off));
  EXPECT_EQ(monitor->get_health_status("r1:wan1"), HealthVerdict::Unknown);
  EXPECT_FALSE(monitor->link_status("r1:wan1").monitoring);
  EXPECT_TRUE(device->netwatch("r1").empty());
  EXPECT_TRUE(monitor->monitored_links().empty());
  ASSERT_TRUE(eventually([&] { return health_events() == 2; }));

  auto gone = monitor->check_now("r1:wan1");
  ASSERT_FALSE(gone);
  EXPECT_EQ(gone.error(), HealthError::InvalidKey);

  // Disabling again changes nothing.
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", off));
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(health_events(), 2u);
}

TEST_F(HealthMonitorTest, EnabledWithoutTargets_MissingTargets) {
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", link_of({"a"})));
  auto r = monitor->configure_health_check("r1:wan1", link_of({}));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), HealthError::MissingTargets);
  EXPECT_TRUE(device->netwatch("r1").empty());
  EXPECT_TRUE(monitor->monitored_links().empty());
  EXPECT_EQ(monitor->get_health_status("r1:wan1"), HealthVerdict::Unknown);
}

TEST_F(HealthMonitorTest, InvalidInput) {
  auto key = monitor->configure_health_check("wan1", link_of({"a"}));
  ASSERT_FALSE(key);
  EXPECT_EQ(key.error(), HealthError::InvalidKey);

  auto zero = monitor->configure_health_check("r1:wan1", link_of({"a"}, 0));
  ASSERT_FALSE(zero);
  EXPECT_EQ(zero.error(), HealthError::InvalidConfig);

  auto blank = monitor->configure_health_check("r1:wan1", link_of({"a", ""}));
  ASSERT_FALSE(blank);
  EXPECT_EQ(blank.error(), HealthError::InvalidConfig);

  EXPECT_EQ(device->total_calls(), 0u);
}

TEST_F(HealthMonitorTest, DeviceFailure_ConfigureReportsIt) {
  device->set_mode(SimMode::Error);
  auto r = monitor->configure_health_check("r1:wan1", link_of({"a"}));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), HealthError::DeviceCommandFailed);
  EXPECT_TRUE(monitor->monitored_links().empty());
  EXPECT_FALSE(monitor->link_status("r1:wan1").monitoring);
}

TEST_F(HealthMonitorTest, DeviceFailure_CheckKeepsVerdict) {
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", link_of({"a"})));
  ASSERT_TRUE(monitor->check_now("r1:wan1"));
  device->set_mode(SimMode::Error);
  auto r = monitor->check_now("r1:wan1");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), HealthError::DeviceCommandFailed);
  EXPECT_EQ(monitor->get_health_status("r1:wan1"), HealthVerdict::Healthy);
}

TEST_F(HealthMonitorTest, ReadsNotBlockedDuringReconfigure) {
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", link_of({"a"})));
  ASSERT_TRUE(monitor->check_now("r1:wan1"));
  device->set_latency(200ms);

  auto pending = std::async(std::launch::async, [&] {
    return monitor->configure_health_check("r1:wan1", link_of({"a", "b"})).has_value();
  });
  std::this_thread::sleep_for(30ms);
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_EQ(monitor->get_health_status("r1:wan1"), HealthVerdict::Healthy);
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 100ms);
  EXPECT_TRUE(pending.get());
}

TEST_F(HealthMonitorTest, CancelledScope) {
  device->set_latency(2s);
  std::stop_source scope;
  std::jthread canceller([&] {
    std::this_thread::sleep_for(20ms);
    scope.request_stop();
  });
  auto r = monitor->configure_health_check("r1:wan1", link_of({"a"}), scope.get_token());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), HealthError::Cancelled);
}

TEST_F(HealthMonitorTest, Shutdown_IdempotentAndFinal) {
  ASSERT_TRUE(monitor->configure_health_check("r1:wan1", link_of({"a"})));
  ASSERT_TRUE(monitor->check_now("r1:wan1"));
  monitor->shutdown();
  monitor->shutdown();
  EXPECT_TRUE(monitor->monitored_links().empty());
  EXPECT_FALSE(monitor->link_status("r1:wan1").monitoring);
  EXPECT_EQ(monitor->get_health_status("r1:wan1"), HealthVerdict::Healthy);

  auto r = monitor->configure_health_check("r1:wan1", link_of({"a"}));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), HealthError::Stopped);
}

/**
 * @file test_rate.cpp
 * @brief Counter rate math, counter parsing and the per-source point builders.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <limits>

#include "rmon/telemetry/counter_parse.hpp"
#include "rmon/telemetry/interface_stats.hpp"
#include "rmon/telemetry/rate.hpp"
#include "rmon/telemetry/traffic_stats.hpp"

using namespace std::chrono_literals;
using rmon::telemetry::calculate_rate;

TEST(Rate, DeltaOverInterval) {
  EXPECT_DOUBLE_EQ(calculate_rate(1000, 500, 5.0), 100.0);
  EXPECT_DOUBLE_EQ(calculate_rate(500, 500, 5.0), 0.0);
  EXPECT_DOUBLE_EQ(calculate_rate(1500, 0, 0.5), 3000.0);
}

TEST(Rate, CounterResetYieldsZero) {
  EXPECT_DOUBLE_EQ(calculate_rate(100, 9000, 5.0), 0.0);
}

TEST(Rate, NonPositiveIntervalYieldsZero) {
  EXPECT_DOUBLE_EQ(calculate_rate(1000, 500, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(calculate_rate(1000, 500, -1.0), 0.0);
  EXPECT_DOUBLE_EQ(calculate_rate(1000, 500, std::numeric_limits<double>::quiet_NaN()), 0.0);
}

TEST(CounterParse, WholeStringOnly) {
  EXPECT_EQ(rmon::telemetry::parse_counter("0").value_or(1), 0u);
  EXPECT_EQ(rmon::telemetry::parse_counter("18446744073709551615").value_or(0),
            std::numeric_limits<uint64_t>::max());
  EXPECT_FALSE(rmon::telemetry::parse_counter(""));
  EXPECT_FALSE(rmon::telemetry::parse_counter("-1"));
  EXPECT_FALSE(rmon::telemetry::parse_counter("12kb"));
  EXPECT_FALSE(rmon::telemetry::parse_counter("18446744073709551616"));
}

TEST(InterfaceStatsSource, KeyAndCommand) {
  EXPECT_EQ(rmon::telemetry::InterfaceStatsSource::from_key("ether1"), nullptr);
  auto src = rmon::telemetry::InterfaceStatsSource::from_key("r1:ether1");
  ASSERT_NE(src, nullptr);
  const auto cmd = src->command();
  EXPECT_EQ(cmd.router_id, "r1");
  EXPECT_EQ(cmd.path, "/interface");
  EXPECT_EQ(cmd.action, "print");
  EXPECT_EQ(cmd.filter.at(".id"), "ether1");
}

TEST(InterfaceStatsSource, FirstPointHasZeroRates_ThenDeltas) {
  auto src = rmon::telemetry::InterfaceStatsSource::from_key("r1:ether1");
  ASSERT_NE(src, nullptr);
  const auto t0 = std::chrono::system_clock::time_point{1000s};

  rmon::core::Record row{{".id", "ether1"}, {"tx-byte", "1000"}, {"rx-byte", "2000"},
                         {"tx-packet", "10"}, {"rx-packet", "20"}};
  auto first = src->build({row}, t0);
  ASSERT_TRUE(first);
  EXPECT_EQ(first->tx_bytes, 1000u);
  EXPECT_EQ(first->tx_errors, 0u); // optional fields default to zero
  EXPECT_DOUBLE_EQ(first->tx_bytes_per_sec, 0.0);

  row["tx-byte"] = "1500";
  row["rx-byte"] = "1000"; // reset
  row["tx-error"] = "5";
  auto second = src->build({row}, t0 + 5s);
  ASSERT_TRUE(second);
  EXPECT_DOUBLE_EQ(second->tx_bytes_per_sec, 100.0);
  EXPECT_DOUBLE_EQ(second->rx_bytes_per_sec, 0.0);
  EXPECT_DOUBLE_EQ(second->tx_errors_per_sec, 1.0);
}

TEST(InterfaceStatsSource, MissingCountersSkipsTick) {
  auto src = rmon::telemetry::InterfaceStatsSource::from_key("r1:ether1");
  ASSERT_NE(src, nullptr);
  rmon::core::Record row{{".id", "ether1"}, {"tx-byte", "abc"}, {"rx-byte", "1"},
                         {"tx-packet", "1"}, {"rx-packet", "1"}};
  EXPECT_FALSE(src->build({row}, std::chrono::system_clock::now()));
}

TEST(InterfaceStatsSource, LoneRowNamingAnotherInterfaceIsRejected) {
  auto src = rmon::telemetry::InterfaceStatsSource::from_key("r1:ether1");
  ASSERT_NE(src, nullptr);
  const auto now = std::chrono::system_clock::now();
  rmon::core::Record other{{".id", "ether2"}, {"name", "ether2"}, {"tx-byte", "10"},
                           {"rx-byte", "20"}, {"tx-packet", "1"}, {"rx-packet", "2"}};
  EXPECT_FALSE(src->build({other}, now));

  rmon::core::Record anonymous{{"tx-byte", "10"}, {"rx-byte", "20"},
                               {"tx-packet", "1"}, {"rx-packet", "2"}};
  auto p = src->build({anonymous}, now);
  ASSERT_TRUE(p);
  EXPECT_EQ(p->interface_id, "ether1");
  EXPECT_EQ(p->tx_bytes, 10u);
}

TEST(ServiceTrafficSource, SumsRowsByChain) {
  auto src = rmon::telemetry::ServiceTrafficSource::from_key("svc-a");
  ASSERT_NE(src, nullptr);
  EXPECT_EQ(src->command().filter.at("comment"), "rmon-svc:svc-a");

  std::vector<rmon::core::Record> rows{
      {{"chain", "postrouting"}, {"bytes", "100"}, {"packets", "1"}},
      {{"chain", "postrouting"}, {"bytes", "50"}, {"packets", "2"}},
      {{"chain", "prerouting"}, {"bytes", "400"}, {"packets", "4"}},
      {{"chain", "forward"}, {"bytes", "999"}, {"packets", "9"}},
  };
  auto p = src->build(rows, std::chrono::system_clock::now());
  ASSERT_TRUE(p);
  EXPECT_EQ(p->tx_bytes, 150u);
  EXPECT_EQ(p->tx_packets, 3u);
  EXPECT_EQ(p->rx_bytes, 400u);
  EXPECT_EQ(p->rx_packets, 4u);
  EXPECT_TRUE(p->router_id.empty());
}

TEST(ServiceTrafficSource, RouterQualifiedKey) {
  auto src = rmon::telemetry::ServiceTrafficSource::from_key("r2:svc-b");
  ASSERT_NE(src, nullptr);
  EXPECT_EQ(src->command().router_id, "r2");
  EXPECT_EQ(rmon::telemetry::ServiceTrafficSource::from_key(""), nullptr);
  EXPECT_EQ(rmon::telemetry::ServiceTrafficSource::from_key("r2:"), nullptr);
}

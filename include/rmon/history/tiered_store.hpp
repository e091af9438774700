#pragma once
/**
 * @file tiered_store.hpp
 * @brief Historical queries routed to one of three tiers by the age of the range start.
 *
 * Routing (age = now - start):
 *  - age <= hot_window            -> hot  (full resolution)
 *  - hot_window < age <= warm_window -> warm (5-minute source resolution)
 *  - otherwise                    -> cold (1-hour source resolution)
 *
 * Exactly one tier answers a query, even when the range crosses a boundary.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "rmon/compat/expected.hpp"
#include "rmon/config/constants.hpp"
#include "rmon/core/setup_error.hpp"
#include "rmon/history/history_point.hpp"
#include "rmon/history/metrics_tier.hpp"
#include "rmon/telemetry/interface_stats.hpp"

namespace rmon::history {

enum class TierKind : uint8_t { Hot, Warm, Cold };

const char* to_string(TierKind t) noexcept;

struct HistoryConfig {
    std::chrono::seconds hot_window{rmon::config::constants::HISTORY_HOT_WINDOW_SEC};
    std::chrono::seconds warm_window{rmon::config::constants::HISTORY_WARM_WINDOW_SEC};
    std::chrono::seconds warm_resolution{rmon::config::constants::HISTORY_WARM_RESOLUTION_SEC};
    std::chrono::seconds cold_resolution{rmon::config::constants::HISTORY_COLD_RESOLUTION_SEC};
    std::chrono::seconds cold_retention{rmon::config::constants::HISTORY_COLD_RETENTION_SEC};
    std::size_t          max_points{rmon::config::constants::HISTORY_MAX_POINTS};
};

struct TierSet {
    std::shared_ptr<MetricsTier> hot;
    std::shared_ptr<MetricsTier> warm;
    std::shared_ptr<MetricsTier> cold;
};

/// In-memory tiers at the configured resolutions.
TierSet make_in_memory_tiers(const HistoryConfig& cfg = {});

struct TimeRange {
    TimePoint start{};
    TimePoint end{};
};

/// Points moved or dropped by one compact() pass.
struct CompactionStats {
    std::size_t hot_rolled{0};   ///< Hot samples folded into warm buckets
    std::size_t warm_rolled{0};  ///< Warm samples folded into cold buckets
    std::size_t cold_evicted{0}; ///< Cold samples past retention
};

using Clock = std::function<TimePoint()>;

/** @class TieredMetricsStore
 *  @brief Query router, ingest point and compactor over a TierSet.
 */
class TieredMetricsStore final {
public:
    /**
     * @param clock Time source; empty selects system_clock::now.
     * @return MissingTier if any tier is null, InvalidConfig for unordered windows.
     */
    static rmon_detail::expected<std::unique_ptr<TieredMetricsStore>, core::SetupError>
    create(TierSet tiers, HistoryConfig cfg = {}, Clock clock = {});

    /**
     * @brief Series for @p resource over @p range at @p interval, at most max_points long.
     * @return InvalidInterval, InvalidRange (end < start), or TierUnavailable.
     */
    rmon_detail::expected<std::vector<HistoryPoint>, HistoryError>
    get_history(const std::string& resource, TimeRange range, std::string_view interval) const;

    /// Tier answering a query starting at @p start; boundaries belong to the lower tier.
    TierKind select_tier(TimePoint start, TimePoint now) const noexcept;

    /// Ingest one sample into the hot tier.
    void record(const std::string& resource, const HistoryPoint& p);

    /// Roll hot -> warm -> cold by age and apply cold retention.
    CompactionStats compact();

    const HistoryConfig& config() const noexcept { return cfg_; }
    TimePoint now() const { return clock_(); }

private:
    TieredMetricsStore(TierSet tiers, HistoryConfig cfg, Clock clock);

    const MetricsTier& tier(TierKind k) const noexcept;

    TierSet       tiers_;
    HistoryConfig cfg_;
    Clock         clock_;
    std::mutex    compact_mu_;
};

/// Counters and rates of an interface poll as a history sample.
HistoryPoint to_history_point(const telemetry::InterfaceStatsPoint& p);

} // namespace rmon::history

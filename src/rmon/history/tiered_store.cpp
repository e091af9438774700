/**
 * @file tiered_store.cpp
 * @brief TieredMetricsStore routing, ingestion and compaction.
 */
#include "rmon/history/tiered_store.hpp"
#include "rmon/history/interval.hpp"
#include "rmon/obs/log.hpp"

#include <utility>

namespace rmon::history {

namespace {

/// Fold each resource's samples into @p width windows aligned to the epoch.
std::size_t roll_into(const SeriesMap& batch, std::chrono::seconds width, MetricsTier& dest) {
    std::size_t moved = 0;
    for (const auto& [resource, points] : batch) {
        moved += points.size();
        for (const auto& p : bucket_by_time(points, TimePoint{}, width)) dest.append(resource, p);
    }
    return moved;
}

} // namespace

const char* to_string(TierKind t) noexcept {
    switch (t) {
        case TierKind::Hot:  return "hot";
        case TierKind::Warm: return "warm";
        case TierKind::Cold: return "cold";
    }
    return "unknown";
}

TierSet make_in_memory_tiers(const HistoryConfig& cfg) {
    return TierSet{
        std::make_shared<InMemoryTier>("hot", std::chrono::seconds{0}),
        std::make_shared<InMemoryTier>("warm", cfg.warm_resolution),
        std::make_shared<InMemoryTier>("cold", cfg.cold_resolution),
    };
}

rmon_detail::expected<std::unique_ptr<TieredMetricsStore>, core::SetupError>
TieredMetricsStore::create(TierSet tiers, HistoryConfig cfg, Clock clock) {
    if (!tiers.hot || !tiers.warm || !tiers.cold) {
        return rmon_detail::unexpected(core::SetupError::MissingTier);
    }
    if (cfg.hot_window.count() <= 0 || cfg.warm_window <= cfg.hot_window ||
        cfg.cold_retention <= cfg.warm_window || cfg.warm_resolution.count() <= 0 ||
        cfg.cold_resolution < cfg.warm_resolution) {
        return rmon_detail::unexpected(core::SetupError::InvalidConfig);
    }
    if (!clock) clock = [] { return std::chrono::system_clock::now(); };
    return std::unique_ptr<TieredMetricsStore>(
        new TieredMetricsStore(std::move(tiers), cfg, std::move(clock)));
}

TieredMetricsStore::TieredMetricsStore(TierSet tiers, HistoryConfig cfg, Clock clock)
    : tiers_(std::move(tiers)), cfg_(cfg), clock_(std::move(clock)) {}

TierKind TieredMetricsStore::select_tier(TimePoint start, TimePoint now) const noexcept {
    const auto age = now - start;
    if (age <= cfg_.hot_window)  return TierKind::Hot;
    if (age <= cfg_.warm_window) return TierKind::Warm;
    return TierKind::Cold;
}

const MetricsTier& TieredMetricsStore::tier(TierKind k) const noexcept {
    switch (k) {
        case TierKind::Hot:  return *tiers_.hot;
        case TierKind::Warm: return *tiers_.warm;
        case TierKind::Cold: break;
    }
    return *tiers_.cold;
}

rmon_detail::expected<std::vector<HistoryPoint>, HistoryError>
TieredMetricsStore::get_history(const std::string& resource, TimeRange range,
                                std::string_view interval) const {
    auto step = parse_interval(interval);
    if (!step) return rmon_detail::unexpected(step.error());
    if (range.end < range.start) return rmon_detail::unexpected(HistoryError::InvalidRange);

    const auto kind = select_tier(range.start, clock_());
    auto points = tier(kind).query(resource, range.start, range.end, *step);
    if (!points) {
        rmon::obs::logger()->warn("history: {} tier failed for {}: {}", to_string(kind), resource,
                                  to_string(points.error()));
        return rmon_detail::unexpected(HistoryError::TierUnavailable);
    }
    rmon::obs::logger()->debug("history: {} tier served {} point(s) for {}", to_string(kind),
                               points->size(), resource);
    return downsample(*points, cfg_.max_points);
}

void TieredMetricsStore::record(const std::string& resource, const HistoryPoint& p) {
    tiers_.hot->append(resource, p);
}

CompactionStats TieredMetricsStore::compact() {
    std::lock_guard<std::mutex> lk(compact_mu_);
    const auto now = clock_();
    CompactionStats stats;
    stats.hot_rolled   = roll_into(tiers_.hot->extract_before(now - cfg_.hot_window),
                                   cfg_.warm_resolution, *tiers_.warm);
    stats.warm_rolled  = roll_into(tiers_.warm->extract_before(now - cfg_.warm_window),
                                   cfg_.cold_resolution, *tiers_.cold);
    stats.cold_evicted = tiers_.cold->evict_before(now - cfg_.cold_retention);
    if (stats.hot_rolled || stats.warm_rolled || stats.cold_evicted) {
        rmon::obs::logger()->info("history: compacted hot={} warm={} evicted={}", stats.hot_rolled,
                                  stats.warm_rolled, stats.cold_evicted);
    }
    return stats;
}

HistoryPoint to_history_point(const telemetry::InterfaceStatsPoint& p) {
    HistoryPoint h;
    h.timestamp          = p.timestamp;
    h.tx_bytes           = static_cast<double>(p.tx_bytes);
    h.rx_bytes           = static_cast<double>(p.rx_bytes);
    h.tx_packets         = static_cast<double>(p.tx_packets);
    h.rx_packets         = static_cast<double>(p.rx_packets);
    h.tx_errors          = static_cast<double>(p.tx_errors);
    h.rx_errors          = static_cast<double>(p.rx_errors);
    h.tx_drops           = static_cast<double>(p.tx_drops);
    h.rx_drops           = static_cast<double>(p.rx_drops);
    h.tx_bytes_per_sec   = p.tx_bytes_per_sec;
    h.rx_bytes_per_sec   = p.rx_bytes_per_sec;
    h.tx_packets_per_sec = p.tx_packets_per_sec;
    h.rx_packets_per_sec = p.rx_packets_per_sec;
    return h;
}

} // namespace rmon::history

#pragma once
/**
 * @file metrics_tier.hpp
 * @brief Storage tier interface shared by hot, warm and cold history, plus the in-memory tier.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "rmon/compat/expected.hpp"
#include "rmon/history/history_point.hpp"

namespace rmon::history {

enum class HistoryError : uint8_t {
    InvalidInterval = 1, ///< Interval string empty, unparsable or not positive
    InvalidRange,        ///< End before start
    TierUnavailable      ///< The selected tier could not serve the query
};

const char* to_string(HistoryError e) noexcept;

using TimePoint = std::chrono::system_clock::time_point;

/// Samples of one or more resources keyed by resource id.
using SeriesMap = std::map<std::string, std::vector<HistoryPoint>>;

/** @class MetricsTier
 *  @brief One resolution of historical data. Tiers differ in resolution and medium only.
 */
class MetricsTier {
public:
    virtual ~MetricsTier() = default;

    virtual std::string_view name() const noexcept = 0;

    /// Source resolution; zero means samples are stored as polled.
    virtual std::chrono::seconds resolution() const noexcept = 0;

    /**
     * @brief Chronological samples of @p resource with start <= t <= end.
     * @param interval Requested spacing; coarser than resolution() averages samples into
     *        windows of that width aligned to @p start. Windows without samples are absent.
     */
    virtual rmon_detail::expected<std::vector<HistoryPoint>, HistoryError>
    query(const std::string& resource, TimePoint start, TimePoint end,
          std::chrono::nanoseconds interval) const = 0;

    virtual void append(const std::string& resource, const HistoryPoint& p) = 0;

    /// Remove and return every sample older than @p cutoff.
    virtual SeriesMap extract_before(TimePoint cutoff) = 0;

    /// Drop every sample older than @p cutoff; returns the number dropped.
    virtual std::size_t evict_before(TimePoint cutoff) = 0;
};

/** @class InMemoryTier
 *  @brief Thread-safe tier keeping one sorted vector per resource.
 */
class InMemoryTier final : public MetricsTier {
public:
    InMemoryTier(std::string name, std::chrono::seconds resolution);

    std::string_view     name() const noexcept override { return name_; }
    std::chrono::seconds resolution() const noexcept override { return resolution_; }

    rmon_detail::expected<std::vector<HistoryPoint>, HistoryError>
    query(const std::string& resource, TimePoint start, TimePoint end,
          std::chrono::nanoseconds interval) const override;

    void        append(const std::string& resource, const HistoryPoint& p) override;
    SeriesMap   extract_before(TimePoint cutoff) override;
    std::size_t evict_before(TimePoint cutoff) override;

    /// Samples held for @p resource.
    std::size_t size(const std::string& resource) const;

private:
    const std::string          name_;
    const std::chrono::seconds resolution_;

    mutable std::mutex mu_;
    SeriesMap          series_;
};

} // namespace rmon::history

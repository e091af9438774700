#pragma once
/**
 * @file history_point.hpp
 * @brief Historical sample, its averaged fields, bucket averaging and downsampling.
 */

#include <array>
#include <chrono>
#include <cstddef>
#include <span>
#include <vector>

namespace rmon::history {

/** @struct HistoryPoint
 *  @brief One stored sample (or the average of several). All numeric fields are averaged
 *         the same way, rates included, so bursts are smoothed by downsampling.
 */
struct HistoryPoint {
    std::chrono::system_clock::time_point timestamp{};

    double tx_bytes{0}, rx_bytes{0};
    double tx_packets{0}, rx_packets{0};
    double tx_errors{0}, rx_errors{0};
    double tx_drops{0}, rx_drops{0};

    double tx_bytes_per_sec{0}, rx_bytes_per_sec{0};
    double tx_packets_per_sec{0}, rx_packets_per_sec{0};
};

/// Every numeric field of HistoryPoint; averaging iterates this list.
inline constexpr std::array<double HistoryPoint::*, 12> kNumericFields{
    &HistoryPoint::tx_bytes,         &HistoryPoint::rx_bytes,
    &HistoryPoint::tx_packets,       &HistoryPoint::rx_packets,
    &HistoryPoint::tx_errors,        &HistoryPoint::rx_errors,
    &HistoryPoint::tx_drops,         &HistoryPoint::rx_drops,
    &HistoryPoint::tx_bytes_per_sec, &HistoryPoint::rx_bytes_per_sec,
    &HistoryPoint::tx_packets_per_sec, &HistoryPoint::rx_packets_per_sec,
};

/**
 * @brief Mean of every numeric field; timestamp of the middle element (index size/2).
 * @return Default point for an empty bucket.
 */
HistoryPoint average_bucket(std::span<const HistoryPoint> bucket);

/**
 * @brief Reduce @p points to at most @p max_points.
 * @details Unchanged when already small enough. Otherwise contiguous buckets of
 *          ceil(size / max_points) points, each replaced by average_bucket(). Order kept.
 *          max_points == 0 yields an empty series.
 */
std::vector<HistoryPoint> downsample(const std::vector<HistoryPoint>& points, std::size_t max_points);

/// Average points into windows of @p width aligned to @p origin; empty windows are skipped.
std::vector<HistoryPoint> bucket_by_time(const std::vector<HistoryPoint>& sorted,
                                         std::chrono::system_clock::time_point origin,
                                         std::chrono::nanoseconds width);

} // namespace rmon::history

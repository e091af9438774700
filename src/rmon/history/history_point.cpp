/**
 * @file history_point.cpp
 * @brief Bucket averaging and downsampling.
 */
#include "rmon/history/history_point.hpp"

#include <algorithm>

namespace rmon::history {

HistoryPoint average_bucket(std::span<const HistoryPoint> bucket) {
    HistoryPoint out;
    if (bucket.empty()) return out;
    out.timestamp = bucket[bucket.size() / 2].timestamp;
    const double n = static_cast<double>(bucket.size());
    for (auto field : kNumericFields) {
        double sum = 0.0;
        for (const auto& p : bucket) sum += p.*field;
        out.*field = sum / n;
    }
    return out;
}

std::vector<HistoryPoint> downsample(const std::vector<HistoryPoint>& points, std::size_t max_points) {
    if (max_points == 0) return {};
    if (points.size() <= max_points) return points;

    const std::size_t n    = points.size();
    const std::size_t size = (n + max_points - 1) / max_points;
    std::vector<HistoryPoint> out;
    out.reserve((n + size - 1) / size);
    for (std::size_t start = 0; start < n; start += size) {
        const std::size_t len = std::min(size, n - start);
        out.push_back(average_bucket(std::span<const HistoryPoint>(points.data() + start, len)));
    }
    return out;
}

std::vector<HistoryPoint> bucket_by_time(const std::vector<HistoryPoint>& sorted,
                                         std::chrono::system_clock::time_point origin,
                                         std::chrono::nanoseconds width) {
    if (width.count() <= 0 || sorted.empty()) return sorted;

    auto window_of = [&](const HistoryPoint& p) {
        const auto d = std::chrono::duration_cast<std::chrono::nanoseconds>(p.timestamp - origin);
        // Floor division so samples before origin land in negative windows.
        auto q = d / width;
        if (d.count() < 0 && d % width != std::chrono::nanoseconds::zero()) --q;
        return q;
    };

    std::vector<HistoryPoint> out;
    std::size_t begin = 0;
    while (begin < sorted.size()) {
        const auto w = window_of(sorted[begin]);
        std::size_t end = begin + 1;
        while (end < sorted.size() && window_of(sorted[end]) == w) ++end;
        out.push_back(average_bucket(std::span<const HistoryPoint>(sorted.data() + begin, end - begin)));
        begin = end;
    }
    return out;
}

} // namespace rmon::history

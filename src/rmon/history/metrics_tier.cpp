/**
 * @file metrics_tier.cpp
 * @brief InMemoryTier implementation.
 */
#include "rmon/history/metrics_tier.hpp"

#include <algorithm>
#include <utility>

namespace rmon::history {

namespace {

bool earlier(const HistoryPoint& a, const HistoryPoint& b) noexcept { return a.timestamp < b.timestamp; }

} // namespace

const char* to_string(HistoryError e) noexcept {
    switch (e) {
        case HistoryError::InvalidInterval: return "invalid_interval";
        case HistoryError::InvalidRange:    return "invalid_range";
        case HistoryError::TierUnavailable: return "tier_unavailable";
    }
    return "unknown";
}

InMemoryTier::InMemoryTier(std::string name, std::chrono::seconds resolution)
    : name_(std::move(name)), resolution_(resolution) {}

rmon_detail::expected<std::vector<HistoryPoint>, HistoryError>
InMemoryTier::query(const std::string& resource, TimePoint start, TimePoint end,
                    std::chrono::nanoseconds interval) const {
    std::vector<HistoryPoint> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = series_.find(resource);
        if (it == series_.end()) return out;
        const auto& s = it->second;
        HistoryPoint lo, hi;
        lo.timestamp = start;
        hi.timestamp = end;
        auto first = std::lower_bound(s.begin(), s.end(), lo, earlier);
        auto last  = std::upper_bound(first, s.end(), hi, earlier);
        out.assign(first, last);
    }
    if (interval > resolution_) return bucket_by_time(out, start, interval);
    return out;
}

void InMemoryTier::append(const std::string& resource, const HistoryPoint& p) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& s = series_[resource];
    // Usually appended in order; upper_bound keeps equal timestamps in arrival order.
    s.insert(std::upper_bound(s.begin(), s.end(), p, earlier), p);
}

SeriesMap InMemoryTier::extract_before(TimePoint cutoff) {
    SeriesMap out;
    std::lock_guard<std::mutex> lk(mu_);
    HistoryPoint edge;
    edge.timestamp = cutoff;
    for (auto it = series_.begin(); it != series_.end();) {
        auto& s   = it->second;
        auto  cut = std::lower_bound(s.begin(), s.end(), edge, earlier);
        if (cut != s.begin()) {
            out[it->first].assign(std::make_move_iterator(s.begin()), std::make_move_iterator(cut));
            s.erase(s.begin(), cut);
        }
        it = s.empty() ? series_.erase(it) : std::next(it);
    }
    return out;
}

std::size_t InMemoryTier::evict_before(TimePoint cutoff) {
    std::size_t dropped = 0;
    for (const auto& [k, v] : extract_before(cutoff)) dropped += v.size();
    return dropped;
}

std::size_t InMemoryTier::size(const std::string& resource) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = series_.find(resource);
    return it == series_.end() ? 0 : it->second.size();
}

} // namespace rmon::history

#pragma once

/**
 * RateEstimator.hpp
 *
 * Smoothed transfer rate and ETA for progress reporting.
 */

#include <chrono>
#include <cstdint>
#include <optional>

namespace wum::core::transfer {

/**
 * RateEstimator - exponential moving average of bytes/second
 *
 * alpha = 1/3 weighs roughly the last five samples.
 */
class RateEstimator {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    static constexpr double ALPHA = 1.0 / 3.0;

    /**
     * Start over (new attempt or new copy)
     */
    void reset(int64_t bytes, TimePoint now);

    /**
     * Feed a cumulative byte count
     * @return Smoothed rate in bytes/second
     */
    double sample(int64_t bytes, TimePoint now);

    double rate() const { return m_rate; }

    /**
     * Remaining time at the current rate; empty without a total or a rate
     */
    std::optional<std::chrono::seconds> eta(int64_t bytes, std::optional<int64_t> total) const;

private:
    int64_t m_lastBytes{0};
    TimePoint m_lastTime{};
    double m_rate{0.0};
    bool m_hasRate{false};
};

} // namespace wum::core::transfer

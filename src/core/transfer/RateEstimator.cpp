/**
 * RateEstimator.cpp
 */

#include "RateEstimator.hpp"

#include <cmath>

namespace wum::core::transfer {

void RateEstimator::reset(int64_t bytes, TimePoint now) {
    m_lastBytes = bytes;
    m_lastTime = now;
    m_rate = 0.0;
    m_hasRate = false;
}

double RateEstimator::sample(int64_t bytes, TimePoint now) {
    auto elapsed = std::chrono::duration<double>(now - m_lastTime).count();
    if (elapsed <= 0.0 || bytes < m_lastBytes) {
        return m_rate;
    }

    double instant = static_cast<double>(bytes - m_lastBytes) / elapsed;
    m_rate = m_hasRate ? ALPHA * instant + (1.0 - ALPHA) * m_rate : instant;
    m_hasRate = true;

    m_lastBytes = bytes;
    m_lastTime = now;
    return m_rate;
}

std::optional<std::chrono::seconds> RateEstimator::eta(int64_t bytes, std::optional<int64_t> total) const {
    if (!total || m_rate <= 0.0) {
        return std::nullopt;
    }
    int64_t remaining = *total > bytes ? *total - bytes : 0;
    return std::chrono::seconds(static_cast<int64_t>(std::ceil(static_cast<double>(remaining) / m_rate)));
}

} // namespace wum::core::transfer

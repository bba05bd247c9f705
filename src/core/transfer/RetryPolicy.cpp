/**
 * RetryPolicy.cpp
 */

#include "RetryPolicy.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>

namespace wum::core::transfer {

bool isRecoverable(FailureKind kind) {
    switch (kind) {
        case FailureKind::NetworkTimeout:
        case FailureKind::NetworkError:
        case FailureKind::TransientServerError:
        case FailureKind::PartialTransfer:
        case FailureKind::StalledTransfer:
        case FailureKind::IoError:
            return true;
        default:
            return false;
    }
}

RetryPolicy::RetryPolicy(RetryOptions options)
    : m_options(options) {
    m_options.maxRetries = std::max(0, m_options.maxRetries);
    if (m_options.baseDelay.count() < 0) {
        m_options.baseDelay = std::chrono::milliseconds(0);
    }
    if (m_options.maxDelay < m_options.baseDelay) {
        m_options.maxDelay = m_options.baseDelay;
    }
}

RetryDecision RetryPolicy::decide(int attempt, FailureKind kind) const {
    RetryDecision decision;
    if (!isRecoverable(kind) || attempt > m_options.maxRetries) {
        return decision;
    }
    decision.retry = true;
    decision.delay = delayFor(attempt);
    return decision;
}

std::chrono::milliseconds RetryPolicy::delayFor(int attempt) const {
    const int64_t base = m_options.baseDelay.count();
    const int64_t cap = m_options.maxDelay.count();
    attempt = std::max(1, attempt);

    int64_t delay = base;
    switch (m_options.strategy) {
        case BackoffStrategy::Fixed:
            break;
        case BackoffStrategy::Linear:
            delay = base * attempt;
            break;
        case BackoffStrategy::Exponential:
            // Doubling past the cap would overflow long before attempt 63
            for (int i = 1; i < attempt && delay < cap; ++i) {
                delay *= 2;
            }
            break;
    }

    return std::chrono::milliseconds(std::min(delay, cap));
}

BackoffStrategy RetryPolicy::parseStrategy(const std::string& name, BackoffStrategy fallback) {
    auto lower = utils::StringUtils::toLower(utils::StringUtils::trim(name));
    if (lower == "fixed") return BackoffStrategy::Fixed;
    if (lower == "linear") return BackoffStrategy::Linear;
    if (lower == "exponential") return BackoffStrategy::Exponential;
    return fallback;
}

} // namespace wum::core::transfer

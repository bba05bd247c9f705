#pragma once

/**
 * RetryPolicy.hpp
 *
 * Decides whether a failed transfer attempt is retried and how long the
 * worker waits before the next attempt.
 */

#include "../models/Models.hpp"

#include <chrono>
#include <string>

namespace wum::core::transfer {

enum class BackoffStrategy {
    Fixed,        // baseDelay every time
    Linear,       // baseDelay * attempt
    Exponential   // baseDelay * 2^(attempt - 1)
};

struct RetryOptions {
    int maxRetries{3};
    BackoffStrategy strategy{BackoffStrategy::Exponential};
    std::chrono::milliseconds baseDelay{2000};
    std::chrono::milliseconds maxDelay{60000};
};

struct RetryDecision {
    bool retry{false};
    std::chrono::milliseconds delay{0};
};

/**
 * True for failures that may go away on their own (network, server, stall)
 */
bool isRecoverable(FailureKind kind);

/**
 * RetryPolicy - pure function of (attempt, failure kind)
 *
 * Holds no per-task state, so one instance is shared by every worker.
 */
class RetryPolicy {
public:
    RetryPolicy() = default;
    explicit RetryPolicy(RetryOptions options);

    /**
     * Decide what to do after a failed attempt
     * @param attempt Number of the attempt that just failed (1-based)
     * @param kind Failure classification of that attempt
     * @return Whether to retry, and the delay before the next attempt
     */
    RetryDecision decide(int attempt, FailureKind kind) const;

    /**
     * Delay before the attempt following attempt number `attempt`
     */
    std::chrono::milliseconds delayFor(int attempt) const;

    const RetryOptions& options() const { return m_options; }

    static BackoffStrategy parseStrategy(const std::string& name,
                                         BackoffStrategy fallback = BackoffStrategy::Exponential);

private:
    RetryOptions m_options;
};

} // namespace wum::core::transfer

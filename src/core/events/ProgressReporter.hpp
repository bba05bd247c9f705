#pragma once

/**
 * ProgressReporter.hpp
 *
 * Sink for structured status and progress events of the transfer engine.
 */

#include "../models/Models.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace wum::core::events {

struct TransferProgress {
    std::string id;
    int attempt{0};
    int64_t bytesTransferred{0};
    std::optional<int64_t> bytesTotal;
    double bytesPerSecond{0.0};
    std::optional<std::chrono::seconds> eta;   // empty while the total is unknown
};

struct CopyProgress {
    std::string jobId;
    std::string artifactId;
    int64_t bytesCopied{0};
    int64_t bytesTotal{0};
    double bytesPerSecond{0.0};
    std::optional<std::chrono::seconds> eta;
};

/**
 * ProgressReporter - implemented by whatever presents progress (CLI, UI, log)
 *
 * Transfer events arrive on the queue's coordinator thread, copy events on
 * the copy worker; per task/job they are delivered in order.
 */
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void onTransferState(const TransferTask& task) = 0;
    virtual void onTransferProgress(const TransferProgress& progress) = 0;
    virtual void onCopyState(const CopyJob& job) = 0;
    virtual void onCopyProgress(const CopyProgress& progress) = 0;
};

} // namespace wum::core::events

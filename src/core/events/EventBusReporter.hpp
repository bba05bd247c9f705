#pragma once

/**
 * EventBusReporter.hpp
 *
 * Publishes engine progress onto an EventBus as JSON payloads.
 */

#include "ProgressReporter.hpp"
#include "../EventBus.hpp"

namespace wum::core::events {

// Topics
inline constexpr const char* TRANSFER_STATE = "transfer.state";
inline constexpr const char* TRANSFER_PROGRESS = "transfer.progress";
inline constexpr const char* COPY_STATE = "copy.state";
inline constexpr const char* COPY_PROGRESS = "copy.progress";

/**
 * EventBusReporter - default ProgressReporter
 *
 * Every payload carries "id" (task id or copy job id) so subscribers can
 * use EventBus::subscribe(topic, key, cb).
 */
class EventBusReporter : public ProgressReporter {
public:
    explicit EventBusReporter(EventBus& bus) : m_bus(bus) {}

    void onTransferState(const TransferTask& task) override;
    void onTransferProgress(const TransferProgress& progress) override;
    void onCopyState(const CopyJob& job) override;
    void onCopyProgress(const CopyProgress& progress) override;

    static json toJson(const TransferTask& task);
    static json toJson(const CopyJob& job);

private:
    EventBus& m_bus;
};

} // namespace wum::core::events

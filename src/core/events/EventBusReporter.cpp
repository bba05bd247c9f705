/**
 * EventBusReporter.cpp
 */

#include "EventBusReporter.hpp"

namespace wum::core::events {

namespace {

json optionalSeconds(const std::optional<std::chrono::seconds>& value) {
    return value ? json(value->count()) : json(nullptr);
}

} // namespace

json EventBusReporter::toJson(const TransferTask& task) {
    json j = {
        {"id", task.id},
        {"title", task.title},
        {"state", toString(task.state)},
        {"attempt", task.attempt},
        {"bytes", task.bytesTransferred},
        {"total", task.bytesTotal ? json(*task.bytesTotal) : json(nullptr)},
        {"path", task.targetPath.string()}
    };
    if (task.lastError.isSet()) {
        j["error"] = {
            {"kind", toString(task.lastError.kind)},
            {"message", task.lastError.message}
        };
    }
    if (!task.artifactPath.empty()) {
        j["artifact"] = task.artifactPath.string();
    }
    return j;
}

json EventBusReporter::toJson(const CopyJob& job) {
    json j = {
        {"id", job.id},
        {"artifactId", job.artifactId},
        {"state", toString(job.state)},
        {"bytes", job.bytesCopied},
        {"total", job.bytesTotal},
        {"source", job.sourcePath.string()},
        {"destination", job.destPath.string()},
        {"mount", job.mountPath.string()}
    };
    if (job.error.isSet()) {
        j["error"] = {
            {"kind", toString(job.error.kind)},
            {"message", job.error.message}
        };
    }
    return j;
}

void EventBusReporter::onTransferState(const TransferTask& task) {
    m_bus.emit(TRANSFER_STATE, toJson(task));
}

void EventBusReporter::onTransferProgress(const TransferProgress& progress) {
    m_bus.emit(TRANSFER_PROGRESS, {
        {"id", progress.id},
        {"attempt", progress.attempt},
        {"bytes", progress.bytesTransferred},
        {"total", progress.bytesTotal ? json(*progress.bytesTotal) : json(nullptr)},
        {"rate", progress.bytesPerSecond},
        {"eta", optionalSeconds(progress.eta)}
    });
}

void EventBusReporter::onCopyState(const CopyJob& job) {
    m_bus.emit(COPY_STATE, toJson(job));
}

void EventBusReporter::onCopyProgress(const CopyProgress& progress) {
    m_bus.emit(COPY_PROGRESS, {
        {"id", progress.jobId},
        {"artifactId", progress.artifactId},
        {"bytes", progress.bytesCopied},
        {"total", progress.bytesTotal},
        {"rate", progress.bytesPerSecond},
        {"eta", optionalSeconds(progress.eta)}
    });
}

} // namespace wum::core::events

#pragma once

/**
 * DownloadQueue.hpp
 *
 * Admission-controlled download scheduler with retry, stall detection,
 * archive post-processing and deduplication against the artifact store.
 */

#include "../models/Models.hpp"
#include "../ThreadPool.hpp"
#include "../events/ProgressReporter.hpp"
#include "../store/ArtifactStore.hpp"
#include "../store/ChecksumProvider.hpp"
#include "RetryPolicy.hpp"
#include "RateEstimator.hpp"
#include "TransferSource.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace wum::core::transfer {

enum class EnqueueStatus {
    Accepted,
    DuplicateRequest,   // a non-terminal task for the id exists
    AlreadyAcquired     // the artifact store has the id and its file exists
};

struct EnqueueResult {
    EnqueueStatus status{EnqueueStatus::Accepted};
    std::optional<TransferTask> task;         // set when accepted or duplicate
    std::optional<ArtifactRecord> artifact;   // set when already acquired

    bool accepted() const { return status == EnqueueStatus::Accepted; }
};

struct QueueOptions {
    size_t maxConcurrent{1};
    // Minimum gap between an admission and the later of the previous
    // admission and the previous completion
    std::chrono::milliseconds admissionDelay{10000};
    // No progress for this long aborts the attempt; 0 disables
    std::chrono::milliseconds stallTimeout{120000};
    std::filesystem::path downloadDirectory;
    bool extractArchives{true};
    bool removeArchiveAfterExtract{true};
    std::vector<std::string> imageFormats{".wbfs", ".iso", ".rvz"};
    // Coordinator wake-up interval for stall checks
    std::chrono::milliseconds tick{250};
};

/**
 * Collaborators of a DownloadQueue; source and checksums are required
 */
struct QueueServices {
    std::shared_ptr<store::ArtifactStore> store;
    std::shared_ptr<TransferSource> source;
    std::shared_ptr<ArchiveExtractor> extractor;
    std::shared_ptr<store::ChecksumProvider> checksums;
    std::shared_ptr<events::ProgressReporter> reporter;
};

/**
 * DownloadQueue - bounded-concurrency transfer scheduler
 *
 * Features:
 * - FIFO admission with "download now" priority
 * - Concurrency limit and inter-admission delay
 * - Retry in place according to RetryPolicy
 * - Stall detection through the progress callback
 * - ZIP extraction and artifact recording on success
 *
 * Threading: one coordinator thread admits tasks, detects stalls and
 * delivers events; a worker pool of maxConcurrent threads runs the attempt
 * loops. All task state lives under a single mutex and callers only ever see
 * copies.
 */
class DownloadQueue {
public:
    DownloadQueue(QueueOptions options, RetryPolicy retryPolicy, QueueServices services);

    /**
     * Destructor - cancels outstanding work and joins all threads
     */
    ~DownloadQueue();

    DownloadQueue(const DownloadQueue&) = delete;
    DownloadQueue& operator=(const DownloadQueue&) = delete;

    /**
     * Start the coordinator and workers; removes leftover .part files
     */
    void initialize();

    /**
     * Cancel everything and stop all threads
     */
    void shutdown();

    /**
     * Request a download
     * @param id Catalog item id
     * @param priority Immediate puts the task at the front of the queue
     * @param title Human-readable title, used for device naming
     * @param sizeHint Expected size from the catalog, until the source reports one
     * @return Accepted with the new task, or the reason for rejection
     */
    EnqueueResult enqueue(const std::string& id,
                          Priority priority = Priority::Normal,
                          const std::string& title = "",
                          std::optional<int64_t> sizeHint = std::nullopt);

    /**
     * Cancel a task; no-op for terminal or unknown ids
     * @return true if the task was queued or active
     */
    bool cancel(const std::string& id);

    void pause();
    void resume();
    bool isPaused() const;

    /**
     * Move a queued task to the front of the queue
     * @return false if the task is not queued
     */
    bool prioritize(const std::string& id);

    /**
     * Forget a terminal task
     * @return false if the task is unknown or still running
     */
    bool dismiss(const std::string& id);

    /**
     * Dismiss a failed or cancelled task and enqueue it again
     */
    EnqueueResult retry(const std::string& id);

    std::optional<TransferTask> getTask(const std::string& id) const;
    std::vector<TransferTask> tasks() const;

    size_t activeCount() const;
    size_t queuedCount() const;

    /**
     * Block until nothing is queued or active and every event was delivered
     * @return false on timeout
     */
    bool waitForIdle(std::chrono::milliseconds timeout);

    const QueueOptions& options() const { return m_options; }

private:
    using SteadyClock = std::chrono::steady_clock;

    struct Entry {
        TransferTask task;
        std::optional<int64_t> sizeHint;
        bool cancelRequested{false};
        bool transferring{false};
        bool stalled{false};
        SteadyClock::time_point lastProgress{};
        SteadyClock::time_point lastProgressEvent{};
        RateEstimator rate;
    };

    struct PendingEvent {
        bool isProgress{false};
        TransferTask task;
        events::TransferProgress progress;
    };

    struct PostProcessResult {
        bool success{true};
        std::filesystem::path artifactPath;
        Failure failure;
    };

    void coordinatorLoop();
    std::optional<SteadyClock::time_point> admitLocked(SteadyClock::time_point now);
    void detectStallsLocked(SteadyClock::time_point now);
    void deliver(std::unique_lock<std::mutex>& lock);

    void runTask(const std::string& id);
    FetchOutcome runAttempt(Entry& entry, const std::filesystem::path& partPath);
    PostProcessResult postProcess(const std::filesystem::path& target);
    void completeTask(Entry& entry, const std::filesystem::path& target);
    void recordArtifact(const TransferTask& task, const std::filesystem::path& artifactPath);
    void discardDownload(const std::filesystem::path& target);

    void transitionLocked(Entry& entry, TransferState next);
    void finishLocked(Entry& entry, TransferState state, const Failure& failure = {});
    void pushStateLocked(const Entry& entry);
    void pushProgressLocked(const Entry& entry);
    bool idleLocked() const;

    std::filesystem::path targetPathFor(const std::string& id) const;
    void purgePartialFiles();

private:
    QueueOptions m_options;
    RetryPolicy m_retryPolicy;
    QueueServices m_services;

    std::unordered_map<std::string, std::unique_ptr<Entry>> m_entries;
    std::vector<std::string> m_order;       // enqueue order, for tasks()
    std::deque<std::string> m_pending;      // queued ids, front is admitted next
    std::deque<PendingEvent> m_outbox;

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;       // coordinator wake-up
    std::condition_variable m_retryCondition;  // interruptible retry waits
    std::condition_variable m_idleCondition;

    size_t m_activeCount{0};
    bool m_paused{false};
    bool m_running{false};
    bool m_stopping{false};
    bool m_delivering{false};
    std::optional<SteadyClock::time_point> m_lastAdmission;
    std::optional<SteadyClock::time_point> m_lastCompletion;

    std::unique_ptr<ThreadPool> m_threadPool;
    std::thread m_coordinator;
};

const char* toString(EnqueueStatus status);

} // namespace wum::core::transfer

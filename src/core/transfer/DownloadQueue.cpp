/**
 * DownloadQueue.cpp
 *
 * Implementation of the download scheduler.
 */

#include "DownloadQueue.hpp"
#include "../Logger.hpp"
#include "../device/DiscImage.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <stdexcept>

namespace wum::core::transfer {

namespace fs = std::filesystem;

namespace {

// Progress events are rate-limited per task; the last byte always goes out
constexpr auto PROGRESS_EVENT_INTERVAL = std::chrono::milliseconds(100);

bool isAllowed(TransferState from, TransferState to) {
    switch (from) {
        case TransferState::Queued:
            return to == TransferState::Active || to == TransferState::Cancelled;
        case TransferState::Active:
            return to == TransferState::Succeeded || to == TransferState::Failed ||
                   to == TransferState::Cancelled;
        default:
            return false;
    }
}

} // namespace

const char* toString(EnqueueStatus status) {
    switch (status) {
        case EnqueueStatus::Accepted:         return "Accepted";
        case EnqueueStatus::DuplicateRequest: return "DuplicateRequest";
        case EnqueueStatus::AlreadyAcquired:  return "AlreadyAcquired";
    }
    return "Unknown";
}

DownloadQueue::DownloadQueue(QueueOptions options, RetryPolicy retryPolicy, QueueServices services)
    : m_options(std::move(options))
    , m_retryPolicy(std::move(retryPolicy))
    , m_services(std::move(services)) {

    if (!m_services.source || !m_services.checksums) {
        throw std::invalid_argument("DownloadQueue needs a transfer source and a checksum provider");
    }
    if (!m_services.store) {
        m_services.store = std::make_shared<store::ArtifactStore>();
    }
    if (m_options.maxConcurrent == 0) {
        m_options.maxConcurrent = 1;
    }
    for (auto& ext : m_options.imageFormats) {
        ext = utils::StringUtils::toLower(ext);
    }
}

DownloadQueue::~DownloadQueue() {
    shutdown();
}

void DownloadQueue::initialize() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) return;
        if (m_stopping) {
            throw std::runtime_error("DownloadQueue cannot be restarted after shutdown");
        }
        m_running = true;
    }

    Logger::instance().info("Initializing DownloadQueue in {} ({} concurrent, {} ms delay)",
                            m_options.downloadDirectory.string(), m_options.maxConcurrent,
                            m_options.admissionDelay.count());

    if (!m_options.downloadDirectory.empty() &&
        !utils::FileUtils::createDirectories(m_options.downloadDirectory)) {
        Logger::instance().error("Cannot create download directory {}", m_options.downloadDirectory.string());
    }
    purgePartialFiles();

    m_threadPool = std::make_unique<ThreadPool>(m_options.maxConcurrent);
    m_coordinator = std::thread([this] { coordinatorLoop(); });
}

void DownloadQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;

        while (!m_pending.empty()) {
            auto& entry = *m_entries.at(m_pending.front());
            m_pending.pop_front();
            finishLocked(entry, TransferState::Cancelled, {FailureKind::Cancelled, "Queue shut down"});
        }
        for (auto& [id, entry] : m_entries) {
            if (entry->task.state == TransferState::Active) {
                entry->cancelRequested = true;
            }
        }
    }

    m_condition.notify_all();
    m_retryCondition.notify_all();

    if (m_coordinator.joinable()) {
        m_coordinator.join();
    }
    m_threadPool.reset();

    // Deliver whatever the coordinator did not
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_outbox.empty()) {
        deliver(lock);
    }
    if (m_running) {
        m_running = false;
        Logger::instance().info("DownloadQueue stopped");
    }
}

EnqueueResult DownloadQueue::enqueue(const std::string& id, Priority priority,
                                     const std::string& title, std::optional<int64_t> sizeHint) {
    if (id.empty()) {
        throw std::invalid_argument("Cannot enqueue an empty id");
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_stopping) {
        throw std::runtime_error("DownloadQueue is shut down");
    }

    EnqueueResult result;

    auto existing = m_entries.find(id);
    if (existing != m_entries.end() && !existing->second->task.isTerminal()) {
        Logger::instance().info("Download {} is already {}", id, toString(existing->second->task.state));
        result.status = EnqueueStatus::DuplicateRequest;
        result.task = existing->second->task;
        return result;
    }

    if (auto record = m_services.store->lookup(id)) {
        if (utils::FileUtils::fileExists(record->path)) {
            Logger::instance().info("Download {} already acquired at {}", id, record->path.string());
            result.status = EnqueueStatus::AlreadyAcquired;
            result.artifact = record;
            return result;
        }
        Logger::instance().warn("Artifact {} is gone from {}, downloading again", id, record->path.string());
        m_services.store->remove(id);
    }

    // A terminal task for the same id is superseded by the new request
    if (existing != m_entries.end()) {
        m_entries.erase(existing);
        m_order.erase(std::remove(m_order.begin(), m_order.end(), id), m_order.end());
    }

    auto entry = std::make_unique<Entry>();
    entry->task.id = id;
    entry->task.title = title;
    entry->task.targetPath = targetPathFor(id);
    entry->task.priority = priority;
    entry->task.enqueuedAt = Clock::now();
    entry->task.bytesTotal = sizeHint;
    entry->sizeHint = sizeHint;

    if (priority == Priority::Immediate) {
        m_pending.push_front(id);
    } else {
        m_pending.push_back(id);
    }
    m_order.push_back(id);

    pushStateLocked(*entry);
    result.task = entry->task;
    m_entries.emplace(id, std::move(entry));

    Logger::instance().info("Queued download {}{}", id, priority == Priority::Immediate ? " (immediate)" : "");
    m_condition.notify_all();
    return result;
}

bool DownloadQueue::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second->task.isTerminal()) {
        return false;
    }

    auto& entry = *it->second;
    if (entry.task.state == TransferState::Queued) {
        m_pending.erase(std::remove(m_pending.begin(), m_pending.end(), id), m_pending.end());
        finishLocked(entry, TransferState::Cancelled, {FailureKind::Cancelled, "Cancelled by user"});
        Logger::instance().info("Cancelled queued download {}", id);
        return true;
    }

    if (!entry.cancelRequested) {
        entry.cancelRequested = true;
        Logger::instance().info("Cancelling download {}", id);
    }
    m_retryCondition.notify_all();
    return true;
}

void DownloadQueue::pause() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_paused) {
        m_paused = true;
        Logger::instance().info("Download queue paused");
    }
}

void DownloadQueue::resume() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_paused) return;
        m_paused = false;
        Logger::instance().info("Download queue resumed");
    }
    m_condition.notify_all();
}

bool DownloadQueue::isPaused() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_paused;
}

bool DownloadQueue::prioritize(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = std::find(m_pending.begin(), m_pending.end(), id);
    if (it == m_pending.end()) {
        return false;
    }

    m_pending.erase(it);
    m_pending.push_front(id);
    m_entries.at(id)->task.priority = Priority::Immediate;
    m_condition.notify_all();
    return true;
}

bool DownloadQueue::dismiss(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(id);
    if (it == m_entries.end() || !it->second->task.isTerminal()) {
        return false;
    }

    m_entries.erase(it);
    m_order.erase(std::remove(m_order.begin(), m_order.end(), id), m_order.end());
    return true;
}

EnqueueResult DownloadQueue::retry(const std::string& id) {
    Priority priority = Priority::Normal;
    std::string title;
    std::optional<int64_t> sizeHint;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_entries.find(id);
        if (it != m_entries.end()) {
            const auto& task = it->second->task;
            priority = task.priority;
            title = task.title;
            sizeHint = it->second->sizeHint;

            if (task.state == TransferState::Failed || task.state == TransferState::Cancelled) {
                m_entries.erase(it);
                m_order.erase(std::remove(m_order.begin(), m_order.end(), id), m_order.end());
            }
        }
    }

    return enqueue(id, priority, title, sizeHint);
}

std::optional<TransferTask> DownloadQueue::getTask(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second->task;
}

std::vector<TransferTask> DownloadQueue::tasks() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<TransferTask> result;
    result.reserve(m_order.size());
    for (const auto& id : m_order) {
        result.push_back(m_entries.at(id)->task);
    }
    return result;
}

size_t DownloadQueue::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_activeCount;
}

size_t DownloadQueue::queuedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

bool DownloadQueue::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCondition.wait_for(lock, timeout, [this] { return idleLocked(); });
}

bool DownloadQueue::idleLocked() const {
    return m_pending.empty() && m_activeCount == 0 && m_outbox.empty() && !m_delivering;
}

//=============================================================================
// Coordinator
//=============================================================================

void DownloadQueue::coordinatorLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (true) {
        auto now = SteadyClock::now();

        std::optional<SteadyClock::time_point> nextAdmission;
        if (!m_stopping) {
            nextAdmission = admitLocked(now);
        }
        detectStallsLocked(now);

        if (!m_outbox.empty()) {
            deliver(lock);
            continue;
        }

        if (m_stopping && m_activeCount == 0) {
            break;
        }

        auto wake = now + m_options.tick;
        if (nextAdmission && *nextAdmission < wake) {
            wake = *nextAdmission;
        }
        m_condition.wait_until(lock, wake);
    }
}

std::optional<DownloadQueue::SteadyClock::time_point> DownloadQueue::admitLocked(SteadyClock::time_point now) {
    while (!m_paused && !m_pending.empty() && m_activeCount < m_options.maxConcurrent && m_threadPool) {
        if (m_options.admissionDelay.count() > 0) {
            std::optional<SteadyClock::time_point> last = m_lastAdmission;
            if (m_lastCompletion && (!last || *m_lastCompletion > *last)) {
                last = m_lastCompletion;
            }
            if (last && now < *last + m_options.admissionDelay) {
                return *last + m_options.admissionDelay;
            }
        }

        std::string id = m_pending.front();
        m_pending.pop_front();

        auto& entry = *m_entries.at(id);
        transitionLocked(entry, TransferState::Active);
        entry.task.startedAt = Clock::now();
        ++m_activeCount;
        m_lastAdmission = now;
        pushStateLocked(entry);

        Logger::instance().info("Starting download {} ({} active)", id, m_activeCount);
        m_threadPool->post([this, id] { runTask(id); });
    }
    return std::nullopt;
}

void DownloadQueue::detectStallsLocked(SteadyClock::time_point now) {
    if (m_options.stallTimeout.count() <= 0) return;

    for (auto& [id, entry] : m_entries) {
        if (entry->task.state != TransferState::Active || !entry->transferring || entry->stalled) {
            continue;
        }
        if (now - entry->lastProgress >= m_options.stallTimeout) {
            entry->stalled = true;
            Logger::instance().warn("Download {} stalled: no progress for {} ms", id,
                                    m_options.stallTimeout.count());
        }
    }
}

void DownloadQueue::deliver(std::unique_lock<std::mutex>& lock) {
    std::deque<PendingEvent> batch;
    batch.swap(m_outbox);
    m_delivering = true;
    lock.unlock();

    if (m_services.reporter) {
        for (const auto& event : batch) {
            try {
                if (event.isProgress) {
                    m_services.reporter->onTransferProgress(event.progress);
                } else {
                    m_services.reporter->onTransferState(event.task);
                }
            } catch (const std::exception& e) {
                Logger::instance().warn("Progress reporter failed: {}", e.what());
            }
        }
    }

    lock.lock();
    m_delivering = false;
    m_idleCondition.notify_all();
}

//=============================================================================
// Workers
//=============================================================================

void DownloadQueue::runTask(const std::string& id) {
    Entry* entry = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) return;
        entry = it->second.get();
    }

    // Active entries are never erased, and id/targetPath never change
    const fs::path target = entry->task.targetPath;
    fs::path part = target;
    part += ".part";

    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (entry->cancelRequested) {
                finishLocked(*entry, TransferState::Cancelled, {FailureKind::Cancelled, "Cancelled by user"});
                return;
            }

            ++entry->task.attempt;
            entry->task.bytesTransferred = 0;
            entry->task.bytesTotal = entry->sizeHint;
            entry->stalled = false;
            entry->transferring = true;
            entry->lastProgress = SteadyClock::now();
            entry->task.lastProgressAt = Clock::now();
            entry->rate.reset(0, entry->lastProgress);
            pushStateLocked(*entry);

            Logger::instance().debug("Download {} attempt {}", id, entry->task.attempt);
        }

        FetchOutcome outcome = runAttempt(*entry, part);

        bool cancelled = false;
        bool stalled = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            entry->transferring = false;
            cancelled = entry->cancelRequested;
            stalled = entry->stalled;
        }

        if (cancelled) {
            utils::FileUtils::deleteFile(part);
            std::lock_guard<std::mutex> lock(m_mutex);
            finishLocked(*entry, TransferState::Cancelled, {FailureKind::Cancelled, "Cancelled by user"});
            Logger::instance().info("Download {} cancelled", id);
            return;
        }

        if (outcome.status != FetchStatus::Success && stalled) {
            outcome = FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::StalledTransfer,
                "No progress for " + std::to_string(m_options.stallTimeout.count()) + " ms");
        }

        if (outcome.status == FetchStatus::Success) {
            std::error_code ec;
            if (!fs::is_regular_file(part, ec)) {
                outcome = FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::PartialTransfer,
                                                "Source reported success but wrote no file");
            } else {
                fs::rename(part, target, ec);
                if (ec) {
                    outcome = FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::IoError,
                                                    "Cannot move download into place: " + ec.message());
                }
            }
        }

        if (outcome.status == FetchStatus::Success) {
            try {
                completeTask(*entry, target);
            } catch (const std::exception& e) {
                Logger::instance().error("Finishing download {} failed: {}", id, e.what());
                discardDownload(target);
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!entry->task.isTerminal()) {
                    finishLocked(*entry, TransferState::Failed, {FailureKind::IoError, e.what()});
                }
            }
            return;
        }

        utils::FileUtils::deleteFile(part);

        std::unique_lock<std::mutex> lock(m_mutex);

        Failure failure{outcome.kind, outcome.message};
        if (!failure.isSet()) {
            failure.kind = FailureKind::NetworkError;
        }
        entry->task.lastError = failure;

        if (outcome.status == FetchStatus::NonRecoverable) {
            Logger::instance().error("Download {} failed: {} ({})", id, failure.message, toString(failure.kind));
            finishLocked(*entry, TransferState::Failed, failure);
            return;
        }

        auto decision = m_retryPolicy.decide(entry->task.attempt, failure.kind);
        if (!decision.retry) {
            Logger::instance().error("Download {} failed after {} attempt(s): {} ({})", id,
                                     entry->task.attempt, failure.message, toString(failure.kind));
            finishLocked(*entry, TransferState::Failed, failure);
            return;
        }

        Logger::instance().warn("Download {} attempt {} failed: {} ({}); retrying in {} ms", id,
                                entry->task.attempt, failure.message, toString(failure.kind),
                                decision.delay.count());
        pushStateLocked(*entry);

        m_retryCondition.wait_for(lock, decision.delay, [entry] { return entry->cancelRequested; });
    }
}

FetchOutcome DownloadQueue::runAttempt(Entry& entry, const fs::path& partPath) {
    std::error_code ec;
    if (partPath.has_parent_path()) {
        fs::create_directories(partPath.parent_path(), ec);
        if (ec) {
            return FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::IoError,
                                         "Cannot create " + partPath.parent_path().string() + ": " + ec.message());
        }
    }
    fs::remove(partPath, ec);

    auto progress = [this, &entry](int64_t bytes, std::optional<int64_t> total) -> bool {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (entry.cancelRequested || entry.stalled) {
            return false;
        }
        if (total && *total > 0) {
            entry.task.bytesTotal = total;
        }
        if (bytes > entry.task.bytesTransferred) {
            auto now = SteadyClock::now();
            entry.task.bytesTransferred = bytes;
            entry.task.lastProgressAt = Clock::now();
            entry.lastProgress = now;
            entry.rate.sample(bytes, now);

            bool complete = entry.task.bytesTotal && bytes >= *entry.task.bytesTotal;
            if (complete || now - entry.lastProgressEvent >= PROGRESS_EVENT_INTERVAL) {
                entry.lastProgressEvent = now;
                pushProgressLocked(entry);
            }
        }
        return true;
    };

    try {
        return m_services.source->fetch(entry.task.id, partPath, progress);
    } catch (const std::exception& e) {
        return FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::NetworkError, e.what());
    }
}

void DownloadQueue::completeTask(Entry& entry, const fs::path& target) {
    const std::string id = entry.task.id;
    PostProcessResult post = postProcess(target);

    bool cancelled = false;
    TransferTask snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cancelled = entry.cancelRequested;
        snapshot = entry.task;
    }

    if (cancelled) {
        discardDownload(target);
        std::lock_guard<std::mutex> lock(m_mutex);
        finishLocked(entry, TransferState::Cancelled, {FailureKind::Cancelled, "Cancelled by user"});
        Logger::instance().info("Download {} cancelled", id);
        return;
    }

    if (!post.success) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Logger::instance().error("Post-processing of {} failed: {}", id, post.failure.message);
        finishLocked(entry, TransferState::Failed, post.failure);
        return;
    }

    recordArtifact(snapshot, post.artifactPath);

    std::lock_guard<std::mutex> lock(m_mutex);
    entry.task.artifactPath = post.artifactPath;
    finishLocked(entry, TransferState::Succeeded);
    Logger::instance().info("Download {} complete: {}", id, post.artifactPath.string());
}

DownloadQueue::PostProcessResult DownloadQueue::postProcess(const fs::path& target) {
    PostProcessResult result;
    result.artifactPath = target;

    if (!m_options.extractArchives || !m_services.extractor || !m_services.extractor->isArchive(target)) {
        return result;
    }

    fs::path extractDir = target;
    extractDir += "_files";

    std::error_code ec;
    fs::remove_all(extractDir, ec);

    Logger::instance().info("Extracting {} into {}", target.string(), extractDir.string());

    ExtractionResult extraction;
    try {
        extraction = m_services.extractor->extract(target, extractDir);
    } catch (const std::exception& e) {
        extraction.success = false;
        extraction.error = e.what();
    }

    auto fail = [&](const std::string& message) {
        fs::remove_all(extractDir, ec);
        result.success = false;
        result.failure = {FailureKind::PostProcessingError, message};
        return result;
    };

    if (!extraction.success) {
        return fail("Extraction failed: " + extraction.error);
    }
    if (extraction.files.empty()) {
        return fail("Archive contains no files");
    }

    auto files = extraction.files;
    std::sort(files.begin(), files.end());

    // First disc image by configured format order, else the largest file
    std::optional<fs::path> payload;
    for (const auto& format : m_options.imageFormats) {
        for (const auto& file : files) {
            if (utils::FileUtils::getLowerExtension(file) == format) {
                payload = file;
                break;
            }
        }
        if (payload) break;
    }
    if (!payload) {
        int64_t largest = -1;
        for (const auto& file : files) {
            auto size = utils::FileUtils::getFileSize(file).value_or(0);
            if (size > largest) {
                largest = size;
                payload = file;
            }
        }
    }

    if (m_options.removeArchiveAfterExtract && !utils::FileUtils::deleteFile(target)) {
        Logger::instance().warn("Could not remove archive {}", target.string());
    }

    result.artifactPath = *payload;
    return result;
}

void DownloadQueue::recordArtifact(const TransferTask& task, const fs::path& artifactPath) {
    ArtifactRecord record;
    record.id = task.id;
    record.path = artifactPath;
    record.sizeBytes = utils::FileUtils::getFileSize(artifactPath).value_or(0);
    record.checksum = m_services.checksums->compute(artifactPath);
    record.acquiredAt = Clock::now();
    record.title = task.title;
    record.gameId = device::DiscImage::readGameId(artifactPath).value_or("");

    m_services.store->record(record);
}

void DownloadQueue::discardDownload(const fs::path& target) {
    fs::path extractDir = target;
    extractDir += "_files";

    std::error_code ec;
    fs::remove(target, ec);
    fs::remove_all(extractDir, ec);
}

//=============================================================================
// State helpers
//=============================================================================

void DownloadQueue::transitionLocked(Entry& entry, TransferState next) {
    if (!isAllowed(entry.task.state, next)) {
        throw std::logic_error("Invalid transfer transition for " + entry.task.id + ": " +
                               toString(entry.task.state) + " -> " + toString(next));
    }
    entry.task.state = next;
}

void DownloadQueue::finishLocked(Entry& entry, TransferState state, const Failure& failure) {
    bool wasActive = entry.task.state == TransferState::Active;

    transitionLocked(entry, state);
    if (failure.isSet()) {
        entry.task.lastError = failure;
    }
    entry.task.finishedAt = Clock::now();

    if (wasActive) {
        --m_activeCount;
        m_lastCompletion = SteadyClock::now();
    }

    pushStateLocked(entry);
    m_condition.notify_all();
    m_idleCondition.notify_all();
}

void DownloadQueue::pushStateLocked(const Entry& entry) {
    PendingEvent event;
    event.task = entry.task;
    m_outbox.push_back(std::move(event));
    m_condition.notify_all();
}

void DownloadQueue::pushProgressLocked(const Entry& entry) {
    PendingEvent event;
    event.isProgress = true;
    event.progress.id = entry.task.id;
    event.progress.attempt = entry.task.attempt;
    event.progress.bytesTransferred = entry.task.bytesTransferred;
    event.progress.bytesTotal = entry.task.bytesTotal;
    event.progress.bytesPerSecond = entry.rate.rate();
    event.progress.eta = entry.rate.eta(entry.task.bytesTransferred, entry.task.bytesTotal);
    m_outbox.push_back(std::move(event));
    m_condition.notify_all();
}

fs::path DownloadQueue::targetPathFor(const std::string& id) const {
    return m_options.downloadDirectory / utils::StringUtils::sanitizeFileName(id);
}

void DownloadQueue::purgePartialFiles() {
    if (m_options.downloadDirectory.empty()) return;

    for (const auto& file : utils::FileUtils::listFiles(m_options.downloadDirectory, {".part"})) {
        if (utils::FileUtils::deleteFile(file)) {
            Logger::instance().info("Removed leftover partial download {}", file.string());
        }
    }
}

} // namespace wum::core::transfer

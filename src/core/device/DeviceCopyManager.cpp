/**
 * DeviceCopyManager.cpp
 *
 * Implementation of verified device copies.
 */

#include "DeviceCopyManager.hpp"
#include "DiscImage.hpp"
#include "../Logger.hpp"
#include "../transfer/RateEstimator.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>

namespace wum::core::device {

namespace {

constexpr int64_t GiB = 1024LL * 1024 * 1024;

bool isAllowed(CopyState from, CopyState to) {
    switch (from) {
        case CopyState::Pending:
            return to == CopyState::Copying || to == CopyState::Failed || to == CopyState::Cancelled;
        case CopyState::Copying:
            return to == CopyState::Verifying || to == CopyState::Done ||
                   to == CopyState::Failed || to == CopyState::Cancelled;
        case CopyState::Verifying:
            return to == CopyState::Done || to == CopyState::Failed || to == CopyState::Cancelled;
        default:
            return false;
    }
}

} // namespace

const char* toString(CopyStatus status) {
    switch (status) {
        case CopyStatus::Accepted:          return "Accepted";
        case CopyStatus::SourceMissing:     return "SourceMissing";
        case CopyStatus::InsufficientSpace: return "InsufficientSpace";
        case CopyStatus::DuplicateOnTarget: return "DuplicateOnTarget";
    }
    return "Unknown";
}

DeviceCopyManager::DeviceCopyManager(DeviceOptions options, DeviceServices services)
    : m_options(std::move(options))
    , m_services(std::move(services)) {

    if (!m_services.store || !m_services.checksums) {
        throw std::invalid_argument("DeviceCopyManager needs an artifact store and a checksum provider");
    }
    if (!m_services.volumes) {
        m_services.volumes = std::make_shared<SystemVolumeEnumerator>();
    }
    if (m_options.maxParallelVolumes == 0) {
        m_options.maxParallelVolumes = 1;
    }
    for (auto& ext : m_options.supportedFormats) {
        ext = utils::StringUtils::toLower(ext);
    }

    m_threadPool = std::make_unique<ThreadPool>(m_options.maxParallelVolumes);
}

DeviceCopyManager::~DeviceCopyManager() {
    shutdown();
}

void DeviceCopyManager::shutdown() {
    std::vector<CopyJob> cancelled;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping && !m_threadPool) return;
        m_stopping = true;

        for (auto& [id, entry] : m_jobs) {
            if (entry->job.isTerminal()) continue;
            entry->cancelRequested = true;
            if (!entry->started) {
                cancelled.push_back(setStateLocked(*entry, CopyState::Cancelled,
                                                   {FailureKind::Cancelled, "Shutting down"}));
            }
        }
        for (auto& [key, lane] : m_lanes) {
            lane.jobIds.clear();
        }
    }

    for (const auto& job : cancelled) {
        emitState(job);
    }

    // Joins the lane workers once their current job notices the cancel flag
    m_threadPool.reset();
}

std::vector<Volume> DeviceCopyManager::listVolumes() {
    return m_services.volumes->enumerate();
}

//=============================================================================
// Copies
//=============================================================================

CopyResult DeviceCopyManager::copyArtifact(const std::string& artifactId, const Volume& volume,
                                           const CopyOptions& options) {
    CopyResult result;

    auto record = m_services.store->lookup(artifactId);
    auto size = record ? utils::FileUtils::getFileSize(record->path) : std::nullopt;
    if (!record || !size) {
        result.status = CopyStatus::SourceMissing;
        result.message = record ? "Artifact file is missing: " + record->path.string()
                                : "No artifact with id " + artifactId;
        Logger::instance().warn("Cannot copy {}: {}", artifactId, result.message);
        return result;
    }

    const auto dest = destinationFor(*record, volume.mountPath);

    if (utils::FileUtils::fileExists(dest) && !options.overwrite) {
        result.status = CopyStatus::DuplicateOnTarget;
        result.message = "Already on the volume: " + dest.string();
        Logger::instance().info("Skipping copy of {}: {}", artifactId, result.message);
        return result;
    }

    auto space = m_services.volumes->querySpace(volume.mountPath);
    int64_t freeBytes = space ? space->freeBytes : volume.freeBytes;
    if (freeBytes < *size) {
        result.status = CopyStatus::InsufficientSpace;
        result.message = "Need " + utils::StringUtils::formatBytes(*size) + ", " +
                         utils::StringUtils::formatBytes(freeBytes) + " free on " + volume.mountPath.string();
        Logger::instance().warn("Cannot copy {}: {}", artifactId, result.message);
        return result;
    }

    CopyJob snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_stopping) {
            throw std::runtime_error("DeviceCopyManager is shut down");
        }

        for (const auto& [id, entry] : m_jobs) {
            if (!entry->job.isTerminal() && entry->job.destPath == dest) {
                result.status = CopyStatus::DuplicateOnTarget;
                result.message = "Copy already scheduled as " + id;
                result.job = entry->job;
                return result;
            }
        }

        auto entry = std::make_unique<JobEntry>();
        entry->record = *record;
        entry->job.id = nextJobId();
        entry->job.artifactId = artifactId;
        entry->job.sourcePath = record->path;
        entry->job.destPath = dest;
        entry->job.mountPath = volume.mountPath;
        entry->job.bytesTotal = *size;
        entry->job.moveSource = options.moveSource;

        snapshot = entry->job;
        m_order.push_back(snapshot.id);
        m_jobs.emplace(snapshot.id, std::move(entry));
    }

    Logger::instance().info("Queued copy {} of {} to {}", snapshot.id, artifactId, dest.string());
    emitState(snapshot);

    // The Pending event goes out before a worker can pick the job up
    bool startLane = false;
    std::string laneKey = volume.mountPath.string();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& entry = *m_jobs.at(snapshot.id);
        if (entry.job.state == CopyState::Pending && !m_stopping) {
            auto& lane = m_lanes[laneKey];
            lane.jobIds.push_back(snapshot.id);
            if (!lane.running) {
                lane.running = true;
                startLane = true;
            }
        }
        snapshot = entry.job;
    }

    if (startLane) {
        m_threadPool->post([this, laneKey] { runLane(laneKey); });
    }

    result.job = snapshot;
    return result;
}

void DeviceCopyManager::runLane(const std::string& laneKey) {
    while (true) {
        JobEntry* entry = nullptr;
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            auto it = m_lanes.find(laneKey);
            if (it == m_lanes.end() || it->second.jobIds.empty()) {
                if (it != m_lanes.end()) {
                    m_lanes.erase(it);
                }
                m_idleCondition.notify_all();
                return;
            }

            auto jobId = it->second.jobIds.front();
            it->second.jobIds.pop_front();
            entry = m_jobs.at(jobId).get();
            entry->started = true;
        }

        try {
            runJob(*entry);
        } catch (const std::exception& e) {
            Logger::instance().error("Copy {} aborted: {}", entry->job.id, e.what());
            failUnfinished(*entry, {FailureKind::IoError, e.what()});
        }
    }
}

void DeviceCopyManager::failUnfinished(JobEntry& entry, const Failure& failure) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (entry.job.isTerminal()) return;
    }

    std::error_code ec;
    std::filesystem::path temp = entry.job.destPath;
    temp += TEMP_SUFFIX;
    std::filesystem::remove(temp, ec);
    if (entry.placed) {
        std::filesystem::remove(entry.job.destPath, ec);
        if (m_options.cleanupEmptyDirs) {
            utils::FileUtils::removeEmptyParents(entry.job.destPath.parent_path(), entry.job.mountPath);
        }
    }

    CopyJob snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (entry.job.isTerminal()) return;
        snapshot = setStateLocked(entry, CopyState::Failed, failure);
    }
    emitState(snapshot);
}

void DeviceCopyManager::runJob(JobEntry& entry) {
    const std::string jobId = entry.job.id;

    if (entry.cancelRequested) {
        setState(entry, CopyState::Cancelled, {FailureKind::Cancelled, "Cancelled by user"});
        return;
    }

    // Space may have changed since the job was accepted
    auto space = m_services.volumes->querySpace(entry.job.mountPath);
    if (space && space->freeBytes < entry.job.bytesTotal) {
        setState(entry, CopyState::Failed, {FailureKind::InsufficientSpace,
            "Only " + utils::StringUtils::formatBytes(space->freeBytes) + " free on " +
            entry.job.mountPath.string()});
        return;
    }

    size_t bufferSize = m_options.bufferSize > 0
        ? m_options.bufferSize
        : recommendedBufferSize(space ? space->totalBytes : 0);

    setState(entry, CopyState::Copying);
    Logger::instance().info("Copying {} -> {}", entry.job.sourcePath.string(), entry.job.destPath.string());

    Failure failure;
    if (!copyFile(entry, bufferSize, failure)) {
        bool cancelled = failure.kind == FailureKind::Cancelled;
        if (!cancelled) {
            Logger::instance().error("Copy {} failed: {}", jobId, failure.message);
        }
        setState(entry, cancelled ? CopyState::Cancelled : CopyState::Failed, failure);
        return;
    }
    entry.placed = true;

    if (m_options.verifyAfterCopy) {
        setState(entry, CopyState::Verifying);
        if (!verifyCopy(entry, failure)) {
            Logger::instance().error("Copy {} failed verification: {}", jobId, failure.message);
            setState(entry, CopyState::Failed, failure);
            return;
        }
    }

    if (entry.cancelRequested) {
        std::error_code ec;
        std::filesystem::remove(entry.job.destPath, ec);
        setState(entry, CopyState::Cancelled, {FailureKind::Cancelled, "Cancelled by user"});
        return;
    }

    if (entry.job.moveSource) {
        if (utils::FileUtils::deleteFile(entry.job.sourcePath)) {
            entry.placed = false;
            m_services.store->remove(entry.job.artifactId);
            Logger::instance().info("Moved {} off the local disk", entry.job.artifactId);
        } else {
            Logger::instance().warn("Copied {} but could not delete {}", entry.job.artifactId,
                                    entry.job.sourcePath.string());
        }
    }

    setState(entry, CopyState::Done);
    Logger::instance().info("Copy {} done: {}", jobId, entry.job.destPath.string());
}

bool DeviceCopyManager::copyFile(JobEntry& entry, size_t bufferSize, Failure& failure) {
    const auto& source = entry.job.sourcePath;
    const auto& dest = entry.job.destPath;
    const int64_t total = entry.job.bytesTotal;

    std::filesystem::path temp = dest;
    temp += TEMP_SUFFIX;

    std::error_code ec;
    std::filesystem::create_directories(dest.parent_path(), ec);
    if (ec) {
        failure = {FailureKind::IoError, "Cannot create " + dest.parent_path().string() + ": " + ec.message()};
        return false;
    }

    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        failure = {FailureKind::SourceMissing, "Cannot open " + source.string()};
        return false;
    }

    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        failure = {FailureKind::IoError, "Cannot create " + temp.string()};
        return false;
    }

    auto abort = [&](Failure reason) {
        out.close();
        std::filesystem::remove(temp, ec);
        failure = std::move(reason);
        return false;
    };

    std::vector<char> buffer(std::max<size_t>(bufferSize, 4096));
    transfer::RateEstimator rate;
    rate.reset(0, std::chrono::steady_clock::now());
    int64_t copied = 0;

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n <= 0) break;

        out.write(buffer.data(), n);
        out.flush();
        if (!out) {
            auto space = m_services.volumes->querySpace(entry.job.mountPath);
            if (space && space->freeBytes <= 0) {
                return abort({FailureKind::DiskFull, "Volume full while writing " + dest.string()});
            }
            return abort({FailureKind::IoError, "Write failed for " + temp.string()});
        }

        copied += n;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            entry.job.bytesCopied = copied;
        }

        events::CopyProgress progress;
        progress.jobId = entry.job.id;
        progress.artifactId = entry.job.artifactId;
        progress.bytesCopied = copied;
        progress.bytesTotal = total;
        progress.bytesPerSecond = rate.sample(copied, std::chrono::steady_clock::now());
        progress.eta = rate.eta(copied, total);
        emitProgress(progress);

        if (entry.cancelRequested) {
            return abort({FailureKind::Cancelled, "Cancelled by user"});
        }
    }

    if (in.bad()) {
        return abort({FailureKind::IoError, "Read failed for " + source.string()});
    }
    if (copied != total) {
        return abort({FailureKind::IoError, "Copied " + std::to_string(copied) + " of " +
                                            std::to_string(total) + " bytes"});
    }

    out.close();
    if (out.fail()) {
        std::filesystem::remove(temp, ec);
        failure = {FailureKind::IoError, "Cannot finish writing " + temp.string()};
        return false;
    }

    std::filesystem::rename(temp, dest, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        failure = {FailureKind::IoError, "Cannot move " + temp.string() + " into place"};
        return false;
    }
    return true;
}

bool DeviceCopyManager::verifyCopy(JobEntry& entry, Failure& failure) {
    std::string expected = entry.record.checksum;
    if (expected.empty()) {
        expected = m_services.checksums->compute(entry.job.sourcePath);
    }
    std::string actual = m_services.checksums->compute(entry.job.destPath);

    if (!expected.empty() && expected == actual) {
        return true;
    }

    std::error_code ec;
    std::filesystem::remove(entry.job.destPath, ec);
    if (m_options.cleanupEmptyDirs) {
        utils::FileUtils::removeEmptyParents(entry.job.destPath.parent_path(), entry.job.mountPath);
    }

    failure = {FailureKind::VerificationMismatch,
               "Checksum mismatch for " + entry.job.destPath.filename().string() +
               " (expected " + (expected.empty() ? "?" : expected) +
               ", got " + (actual.empty() ? "?" : actual) + ")"};
    return false;
}

bool DeviceCopyManager::cancelCopy(const std::string& jobId) {
    CopyJob snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_jobs.find(jobId);
        if (it == m_jobs.end() || it->second->job.isTerminal()) {
            return false;
        }

        auto& entry = *it->second;
        entry.cancelRequested = true;

        if (entry.started) {
            Logger::instance().info("Cancelling copy {}", jobId);
            return true;
        }

        auto lane = m_lanes.find(entry.job.mountPath.string());
        if (lane != m_lanes.end()) {
            auto& ids = lane->second.jobIds;
            ids.erase(std::remove(ids.begin(), ids.end(), jobId), ids.end());
        }
        snapshot = setStateLocked(entry, CopyState::Cancelled, {FailureKind::Cancelled, "Cancelled by user"});
    }

    Logger::instance().info("Cancelled pending copy {}", jobId);
    emitState(snapshot);
    return true;
}

std::optional<CopyJob> DeviceCopyManager::getJob(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        return std::nullopt;
    }
    return it->second->job;
}

std::vector<CopyJob> DeviceCopyManager::jobs() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<CopyJob> result;
    result.reserve(m_order.size());
    for (const auto& id : m_order) {
        result.push_back(m_jobs.at(id)->job);
    }
    return result;
}

bool DeviceCopyManager::dismissJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end() || !it->second->job.isTerminal()) {
        return false;
    }
    m_jobs.erase(it);
    m_order.erase(std::remove(m_order.begin(), m_order.end(), jobId), m_order.end());
    return true;
}

bool DeviceCopyManager::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCondition.wait_for(lock, timeout, [this] {
        if (!m_lanes.empty()) return false;
        return std::all_of(m_jobs.begin(), m_jobs.end(), [](const auto& item) {
            return item.second->job.isTerminal();
        });
    });
}

//=============================================================================
// State helpers
//=============================================================================

CopyJob DeviceCopyManager::setStateLocked(JobEntry& entry, CopyState state, const Failure& failure) {
    if (!isAllowed(entry.job.state, state)) {
        throw std::logic_error("Invalid copy transition for " + entry.job.id + ": " +
                               toString(entry.job.state) + " -> " + toString(state));
    }
    entry.job.state = state;
    if (failure.isSet()) {
        entry.job.error = failure;
    }
    if (wum::isTerminal(state)) {
        m_idleCondition.notify_all();
    }
    return entry.job;
}

void DeviceCopyManager::setState(JobEntry& entry, CopyState state, const Failure& failure) {
    CopyJob snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        snapshot = setStateLocked(entry, state, failure);
    }
    emitState(snapshot);
}

void DeviceCopyManager::emitState(const CopyJob& job) {
    if (!m_services.reporter) return;
    try {
        m_services.reporter->onCopyState(job);
    } catch (const std::exception& e) {
        Logger::instance().warn("Progress reporter failed: {}", e.what());
    }
}

void DeviceCopyManager::emitProgress(const events::CopyProgress& progress) {
    if (!m_services.reporter) return;
    try {
        m_services.reporter->onCopyProgress(progress);
    } catch (const std::exception& e) {
        Logger::instance().warn("Progress reporter failed: {}", e.what());
    }
}

std::string DeviceCopyManager::nextJobId() {
    return "copy-" + std::to_string(m_nextJobId++);
}

//=============================================================================
// Layout and maintenance
//=============================================================================

std::filesystem::path DeviceCopyManager::gameRoot(const Volume& volume) const {
    return volume.mountPath / m_options.gameFolder;
}

std::string DeviceCopyManager::extensionFor(const std::filesystem::path& source) const {
    auto ext = utils::FileUtils::getLowerExtension(source);
    if (std::find(m_options.supportedFormats.begin(), m_options.supportedFormats.end(), ext) !=
        m_options.supportedFormats.end()) {
        return ext;
    }
    auto detected = DiscImage::detectExtension(source);
    return detected.empty() ? ".wbfs" : detected;
}

std::filesystem::path DeviceCopyManager::destinationFor(const ArtifactRecord& record,
                                                        const std::filesystem::path& mountPath) const {
    std::string gameId = record.gameId;
    if (!DiscImage::isValidGameId(gameId)) {
        gameId = DiscImage::readGameId(record.path).value_or("");
    }

    std::string title = record.title;
    const std::string stem = record.path.stem().string();
    if (title.empty()) {
        if (auto parts = DiscImage::parseName(stem)) {
            title = parts->title;
            if (gameId.empty()) gameId = parts->gameId;
        } else {
            title = stem;
        }
    }
    if (gameId.empty()) {
        gameId = utils::StringUtils::sanitizeFileName(record.id);
    }
    if (utils::StringUtils::sanitizeTitle(title).empty()) {
        title = gameId;
    }

    const std::string name = DiscImage::formatName(title, gameId);
    return mountPath / m_options.gameFolder / name / (name + extensionFor(record.path));
}

RemoveResult DeviceCopyManager::removeArtifactFromVolume(const std::string& artifactIdOrGameId,
                                                         const Volume& volume) {
    RemoveResult result;

    if (auto record = m_services.store->lookup(artifactIdOrGameId)) {
        auto dest = destinationFor(*record, volume.mountPath);
        if (utils::FileUtils::fileExists(dest)) {
            result.path = dest;
        }
    }
    if (result.path.empty()) {
        for (const auto& game : listGamesOnVolume(volume)) {
            if (game.gameId == artifactIdOrGameId && !game.imagePath.empty()) {
                result.path = game.imagePath;
                break;
            }
        }
    }
    if (result.path.empty()) {
        result.status = RemoveStatus::NotFound;
        result.message = artifactIdOrGameId + " is not on " + volume.mountPath.string();
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_jobs) {
            if (!entry->job.isTerminal() && entry->job.destPath == result.path) {
                result.status = RemoveStatus::Failed;
                result.message = "Copy " + id + " is writing that file";
                return result;
            }
        }
    }

    std::error_code ec;
    if (!std::filesystem::remove(result.path, ec) || ec) {
        result.status = RemoveStatus::Failed;
        result.message = "Cannot delete " + result.path.string() + (ec ? ": " + ec.message() : "");
        Logger::instance().error("{}", result.message);
        return result;
    }

    result.status = RemoveStatus::Removed;
    if (m_options.cleanupEmptyDirs) {
        result.removedDirectories = utils::FileUtils::removeEmptyParents(result.path.parent_path(), volume.mountPath);
    }
    Logger::instance().info("Removed {} from {}", result.path.string(), volume.mountPath.string());
    return result;
}

std::vector<GameEntry> DeviceCopyManager::listGamesOnVolume(const Volume& volume) const {
    std::vector<GameEntry> games;
    const auto root = gameRoot(volume);

    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(root, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (!it->is_directory(ec)) continue;

        GameEntry game;
        game.directory = it->path();

        const std::string name = it->path().filename().string();
        if (auto parts = DiscImage::parseName(name)) {
            game.title = parts->title;
            game.gameId = parts->gameId;
        } else {
            game.title = name;
        }

        auto images = utils::FileUtils::listFiles(game.directory, m_options.supportedFormats);
        if (!images.empty()) {
            game.imagePath = images.front();
            if (game.gameId.empty()) {
                game.gameId = DiscImage::readGameId(game.imagePath).value_or("");
            }
        }

        game.region = DiscImage::regionOf(game.gameId);
        game.sizeBytes = utils::FileUtils::getDirectorySize(game.directory);
        games.push_back(std::move(game));
    }

    std::sort(games.begin(), games.end(), [](const GameEntry& a, const GameEntry& b) {
        return utils::StringUtils::toLower(a.title) < utils::StringUtils::toLower(b.title);
    });
    return games;
}

std::vector<GameCheck> DeviceCopyManager::verifyVolume(const Volume& volume) const {
    std::vector<GameCheck> checks;

    for (auto& game : listGamesOnVolume(volume)) {
        GameCheck check;
        check.game = game;

        if (game.imagePath.empty()) {
            check.problems.push_back("Game file not found");
        } else {
            auto size = utils::FileUtils::getFileSize(game.imagePath).value_or(0);
            if (size < MIN_IMAGE_SIZE) {
                check.problems.push_back("Game file is too small");
            }
            if (!utils::FileUtils::readBytes(game.imagePath, 0, static_cast<size_t>(std::min<int64_t>(size, 1024)))) {
                check.problems.push_back("Game file cannot be read");
            }
        }

        check.valid = check.problems.empty();
        if (!check.valid) {
            Logger::instance().warn("{}: {}", game.directory.string(),
                                    utils::StringUtils::join(check.problems, ", "));
        }
        checks.push_back(std::move(check));
    }
    return checks;
}

int DeviceCopyManager::cleanupEmptyDirectories(const Volume& volume) const {
    int removed = 0;
    const auto root = gameRoot(volume);

    std::vector<std::filesystem::path> empty;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(root, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec) && utils::FileUtils::isDirectoryEmpty(it->path())) {
            empty.push_back(it->path());
        }
    }

    for (const auto& dir : empty) {
        std::error_code removeError;
        if (std::filesystem::remove(dir, removeError) && !removeError) {
            ++removed;
        }
    }

    if (removed > 0) {
        Logger::instance().info("Removed {} empty folder(s) from {}", removed, root.string());
    }
    return removed;
}

int DeviceCopyManager::collectOrphanedTemps(const Volume& volume) const {
    std::set<std::filesystem::path> active;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_jobs) {
            if (!entry->job.isTerminal()) {
                auto temp = entry->job.destPath;
                temp += TEMP_SUFFIX;
                active.insert(temp);
            }
        }
    }

    int removed = 0;
    for (const auto& file : utils::FileUtils::listFiles(gameRoot(volume), {TEMP_SUFFIX}, true)) {
        if (active.count(file) != 0) continue;
        if (utils::FileUtils::deleteFile(file)) {
            ++removed;
            Logger::instance().info("Removed orphaned copy {}", file.string());
            if (m_options.cleanupEmptyDirs) {
                utils::FileUtils::removeEmptyParents(file.parent_path(), volume.mountPath);
            }
        }
    }
    return removed;
}

size_t DeviceCopyManager::recommendedBufferSize(int64_t totalBytes) {
    if (totalBytes < 8 * GiB) {
        return 512 * 1024;
    }
    if (totalBytes > 64 * GiB) {
        return 4 * 1024 * 1024;
    }
    return 1024 * 1024;
}

} // namespace wum::core::device

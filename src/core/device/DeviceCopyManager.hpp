#pragma once

/**
 * DeviceCopyManager.hpp
 *
 * Verified copies of downloaded artifacts onto removable volumes, plus the
 * maintenance operations a USB loader drive needs (listing, removal,
 * integrity check, cleanup).
 */

#include "../models/Models.hpp"
#include "../ThreadPool.hpp"
#include "../events/ProgressReporter.hpp"
#include "../store/ArtifactStore.hpp"
#include "../store/ChecksumProvider.hpp"
#include "VolumeEnumerator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wum::core::device {

struct DeviceOptions {
    // Copy chunk size; 0 picks one from the volume size
    size_t bufferSize{1024 * 1024};
    bool verifyAfterCopy{true};
    bool cleanupEmptyDirs{true};
    std::string gameFolder{"wbfs"};
    std::vector<std::string> supportedFormats{".wbfs", ".iso", ".rvz"};
    size_t maxParallelVolumes{2};
};

struct CopyOptions {
    bool overwrite{false};
    // On success delete the local artifact and its record
    bool moveSource{false};
};

enum class CopyStatus {
    Accepted,
    SourceMissing,
    InsufficientSpace,
    DuplicateOnTarget
};

struct CopyResult {
    CopyStatus status{CopyStatus::Accepted};
    std::optional<CopyJob> job;
    std::string message;

    bool accepted() const { return status == CopyStatus::Accepted; }
};

enum class RemoveStatus {
    Removed,
    NotFound,
    Failed
};

struct RemoveResult {
    RemoveStatus status{RemoveStatus::NotFound};
    std::filesystem::path path;
    int removedDirectories{0};
    std::string message;
};

struct DeviceServices {
    std::shared_ptr<store::ArtifactStore> store;
    std::shared_ptr<VolumeEnumerator> volumes;
    std::shared_ptr<store::ChecksumProvider> checksums;
    std::shared_ptr<events::ProgressReporter> reporter;
};

/**
 * DeviceCopyManager - per-volume copy lanes on a shared worker pool
 *
 * Jobs for the same mount run one at a time in submission order; different
 * mounts copy in parallel up to maxParallelVolumes. Each job writes to
 * "<dest>.wumtmp", renames on completion and then verifies checksums.
 * Events are delivered synchronously from the copying thread.
 */
class DeviceCopyManager {
public:
    DeviceCopyManager(DeviceOptions options, DeviceServices services);

    /**
     * Destructor - cancels outstanding jobs and waits for the workers
     */
    ~DeviceCopyManager();

    DeviceCopyManager(const DeviceCopyManager&) = delete;
    DeviceCopyManager& operator=(const DeviceCopyManager&) = delete;

    void shutdown();

    /**
     * Removable volumes mounted right now
     */
    std::vector<Volume> listVolumes();

    /**
     * Schedule a copy of an artifact onto a volume
     * @param artifactId Id of an ArtifactStore record
     * @param volume Destination volume
     * @param options Overwrite / move behaviour
     * @return Accepted with the new job, or the reason for rejection
     */
    CopyResult copyArtifact(const std::string& artifactId, const Volume& volume,
                            const CopyOptions& options = {});

    /**
     * Delete an artifact's image from a volume
     * @param artifactIdOrGameId Artifact id, or the game id of the folder
     */
    RemoveResult removeArtifactFromVolume(const std::string& artifactIdOrGameId, const Volume& volume);

    /**
     * Cancel a job; no-op for terminal or unknown jobs
     * @return true if the job was pending or running
     */
    bool cancelCopy(const std::string& jobId);

    std::optional<CopyJob> getJob(const std::string& jobId) const;
    std::vector<CopyJob> jobs() const;

    /**
     * Forget a terminal job
     */
    bool dismissJob(const std::string& jobId);

    /**
     * Block until no job is pending or running
     * @return false on timeout
     */
    bool waitForIdle(std::chrono::milliseconds timeout);

    /**
     * "<mount>/<gameFolder>/<Title> [<GAMEID>]/<Title> [<GAMEID>]<ext>"
     */
    std::filesystem::path destinationFor(const ArtifactRecord& record, const std::filesystem::path& mountPath) const;

    /**
     * Game folders on a volume, sorted by title
     */
    std::vector<GameEntry> listGamesOnVolume(const Volume& volume) const;

    /**
     * Check every game folder for a present, plausible, readable image
     */
    std::vector<GameCheck> verifyVolume(const Volume& volume) const;

    /**
     * Remove empty game folders
     * @return Number of directories removed
     */
    int cleanupEmptyDirectories(const Volume& volume) const;

    /**
     * Delete *.wumtmp files no running job owns
     * @return Number of files removed
     */
    int collectOrphanedTemps(const Volume& volume) const;

    /**
     * Copy buffer for a volume: 512 KiB below 8 GiB, 4 MiB above 64 GiB, else 1 MiB
     */
    static size_t recommendedBufferSize(int64_t totalBytes);

    static constexpr const char* TEMP_SUFFIX = ".wumtmp";
    static constexpr int64_t MIN_IMAGE_SIZE = 1024 * 1024;

private:
    struct JobEntry {
        CopyJob job;
        ArtifactRecord record;
        std::atomic<bool> cancelRequested{false};
        bool started{false};   // taken off its lane by a worker
        bool placed{false};    // destination written, source still present
    };

    struct Lane {
        std::deque<std::string> jobIds;
        bool running{false};
    };

    void runLane(const std::string& laneKey);
    void runJob(JobEntry& entry);
    bool copyFile(JobEntry& entry, size_t bufferSize, Failure& failure);
    bool verifyCopy(JobEntry& entry, Failure& failure);

    void setState(JobEntry& entry, CopyState state, const Failure& failure = {});
    void failUnfinished(JobEntry& entry, const Failure& failure);
    CopyJob setStateLocked(JobEntry& entry, CopyState state, const Failure& failure);
    void emitState(const CopyJob& job);
    void emitProgress(const events::CopyProgress& progress);

    std::filesystem::path gameRoot(const Volume& volume) const;
    std::string extensionFor(const std::filesystem::path& source) const;
    std::string nextJobId();

private:
    DeviceOptions m_options;
    DeviceServices m_services;

    std::unordered_map<std::string, std::unique_ptr<JobEntry>> m_jobs;
    std::vector<std::string> m_order;
    std::map<std::string, Lane> m_lanes;   // keyed by mount path

    mutable std::mutex m_mutex;
    std::condition_variable m_idleCondition;

    uint64_t m_nextJobId{1};
    bool m_stopping{false};

    std::unique_ptr<ThreadPool> m_threadPool;
};

const char* toString(CopyStatus status);

} // namespace wum::core::device

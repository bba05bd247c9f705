#pragma once

/**
 * ArtifactStore.hpp
 *
 * Durable index of downloaded artifacts, used to skip downloads the user
 * already has and to locate files for device copies.
 */

#include "../models/Models.hpp"
#include "ChecksumProvider.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wum::core::store {

/**
 * Counters reported by ArtifactStore::reconcile
 */
struct ReconcileReport {
    int dropped{0};            // records whose file was gone
    int checksummed{0};        // records that got their missing checksum
    int adopted{0};            // unknown disc images added to the index
    int skippedDuplicates{0};  // unknown images whose content was already indexed
};

/**
 * ArtifactStore - id-keyed artifact index persisted as JSON
 *
 * Features:
 * - At most one record per id
 * - Content lookup by (size, checksum) for files acquired outside the queue
 * - Atomic index writes (temp file + rename) after every mutation
 * - Reconciliation against the download directory; never deletes files
 *
 * An empty index path keeps the store in memory only.
 */
class ArtifactStore {
public:
    /**
     * Constructor
     * @param indexPath JSON index file (empty = in-memory)
     * @param imageFormats Lowercase disc image extensions adopted by reconcile()
     */
    explicit ArtifactStore(std::filesystem::path indexPath = {},
                           std::vector<std::string> imageFormats = {".wbfs", ".iso", ".rvz"});

    ArtifactStore(const ArtifactStore&) = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;

    /**
     * Load the index from disk, replacing in-memory records
     * @return false if the file exists but cannot be parsed
     */
    bool load();

    /**
     * Write the index to disk
     * @return true if written (always true for an in-memory store)
     */
    bool save() const;

    std::optional<ArtifactRecord> lookup(const std::string& id) const;

    /**
     * Find a record by content; an empty checksum never matches
     */
    std::optional<ArtifactRecord> findByContent(int64_t sizeBytes, const std::string& checksum) const;

    /**
     * Find the record an artifact duplicates: by id first, then by content
     * once a checksum is known
     */
    std::optional<ArtifactRecord> findDuplicate(const std::string& id, int64_t sizeBytes,
                                                const std::string& checksum) const;

    /**
     * Insert or replace the record for artifact.id
     */
    void record(const ArtifactRecord& artifact);

    /**
     * Remove a record (the file is left alone)
     * @return true if a record was removed
     */
    bool remove(const std::string& id);

    std::vector<ArtifactRecord> all() const;

    size_t size() const;

    /**
     * Bring the index in line with what is on disk
     * @param directory Download directory to scan for unknown disc images
     * @param checksums Provider used for missing checksums (called outside the lock)
     */
    ReconcileReport reconcile(const std::filesystem::path& directory, ChecksumProvider& checksums);

    const std::filesystem::path& indexPath() const { return m_indexPath; }

private:
    bool saveLocked() const;
    bool hasPathLocked(const std::filesystem::path& path) const;

private:
    std::filesystem::path m_indexPath;
    std::vector<std::string> m_imageFormats;

    std::unordered_map<std::string, ArtifactRecord> m_records;
    mutable std::mutex m_mutex;
};

} // namespace wum::core::store

#pragma once

/**
 * TransferSource.hpp
 *
 * Seams between the download queue and the outside world: where bytes come
 * from and how downloaded archives are unpacked.
 */

#include "../models/Models.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace wum::core::transfer {

enum class FetchStatus {
    Success,
    Recoverable,
    NonRecoverable
};

struct FetchOutcome {
    FetchStatus status{FetchStatus::Success};
    FailureKind kind{FailureKind::None};
    std::string message;

    static FetchOutcome success() { return {}; }
    static FetchOutcome failure(FetchStatus status, FailureKind kind, std::string message) {
        return {status, kind, std::move(message)};
    }
};

/**
 * Called as bytes arrive. `total` is empty while the size is unknown.
 * Returning false aborts the fetch.
 */
using FetchProgressCallback = std::function<bool(int64_t bytesSoFar, std::optional<int64_t> total)>;

/**
 * TransferSource - fetches one catalog item into a local file
 */
class TransferSource {
public:
    virtual ~TransferSource() = default;

    /**
     * Fetch an item
     * @param id Catalog item id
     * @param destination File to write (truncated first)
     * @param progress Progress callback; a false return aborts the fetch
     * @return Outcome of the attempt
     */
    virtual FetchOutcome fetch(const std::string& id,
                               const std::filesystem::path& destination,
                               const FetchProgressCallback& progress) = 0;
};

struct ExtractionResult {
    bool success{false};
    std::vector<std::filesystem::path> files;
    std::string error;
};

/**
 * ArchiveExtractor - unpacks a downloaded archive
 */
class ArchiveExtractor {
public:
    virtual ~ArchiveExtractor() = default;

    /**
     * Whether `file` is an archive this extractor understands
     */
    virtual bool isArchive(const std::filesystem::path& file) const = 0;

    /**
     * Extract every entry of `archive` below `destination`
     */
    virtual ExtractionResult extract(const std::filesystem::path& archive,
                                     const std::filesystem::path& destination) = 0;
};

} // namespace wum::core::transfer

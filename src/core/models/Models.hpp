// Wii Unified Manager - Data Models
// Core data structures shared by the transfer engine and the device layer

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace wum {

using Clock = std::chrono::system_clock;

//=============================================================================
// Failures
//=============================================================================

enum class FailureKind {
    None,
    // Recoverable
    NetworkTimeout,
    NetworkError,
    TransientServerError,
    PartialTransfer,
    StalledTransfer,
    IoError,
    // Non-recoverable
    NotFound,
    AuthenticationRequired,
    DiskFull,
    InvalidArchive,
    PostProcessingError,
    VerificationMismatch,
    InsufficientSpace,
    SourceMissing,
    Cancelled
};

inline const char* toString(FailureKind kind) {
    switch (kind) {
        case FailureKind::None:                   return "None";
        case FailureKind::NetworkTimeout:         return "NetworkTimeout";
        case FailureKind::NetworkError:           return "NetworkError";
        case FailureKind::TransientServerError:   return "TransientServerError";
        case FailureKind::PartialTransfer:        return "PartialTransfer";
        case FailureKind::StalledTransfer:        return "StalledTransfer";
        case FailureKind::IoError:                return "IoError";
        case FailureKind::NotFound:               return "NotFound";
        case FailureKind::AuthenticationRequired: return "AuthenticationRequired";
        case FailureKind::DiskFull:               return "DiskFull";
        case FailureKind::InvalidArchive:         return "InvalidArchive";
        case FailureKind::PostProcessingError:    return "PostProcessingError";
        case FailureKind::VerificationMismatch:   return "VerificationMismatch";
        case FailureKind::InsufficientSpace:      return "InsufficientSpace";
        case FailureKind::SourceMissing:          return "SourceMissing";
        case FailureKind::Cancelled:              return "Cancelled";
    }
    return "Unknown";
}

struct Failure {
    FailureKind kind{FailureKind::None};
    std::string message;

    bool isSet() const { return kind != FailureKind::None; }
};

//=============================================================================
// Transfers
//=============================================================================

enum class TransferState {
    Queued,
    Active,
    Succeeded,
    Failed,
    Cancelled
};

inline const char* toString(TransferState state) {
    switch (state) {
        case TransferState::Queued:    return "Queued";
        case TransferState::Active:    return "Active";
        case TransferState::Succeeded: return "Succeeded";
        case TransferState::Failed:    return "Failed";
        case TransferState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

inline bool isTerminal(TransferState state) {
    return state == TransferState::Succeeded ||
           state == TransferState::Failed ||
           state == TransferState::Cancelled;
}

enum class Priority {
    Normal,
    Immediate   // "download now": goes to the front of the queue
};

/**
 * TransferTask - one requested catalog item
 *
 * Owned by DownloadQueue; everything handed to callers is a copy.
 */
struct TransferTask {
    std::string id;
    std::string title;
    std::filesystem::path targetPath;

    TransferState state{TransferState::Queued};
    Priority priority{Priority::Normal};

    // Attempts made so far; 0 until the first attempt starts
    int attempt{0};

    // Per-attempt counters
    int64_t bytesTransferred{0};
    std::optional<int64_t> bytesTotal;

    Clock::time_point enqueuedAt{};
    Clock::time_point startedAt{};
    Clock::time_point lastProgressAt{};
    Clock::time_point finishedAt{};

    // Kept after a later attempt succeeds
    Failure lastError;

    // Set on success; the extracted payload when the download was an archive
    std::filesystem::path artifactPath;

    bool isTerminal() const { return wum::isTerminal(state); }
};

//=============================================================================
// Artifacts
//=============================================================================

struct ArtifactRecord {
    std::string id;
    std::filesystem::path path;
    int64_t sizeBytes{0};
    std::string checksum;       // hex digest, empty until computed
    Clock::time_point acquiredAt{};
    std::string title;
    std::string gameId;         // 6-character disc id, empty when unknown
};

//=============================================================================
// Devices
//=============================================================================

/**
 * Volume - a mounted filesystem; rediscovered on every enumeration
 */
struct Volume {
    std::filesystem::path mountPath;
    std::string device;
    std::string fsType;
    std::string label;
    int64_t totalBytes{0};
    int64_t freeBytes{0};
    bool isRemovable{false};
};

struct VolumeSpace {
    int64_t totalBytes{0};
    int64_t freeBytes{0};
};

enum class CopyState {
    Pending,
    Copying,
    Verifying,
    Done,
    Failed,
    Cancelled
};

inline const char* toString(CopyState state) {
    switch (state) {
        case CopyState::Pending:   return "Pending";
        case CopyState::Copying:   return "Copying";
        case CopyState::Verifying: return "Verifying";
        case CopyState::Done:      return "Done";
        case CopyState::Failed:    return "Failed";
        case CopyState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

inline bool isTerminal(CopyState state) {
    return state == CopyState::Done ||
           state == CopyState::Failed ||
           state == CopyState::Cancelled;
}

struct CopyJob {
    std::string id;
    std::string artifactId;
    std::filesystem::path sourcePath;
    std::filesystem::path destPath;
    std::filesystem::path mountPath;
    CopyState state{CopyState::Pending};
    int64_t bytesCopied{0};
    int64_t bytesTotal{0};
    Failure error;
    bool moveSource{false};

    bool isTerminal() const { return wum::isTerminal(state); }
};

/**
 * GameEntry - one "Title [GAMEID]" folder found on a volume
 */
struct GameEntry {
    std::string title;
    std::string gameId;
    std::string region;
    std::filesystem::path directory;
    std::filesystem::path imagePath;   // empty when the folder has no image
    int64_t sizeBytes{0};
};

struct GameCheck {
    GameEntry game;
    bool valid{true};
    std::vector<std::string> problems;
};

} // namespace wum

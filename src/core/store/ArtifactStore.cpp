/**
 * ArtifactStore.cpp
 *
 * Implementation of the artifact index.
 */

#include "ArtifactStore.hpp"
#include "../Logger.hpp"
#include "../device/DiscImage.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

namespace wum::core::store {

using json = nlohmann::json;

namespace {

constexpr int INDEX_VERSION = 1;

int64_t toMillis(Clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

Clock::time_point fromMillis(int64_t millis) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

json toJson(const ArtifactRecord& record) {
    return {
        {"id", record.id},
        {"path", record.path.string()},
        {"size", record.sizeBytes},
        {"checksum", record.checksum},
        {"acquiredAt", toMillis(record.acquiredAt)},
        {"title", record.title},
        {"gameId", record.gameId}
    };
}

ArtifactRecord fromJson(const json& j) {
    ArtifactRecord record;
    record.id = j.at("id").get<std::string>();
    record.path = j.at("path").get<std::string>();
    record.sizeBytes = j.value("size", int64_t{0});
    record.checksum = j.value("checksum", std::string());
    record.acquiredAt = fromMillis(j.value("acquiredAt", int64_t{0}));
    record.title = j.value("title", std::string());
    record.gameId = j.value("gameId", std::string());
    return record;
}

} // namespace

ArtifactStore::ArtifactStore(std::filesystem::path indexPath, std::vector<std::string> imageFormats)
    : m_indexPath(std::move(indexPath))
    , m_imageFormats(std::move(imageFormats)) {
    for (auto& ext : m_imageFormats) {
        ext = utils::StringUtils::toLower(ext);
    }
}

bool ArtifactStore::load() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_indexPath.empty() || !utils::FileUtils::fileExists(m_indexPath)) {
        return true;
    }

    auto content = utils::FileUtils::readFile(m_indexPath);
    if (!content) {
        Logger::instance().error("Cannot read artifact index {}", m_indexPath.string());
        return false;
    }

    try {
        json index = json::parse(*content);
        std::unordered_map<std::string, ArtifactRecord> records;

        for (const auto& entry : index.value("artifacts", json::array())) {
            auto record = fromJson(entry);
            if (record.id.empty()) continue;
            records[record.id] = std::move(record);
        }

        m_records = std::move(records);
        Logger::instance().info("Loaded {} artifact(s) from {}", m_records.size(), m_indexPath.string());
        return true;

    } catch (const json::exception& e) {
        Logger::instance().error("Artifact index {} is corrupt: {}", m_indexPath.string(), e.what());
        return false;
    }
}

bool ArtifactStore::save() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return saveLocked();
}

bool ArtifactStore::saveLocked() const {
    if (m_indexPath.empty()) {
        return true;
    }

    std::vector<const ArtifactRecord*> sorted;
    sorted.reserve(m_records.size());
    for (const auto& [id, record] : m_records) {
        sorted.push_back(&record);
    }
    std::sort(sorted.begin(), sorted.end(), [](const ArtifactRecord* a, const ArtifactRecord* b) {
        return a->id < b->id;
    });

    json artifacts = json::array();
    for (const auto* record : sorted) {
        artifacts.push_back(toJson(*record));
    }

    json index = {
        {"version", INDEX_VERSION},
        {"artifacts", artifacts}
    };

    // Titles scraped from the catalog are not always valid UTF-8
    std::string content;
    try {
        content = index.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        Logger::instance().error("Cannot serialize artifact index {}: {}", m_indexPath.string(), e.what());
        return false;
    }

    if (!utils::FileUtils::writeFileAtomic(m_indexPath, content)) {
        Logger::instance().error("Failed to write artifact index {}", m_indexPath.string());
        return false;
    }
    return true;
}

std::optional<ArtifactRecord> ArtifactStore::lookup(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ArtifactRecord> ArtifactStore::findByContent(int64_t sizeBytes, const std::string& checksum) const {
    if (checksum.empty()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    for (const auto& [id, record] : m_records) {
        if (record.sizeBytes == sizeBytes && record.checksum == checksum) {
            return record;
        }
    }
    return std::nullopt;
}

std::optional<ArtifactRecord> ArtifactStore::findDuplicate(const std::string& id, int64_t sizeBytes,
                                                           const std::string& checksum) const {
    if (auto byId = lookup(id)) {
        return byId;
    }
    return findByContent(sizeBytes, checksum);
}

void ArtifactStore::record(const ArtifactRecord& artifact) {
    if (artifact.id.empty()) {
        throw std::invalid_argument("Artifact record without id");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_records[artifact.id] = artifact;
    saveLocked();

    Logger::instance().debug("Recorded artifact {} -> {}", artifact.id, artifact.path.string());
}

bool ArtifactStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_records.erase(id) == 0) {
        return false;
    }
    saveLocked();
    return true;
}

std::vector<ArtifactRecord> ArtifactStore::all() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<ArtifactRecord> records;
    records.reserve(m_records.size());
    for (const auto& [id, record] : m_records) {
        records.push_back(record);
    }
    std::sort(records.begin(), records.end(), [](const ArtifactRecord& a, const ArtifactRecord& b) {
        return a.id < b.id;
    });
    return records;
}

size_t ArtifactStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

bool ArtifactStore::hasPathLocked(const std::filesystem::path& path) const {
    auto normal = path.lexically_normal();
    for (const auto& [id, record] : m_records) {
        if (record.path.lexically_normal() == normal) {
            return true;
        }
    }
    return false;
}

ReconcileReport ArtifactStore::reconcile(const std::filesystem::path& directory, ChecksumProvider& checksums) {
    ReconcileReport report;
    std::vector<std::pair<std::string, std::filesystem::path>> missingChecksums;

    // Pass 1: drop records whose file is gone
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        for (auto it = m_records.begin(); it != m_records.end();) {
            if (!utils::FileUtils::fileExists(it->second.path)) {
                Logger::instance().info("Artifact {} no longer on disk, dropping record", it->first);
                it = m_records.erase(it);
                ++report.dropped;
                continue;
            }
            if (it->second.checksum.empty()) {
                missingChecksums.emplace_back(it->first, it->second.path);
            }
            ++it;
        }
    }

    // Pass 2: fill in missing checksums
    for (const auto& [id, path] : missingChecksums) {
        auto digest = checksums.compute(path);
        if (digest.empty()) continue;

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(id);
        if (it != m_records.end() && it->second.path == path && it->second.checksum.empty()) {
            it->second.checksum = digest;
            ++report.checksummed;
        }
    }

    // Pass 3: adopt disc images nobody recorded
    for (const auto& file : utils::FileUtils::listFiles(directory, m_imageFormats, true)) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (hasPathLocked(file)) continue;
        }

        auto size = utils::FileUtils::getFileSize(file);
        if (!size) continue;

        auto digest = checksums.compute(file);
        if (digest.empty()) continue;

        if (findByContent(*size, digest)) {
            Logger::instance().debug("Skipping {}: same content already indexed", file.string());
            ++report.skippedDuplicates;
            continue;
        }

        ArtifactRecord record;
        record.path = file;
        record.sizeBytes = *size;
        record.checksum = digest;
        record.acquiredAt = Clock::now();
        record.title = file.stem().string();

        auto header = device::DiscImage::readGameId(file);
        if (auto parts = device::DiscImage::parseName(file.stem().string())) {
            record.title = parts->title;
            record.id = parts->gameId;
        } else if (header) {
            record.id = *header;
        } else {
            record.id = file.stem().string();
        }
        record.gameId = header.value_or(
            device::DiscImage::isValidGameId(record.id) ? record.id : std::string());

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_records.count(record.id) != 0) {
            ++report.skippedDuplicates;
            continue;
        }
        Logger::instance().info("Adopting {} as artifact {}", file.string(), record.id);
        m_records[record.id] = std::move(record);
        ++report.adopted;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (report.dropped > 0 || report.checksummed > 0 || report.adopted > 0) {
            saveLocked();
        }
    }

    Logger::instance().info("Reconciled {}: {} dropped, {} checksummed, {} adopted, {} duplicate(s)",
                            directory.string(), report.dropped, report.checksummed,
                            report.adopted, report.skippedDuplicates);
    return report;
}

} // namespace wum::core::store

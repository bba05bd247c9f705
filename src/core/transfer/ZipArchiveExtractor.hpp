#pragma once

/**
 * ZipArchiveExtractor.hpp
 *
 * libzip-backed extraction of downloaded ZIP archives.
 */

#include "TransferSource.hpp"

namespace wum::core::transfer {

/**
 * ZipArchiveExtractor - recognizes archives by the "PK\x03\x04" signature
 *
 * Entries that would land outside the destination directory (absolute
 * names, ".." components) fail the whole extraction.
 */
class ZipArchiveExtractor : public ArchiveExtractor {
public:
    explicit ZipArchiveExtractor(size_t bufferSize = 1024 * 1024)
        : m_bufferSize(bufferSize) {}

    bool isArchive(const std::filesystem::path& file) const override;

    ExtractionResult extract(const std::filesystem::path& archive,
                             const std::filesystem::path& destination) override;

private:
    size_t m_bufferSize;
};

} // namespace wum::core::transfer

/**
 * ZipArchiveExtractor.cpp
 */

#include "ZipArchiveExtractor.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <zip.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <vector>

namespace wum::core::transfer {

namespace fs = std::filesystem;

namespace {

constexpr uint8_t ZIP_SIGNATURE[] = {'P', 'K', 0x03, 0x04};

struct ZipCloser {
    void operator()(zip_t* archive) const { zip_discard(archive); }
};

struct ZipFileCloser {
    void operator()(zip_file_t* file) const { zip_fclose(file); }
};

using ZipHandle = std::unique_ptr<zip_t, ZipCloser>;
using ZipFileHandle = std::unique_ptr<zip_file_t, ZipFileCloser>;

/**
 * Resolve an entry name below root; empty if it escapes root
 */
fs::path safeEntryPath(const fs::path& root, const std::string& name) {
    fs::path relative = fs::path(name).lexically_normal();
    if (relative.empty() || relative.is_absolute() || relative.has_root_name()) {
        return {};
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return {};
        }
    }
    return root / relative;
}

} // namespace

bool ZipArchiveExtractor::isArchive(const fs::path& file) const {
    auto magic = utils::FileUtils::readBytes(file, 0, sizeof(ZIP_SIGNATURE));
    return magic && std::equal(magic->begin(), magic->end(), ZIP_SIGNATURE);
}

ExtractionResult ZipArchiveExtractor::extract(const fs::path& archivePath, const fs::path& destination) {
    ExtractionResult result;

    int error = 0;
    ZipHandle archive(zip_open(archivePath.string().c_str(), ZIP_RDONLY, &error));
    if (!archive) {
        zip_error_t zipError;
        zip_error_init_with_code(&zipError, error);
        result.error = "Cannot open archive: " + std::string(zip_error_strerror(&zipError));
        zip_error_fini(&zipError);
        return result;
    }

    if (!utils::FileUtils::createDirectories(destination)) {
        result.error = "Cannot create " + destination.string();
        return result;
    }

    std::vector<char> buffer(m_bufferSize);
    zip_int64_t count = zip_get_num_entries(archive.get(), 0);

    for (zip_int64_t i = 0; i < count; ++i) {
        zip_stat_t stat;
        zip_stat_init(&stat);
        if (zip_stat_index(archive.get(), static_cast<zip_uint64_t>(i), 0, &stat) != 0 || !stat.name) {
            result.error = "Cannot read entry " + std::to_string(i);
            return result;
        }

        std::string name = stat.name;
        fs::path target = safeEntryPath(destination, name);
        if (target.empty()) {
            result.error = "Entry escapes the extraction directory: " + name;
            return result;
        }

        if (!name.empty() && name.back() == '/') {
            if (!utils::FileUtils::createDirectories(target)) {
                result.error = "Cannot create " + target.string();
                return result;
            }
            continue;
        }

        if (!utils::FileUtils::createDirectories(target.parent_path())) {
            result.error = "Cannot create " + target.parent_path().string();
            return result;
        }

        ZipFileHandle entry(zip_fopen_index(archive.get(), static_cast<zip_uint64_t>(i), 0));
        if (!entry) {
            result.error = "Cannot open entry " + name + ": " + zip_strerror(archive.get());
            return result;
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            result.error = "Cannot write " + target.string();
            return result;
        }

        zip_int64_t read = 0;
        while ((read = zip_fread(entry.get(), buffer.data(), buffer.size())) > 0) {
            out.write(buffer.data(), static_cast<std::streamsize>(read));
            if (!out) {
                result.error = "Write failed for " + target.string();
                return result;
            }
        }
        if (read < 0) {
            result.error = "Corrupt entry " + name + ": " + zip_file_strerror(entry.get());
            return result;
        }

        result.files.push_back(target);
        Logger::instance().debug("Extracted {} ({} bytes)", name, static_cast<int64_t>(stat.size));
    }

    result.success = true;
    return result;
}

} // namespace wum::core::transfer

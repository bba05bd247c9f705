// Wii Unified Manager - File Utilities
// Cross-platform file system operations

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <cstdint>

namespace fs = std::filesystem;

namespace wum::utils {

/**
 * @brief File and directory utilities
 *
 * Every function is non-throwing; failures are reported through the
 * return value.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);
    static bool isDirectoryEmpty(const fs::path& path);
    static std::vector<fs::path> listFiles(const fs::path& path, const std::vector<std::string>& extensions = {},
                                           bool recursive = false);
    static int64_t getDirectorySize(const fs::path& path);

    /**
     * @brief Remove empty directories from path upwards
     *
     * Walks from `start` towards `stopAt` removing each directory that is
     * empty. `stopAt` itself is never removed, and nothing outside it is
     * touched.
     * @return Number of directories removed
     */
    static int removeEmptyParents(const fs::path& start, const fs::path& stopAt);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool moveFile(const fs::path& source, const fs::path& destination);
    static bool deleteFile(const fs::path& path);
    static std::optional<int64_t> getFileSize(const fs::path& path);
    static std::string getLowerExtension(const fs::path& path);

    // Read/Write operations
    static std::optional<std::string> readFile(const fs::path& path);
    static std::optional<std::vector<uint8_t>> readBytes(const fs::path& path, uint64_t offset, size_t count);

    /**
     * @brief Replace a file's content via a sibling temp file and rename
     */
    static bool writeFileAtomic(const fs::path& path, const std::string& content);

    // Path utilities
    static bool isWithin(const fs::path& path, const fs::path& base);
};

/**
 * @brief RAII advisory lock on a lock file
 */
class FileLock {
public:
    explicit FileLock(const fs::path& path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool isLocked() const { return m_locked; }
    void unlock();

private:
    fs::path m_path;
    bool m_locked{false};

#ifdef _WIN32
    void* m_handle{nullptr};
#else
    int m_fd{-1};
#endif
};

} // namespace wum::utils

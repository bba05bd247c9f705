/**
 * FileUtils.cpp
 *
 * Cross-platform file system operations.
 */

#include "FileUtils.hpp"
#include "StringUtils.hpp"

#include <fstream>
#include <algorithm>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#endif

namespace wum::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool FileUtils::isDirectoryEmpty(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec) && fs::is_empty(path, ec) && !ec;
}

std::vector<fs::path> FileUtils::listFiles(const fs::path& path, const std::vector<std::string>& extensions,
                                           bool recursive) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return files;

    auto accept = [&](const fs::directory_entry& e) {
        if (!e.is_regular_file(ec)) return;
        if (!extensions.empty()) {
            auto ext = getLowerExtension(e.path());
            if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) return;
        }
        files.push_back(e.path());
    };

    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            accept(*it);
        }
    } else {
        for (auto it = fs::directory_iterator(path, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            accept(*it);
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

int64_t FileUtils::getDirectorySize(const fs::path& path) {
    int64_t size = 0;
    for (const auto& file : listFiles(path, {}, true)) {
        size += getFileSize(file).value_or(0);
    }
    return size;
}

int FileUtils::removeEmptyParents(const fs::path& start, const fs::path& stopAt) {
    int removed = 0;
    std::error_code ec;
    fs::path stop = stopAt.lexically_normal();
    fs::path current = start.lexically_normal();

    while (current != stop && isWithin(current, stop)) {
        if (!isDirectoryEmpty(current)) break;
        if (!fs::remove(current, ec) || ec) break;
        ++removed;
        current = current.parent_path();
    }
    return removed;
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::rename(source, destination, ec);
    return !ec;
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::optional<int64_t> FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<int64_t>(size);
}

std::string FileUtils::getLowerExtension(const fs::path& path) {
    return StringUtils::toLower(path.extension().string());
}

// -- Read/Write --

std::optional<std::string> FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::optional<std::vector<uint8_t>> FileUtils::readBytes(const fs::path& path, uint64_t offset, size_t count) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;

    file.seekg(static_cast<std::streamoff>(offset));
    if (!file) return std::nullopt;

    std::vector<uint8_t> data(count);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(count));
    if (file.gcount() != static_cast<std::streamsize>(count)) return std::nullopt;
    return data;
}

bool FileUtils::writeFileAtomic(const fs::path& path, const std::string& content) {
    if (path.has_parent_path() && !createDirectories(path.parent_path())) return false;

    fs::path temp = path;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) return false;
        file << content;
        file.flush();
        if (!file) {
            deleteFile(temp);
            return false;
        }
    }

    if (!moveFile(temp, path)) {
        deleteFile(temp);
        return false;
    }
    return true;
}

// -- Path utilities --

bool FileUtils::isWithin(const fs::path& path, const fs::path& base) {
    auto rel = path.lexically_normal().lexically_relative(base.lexically_normal());
    if (rel.empty()) return false;
    auto first = rel.begin();
    return first == rel.end() || *first != "..";
}

// -- FileLock --

FileLock::FileLock(const fs::path& path) : m_path(path) {
#ifdef _WIN32
    m_handle = CreateFileA(path.string().c_str(), GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    m_locked = (m_handle != INVALID_HANDLE_VALUE);
#else
    m_fd = open(path.string().c_str(), O_CREAT | O_WRONLY, 0644);
    if (m_fd >= 0) {
        m_locked = flock(m_fd, LOCK_EX | LOCK_NB) == 0;
        if (!m_locked) {
            close(m_fd);
            m_fd = -1;
        }
    }
#endif
}

FileLock::~FileLock() { unlock(); }

void FileLock::unlock() {
    if (!m_locked) return;
#ifdef _WIN32
    if (m_handle) { CloseHandle(m_handle); m_handle = nullptr; }
#else
    if (m_fd >= 0) { flock(m_fd, LOCK_UN); close(m_fd); m_fd = -1; }
#endif
    m_locked = false;
    std::error_code ec;
    fs::remove(m_path, ec);
}

} // namespace wum::utils

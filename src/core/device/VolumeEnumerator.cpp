/**
 * VolumeEnumerator.cpp
 */

#include "VolumeEnumerator.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace wum::core::device {

namespace {

const std::vector<std::string> REMOVABLE_FS_TYPES = {"vfat", "exfat", "ntfs", "ntfs3", "fuseblk", "msdos"};
const std::vector<std::string> SYSTEM_MOUNTS = {"/", "/boot", "/boot/efi", "/home"};

std::string unescape(const std::string& field) {
    std::string out;
    out.reserve(field.size());

    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            std::isdigit(static_cast<unsigned char>(field[i + 1])) &&
            std::isdigit(static_cast<unsigned char>(field[i + 2])) &&
            std::isdigit(static_cast<unsigned char>(field[i + 3]))) {
            out += static_cast<char>(std::stoi(field.substr(i + 1, 3), nullptr, 8));
            i += 3;
        } else {
            out += field[i];
        }
    }
    return out;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

SystemVolumeEnumerator::SystemVolumeEnumerator(fs::path mountsFile, fs::path sysBlockDir, fs::path labelDir)
    : m_mountsFile(std::move(mountsFile))
    , m_sysBlockDir(std::move(sysBlockDir))
    , m_labelDir(std::move(labelDir)) {
}

std::optional<MountEntry> SystemVolumeEnumerator::parseMountLine(const std::string& line) {
    std::istringstream stream(line);
    std::string device, mount, type, options;
    if (!(stream >> device >> mount >> type)) {
        return std::nullopt;
    }
    stream >> options;

    MountEntry entry;
    entry.device = unescape(device);
    entry.mountPath = unescape(mount);
    entry.fsType = type;
    entry.options = options;
    return entry;
}

bool SystemVolumeEnumerator::looksRemovable(const MountEntry& entry, bool sysfsRemovable) {
    if (!utils::StringUtils::startsWith(entry.device, "/dev/")) {
        return false;
    }

    const std::string mount = entry.mountPath.string();
    if (contains(SYSTEM_MOUNTS, mount)) {
        return false;
    }
    if (sysfsRemovable) {
        return true;
    }
    if (utils::StringUtils::startsWith(mount, "/media/") || utils::StringUtils::startsWith(mount, "/run/media/")) {
        return true;
    }
    return contains(REMOVABLE_FS_TYPES, utils::StringUtils::toLower(entry.fsType));
}

std::string SystemVolumeEnumerator::diskName(const std::string& device) {
    std::string name = fs::path(device).filename().string();

    // nvme0n1p1, mmcblk0p1: partition suffix is "p<digits>" after a digit
    auto p = name.find_last_of('p');
    if (p != std::string::npos && p > 0 && p + 1 < name.size() &&
        std::isdigit(static_cast<unsigned char>(name[p - 1])) &&
        std::all_of(name.begin() + static_cast<std::ptrdiff_t>(p) + 1, name.end(),
                    [](unsigned char c) { return std::isdigit(c); })) {
        return name.substr(0, p);
    }

    // sdb1 -> sdb
    while (!name.empty() && std::isdigit(static_cast<unsigned char>(name.back()))) {
        name.pop_back();
    }
    return name;
}

bool SystemVolumeEnumerator::sysfsRemovable(const std::string& device) const {
    // Whole-disk devices have their own sysfs entry
    auto whole = m_sysBlockDir / fs::path(device).filename() / "removable";
    auto flag = utils::FileUtils::readFile(utils::FileUtils::fileExists(whole)
        ? whole
        : m_sysBlockDir / diskName(device) / "removable");
    return flag && utils::StringUtils::trim(*flag) == "1";
}

std::string SystemVolumeEnumerator::labelFor(const MountEntry& entry) const {
    std::error_code ec;
    for (auto it = fs::directory_iterator(m_labelDir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        auto target = fs::canonical(it->path(), ec);
        if (!ec && target == fs::path(entry.device)) {
            return unescape(it->path().filename().string());
        }
        ec.clear();
    }

    auto name = entry.mountPath.filename().string();
    return name.empty() ? entry.device : name;
}

std::vector<Volume> SystemVolumeEnumerator::enumerate() {
    std::vector<Volume> volumes;

    std::ifstream mounts(m_mountsFile);
    if (!mounts.is_open()) {
        Logger::instance().warn("Cannot read {}", m_mountsFile.string());
        return volumes;
    }

    std::string line;
    while (std::getline(mounts, line)) {
        auto entry = parseMountLine(line);
        if (!entry) continue;

        bool removableFlag = utils::StringUtils::startsWith(entry->device, "/dev/") && sysfsRemovable(entry->device);
        if (!looksRemovable(*entry, removableFlag)) continue;

        auto space = querySpace(entry->mountPath);
        if (!space) continue;

        bool seen = std::any_of(volumes.begin(), volumes.end(), [&](const Volume& v) {
            return v.mountPath == entry->mountPath;
        });
        if (seen) continue;

        Volume volume;
        volume.mountPath = entry->mountPath;
        volume.device = entry->device;
        volume.fsType = entry->fsType;
        volume.label = labelFor(*entry);
        volume.totalBytes = space->totalBytes;
        volume.freeBytes = space->freeBytes;
        volume.isRemovable = true;
        volumes.push_back(std::move(volume));
    }

    Logger::instance().debug("Found {} removable volume(s)", volumes.size());
    return volumes;
}

std::optional<VolumeSpace> SystemVolumeEnumerator::querySpace(const fs::path& mountPath) {
    std::error_code ec;
    auto info = fs::space(mountPath, ec);
    if (ec) {
        Logger::instance().debug("Cannot query space of {}: {}", mountPath.string(), ec.message());
        return std::nullopt;
    }
    return VolumeSpace{static_cast<int64_t>(info.capacity), static_cast<int64_t>(info.available)};
}

} // namespace wum::core::device

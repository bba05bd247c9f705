#pragma once

/**
 * VolumeEnumerator.hpp
 *
 * Discovery of mounted removable volumes.
 */

#include "../models/Models.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wum::core::device {

namespace fs = std::filesystem;

class VolumeEnumerator {
public:
    virtual ~VolumeEnumerator() = default;

    /**
     * Removable volumes mounted right now
     */
    virtual std::vector<Volume> enumerate() = 0;

    /**
     * Current capacity of a mounted filesystem
     * @return nullopt if the mount cannot be queried
     */
    virtual std::optional<VolumeSpace> querySpace(const fs::path& mountPath) = 0;
};

/**
 * One line of /proc/mounts
 */
struct MountEntry {
    std::string device;
    fs::path mountPath;
    std::string fsType;
    std::string options;
};

/**
 * SystemVolumeEnumerator - Linux implementation
 *
 * Reads /proc/mounts and treats a block device as removable when sysfs
 * flags it, when it is mounted below /media or /run/media, or when it
 * carries a FAT/exFAT/NTFS filesystem outside the system mounts.
 */
class SystemVolumeEnumerator : public VolumeEnumerator {
public:
    explicit SystemVolumeEnumerator(fs::path mountsFile = "/proc/mounts",
                                    fs::path sysBlockDir = "/sys/block",
                                    fs::path labelDir = "/dev/disk/by-label");

    std::vector<Volume> enumerate() override;
    std::optional<VolumeSpace> querySpace(const fs::path& mountPath) override;

    /**
     * Parse a /proc/mounts line, decoding octal escapes (\040 etc.)
     */
    static std::optional<MountEntry> parseMountLine(const std::string& line);

    /**
     * Removable-media heuristic applied to a mount entry
     * @param sysfsRemovable Value of /sys/block/<disk>/removable
     */
    static bool looksRemovable(const MountEntry& entry, bool sysfsRemovable);

    /**
     * Parent disk of a partition device ("/dev/sdb1" -> "sdb", "/dev/mmcblk0p1" -> "mmcblk0")
     */
    static std::string diskName(const std::string& device);

private:
    bool sysfsRemovable(const std::string& device) const;
    std::string labelFor(const MountEntry& entry) const;

    fs::path m_mountsFile;
    fs::path m_sysBlockDir;
    fs::path m_labelDir;
};

} // namespace wum::core::device

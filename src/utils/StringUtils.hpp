// Wii Unified Manager - String Utilities
// String manipulation and formatting

#pragma once

#include <string>
#include <vector>
#include <sstream>
#include <algorithm>
#include <iomanip>
#include <chrono>
#include <cstdint>
#include <optional>

namespace wum::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    // Splitting and joining
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Search and replace
    static std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatRate(double bytesPerSecond);
    static std::string formatDuration(std::chrono::seconds duration);
    static std::string formatTimestamp(std::chrono::system_clock::time_point time,
                                        const std::string& format = "%Y-%m-%d %H:%M:%S");
    static std::string formatPercentage(double value, int precision = 1);

    /**
     * @brief Map an opaque catalog key onto a portable file name
     *
     * Keeps [A-Za-z0-9._-] and replaces everything else with '_'.
     */
    static std::string sanitizeFileName(const std::string& name);

    /**
     * @brief Strip characters FAT32/exFAT reject, keeping spaces and brackets
     */
    static std::string sanitizeTitle(const std::string& title);

    /**
     * @brief Parse a catalog size label into bytes
     *
     * Accepts "4,699,979,776 bytes" and "1.2 GB" / "700 MB" / "512 KB".
     * @return Byte count, or std::nullopt when the label is not understood
     */
    static std::optional<int64_t> parseSize(const std::string& label);

    // Parsing
    static int parseInt(const std::string& str, int defaultValue = 0);
    static bool parseBool(const std::string& str, bool defaultValue = false);
};

} // namespace wum::utils

/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <cctype>
#include <cmath>
#include <ctime>
#include <stdexcept>

namespace wum::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// -- Split/Join --

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) parts.push_back(part);
    return parts;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& separator) {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) result += separator + parts[i];
    return result;
}

// -- Search/Replace --

std::string StringUtils::replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatRate(double bytesPerSecond) {
    if (bytesPerSecond <= 0.0 || !std::isfinite(bytesPerSecond)) return "-";
    return formatBytes(static_cast<int64_t>(bytesPerSecond)) + "/s";
}

std::string StringUtils::formatDuration(std::chrono::seconds duration) {
    auto h = std::chrono::duration_cast<std::chrono::hours>(duration);
    auto m = std::chrono::duration_cast<std::chrono::minutes>(duration - h);
    auto s = duration - h - m;
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << h.count() << ":"
        << std::setfill('0') << std::setw(2) << m.count() << ":"
        << std::setfill('0') << std::setw(2) << s.count();
    return oss.str();
}

std::string StringUtils::formatTimestamp(std::chrono::system_clock::time_point time, const std::string& format) {
    auto tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

std::string StringUtils::formatPercentage(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << (value * 100.0) << "%";
    return oss.str();
}

std::string StringUtils::sanitizeFileName(const std::string& name) {
    std::string result;
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.') result += c;
        else result += '_';
    }
    if (result.empty() || result == "." || result == "..") {
        result = "_" + result;
    }
    return result;
}

std::string StringUtils::sanitizeTitle(const std::string& title) {
    static const std::string forbidden = "<>:\"/\\|?*";
    std::string result;
    for (char c : title) {
        if (static_cast<unsigned char>(c) < 0x20 || forbidden.find(c) != std::string::npos) continue;
        result += c;
    }
    result = trim(result);
    // FAT drops trailing dots silently, which would break the rename.
    while (!result.empty() && result.back() == '.') result.pop_back();
    return result;
}

std::optional<int64_t> StringUtils::parseSize(const std::string& label) {
    std::string lower = toLower(trim(label));
    if (lower.empty()) return std::nullopt;

    auto bytesPos = lower.find("bytes");
    if (bytesPos != std::string::npos) {
        std::string digits;
        for (size_t i = 0; i < bytesPos; ++i) {
            if (std::isdigit(static_cast<unsigned char>(lower[i]))) digits += lower[i];
        }
        if (digits.empty()) return std::nullopt;
        try {
            return std::stoll(digits);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    struct Unit { const char* suffix; int64_t factor; };
    static const Unit units[] = {
        {"gb", 1024LL * 1024 * 1024},
        {"mb", 1024LL * 1024},
        {"kb", 1024LL},
    };

    for (const auto& unit : units) {
        auto pos = lower.find(unit.suffix);
        if (pos == std::string::npos) continue;

        std::string number = replaceAll(trim(lower.substr(0, pos)), ",", ".");
        try {
            size_t consumed = 0;
            double value = std::stod(number, &consumed);
            if (consumed == 0 || value < 0.0) return std::nullopt;
            return static_cast<int64_t>(value * static_cast<double>(unit.factor));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// -- Parsing --

int StringUtils::parseInt(const std::string& str, int defaultValue) {
    try { return std::stoi(str); } catch (const std::exception&) { return defaultValue; }
}

bool StringUtils::parseBool(const std::string& str, bool defaultValue) {
    auto lower = toLower(trim(str));
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    return defaultValue;
}

} // namespace wum::utils

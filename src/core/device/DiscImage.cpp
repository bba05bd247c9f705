/**
 * DiscImage.cpp
 */

#include "DiscImage.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <cctype>

namespace wum::core::device {

namespace {

constexpr char WBFS_MAGIC[] = {'W', 'B', 'F', 'S'};

} // namespace

bool DiscImage::isWbfsContainer(const fs::path& image) {
    if (utils::FileUtils::getLowerExtension(image) == ".wbfs") {
        return true;
    }
    auto magic = utils::FileUtils::readBytes(image, 0, sizeof(WBFS_MAGIC));
    return magic && std::equal(magic->begin(), magic->end(), WBFS_MAGIC);
}

std::string DiscImage::detectExtension(const fs::path& image) {
    if (isWbfsContainer(image)) {
        return ".wbfs";
    }
    return readGameId(image) ? ".iso" : std::string();
}

std::optional<std::string> DiscImage::readGameId(const fs::path& image) {
    uint64_t offset = isWbfsContainer(image) ? WBFS_GAME_ID_OFFSET : 0;

    auto bytes = utils::FileUtils::readBytes(image, offset, GAME_ID_LENGTH);
    if (!bytes || bytes->size() != GAME_ID_LENGTH) {
        return std::nullopt;
    }

    std::string id(bytes->begin(), bytes->end());
    if (!isValidGameId(id)) {
        return std::nullopt;
    }
    return id;
}

bool DiscImage::isValidGameId(const std::string& id) {
    return id.size() == GAME_ID_LENGTH &&
           std::all_of(id.begin(), id.end(), [](unsigned char c) {
               return c < 0x80 && std::isalnum(c);
           });
}

std::optional<DiscImage::NameParts> DiscImage::parseName(const std::string& name) {
    auto open = name.rfind('[');
    auto close = name.rfind(']');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    NameParts parts;
    parts.title = utils::StringUtils::trim(name.substr(0, open));
    parts.gameId = utils::StringUtils::trim(name.substr(open + 1, close - open - 1));

    if (parts.title.empty() || parts.gameId.empty()) {
        return std::nullopt;
    }
    return parts;
}

std::string DiscImage::formatName(const std::string& title, const std::string& gameId) {
    return utils::StringUtils::sanitizeTitle(title) + " [" + gameId + "]";
}

std::string DiscImage::regionOf(const std::string& gameId) {
    if (gameId.size() < 4) {
        return "Unknown";
    }
    switch (std::toupper(static_cast<unsigned char>(gameId[3]))) {
        case 'E': return "USA";
        case 'P': return "Europe";
        case 'J': return "Japan";
        case 'K': return "Korea";
        default:  return "Unknown";
    }
}

} // namespace wum::core::device

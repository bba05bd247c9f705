#pragma once

/**
 * DiscImage.hpp
 *
 * Wii disc image naming helpers: the 6-character game id stored in the
 * image header and the "Title [GAMEID]" layout used by USB loaders.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace wum::core::device {

namespace fs = std::filesystem;

class DiscImage {
public:
    struct NameParts {
        std::string title;
        std::string gameId;
    };

    // Header offset of the game id in a WBFS container; raw ISO images start with it
    static constexpr uint64_t WBFS_GAME_ID_OFFSET = 0x200;
    static constexpr size_t GAME_ID_LENGTH = 6;

    /**
     * Read the game id from an image header
     * @param image .wbfs or .iso file
     * @return Game id, or nullopt if the header is unreadable or not a valid id
     */
    static std::optional<std::string> readGameId(const fs::path& image);

    static bool isWbfsContainer(const fs::path& image);

    /**
     * Extension matching the image content: ".wbfs" for a WBFS container,
     * ".iso" for a raw disc image, empty if neither
     */
    static std::string detectExtension(const fs::path& image);

    /**
     * Six ASCII letters or digits
     */
    static bool isValidGameId(const std::string& id);

    /**
     * Split "Title [GAMEID]" into its parts
     */
    static std::optional<NameParts> parseName(const std::string& name);

    /**
     * "Title [GAMEID]"
     */
    static std::string formatName(const std::string& title, const std::string& gameId);

    /**
     * Region of a game id, from its 4th character (E, P, J, K)
     */
    static std::string regionOf(const std::string& gameId);
};

} // namespace wum::core::device

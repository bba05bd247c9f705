#include <catch2/catch.hpp>

#include "core/device/DiscImage.hpp"
#include "support/FakeCollaborators.hpp"

using wum::core::device::DiscImage;
using wum::test::TempDir;
using wum::test::writeFile;

TEST_CASE("Game ids are read from raw and WBFS headers") {
    TempDir dir;

    writeFile(dir / "raw.iso", wum::test::discImage("RMCE01", 1024));
    CHECK(DiscImage::readGameId(dir / "raw.iso") == std::optional<std::string>("RMCE01"));
    CHECK_FALSE(DiscImage::isWbfsContainer(dir / "raw.iso"));
    CHECK(DiscImage::detectExtension(dir / "raw.iso") == ".iso");

    // WBFS magic is enough even without the extension
    writeFile(dir / "container.bin", wum::test::discImage("RSPP01", 1024, DiscImage::WBFS_GAME_ID_OFFSET));
    CHECK(DiscImage::isWbfsContainer(dir / "container.bin"));
    CHECK(DiscImage::readGameId(dir / "container.bin") == std::optional<std::string>("RSPP01"));
    CHECK(DiscImage::detectExtension(dir / "container.bin") == ".wbfs");
}

TEST_CASE("Unreadable or short headers have no game id") {
    TempDir dir;

    writeFile(dir / "short.iso", "RMC");
    CHECK_FALSE(DiscImage::readGameId(dir / "short.iso"));

    writeFile(dir / "text.iso", "hello world, not a disc");
    CHECK_FALSE(DiscImage::readGameId(dir / "text.iso"));
    CHECK(DiscImage::detectExtension(dir / "text.iso").empty());

    CHECK_FALSE(DiscImage::readGameId(dir / "missing.iso"));
}

TEST_CASE("Game ids are six ASCII letters or digits") {
    CHECK(DiscImage::isValidGameId("RMCE01"));
    CHECK(DiscImage::isValidGameId("r0000z"));
    CHECK_FALSE(DiscImage::isValidGameId("RMCE0"));
    CHECK_FALSE(DiscImage::isValidGameId("RMCE012"));
    CHECK_FALSE(DiscImage::isValidGameId("RMC-01"));
    CHECK_FALSE(DiscImage::isValidGameId(""));
}

TEST_CASE("Loader folder names split into title and game id") {
    auto parts = DiscImage::parseName("Mario Kart Wii [RMCE01]");
    REQUIRE(parts);
    CHECK(parts->title == "Mario Kart Wii");
    CHECK(parts->gameId == "RMCE01");

    // Brackets inside the title belong to the title
    parts = DiscImage::parseName("Game [Demo] [RDME01]");
    REQUIRE(parts);
    CHECK(parts->title == "Game [Demo]");
    CHECK(parts->gameId == "RDME01");

    CHECK_FALSE(DiscImage::parseName("No id here"));
    CHECK_FALSE(DiscImage::parseName("[RMCE01]"));
    CHECK_FALSE(DiscImage::parseName("Title []"));
}

TEST_CASE("Folder names drop characters FAT cannot store") {
    CHECK(DiscImage::formatName("Mario Kart Wii", "RMCE01") == "Mario Kart Wii [RMCE01]");
    CHECK(DiscImage::formatName("Zelda: Twilight Princess?", "RZDE01") == "Zelda Twilight Princess [RZDE01]");
}

TEST_CASE("Regions come from the fourth character of the game id") {
    CHECK(DiscImage::regionOf("RMCE01") == "USA");
    CHECK(DiscImage::regionOf("RMCP01") == "Europe");
    CHECK(DiscImage::regionOf("rmcj01") == "Japan");
    CHECK(DiscImage::regionOf("RMCK01") == "Korea");
    CHECK(DiscImage::regionOf("RMCX01") == "Unknown");
    CHECK(DiscImage::regionOf("RM") == "Unknown");
}

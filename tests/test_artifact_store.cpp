#include <catch2/catch.hpp>

#include "core/store/ArtifactStore.hpp"
#include "core/store/ChecksumProvider.hpp"
#include "utils/HashUtils.hpp"
#include "support/FakeCollaborators.hpp"

#include <nlohmann/json.hpp>

using namespace wum;
using namespace wum::core::store;
using wum::test::TempDir;
using wum::test::writeFile;

namespace {

ArtifactRecord makeRecord(const std::string& id, const std::filesystem::path& path,
                          const std::string& checksum = "", int64_t size = 0) {
    ArtifactRecord record;
    record.id = id;
    record.path = path;
    record.checksum = checksum;
    record.sizeBytes = size;
    record.acquiredAt = Clock::now();
    return record;
}

} // namespace

TEST_CASE("ArtifactStore records and looks up by id") {
    ArtifactStore store;
    store.record(makeRecord("1", "/tmp/a.wbfs"));

    auto found = store.lookup("1");
    REQUIRE(found);
    CHECK(found->path == "/tmp/a.wbfs");
    CHECK_FALSE(store.lookup("2"));
    CHECK(store.size() == 1);
}

TEST_CASE("ArtifactStore replaces a record with the same id") {
    ArtifactStore store;
    store.record(makeRecord("1", "/tmp/a.wbfs"));
    store.record(makeRecord("1", "/tmp/b.wbfs"));

    CHECK(store.size() == 1);
    CHECK(store.lookup("1")->path == "/tmp/b.wbfs");
}

TEST_CASE("ArtifactStore rejects records without an id") {
    ArtifactStore store;
    CHECK_THROWS_AS(store.record(makeRecord("", "/tmp/a.wbfs")), std::invalid_argument);
}

TEST_CASE("ArtifactStore finds duplicates by id first, then by content") {
    ArtifactStore store;
    store.record(makeRecord("1", "/tmp/a.wbfs", "abc", 10));

    CHECK(store.findDuplicate("1", 0, "")->id == "1");
    CHECK(store.findDuplicate("2", 10, "abc")->id == "1");
    CHECK_FALSE(store.findDuplicate("2", 11, "abc"));
    CHECK_FALSE(store.findByContent(10, ""));
}

TEST_CASE("ArtifactStore lists records sorted by id and removes them") {
    ArtifactStore store;
    store.record(makeRecord("b", "/tmp/b"));
    store.record(makeRecord("a", "/tmp/a"));

    auto all = store.all();
    REQUIRE(all.size() == 2);
    CHECK(all[0].id == "a");
    CHECK(all[1].id == "b");

    CHECK(store.remove("a"));
    CHECK_FALSE(store.remove("a"));
    CHECK(store.size() == 1);
}

TEST_CASE("ArtifactStore persists its index as JSON") {
    TempDir dir;
    auto index = dir / "artifacts.json";

    {
        ArtifactStore store(index);
        auto record = makeRecord("42", dir / "game.wbfs", "deadbeef", 1234);
        record.title = "Wii Sports";
        record.gameId = "RSPE01";
        store.record(record);
    }

    auto json = nlohmann::json::parse(wum::test::readFile(index));
    CHECK(json["version"] == 1);
    REQUIRE(json["artifacts"].size() == 1);
    CHECK(json["artifacts"][0]["id"] == "42");
    CHECK(json["artifacts"][0]["gameId"] == "RSPE01");

    ArtifactStore reloaded(index);
    REQUIRE(reloaded.load());
    auto record = reloaded.lookup("42");
    REQUIRE(record);
    CHECK(record->path == dir / "game.wbfs");
    CHECK(record->checksum == "deadbeef");
    CHECK(record->sizeBytes == 1234);
    CHECK(record->title == "Wii Sports");
    CHECK_FALSE(std::filesystem::exists(dir / "artifacts.json.tmp"));
}

TEST_CASE("ArtifactStore keeps its records when the index is corrupt") {
    TempDir dir;
    auto index = dir / "artifacts.json";
    writeFile(index, "{ not json");

    ArtifactStore store(index);
    store.record(makeRecord("1", "/tmp/a"));
    CHECK_FALSE(store.load());
    CHECK(store.size() == 1);
}

TEST_CASE("A missing index loads as empty") {
    TempDir dir;
    ArtifactStore store(dir / "none.json");
    CHECK(store.load());
    CHECK(store.size() == 0);
}

TEST_CASE("Reconcile drops records whose file is gone") {
    TempDir dir;
    writeFile(dir / "present.wbfs", "present");

    ArtifactStore store;
    store.record(makeRecord("present", dir / "present.wbfs", "x", 7));
    store.record(makeRecord("missing", dir / "missing.wbfs", "y", 7));

    HashChecksumProvider checksums;
    auto report = store.reconcile(dir.path(), checksums);

    CHECK(report.dropped == 1);
    CHECK(store.lookup("present"));
    CHECK_FALSE(store.lookup("missing"));
}

TEST_CASE("Reconcile fills in missing checksums") {
    TempDir dir;
    writeFile(dir / "a.bin", "content");

    ArtifactStore store;
    store.record(makeRecord("a", dir / "a.bin"));

    HashChecksumProvider checksums;
    auto report = store.reconcile(dir.path(), checksums);

    CHECK(report.checksummed == 1);
    CHECK(store.lookup("a")->checksum == utils::HashUtils::sha1String("content"));
}

TEST_CASE("Reconcile adopts unknown disc images") {
    TempDir dir;
    writeFile(dir / "Mario Kart Wii [RMCE01]" / "Mario Kart Wii [RMCE01].wbfs",
              wum::test::discImage("RMCE01", 2048, 0x200));
    writeFile(dir / "nested" / "header.iso", wum::test::discImage("RSPP01", 2048));
    writeFile(dir / "notes.txt", "not an image");

    ArtifactStore store;
    HashChecksumProvider checksums;
    auto report = store.reconcile(dir.path(), checksums);

    CHECK(report.adopted == 2);

    auto named = store.lookup("RMCE01");
    REQUIRE(named);
    CHECK(named->title == "Mario Kart Wii");
    CHECK(named->gameId == "RMCE01");
    CHECK(named->sizeBytes == 2048);
    CHECK_FALSE(named->checksum.empty());

    auto byHeader = store.lookup("RSPP01");
    REQUIRE(byHeader);
    CHECK(byHeader->title == "header");

    // A second pass finds nothing new
    auto again = store.reconcile(dir.path(), checksums);
    CHECK(again.adopted == 0);
    CHECK(store.size() == 2);
}

TEST_CASE("Reconcile skips images whose content is already indexed") {
    TempDir dir;
    const auto image = wum::test::discImage("RSBE01", 1024);
    writeFile(dir / "original.iso", image);
    writeFile(dir / "copy" / "duplicate.iso", image);

    ArtifactStore store;
    HashChecksumProvider checksums;
    store.record(makeRecord("known", dir / "original.iso", checksums.compute(dir / "original.iso"), 1024));

    auto report = store.reconcile(dir.path(), checksums);
    CHECK(report.adopted == 0);
    CHECK(report.skippedDuplicates == 1);
    CHECK(store.size() == 1);
}

TEST_CASE("HashChecksumProvider digests files") {
    TempDir dir;
    writeFile(dir / "f", "abc");

    HashChecksumProvider sha1;
    CHECK(sha1.compute(dir / "f") == "a9993e364706816aba3e25717850c26c9cd0d89d");

    HashChecksumProvider sha256(ChecksumAlgorithm::Sha256);
    CHECK(sha256.compute(dir / "f") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    CHECK(sha1.compute(dir / "missing").empty());
    CHECK(HashChecksumProvider::parseAlgorithm("SHA256") == ChecksumAlgorithm::Sha256);
    CHECK(HashChecksumProvider::parseAlgorithm("md5") == ChecksumAlgorithm::Sha1);
}

TEST_CASE("ArtifactStore saves titles that are not valid UTF-8") {
    TempDir dir;
    auto index = dir / "artifacts.json";

    ArtifactStore store(index);
    auto record = makeRecord("1001", dir / "game.wbfs");
    record.title = "Pok\xe9mon Battle Revolution";
    REQUIRE_NOTHROW(store.record(record));
    CHECK(store.lookup("1001")->title == record.title);

    ArtifactStore reloaded(index);
    REQUIRE(reloaded.load());
    auto saved = reloaded.lookup("1001");
    REQUIRE(saved);
    CHECK(saved->title == "Pok\xef\xbf\xbdmon Battle Revolution");
}

#include <catch2/catch.hpp>

#include "core/device/DeviceCopyManager.hpp"
#include "support/FakeCollaborators.hpp"

#include <future>

using namespace wum;
using namespace wum::core::device;
using wum::core::store::ArtifactStore;
using wum::core::store::HashChecksumProvider;
using wum::test::TempDir;
using wum::test::writeFile;
using wum::test::readFile;

namespace fs = std::filesystem;

namespace {

constexpr int64_t GiB = 1024LL * 1024 * 1024;

struct CopyFixture {
    TempDir dir;
    fs::path mount = dir / "usb";
    std::shared_ptr<ArtifactStore> store = std::make_shared<ArtifactStore>();
    std::shared_ptr<HashChecksumProvider> checksums = std::make_shared<HashChecksumProvider>();
    std::shared_ptr<wum::test::FakeVolumeEnumerator> volumes = std::make_shared<wum::test::FakeVolumeEnumerator>();
    std::shared_ptr<wum::test::RecordingReporter> reporter = std::make_shared<wum::test::RecordingReporter>();
    std::unique_ptr<DeviceCopyManager> manager;

    CopyFixture() {
        fs::create_directories(mount);
        volumes->addVolume(mount, 16 * GiB);

        DeviceOptions options;
        options.bufferSize = 4096;
        manager = std::make_unique<DeviceCopyManager>(options,
            DeviceServices{store, volumes, checksums, reporter});
    }

    ~CopyFixture() {
        manager.reset();
    }

    Volume volume() const { return volumes->volume(0); }

    /**
     * Put a disc image on the local disk and index it
     */
    ArtifactRecord addArtifact(const std::string& id, const std::string& title, const std::string& gameId,
                               size_t size = 8192) {
        auto path = dir / "local" / (title + " [" + gameId + "].wbfs");
        writeFile(path, wum::test::discImage(gameId, size, 0x200));

        ArtifactRecord record;
        record.id = id;
        record.path = path;
        record.sizeBytes = static_cast<int64_t>(size);
        record.checksum = checksums->compute(path);
        record.acquiredAt = Clock::now();
        record.title = title;
        record.gameId = gameId;
        store->record(record);
        return record;
    }

    CopyJob finish(const CopyResult& result) {
        REQUIRE(result.accepted());
        REQUIRE(result.job);
        REQUIRE(manager->waitForIdle(std::chrono::seconds(10)));
        auto job = manager->getJob(result.job->id);
        REQUIRE(job);
        return *job;
    }
};

/**
 * One-shot gate a progress hook can block on
 */
struct Gate {
    std::promise<void> promise;
    std::shared_future<void> future{promise.get_future().share()};

    void open() { promise.set_value(); }
    void wait() const { future.wait_for(std::chrono::seconds(10)); }
};

} // namespace

TEST_CASE_METHOD(CopyFixture, "A copy lands in the loader layout with the same checksum") {
    auto record = addArtifact("1001", "Mario Kart Wii", "RMCE01");

    auto job = finish(manager->copyArtifact("1001", volume()));

    auto expected = mount / "wbfs" / "Mario Kart Wii [RMCE01]" / "Mario Kart Wii [RMCE01].wbfs";
    CHECK(job.state == CopyState::Done);
    CHECK(job.destPath == expected);
    CHECK(job.bytesCopied == 8192);
    REQUIRE(fs::exists(expected));
    CHECK(checksums->compute(expected) == record.checksum);
    CHECK_FALSE(fs::exists(fs::path(expected.string() + DeviceCopyManager::TEMP_SUFFIX)));

    CHECK(reporter->copyStates(job.id) ==
          std::vector<CopyState>{CopyState::Pending, CopyState::Copying, CopyState::Verifying, CopyState::Done});

    auto progress = reporter->copyProgress();
    REQUIRE(progress.size() == 2);
    CHECK(progress[0].bytesCopied == 4096);
    CHECK(progress.back().bytesCopied == 8192);
    CHECK(progress.back().bytesTotal == 8192);

    // Source stays without moveSource
    CHECK(fs::exists(record.path));
    CHECK(store->lookup("1001"));
}

TEST_CASE_METHOD(CopyFixture, "A corrupted copy fails verification and leaves nothing behind") {
    addArtifact("1001", "Mario Kart Wii", "RMCE01");

    auto dest = mount / "wbfs" / "Mario Kart Wii [RMCE01]" / "Mario Kart Wii [RMCE01].wbfs";
    auto temp = fs::path(dest.string() + DeviceCopyManager::TEMP_SUFFIX);
    // Truncate the half-written file behind the copier's back
    reporter->onCopyProgressHook = [temp](const core::events::CopyProgress& progress) {
        if (progress.bytesCopied == 4096) {
            fs::resize_file(temp, 0);
        }
    };

    auto job = finish(manager->copyArtifact("1001", volume()));

    CHECK(job.state == CopyState::Failed);
    CHECK(job.error.kind == FailureKind::VerificationMismatch);
    CHECK_FALSE(fs::exists(dest));
    CHECK_FALSE(fs::exists(temp));
    CHECK_FALSE(fs::exists(dest.parent_path()));
    CHECK(reporter->copyStates(job.id).back() == CopyState::Failed);
}

TEST_CASE_METHOD(CopyFixture, "A copy that does not fit is rejected up front") {
    addArtifact("1001", "Mario Kart Wii", "RMCE01");
    volumes->setFree(mount, 100);

    auto result = manager->copyArtifact("1001", volume());

    CHECK(result.status == CopyStatus::InsufficientSpace);
    CHECK_FALSE(result.job);
    CHECK_FALSE(fs::exists(mount / "wbfs"));
    CHECK(manager->jobs().empty());
}

TEST_CASE_METHOD(CopyFixture, "Copies of unknown or vanished artifacts are rejected") {
    CHECK(manager->copyArtifact("nope", volume()).status == CopyStatus::SourceMissing);

    auto record = addArtifact("1001", "Mario Kart Wii", "RMCE01");
    fs::remove(record.path);
    CHECK(manager->copyArtifact("1001", volume()).status == CopyStatus::SourceMissing);
}

TEST_CASE_METHOD(CopyFixture, "An existing image on the volume is only replaced on request") {
    auto record = addArtifact("1001", "Mario Kart Wii", "RMCE01");
    auto dest = manager->destinationFor(record, mount);
    writeFile(dest, "older copy");

    auto rejected = manager->copyArtifact("1001", volume());
    CHECK(rejected.status == CopyStatus::DuplicateOnTarget);
    CHECK(readFile(dest) == "older copy");

    CopyOptions options;
    options.overwrite = true;
    auto job = finish(manager->copyArtifact("1001", volume(), options));
    CHECK(job.state == CopyState::Done);
    CHECK(readFile(dest) == readFile(record.path));
}

TEST_CASE_METHOD(CopyFixture, "A second copy to the same destination is refused while one is scheduled") {
    addArtifact("1001", "Mario Kart Wii", "RMCE01");

    Gate gate;
    reporter->onCopyProgressHook = [&gate](const core::events::CopyProgress&) { gate.wait(); };

    auto first = manager->copyArtifact("1001", volume());
    REQUIRE(first.accepted());

    auto second = manager->copyArtifact("1001", volume());
    CHECK(second.status == CopyStatus::DuplicateOnTarget);
    REQUIRE(second.job);
    CHECK(second.job->id == first.job->id);

    gate.open();
    CHECK(finish(first).state == CopyState::Done);
}

TEST_CASE_METHOD(CopyFixture, "Moving deletes the local artifact and its record") {
    auto record = addArtifact("1001", "Mario Kart Wii", "RMCE01");

    CopyOptions options;
    options.moveSource = true;
    auto job = finish(manager->copyArtifact("1001", volume(), options));

    CHECK(job.state == CopyState::Done);
    CHECK(fs::exists(job.destPath));
    CHECK_FALSE(fs::exists(record.path));
    CHECK_FALSE(store->lookup("1001"));
}

TEST_CASE_METHOD(CopyFixture, "Cancelling a running copy removes the partial file") {
    addArtifact("1001", "Mario Kart Wii", "RMCE01");

    DeviceCopyManager* copies = manager.get();
    reporter->onCopyProgressHook = [copies](const core::events::CopyProgress& progress) {
        copies->cancelCopy(progress.jobId);
    };

    auto job = finish(manager->copyArtifact("1001", volume()));

    CHECK(job.state == CopyState::Cancelled);
    CHECK(job.error.kind == FailureKind::Cancelled);
    CHECK_FALSE(fs::exists(job.destPath));
    CHECK_FALSE(fs::exists(fs::path(job.destPath.string() + DeviceCopyManager::TEMP_SUFFIX)));
    CHECK(reporter->copyStates(job.id) ==
          std::vector<CopyState>{CopyState::Pending, CopyState::Copying, CopyState::Cancelled});

    // Cancelling again changes nothing
    CHECK_FALSE(manager->cancelCopy(job.id));
    auto after = manager->getJob(job.id);
    REQUIRE(after);
    CHECK(after->state == job.state);
    CHECK(after->error.kind == job.error.kind);
    CHECK(after->error.message == job.error.message);
    CHECK(reporter->copyStates(job.id).size() == 3);
}

TEST_CASE_METHOD(CopyFixture, "Free space is checked again when a waiting copy starts") {
    addArtifact("1001", "Mario Kart Wii", "RMCE01");
    addArtifact("1002", "Wii Sports", "RSPE01");

    Gate gate;
    reporter->onCopyProgressHook = [&gate](const core::events::CopyProgress& progress) {
        if (progress.artifactId == "1001") gate.wait();
    };

    auto first = manager->copyArtifact("1001", volume());
    auto second = manager->copyArtifact("1002", volume());
    REQUIRE(first.accepted());
    REQUIRE(second.accepted());

    // Something else filled the volume while the second copy waited
    volumes->setFree(mount, 100);
    gate.open();
    REQUIRE(manager->waitForIdle(std::chrono::seconds(10)));

    auto job = manager->getJob(second.job->id);
    REQUIRE(job);
    CHECK(job->state == CopyState::Failed);
    CHECK(job->error.kind == FailureKind::InsufficientSpace);
    CHECK(job->bytesCopied == 0);
    CHECK_FALSE(fs::exists(job->destPath));
    CHECK_FALSE(fs::exists(fs::path(job->destPath.string() + DeviceCopyManager::TEMP_SUFFIX)));
    CHECK(reporter->copyStates(job->id) == std::vector<CopyState>{CopyState::Pending, CopyState::Failed});
    CHECK(manager->getJob(first.job->id)->state == CopyState::Done);
}

TEST_CASE_METHOD(CopyFixture, "A failed write is classified by the space left on the volume") {
    if (!fs::exists("/dev/full")) {
        WARN("No /dev/full on this system");
        return;
    }
    addArtifact("1001", "Mario Kart Wii", "RMCE01");

    // Every write into the temp file fails with ENOSPC
    auto dest = mount / "wbfs" / "Mario Kart Wii [RMCE01]" / "Mario Kart Wii [RMCE01].wbfs";
    auto temp = fs::path(dest.string() + DeviceCopyManager::TEMP_SUFFIX);
    fs::create_directories(dest.parent_path());
    fs::create_symlink("/dev/full", temp);

    FailureKind expected = FailureKind::None;
    SECTION("volume full") {
        volumes->setFreeSequence(mount, {16 * GiB, 16 * GiB, 0});
        expected = FailureKind::DiskFull;
    }
    SECTION("volume with room") {
        expected = FailureKind::IoError;
    }

    auto job = finish(manager->copyArtifact("1001", volume()));

    CHECK(job.state == CopyState::Failed);
    CHECK(job.error.kind == expected);
    CHECK_FALSE(fs::exists(fs::symlink_status(temp)));
    CHECK_FALSE(fs::exists(dest));
    CHECK(reporter->copyStates(job.id) ==
          std::vector<CopyState>{CopyState::Pending, CopyState::Copying, CopyState::Failed});
}

namespace {

class FailingChecksums : public core::store::ChecksumProvider {
public:
    std::string compute(const fs::path&) override {
        throw std::runtime_error("checksum backend unavailable");
    }
};

} // namespace

TEST_CASE_METHOD(CopyFixture, "An exception while finishing a copy fails the job") {
    auto record = addArtifact("1001", "Mario Kart Wii", "RMCE01");
    addArtifact("1002", "Wii Sports", "RSPE01");

    DeviceOptions options;
    options.bufferSize = 4096;
    manager = std::make_unique<DeviceCopyManager>(options,
        DeviceServices{store, volumes, std::make_shared<FailingChecksums>(), reporter});

    CopyOptions move;
    move.moveSource = true;
    auto first = manager->copyArtifact("1001", volume(), move);
    auto second = manager->copyArtifact("1002", volume());
    REQUIRE(first.accepted());
    REQUIRE(second.accepted());
    REQUIRE(manager->waitForIdle(std::chrono::seconds(10)));

    auto job = manager->getJob(first.job->id);
    REQUIRE(job);
    CHECK(job->state == CopyState::Failed);
    CHECK(job->error.kind == FailureKind::IoError);
    CHECK(job->error.message.find("checksum backend unavailable") != std::string::npos);
    CHECK_FALSE(fs::exists(job->destPath));
    CHECK_FALSE(fs::exists(fs::path(job->destPath.string() + DeviceCopyManager::TEMP_SUFFIX)));
    CHECK(reporter->copyStates(job->id).back() == CopyState::Failed);

    // The source survives and the lane keeps going
    CHECK(fs::exists(record.path));
    CHECK(store->lookup("1001"));
    CHECK(manager->getJob(second.job->id)->state == CopyState::Failed);
}

TEST_CASE_METHOD(CopyFixture, "Copies to one volume run in order and pending ones can be cancelled") {
    addArtifact("1001", "Mario Kart Wii", "RMCE01");
    addArtifact("1002", "Wii Sports", "RSPE01");
    addArtifact("1003", "Super Mario Galaxy", "RMGE01");

    Gate gate;
    reporter->onCopyProgressHook = [&gate](const core::events::CopyProgress& progress) {
        if (progress.artifactId == "1001") gate.wait();
    };

    auto first = manager->copyArtifact("1001", volume());
    auto second = manager->copyArtifact("1002", volume());
    auto third = manager->copyArtifact("1003", volume());
    REQUIRE(first.accepted());
    REQUIRE(second.accepted());
    REQUIRE(third.accepted());

    CHECK(manager->cancelCopy(second.job->id));
    CHECK(manager->getJob(second.job->id)->state == CopyState::Cancelled);

    gate.open();
    REQUIRE(manager->waitForIdle(std::chrono::seconds(10)));

    CHECK(manager->getJob(first.job->id)->state == CopyState::Done);
    CHECK(manager->getJob(third.job->id)->state == CopyState::Done);
    CHECK(reporter->copyStates(second.job->id) ==
          std::vector<CopyState>{CopyState::Pending, CopyState::Cancelled});
    CHECK_FALSE(fs::exists(second.job->destPath));

    // The third job only started copying after the first one finished
    auto events = reporter->copyEvents();
    auto firstDone = std::find(events.begin(), events.end(), std::make_pair(first.job->id, CopyState::Done));
    auto thirdCopying = std::find(events.begin(), events.end(), std::make_pair(third.job->id, CopyState::Copying));
    REQUIRE(firstDone != events.end());
    REQUIRE(thirdCopying != events.end());
    CHECK(firstDone < thirdCopying);
}

TEST_CASE_METHOD(CopyFixture, "Finished jobs can be dismissed") {
    addArtifact("1001", "Mario Kart Wii", "RMCE01");
    auto job = finish(manager->copyArtifact("1001", volume()));

    CHECK(manager->jobs().size() == 1);
    CHECK(manager->dismissJob(job.id));
    CHECK_FALSE(manager->getJob(job.id));
    CHECK_FALSE(manager->dismissJob(job.id));
}

TEST_CASE_METHOD(CopyFixture, "Removing an artifact deletes its image and empty folders") {
    addArtifact("1001", "Mario Kart Wii", "RMCE01");
    auto job = finish(manager->copyArtifact("1001", volume()));
    REQUIRE(job.state == CopyState::Done);

    auto result = manager->removeArtifactFromVolume("1001", volume());
    CHECK(result.status == RemoveStatus::Removed);
    CHECK(result.path == job.destPath);
    CHECK(result.removedDirectories == 2);
    CHECK_FALSE(fs::exists(mount / "wbfs"));
    CHECK(fs::exists(mount));

    CHECK(manager->removeArtifactFromVolume("1001", volume()).status == RemoveStatus::NotFound);
}

TEST_CASE_METHOD(CopyFixture, "Images copied by other tools are removed by game id") {
    auto image = mount / "wbfs" / "Zelda [RZDE01]" / "Zelda [RZDE01].wbfs";
    writeFile(image, wum::test::discImage("RZDE01", 4096, 0x200));
    writeFile(mount / "wbfs" / "Zelda [RZDE01]" / "notes.txt", "keep");

    auto result = manager->removeArtifactFromVolume("RZDE01", volume());
    CHECK(result.status == RemoveStatus::Removed);
    CHECK(result.removedDirectories == 0);
    CHECK_FALSE(fs::exists(image));
    CHECK(fs::exists(mount / "wbfs" / "Zelda [RZDE01]" / "notes.txt"));
}

TEST_CASE_METHOD(CopyFixture, "Games on a volume are listed by title with their region") {
    writeFile(mount / "wbfs" / "Zelda [RZDE01]" / "Zelda [RZDE01].wbfs",
              wum::test::discImage("RZDE01", 4096, 0x200));
    writeFile(mount / "wbfs" / "Animal Crossing [RUUP01]" / "game.iso",
              wum::test::discImage("RUUP01", 2048));
    fs::create_directories(mount / "wbfs" / "Empty [RABJ01]");
    writeFile(mount / "wbfs" / "loose.txt", "ignored");

    auto games = manager->listGamesOnVolume(volume());
    REQUIRE(games.size() == 3);

    CHECK(games[0].title == "Animal Crossing");
    CHECK(games[0].gameId == "RUUP01");
    CHECK(games[0].region == "Europe");
    CHECK(games[0].sizeBytes == 2048);

    CHECK(games[1].title == "Empty");
    CHECK(games[1].region == "Japan");
    CHECK(games[1].imagePath.empty());

    CHECK(games[2].title == "Zelda");
    CHECK(games[2].region == "USA");
    CHECK(games[2].imagePath.filename() == "Zelda [RZDE01].wbfs");
}

TEST_CASE_METHOD(CopyFixture, "Volume verification reports missing and truncated images") {
    writeFile(mount / "wbfs" / "Good [RGDE01]" / "Good [RGDE01].wbfs",
              wum::test::discImage("RGDE01", static_cast<size_t>(DeviceCopyManager::MIN_IMAGE_SIZE), 0x200));
    writeFile(mount / "wbfs" / "Small [RSME01]" / "Small [RSME01].wbfs",
              wum::test::discImage("RSME01", 4096, 0x200));
    fs::create_directories(mount / "wbfs" / "Missing [RMSE01]");

    auto checks = manager->verifyVolume(volume());
    REQUIRE(checks.size() == 3);

    CHECK(checks[0].game.title == "Good");
    CHECK(checks[0].valid);
    CHECK(checks[0].problems.empty());

    CHECK(checks[1].game.title == "Missing");
    CHECK_FALSE(checks[1].valid);
    CHECK(checks[1].problems == std::vector<std::string>{"Game file not found"});

    CHECK(checks[2].game.title == "Small");
    CHECK_FALSE(checks[2].valid);
    CHECK(checks[2].problems == std::vector<std::string>{"Game file is too small"});
}

TEST_CASE_METHOD(CopyFixture, "Empty game folders and stale temp files are cleaned up") {
    fs::create_directories(mount / "wbfs" / "Empty [RAAE01]");
    fs::create_directories(mount / "wbfs" / "Also Empty [RBBE01]");
    writeFile(mount / "wbfs" / "Kept [RCCE01]" / "Kept [RCCE01].wbfs", "image");
    writeFile(mount / "wbfs" / "Broken [RDDE01]" / "Broken [RDDE01].wbfs.wumtmp", "partial");

    CHECK(manager->collectOrphanedTemps(volume()) == 1);
    CHECK_FALSE(fs::exists(mount / "wbfs" / "Broken [RDDE01]"));

    CHECK(manager->cleanupEmptyDirectories(volume()) == 2);
    CHECK(fs::exists(mount / "wbfs" / "Kept [RCCE01]"));
    CHECK(manager->cleanupEmptyDirectories(volume()) == 0);
}

TEST_CASE_METHOD(CopyFixture, "Destination names fall back to the image header and the artifact id") {
    ArtifactRecord record;
    record.id = "2002";
    record.path = dir / "local" / "download.iso";
    writeFile(record.path, wum::test::discImage("RSPE01", 2048));

    CHECK(manager->destinationFor(record, mount) ==
          mount / "wbfs" / "download [RSPE01]" / "download [RSPE01].iso");

    record.path = dir / "local" / "blob.bin";
    writeFile(record.path, "no header here");
    record.title = "Some: Game?";
    CHECK(manager->destinationFor(record, mount) ==
          mount / "wbfs" / "Some Game [2002]" / "Some Game [2002].wbfs");
}

TEST_CASE("Copy buffers scale with the volume size") {
    CHECK(DeviceCopyManager::recommendedBufferSize(4 * GiB) == 512 * 1024);
    CHECK(DeviceCopyManager::recommendedBufferSize(32 * GiB) == 1024 * 1024);
    CHECK(DeviceCopyManager::recommendedBufferSize(128 * GiB) == 4 * 1024 * 1024);
}

TEST_CASE("DeviceCopyManager needs a store and a checksum provider") {
    CHECK_THROWS_AS(DeviceCopyManager(DeviceOptions{}, DeviceServices{}), std::invalid_argument);
}

TEST_CASE_METHOD(CopyFixture, "No copies are accepted after shutdown") {
    addArtifact("1001", "Mario Kart Wii", "RMCE01");
    manager->shutdown();
    CHECK_THROWS_AS(manager->copyArtifact("1001", volume()), std::runtime_error);
}

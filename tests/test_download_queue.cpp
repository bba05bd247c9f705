#include <catch2/catch.hpp>

#include "core/transfer/DownloadQueue.hpp"
#include "utils/HashUtils.hpp"
#include "support/FakeCollaborators.hpp"

#include <nlohmann/json.hpp>

#include <thread>

using namespace std::chrono_literals;
using namespace wum;
using namespace wum::core::transfer;
using wum::test::FakeArchiveExtractor;
using wum::test::FakeTransferSource;
using wum::test::RecordingReporter;
using wum::test::ScriptedAttempt;
using wum::test::TempDir;

namespace {

ScriptedAttempt fails(FailureKind kind, FetchStatus status = FetchStatus::Recoverable) {
    ScriptedAttempt attempt;
    attempt.status = status;
    attempt.kind = kind;
    return attempt;
}

ScriptedAttempt held() {
    ScriptedAttempt attempt;
    attempt.holdUntilReleased = true;
    return attempt;
}

struct QueueFixture {
    TempDir dir;
    std::shared_ptr<FakeTransferSource> source = std::make_shared<FakeTransferSource>();
    std::shared_ptr<FakeArchiveExtractor> extractor = std::make_shared<FakeArchiveExtractor>();
    std::shared_ptr<RecordingReporter> reporter = std::make_shared<RecordingReporter>();
    std::shared_ptr<core::store::ArtifactStore> store = std::make_shared<core::store::ArtifactStore>();
    std::shared_ptr<core::store::HashChecksumProvider> checksums =
        std::make_shared<core::store::HashChecksumProvider>();
    QueueOptions options;
    RetryOptions retry;

    QueueFixture() {
        options.maxConcurrent = 1;
        options.admissionDelay = 0ms;
        options.stallTimeout = 0ms;
        options.downloadDirectory = dir.path() / "downloads";
        options.tick = 10ms;

        retry.maxRetries = 3;
        retry.strategy = BackoffStrategy::Fixed;
        retry.baseDelay = 1ms;
        retry.maxDelay = 1ms;
    }

    std::unique_ptr<DownloadQueue> make() {
        QueueServices services;
        services.store = store;
        services.source = source;
        services.extractor = extractor;
        services.checksums = checksums;
        services.reporter = reporter;
        return std::make_unique<DownloadQueue>(options, RetryPolicy(retry), services);
    }

    std::filesystem::path downloads() const { return options.downloadDirectory; }
};

bool hasPartFiles(const std::filesystem::path& directory) {
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(directory, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->path().extension() == ".part") return true;
    }
    return false;
}

} // namespace

TEST_CASE("DownloadQueue downloads an item and records the artifact") {
    QueueFixture fx;
    auto queue = fx.make();
    queue->initialize();

    auto result = queue->enqueue("1001", Priority::Normal, "Mario Kart Wii");
    REQUIRE(result.accepted());
    REQUIRE(result.task->state == TransferState::Queued);
    REQUIRE(queue->waitForIdle(10s));

    auto task = queue->getTask("1001");
    REQUIRE(task);
    CHECK(task->state == TransferState::Succeeded);
    CHECK(task->attempt == 1);
    CHECK(task->artifactPath == fx.downloads() / "1001");
    CHECK(wum::test::readFile(task->artifactPath) == "data-1001");

    auto record = fx.store->lookup("1001");
    REQUIRE(record);
    CHECK(record->title == "Mario Kart Wii");
    CHECK(record->sizeBytes == 9);
    CHECK(record->checksum == utils::HashUtils::sha1String("data-1001"));

    auto states = fx.reporter->transferStates("1001");
    REQUIRE(states.size() >= 3);
    CHECK(states.front() == TransferState::Queued);
    CHECK(states[1] == TransferState::Active);
    CHECK(states.back() == TransferState::Succeeded);
    CHECK_FALSE(hasPartFiles(fx.downloads()));
}

TEST_CASE("Titles that are not valid UTF-8 do not stall the queue") {
    QueueFixture fx;
    const auto index = fx.dir.path() / "artifacts.json";
    fx.store = std::make_shared<core::store::ArtifactStore>(index);
    auto queue = fx.make();
    queue->initialize();

    REQUIRE(queue->enqueue("1001", Priority::Normal, "Pok\xe9mon Battle Revolution").accepted());
    REQUIRE(queue->waitForIdle(10s));

    auto task = queue->getTask("1001");
    REQUIRE(task);
    CHECK(task->state == TransferState::Succeeded);
    CHECK(queue->activeCount() == 0);

    auto json = nlohmann::json::parse(wum::test::readFile(index));
    REQUIRE(json["artifacts"].size() == 1);
    CHECK(json["artifacts"][0]["id"] == "1001");

    core::store::ArtifactStore reloaded(index);
    REQUIRE(reloaded.load());
    CHECK(reloaded.lookup("1001"));

    // The slot was released for the next download
    REQUIRE(queue->enqueue("2002").accepted());
    REQUIRE(queue->waitForIdle(10s));
    CHECK(queue->getTask("2002")->state == TransferState::Succeeded);
}

namespace {

class ThrowingChecksums : public core::store::ChecksumProvider {
public:
    std::string compute(const std::filesystem::path& file) override {
        if (file.filename() == "bad") throw std::runtime_error("checksum backend unavailable");
        return m_hash.compute(file);
    }

private:
    core::store::HashChecksumProvider m_hash;
};

} // namespace

TEST_CASE("An exception while recording a download fails the task and frees its slot") {
    QueueFixture fx;
    auto queue = [&] {
        QueueServices services;
        services.store = fx.store;
        services.source = fx.source;
        services.extractor = fx.extractor;
        services.checksums = std::make_shared<ThrowingChecksums>();
        services.reporter = fx.reporter;
        return std::make_unique<DownloadQueue>(fx.options, RetryPolicy(fx.retry), services);
    }();
    queue->initialize();

    queue->enqueue("bad");
    queue->enqueue("good");
    REQUIRE(queue->waitForIdle(10s));

    auto bad = queue->getTask("bad");
    REQUIRE(bad);
    CHECK(bad->state == TransferState::Failed);
    CHECK(bad->lastError.kind == FailureKind::IoError);
    CHECK(bad->lastError.message.find("checksum backend unavailable") != std::string::npos);
    CHECK(fx.source->calls("bad") == 1);
    CHECK_FALSE(std::filesystem::exists(fx.downloads() / "bad"));
    CHECK_FALSE(fx.store->lookup("bad"));
    CHECK(fx.reporter->transferStates("bad").back() == TransferState::Failed);

    CHECK(queue->getTask("good")->state == TransferState::Succeeded);
    CHECK(fx.store->lookup("good"));
    CHECK(queue->activeCount() == 0);
}

TEST_CASE("DownloadQueue retries recoverable failures in place") {
    QueueFixture fx;
    fx.source->script("7", {fails(FailureKind::NetworkTimeout), fails(FailureKind::TransientServerError), {}});
    auto queue = fx.make();
    queue->initialize();

    queue->enqueue("7");
    REQUIRE(queue->waitForIdle(10s));

    auto task = queue->getTask("7");
    CHECK(task->state == TransferState::Succeeded);
    CHECK(task->attempt == 3);
    CHECK(task->lastError.kind == FailureKind::TransientServerError);
    CHECK(fx.store->size() == 1);
    CHECK(fx.source->calls("7") == 3);

    // One terminal event, no Failed in between
    auto states = fx.reporter->transferStates("7");
    CHECK(std::count(states.begin(), states.end(), TransferState::Succeeded) == 1);
    CHECK(std::count(states.begin(), states.end(), TransferState::Failed) == 0);
}

TEST_CASE("DownloadQueue gives up after maxRetries recoverable failures") {
    QueueFixture fx;
    fx.retry.maxRetries = 2;
    fx.source->script("9", {fails(FailureKind::NetworkError)});
    auto queue = fx.make();
    queue->initialize();

    queue->enqueue("9");
    REQUIRE(queue->waitForIdle(10s));

    auto task = queue->getTask("9");
    CHECK(task->state == TransferState::Failed);
    CHECK(task->attempt == 3);
    CHECK(task->lastError.kind == FailureKind::NetworkError);
    CHECK_FALSE(fx.store->lookup("9"));
    CHECK_FALSE(hasPartFiles(fx.downloads()));
    CHECK_FALSE(std::filesystem::exists(fx.downloads() / "9"));
}

TEST_CASE("DownloadQueue fails non-recoverable errors on the first attempt") {
    QueueFixture fx;
    fx.source->script("404", {fails(FailureKind::NotFound, FetchStatus::NonRecoverable)});
    auto queue = fx.make();
    queue->initialize();

    queue->enqueue("404");
    REQUIRE(queue->waitForIdle(10s));

    auto task = queue->getTask("404");
    CHECK(task->state == TransferState::Failed);
    CHECK(task->attempt == 1);
    CHECK(task->lastError.kind == FailureKind::NotFound);
    CHECK(fx.source->calls("404") == 1);
}

TEST_CASE("DownloadQueue rejects ids that are already downloaded") {
    QueueFixture fx;
    auto queue = fx.make();
    queue->initialize();

    queue->enqueue("55");
    REQUIRE(queue->waitForIdle(10s));

    auto again = queue->enqueue("55");
    CHECK(again.status == EnqueueStatus::AlreadyAcquired);
    CHECK_FALSE(again.task);
    REQUIRE(again.artifact);
    CHECK(again.artifact->id == "55");
    CHECK(queue->tasks().size() == 1);
    CHECK(fx.source->calls("55") == 1);
}

TEST_CASE("DownloadQueue downloads again when the recorded file is gone") {
    QueueFixture fx;

    ArtifactRecord stale;
    stale.id = "56";
    stale.path = fx.dir.path() / "gone.wbfs";
    fx.store->record(stale);

    auto queue = fx.make();
    queue->initialize();

    CHECK(queue->enqueue("56").accepted());
    REQUIRE(queue->waitForIdle(10s));
    CHECK(queue->getTask("56")->state == TransferState::Succeeded);
    CHECK(fx.store->lookup("56")->path == fx.downloads() / "56");
}

TEST_CASE("DownloadQueue reports duplicate requests for live tasks") {
    QueueFixture fx;
    auto queue = fx.make();

    REQUIRE(queue->enqueue("12").accepted());
    auto duplicate = queue->enqueue("12");
    CHECK(duplicate.status == EnqueueStatus::DuplicateRequest);
    REQUIRE(duplicate.task);
    CHECK(duplicate.task->state == TransferState::Queued);
    CHECK(queue->queuedCount() == 1);
}

TEST_CASE("DownloadQueue never exceeds the concurrency limit") {
    QueueFixture fx;
    fx.options.maxConcurrent = 2;
    const std::vector<std::string> ids = {"a", "b", "c", "d", "e"};
    for (const auto& id : ids) {
        fx.source->script(id, {held()});
    }
    auto queue = fx.make();
    queue->initialize();

    for (const auto& id : ids) {
        queue->enqueue(id);
    }

    REQUIRE(fx.source->waitForStart("b"));
    std::this_thread::sleep_for(100ms);
    CHECK(queue->activeCount() == 2);
    CHECK(queue->queuedCount() == 3);
    CHECK(fx.source->started().size() == 2);

    for (const auto& id : ids) {
        fx.source->release(id);
    }
    REQUIRE(queue->waitForIdle(10s));

    CHECK(fx.source->maxConcurrent() <= 2);
    CHECK(fx.reporter->idsReaching(TransferState::Succeeded).size() == ids.size());
}

TEST_CASE("Cancelling a queued task skips it without ever starting it") {
    QueueFixture fx;
    fx.source->script("A", {held()});
    auto queue = fx.make();
    queue->initialize();

    queue->enqueue("A");
    queue->enqueue("B");
    queue->enqueue("C");
    REQUIRE(fx.source->waitForStart("A"));

    CHECK(queue->cancel("B"));
    CHECK_FALSE(queue->cancel("B"));

    fx.source->release("A");
    REQUIRE(queue->waitForIdle(10s));

    CHECK(fx.source->finished() == std::vector<std::string>{"A", "C"});
    CHECK(fx.source->calls("B") == 0);
    CHECK(fx.reporter->transferStates("B") == std::vector<TransferState>{TransferState::Queued, TransferState::Cancelled});
    CHECK(queue->getTask("B")->state == TransferState::Cancelled);
}

TEST_CASE("Cancelling an active task removes its partial file") {
    QueueFixture fx;
    fx.source->script("big", {held()});
    auto queue = fx.make();
    queue->initialize();

    queue->enqueue("big");
    REQUIRE(fx.source->waitForStart("big"));

    CHECK(queue->cancel("big"));
    REQUIRE(queue->waitForIdle(10s));

    auto task = queue->getTask("big");
    CHECK(task->state == TransferState::Cancelled);
    CHECK(task->lastError.kind == FailureKind::Cancelled);
    CHECK(fx.source->calls("big") == 1);
    CHECK_FALSE(hasPartFiles(fx.downloads()));
    CHECK_FALSE(std::filesystem::exists(fx.downloads() / "big"));

    // Cancelling again changes nothing
    const auto state = task->state;
    const auto kind = task->lastError.kind;
    const auto message = task->lastError.message;
    CHECK_FALSE(queue->cancel("big"));
    auto after = queue->getTask("big");
    REQUIRE(after);
    CHECK(after->state == state);
    CHECK(after->lastError.kind == kind);
    CHECK(after->lastError.message == message);
    CHECK_FALSE(queue->cancel("unknown"));
}

TEST_CASE("Immediate priority and prioritize move tasks to the front") {
    QueueFixture fx;
    auto queue = fx.make();

    queue->enqueue("A");
    queue->enqueue("B");

    SECTION("enqueue with Immediate") {
        queue->enqueue("C", Priority::Immediate);
    }
    SECTION("prioritize a queued task") {
        queue->enqueue("C");
        CHECK(queue->prioritize("C"));
        CHECK_FALSE(queue->prioritize("missing"));
    }

    queue->initialize();
    REQUIRE(queue->waitForIdle(10s));
    CHECK(fx.source->started() == std::vector<std::string>{"C", "A", "B"});
}

TEST_CASE("A paused queue admits nothing until resumed") {
    QueueFixture fx;
    auto queue = fx.make();
    queue->initialize();
    queue->pause();
    CHECK(queue->isPaused());

    queue->enqueue("p1");
    std::this_thread::sleep_for(100ms);
    CHECK(queue->getTask("p1")->state == TransferState::Queued);
    CHECK(fx.source->calls("p1") == 0);

    queue->resume();
    CHECK_FALSE(queue->isPaused());
    REQUIRE(queue->waitForIdle(10s));
    CHECK(queue->getTask("p1")->state == TransferState::Succeeded);
}

TEST_CASE("Admissions are spaced by the queue delay") {
    QueueFixture fx;
    fx.options.maxConcurrent = 2;
    fx.options.admissionDelay = 400ms;
    auto queue = fx.make();
    queue->initialize();

    queue->enqueue("first");
    queue->enqueue("second");

    REQUIRE(fx.source->waitForStart("first"));
    std::this_thread::sleep_for(150ms);
    CHECK(fx.source->calls("second") == 0);

    REQUIRE(queue->waitForIdle(10s));
    CHECK(queue->getTask("second")->state == TransferState::Succeeded);
}

TEST_CASE("A transfer without progress is aborted as stalled") {
    QueueFixture fx;
    fx.options.stallTimeout = 100ms;
    fx.retry.maxRetries = 0;

    ScriptedAttempt hang;
    hang.hang = true;
    fx.source->script("slow", {hang});

    auto queue = fx.make();
    queue->initialize();
    queue->enqueue("slow");
    REQUIRE(queue->waitForIdle(10s));

    auto task = queue->getTask("slow");
    CHECK(task->state == TransferState::Failed);
    CHECK(task->lastError.kind == FailureKind::StalledTransfer);
    CHECK(task->attempt == 1);
    CHECK_FALSE(hasPartFiles(fx.downloads()));
}

TEST_CASE("Downloaded archives are extracted and the disc image recorded") {
    QueueFixture fx;
    fx.extractor->entries = {
        {"Game/readme.txt", "hello"},
        {"Game/game.wbfs", wum::test::discImage("RMCE01", 4096, 0x200)}
    };
    ScriptedAttempt archive;
    archive.content = "ARCHIVE-bytes";
    fx.source->script("300", {archive});

    auto queue = fx.make();
    queue->initialize();
    queue->enqueue("300", Priority::Normal, "Mario Kart Wii");
    REQUIRE(queue->waitForIdle(10s));

    auto task = queue->getTask("300");
    REQUIRE(task->state == TransferState::Succeeded);
    CHECK(task->artifactPath == fx.downloads() / "300_files" / "Game" / "game.wbfs");
    CHECK_FALSE(std::filesystem::exists(fx.downloads() / "300"));

    auto record = fx.store->lookup("300");
    REQUIRE(record);
    CHECK(record->gameId == "RMCE01");
    CHECK(record->sizeBytes == 4096);
}

TEST_CASE("An extraction failure fails the task without retrying") {
    QueueFixture fx;
    fx.extractor->fail = true;
    ScriptedAttempt archive;
    archive.content = "ARCHIVE-bytes";
    fx.source->script("301", {archive});

    auto queue = fx.make();
    queue->initialize();
    queue->enqueue("301");
    REQUIRE(queue->waitForIdle(10s));

    auto task = queue->getTask("301");
    CHECK(task->state == TransferState::Failed);
    CHECK(task->lastError.kind == FailureKind::PostProcessingError);
    CHECK(fx.source->calls("301") == 1);
    CHECK_FALSE(std::filesystem::exists(fx.downloads() / "301_files"));
    CHECK_FALSE(fx.store->lookup("301"));
}

TEST_CASE("Failed tasks can be retried and dismissed") {
    QueueFixture fx;
    fx.source->script("r", {fails(FailureKind::AuthenticationRequired, FetchStatus::NonRecoverable), {}});
    auto queue = fx.make();
    queue->initialize();

    queue->enqueue("r");
    REQUIRE(queue->waitForIdle(10s));
    REQUIRE(queue->getTask("r")->state == TransferState::Failed);

    auto retried = queue->retry("r");
    REQUIRE(retried.accepted());
    CHECK(retried.task->attempt == 0);
    REQUIRE(queue->waitForIdle(10s));

    auto task = queue->getTask("r");
    CHECK(task->state == TransferState::Succeeded);
    CHECK(task->attempt == 1);

    CHECK(queue->dismiss("r"));
    CHECK_FALSE(queue->getTask("r"));
    CHECK(queue->tasks().empty());
}

TEST_CASE("Live tasks cannot be dismissed") {
    QueueFixture fx;
    auto queue = fx.make();
    queue->enqueue("q");
    CHECK_FALSE(queue->dismiss("q"));
    CHECK(queue->getTask("q"));
}

TEST_CASE("The last progress event carries the full size") {
    QueueFixture fx;
    ScriptedAttempt big;
    big.content = std::string(10000, 'x');
    fx.source->script("prog", {big});

    auto queue = fx.make();
    queue->initialize();
    queue->enqueue("prog");
    REQUIRE(queue->waitForIdle(10s));

    auto progress = fx.reporter->transferProgress();
    REQUIRE_FALSE(progress.empty());
    CHECK(progress.back().id == "prog");
    CHECK(progress.back().bytesTransferred == 10000);
    REQUIRE(progress.back().bytesTotal);
    CHECK(*progress.back().bytesTotal == 10000);
}

TEST_CASE("The size hint stands in until the source reports a total") {
    QueueFixture fx;
    ScriptedAttempt unknown;
    unknown.reportTotal = false;
    fx.source->script("hint", {unknown});
    auto queue = fx.make();

    auto result = queue->enqueue("hint", Priority::Normal, "", 123456);
    REQUIRE(result.task->bytesTotal);
    CHECK(*result.task->bytesTotal == 123456);
}

TEST_CASE("DownloadQueue removes leftover partial files on start") {
    QueueFixture fx;
    wum::test::writeFile(fx.downloads() / "old.part", "stale");
    wum::test::writeFile(fx.downloads() / "keep.wbfs", "keep");

    auto queue = fx.make();
    queue->initialize();

    CHECK_FALSE(std::filesystem::exists(fx.downloads() / "old.part"));
    CHECK(std::filesystem::exists(fx.downloads() / "keep.wbfs"));
}

TEST_CASE("Shutdown cancels queued tasks and refuses new ones") {
    QueueFixture fx;
    auto queue = fx.make();

    queue->enqueue("s1");
    queue->shutdown();

    CHECK(queue->getTask("s1")->state == TransferState::Cancelled);
    CHECK(fx.reporter->transferStates("s1").back() == TransferState::Cancelled);
    CHECK_THROWS_AS(queue->enqueue("s2"), std::runtime_error);
    CHECK_THROWS_AS(queue->initialize(), std::runtime_error);
}

TEST_CASE("DownloadQueue validates its inputs") {
    QueueFixture fx;
    auto queue = fx.make();
    CHECK_THROWS_AS(queue->enqueue(""), std::invalid_argument);

    QueueServices missing;
    missing.source = fx.source;
    CHECK_THROWS_AS(DownloadQueue(fx.options, RetryPolicy(), missing), std::invalid_argument);
}

TEST_CASE("Independent queues do not share state") {
    QueueFixture one;
    QueueFixture two;
    auto first = one.make();
    auto second = two.make();

    first->enqueue("shared");
    CHECK(second->enqueue("shared").accepted());
    CHECK(first->tasks().size() == 1);
    CHECK(second->tasks().size() == 1);
}

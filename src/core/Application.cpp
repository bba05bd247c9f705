/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "Config.hpp"
#include "events/EventBusReporter.hpp"
#include "store/ArtifactStore.hpp"
#include "store/ChecksumProvider.hpp"
#include "transfer/DownloadQueue.hpp"
#include "transfer/HttpTransferSource.hpp"
#include "transfer/ZipArchiveExtractor.hpp"
#include "device/DeviceCopyManager.hpp"
#include "device/VolumeEnumerator.hpp"
#include "../utils/FileUtils.hpp"
#include "../utils/PathUtils.hpp"

#include <chrono>

namespace wum::core {

namespace {

std::vector<std::string> imageFormatsFromConfig() {
    return Config::instance().get<std::vector<std::string>>(
        "device.supportedFormats", {".wbfs", ".iso", ".rvz"});
}

std::filesystem::path downloadDirectoryFromConfig() {
    auto directory = Config::instance().get<std::string>("downloads.directory", "");
    return directory.empty() ? utils::PathUtils::getDownloadsPath() : std::filesystem::path(directory);
}

} // namespace

Application::Application() {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
    Logger::instance().debug("Application instance destroyed");
}

bool Application::initialize(bool startQueue) {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    Logger::instance().info("Initializing application...");

    auto startTime = std::chrono::steady_clock::now();

    if (startQueue && !acquireInstanceLock()) {
        Logger::instance().error("Another instance is already downloading into this directory");
        setState(AppState::Error);
        return false;
    }

    if (!initializeStore()) {
        Logger::instance().error("Failed to initialize artifact store");
        setState(AppState::Error);
        return false;
    }

    if (!initializeDownloader(startQueue)) {
        Logger::instance().error("Failed to initialize download queue");
        setState(AppState::Error);
        return false;
    }

    if (!initializeDevices()) {
        Logger::instance().error("Failed to initialize device copy manager");
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());

    setState(AppState::Ready);
    m_eventBus.emit("app.initialized", {});

    return true;
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    // Copies first: they may still read artifacts the queue owns
    if (m_deviceCopyManager) {
        m_deviceCopyManager->shutdown();
    }
    if (m_downloadQueue) {
        m_downloadQueue->shutdown();
    }
    if (m_artifactStore) {
        m_artifactStore->save();
    }

    m_deviceCopyManager.reset();
    m_downloadQueue.reset();
    m_artifactStore.reset();
    m_checksums.reset();
    m_reporter.reset();
    m_instanceLock.reset();

    m_eventBus.emit("app.shutdown", {});
    Logger::instance().info("Application shutdown complete");

    setState(AppState::Uninitialized);
}

void Application::onStateChange(std::function<void(AppState)> callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCallbacks.push_back(std::move(callback));
}

void Application::setState(AppState state) {
    m_state = state;

    std::lock_guard<std::mutex> lock(m_callbackMutex);
    for (const auto& callback : m_stateCallbacks) {
        try {
            callback(state);
        } catch (const std::exception& e) {
            Logger::instance().error("State callback error: {}", e.what());
        }
    }
}

bool Application::acquireInstanceLock() {
    auto lockPath = utils::PathUtils::getManagerPath() / "wum.lock";
    if (!utils::FileUtils::createDirectories(lockPath.parent_path())) {
        return false;
    }

    m_instanceLock = std::make_unique<utils::FileLock>(lockPath);
    if (!m_instanceLock->isLocked()) {
        m_instanceLock.reset();
        return false;
    }
    return true;
}

bool Application::initializeStore() {
    try {
        auto& config = Config::instance();

        auto algorithm = store::HashChecksumProvider::parseAlgorithm(
            config.get<std::string>("verification.algorithm", "sha1"));
        m_checksums = std::make_shared<store::HashChecksumProvider>(algorithm);

        m_artifactStore = std::make_shared<store::ArtifactStore>(
            utils::PathUtils::getArtifactIndexPath(), imageFormatsFromConfig());
        if (!m_artifactStore->load()) {
            Logger::instance().warn("Starting with an empty artifact index");
        }

        auto downloads = downloadDirectoryFromConfig();
        utils::FileUtils::createDirectories(downloads);
        m_artifactStore->reconcile(downloads, *m_checksums);

        m_reporter = std::make_shared<events::EventBusReporter>(m_eventBus);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Artifact store initialization error: {}", e.what());
        return false;
    }
}

bool Application::initializeDownloader(bool startQueue) {
    try {
        auto& config = Config::instance();

        transfer::QueueOptions options;
        options.maxConcurrent = config.get<size_t>("downloads.maxConcurrent", 1);
        options.admissionDelay = std::chrono::milliseconds(config.get<int64_t>("downloads.queueDelayMs", 10000));
        options.stallTimeout = std::chrono::milliseconds(config.get<int64_t>("downloads.stallTimeoutMs", 120000));
        options.downloadDirectory = downloadDirectoryFromConfig();
        options.extractArchives = config.get<bool>("downloads.extractArchives", true);
        options.removeArchiveAfterExtract = config.get<bool>("downloads.removeArchiveAfterExtract", true);
        options.imageFormats = imageFormatsFromConfig();

        transfer::RetryOptions retry;
        retry.maxRetries = config.get<int>("retry.maxRetries", 3);
        retry.strategy = transfer::RetryPolicy::parseStrategy(config.get<std::string>("retry.strategy", "exponential"));
        retry.baseDelay = std::chrono::milliseconds(config.get<int64_t>("retry.baseDelayMs", 2000));
        retry.maxDelay = std::chrono::milliseconds(config.get<int64_t>("retry.maxDelayMs", 60000));

        transfer::HttpSourceOptions source;
        source.urlTemplate = config.get<std::string>("catalog.downloadUrl", source.urlTemplate);
        source.referer = config.get<std::string>("catalog.referer", source.referer);
        source.userAgent = config.get<std::string>("catalog.userAgent", "");
        source.timeout = std::chrono::seconds(config.get<int64_t>("catalog.timeoutSeconds", 3600));
        source.verifySsl = config.get<bool>("catalog.verifySsl", true);

        transfer::QueueServices services;
        services.store = m_artifactStore;
        services.source = std::make_shared<transfer::HttpTransferSource>(source);
        services.extractor = std::make_shared<transfer::ZipArchiveExtractor>();
        services.checksums = m_checksums;
        services.reporter = m_reporter;

        m_downloadQueue = std::make_shared<transfer::DownloadQueue>(
            options, transfer::RetryPolicy(retry), services);
        if (startQueue) {
            m_downloadQueue->initialize();
        }
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Downloader initialization error: {}", e.what());
        return false;
    }
}

bool Application::initializeDevices() {
    try {
        auto& config = Config::instance();

        device::DeviceOptions options;
        options.bufferSize = config.get<size_t>("device.bufferSize", 1024 * 1024);
        options.verifyAfterCopy = config.get<bool>("device.verifyAfterCopy", true);
        options.cleanupEmptyDirs = config.get<bool>("device.cleanupEmptyDirs", true);
        options.gameFolder = config.get<std::string>("device.gameFolder", "wbfs");
        options.supportedFormats = imageFormatsFromConfig();
        options.maxParallelVolumes = config.get<size_t>("device.maxParallelVolumes", 2);

        device::DeviceServices services;
        services.store = m_artifactStore;
        services.volumes = std::make_shared<device::SystemVolumeEnumerator>();
        services.checksums = m_checksums;
        services.reporter = m_reporter;

        m_deviceCopyManager = std::make_shared<device::DeviceCopyManager>(options, services);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Device manager initialization error: {}", e.what());
        return false;
    }
}

} // namespace wum::core

/**
 * Wii Unified Manager - transfer engine command line
 *
 * Main entry point. Loads configuration, initializes the application and
 * runs one command against the download queue or a removable volume.
 *
 * @version 1.0.0
 * @license MIT
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/device/DeviceCopyManager.hpp"
#include "core/events/EventBusReporter.hpp"
#include "core/store/ArtifactStore.hpp"
#include "core/transfer/DownloadQueue.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using wum::core::Logger;
using wum::utils::StringUtils;

namespace {

std::atomic<bool> g_interrupted{false};

/**
 * Signal handler; the main loop notices the flag and shuts down
 */
void signalHandler(int) {
    g_interrupted = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printUsage(const char* program) {
    std::cout << "Wii Unified Manager - transfer engine\n"
              << "\nUsage: " << program << " [options] <command> [args]\n"
              << "\nCommands:\n"
              << "  download <id[:title[:size]]>...       Download catalog items\n"
              << "  artifacts                             List downloaded artifacts\n"
              << "  reconcile                             Re-scan the download directory\n"
              << "  volumes                               List removable volumes\n"
              << "  copy <id> <mount> [--overwrite] [--move]\n"
              << "                                        Copy an artifact onto a volume\n"
              << "  remove <id> <mount>                   Delete a game from a volume\n"
              << "  games <mount>                         List games on a volume\n"
              << "  verify <mount>                        Check game files on a volume\n"
              << "  cleanup <mount>                       Remove empty folders and stale temp files\n"
              << "\nOptions:\n"
              << "  -c, --config <file>  Use another configuration file\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

/**
 * Load configuration, creating the default file on first run
 */
bool loadConfiguration(const fs::path& configPath) {
    auto& logger = Logger::instance();
    auto& config = wum::core::Config::instance();

    if (fs::exists(configPath)) {
        if (!config.load(configPath.string())) {
            logger.error("Configuration {} is not valid JSON", configPath.string());
            return false;
        }
        logger.info("Configuration loaded from {}", configPath.string());
    } else {
        config.setDefaults();
        if (config.save(configPath.string())) {
            logger.info("Default configuration created at {}", configPath.string());
        } else {
            logger.warn("Cannot write default configuration to {}", configPath.string());
        }
    }
    return true;
}

/**
 * Resolve a mount path to a Volume, enumerated or not
 */
wum::Volume resolveVolume(wum::core::device::DeviceCopyManager& devices, const std::string& mount) {
    auto target = fs::path(mount).lexically_normal();
    for (const auto& volume : devices.listVolumes()) {
        if (volume.mountPath.lexically_normal() == target) {
            return volume;
        }
    }

    wum::Volume volume;
    volume.mountPath = target;
    volume.label = target.filename().string();
    std::error_code ec;
    auto space = fs::space(target, ec);
    if (!ec) {
        volume.totalBytes = static_cast<int64_t>(space.capacity);
        volume.freeBytes = static_cast<int64_t>(space.available);
    }
    return volume;
}

void printProgressLine(const std::string& id, int64_t done, std::optional<int64_t> total,
                       double rate, std::optional<std::chrono::seconds> eta) {
    std::cout << "\r  " << id << "  " << StringUtils::formatBytes(done);
    if (total && *total > 0) {
        std::cout << " / " << StringUtils::formatBytes(*total) << "  "
                  << StringUtils::formatPercentage(static_cast<double>(done) / static_cast<double>(*total));
    }
    std::cout << "  " << StringUtils::formatRate(rate);
    if (eta) {
        std::cout << "  ETA " << StringUtils::formatDuration(*eta);
    }
    std::cout << "    " << std::flush;
}

std::string describeError(const wum::Failure& error) {
    if (!error.isSet()) return "";
    return std::string(" (") + wum::toString(error.kind) + ": " + error.message + ")";
}

int runDownload(wum::core::Application& app, const std::vector<std::string>& args) {
    auto queue = app.getDownloadQueue();
    auto& bus = app.getEventBus();
    using wum::core::events::EventBusReporter;

    auto stateSub = bus.subscribe(wum::core::events::TRANSFER_STATE, [](const wum::core::json& data) {
        std::cout << "\n" << data.value("id", "") << ": " << data.value("state", "");
        if (data.contains("error")) {
            std::cout << " (" << data["error"].value("kind", "") << ": " << data["error"].value("message", "") << ")";
        }
        std::cout << std::endl;
    });
    auto progressSub = bus.subscribe(wum::core::events::TRANSFER_PROGRESS, [](const wum::core::json& data) {
        std::optional<int64_t> total;
        if (data.contains("total") && data["total"].is_number()) total = data["total"].get<int64_t>();
        std::optional<std::chrono::seconds> eta;
        if (data.contains("eta") && data["eta"].is_number()) eta = std::chrono::seconds(data["eta"].get<int64_t>());
        printProgressLine(data.value("id", ""), data.value("bytes", int64_t{0}), total,
                          data.value("rate", 0.0), eta);
    });

    std::vector<std::string> accepted;
    for (const auto& arg : args) {
        auto parts = StringUtils::split(arg, ':');
        if (parts.empty() || StringUtils::trim(parts[0]).empty()) {
            std::cerr << "Ignoring empty id in '" << arg << "'" << std::endl;
            continue;
        }

        std::string id = StringUtils::trim(parts[0]);
        std::string title = parts.size() > 1 ? StringUtils::trim(parts[1]) : "";
        std::optional<int64_t> sizeHint = parts.size() > 2 ? StringUtils::parseSize(parts[2]) : std::nullopt;

        auto result = queue->enqueue(id, wum::Priority::Normal, title, sizeHint);
        switch (result.status) {
            case wum::core::transfer::EnqueueStatus::Accepted:
                accepted.push_back(id);
                break;
            case wum::core::transfer::EnqueueStatus::DuplicateRequest:
                std::cout << id << ": already queued" << std::endl;
                break;
            case wum::core::transfer::EnqueueStatus::AlreadyAcquired:
                std::cout << id << ": already downloaded to " << result.artifact->path.string() << std::endl;
                break;
        }
    }

    while (!queue->waitForIdle(std::chrono::milliseconds(500))) {
        if (g_interrupted) {
            std::cout << "\nInterrupted, cancelling downloads..." << std::endl;
            break;
        }
    }

    bus.unsubscribe(stateSub);
    bus.unsubscribe(progressSub);

    int failures = 0;
    for (const auto& id : accepted) {
        auto task = queue->getTask(id);
        if (!task || task->state != wum::TransferState::Succeeded) {
            ++failures;
        }
    }
    return failures == 0 && !g_interrupted ? 0 : 1;
}

int runArtifacts(wum::core::Application& app) {
    auto records = app.getArtifactStore()->all();
    if (records.empty()) {
        std::cout << "No artifacts." << std::endl;
        return 0;
    }
    for (const auto& record : records) {
        std::cout << record.id << "  " << StringUtils::formatBytes(record.sizeBytes)
                  << "  " << (record.gameId.empty() ? "------" : record.gameId)
                  << "  " << StringUtils::formatTimestamp(record.acquiredAt)
                  << "  " << record.path.string() << std::endl;
    }
    return 0;
}

int runReconcile(wum::core::Application& app) {
    auto report = app.getArtifactStore()->reconcile(app.getDownloadQueue()->options().downloadDirectory,
                                                    *app.getChecksumProvider());
    std::cout << "Dropped " << report.dropped << ", checksummed " << report.checksummed
              << ", adopted " << report.adopted << ", duplicates " << report.skippedDuplicates << std::endl;
    return 0;
}

int runVolumes(wum::core::Application& app) {
    auto volumes = app.getDeviceCopyManager()->listVolumes();
    if (volumes.empty()) {
        std::cout << "No removable volumes found." << std::endl;
        return 0;
    }
    for (const auto& volume : volumes) {
        std::cout << volume.mountPath.string() << "  " << volume.label << "  " << volume.fsType
                  << "  " << StringUtils::formatBytes(volume.freeBytes) << " free of "
                  << StringUtils::formatBytes(volume.totalBytes) << std::endl;
    }
    return 0;
}

int runCopy(wum::core::Application& app, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Usage: copy <id> <mount> [--overwrite] [--move]" << std::endl;
        return 2;
    }

    wum::core::device::CopyOptions options;
    for (size_t i = 2; i < args.size(); ++i) {
        if (args[i] == "--overwrite") options.overwrite = true;
        else if (args[i] == "--move") options.moveSource = true;
        else {
            std::cerr << "Unknown copy option " << args[i] << std::endl;
            return 2;
        }
    }

    auto devices = app.getDeviceCopyManager();
    auto& bus = app.getEventBus();
    using wum::core::events::EventBusReporter;

    auto volume = resolveVolume(*devices, args[1]);
    auto result = devices->copyArtifact(args[0], volume, options);
    if (!result.accepted()) {
        std::cerr << args[0] << ": " << wum::core::device::toString(result.status) << ": " << result.message << std::endl;
        return 1;
    }

    const std::string jobId = result.job->id;
    auto progressSub = bus.subscribe(wum::core::events::COPY_PROGRESS, jobId, [](const wum::core::json& data) {
        std::optional<std::chrono::seconds> eta;
        if (data.contains("eta") && data["eta"].is_number()) eta = std::chrono::seconds(data["eta"].get<int64_t>());
        printProgressLine(data.value("id", ""), data.value("bytes", int64_t{0}),
                          data.value("total", int64_t{0}), data.value("rate", 0.0), eta);
    });

    while (!devices->waitForIdle(std::chrono::milliseconds(500))) {
        if (g_interrupted) {
            devices->cancelCopy(jobId);
        }
    }
    bus.unsubscribe(progressSub);

    auto job = devices->getJob(jobId);
    std::cout << "\n" << jobId << ": " << (job ? wum::toString(job->state) : "unknown")
              << (job ? describeError(job->error) : "") << std::endl;
    if (job && job->state == wum::CopyState::Done) {
        std::cout << job->destPath.string() << std::endl;
        return 0;
    }
    return 1;
}

int runRemove(wum::core::Application& app, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: remove <id> <mount>" << std::endl;
        return 2;
    }

    auto devices = app.getDeviceCopyManager();
    auto result = devices->removeArtifactFromVolume(args[0], resolveVolume(*devices, args[1]));
    switch (result.status) {
        case wum::core::device::RemoveStatus::Removed:
            std::cout << "Removed " << result.path.string();
            if (result.removedDirectories > 0) {
                std::cout << " and " << result.removedDirectories << " empty folder(s)";
            }
            std::cout << std::endl;
            return 0;
        case wum::core::device::RemoveStatus::NotFound:
            std::cerr << result.message << std::endl;
            return 1;
        case wum::core::device::RemoveStatus::Failed:
            std::cerr << result.message << std::endl;
            return 1;
    }
    return 1;
}

int runGames(wum::core::Application& app, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Usage: games <mount>" << std::endl;
        return 2;
    }

    auto devices = app.getDeviceCopyManager();
    auto games = devices->listGamesOnVolume(resolveVolume(*devices, args[0]));
    for (const auto& game : games) {
        std::cout << (game.gameId.empty() ? "------" : game.gameId) << "  " << game.region
                  << "  " << StringUtils::formatBytes(game.sizeBytes) << "  " << game.title << std::endl;
    }
    std::cout << games.size() << " game(s)" << std::endl;
    return 0;
}

int runVerify(wum::core::Application& app, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Usage: verify <mount>" << std::endl;
        return 2;
    }

    auto devices = app.getDeviceCopyManager();
    int invalid = 0;
    for (const auto& check : devices->verifyVolume(resolveVolume(*devices, args[0]))) {
        std::cout << (check.valid ? "OK   " : "BAD  ") << check.game.title;
        if (!check.valid) {
            ++invalid;
            std::cout << ": " << StringUtils::join(check.problems, ", ");
        }
        std::cout << std::endl;
    }
    return invalid == 0 ? 0 : 1;
}

int runCleanup(wum::core::Application& app, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Usage: cleanup <mount>" << std::endl;
        return 2;
    }

    auto devices = app.getDeviceCopyManager();
    auto volume = resolveVolume(*devices, args[0]);
    int temps = devices->collectOrphanedTemps(volume);
    int folders = devices->cleanupEmptyDirectories(volume);
    std::cout << "Removed " << temps << " stale temp file(s) and " << folders << " empty folder(s)" << std::endl;
    return 0;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    bool debugMode = false;
    fs::path configPath;
    std::string command;
    std::vector<std::string> commandArgs;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "--config needs a file" << std::endl;
                return 2;
            }
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << wum::core::Application::getName() << " v" << wum::core::Application::getVersion() << std::endl;
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else {
            commandArgs.push_back(arg);
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    if (configPath.empty()) {
        configPath = wum::utils::PathUtils::getConfigPath();
    }

    // Console first so configuration problems are visible
    Logger::instance().initialize(debugMode ? wum::core::LogLevel::Debug : wum::core::LogLevel::Warn);
    auto& logger = Logger::instance();

    if (!loadConfiguration(configPath)) {
        logger.critical("Failed to load configuration");
        return 1;
    }

    auto& config = wum::core::Config::instance();
    auto level = debugMode ? wum::core::LogLevel::Debug
                           : Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    Logger::instance().initialize(level, wum::utils::PathUtils::getLogsPath().string(),
                                  config.get<size_t>("logging.maxFileSize", 10485760),
                                  config.get<size_t>("logging.maxFiles", 3));
    logger.info("{} v{} starting: {}", wum::core::Application::getName(),
                wum::core::Application::getVersion(), command);

    setupSignalHandlers();

    try {
        wum::core::Application app;

        if (!app.initialize(command == "download")) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        int status = 2;
        if (command == "download") {
            if (commandArgs.empty()) {
                std::cerr << "Usage: download <id[:title[:size]]>..." << std::endl;
            } else {
                status = runDownload(app, commandArgs);
            }
        } else if (command == "artifacts") {
            status = runArtifacts(app);
        } else if (command == "reconcile") {
            status = runReconcile(app);
        } else if (command == "volumes") {
            status = runVolumes(app);
        } else if (command == "copy") {
            status = runCopy(app, commandArgs);
        } else if (command == "remove") {
            status = runRemove(app, commandArgs);
        } else if (command == "games") {
            status = runGames(app, commandArgs);
        } else if (command == "verify") {
            status = runVerify(app, commandArgs);
        } else if (command == "cleanup") {
            status = runCleanup(app, commandArgs);
        } else {
            std::cerr << "Unknown command '" << command << "'" << std::endl;
            printUsage(argv[0]);
        }

        app.shutdown();
        logger.info("Shutdown complete");
        return status;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}

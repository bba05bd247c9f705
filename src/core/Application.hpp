#pragma once

/**
 * Application.hpp
 *
 * Core application class that wires the transfer engine together.
 * Builds every component from Config and owns their lifetimes.
 */

#include "EventBus.hpp"

#include <memory>
#include <atomic>
#include <string>
#include <functional>
#include <vector>
#include <mutex>

namespace wum::utils { class FileLock; }
namespace wum::core::store { class ArtifactStore; class ChecksumProvider; }
namespace wum::core::transfer { class DownloadQueue; }
namespace wum::core::device { class DeviceCopyManager; }
namespace wum::core::events { class EventBusReporter; }

namespace wum::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

/**
 * Main application class
 *
 * Owns the event bus, the artifact store, the download queue and the device
 * copy manager. Only this class reads Config; the components get option
 * structs.
 */
class Application {
public:
    Application();
    ~Application();

    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Initialize all subsystems
     * @param startQueue Start the download workers (not needed for device-only commands)
     * @return true if initialization successful
     */
    bool initialize(bool startQueue = true);

    /**
     * Shutdown the application gracefully; safe to call more than once
     */
    void shutdown();

    AppState getState() const { return m_state.load(); }

    bool isRunning() const { return m_state.load() == AppState::Ready; }

    EventBus& getEventBus() { return m_eventBus; }

    std::shared_ptr<store::ArtifactStore> getArtifactStore() const { return m_artifactStore; }
    std::shared_ptr<store::ChecksumProvider> getChecksumProvider() const { return m_checksums; }
    std::shared_ptr<transfer::DownloadQueue> getDownloadQueue() const { return m_downloadQueue; }
    std::shared_ptr<device::DeviceCopyManager> getDeviceCopyManager() const { return m_deviceCopyManager; }

    /**
     * Register state change callback
     * @param callback Function to call on state change
     */
    void onStateChange(std::function<void(AppState)> callback);

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "WiiUnifiedManager"; }

private:
    void setState(AppState state);

    bool acquireInstanceLock();
    bool initializeStore();
    bool initializeDownloader(bool startQueue);
    bool initializeDevices();

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};

    std::vector<std::function<void(AppState)>> m_stateCallbacks;
    std::mutex m_callbackMutex;

    EventBus m_eventBus;

    std::unique_ptr<utils::FileLock> m_instanceLock;
    std::shared_ptr<events::EventBusReporter> m_reporter;
    std::shared_ptr<store::ArtifactStore> m_artifactStore;
    std::shared_ptr<store::ChecksumProvider> m_checksums;
    std::shared_ptr<transfer::DownloadQueue> m_downloadQueue;
    std::shared_ptr<device::DeviceCopyManager> m_deviceCopyManager;
};

} // namespace wum::core

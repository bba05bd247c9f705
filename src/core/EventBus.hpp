#pragma once

/**
 * EventBus.hpp
 *
 * Thread-safe event bus for decoupled communication between the transfer
 * engine and its presentation layers (CLI, UI, log).
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <functional>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <string>
#include <memory>
#include <atomic>
#include <cstdint>

namespace wum::core {

using json = nlohmann::json;
using EventCallback = std::function<void(const json&)>;

/**
 * Event subscription handle
 */
class Subscription {
public:
    Subscription(uint64_t id, const std::string& event)
        : m_id(id), m_event(event), m_active(true) {}

    uint64_t getId() const { return m_id; }
    const std::string& getEvent() const { return m_event; }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::string m_event;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * EventBus - publish/subscribe with JSON payloads
 *
 * Payloads published by the engine carry an "id" member (task id for
 * transfer.* topics, job id for copy.* topics); subscribe(event, key, cb)
 * only receives payloads whose "id" equals key.
 *
 * Callbacks run on the publishing thread, outside the bus lock.
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * Subscribe to every payload of an event
     * @param event Event name
     * @param callback Callback function
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(const std::string& event, EventCallback callback) {
        return addSubscriber(event, std::string(), std::move(callback));
    }

    /**
     * Subscribe to the payloads of one task or job
     * @param event Event name
     * @param key Value of the payload "id" member to match
     * @param callback Callback function
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(const std::string& event, const std::string& key, EventCallback callback) {
        return addSubscriber(event, key, std::move(callback));
    }

    /**
     * Unsubscribe from an event
     * @param subscription Subscription handle
     */
    void unsubscribe(const SubscriptionPtr& subscription) {
        if (!subscription) return;

        subscription->cancel();

        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_subscribers.find(subscription->getEvent());
        if (it == m_subscribers.end()) return;

        auto& subscribers = it->second;
        subscribers.erase(
            std::remove_if(subscribers.begin(), subscribers.end(),
                [id = subscription->getId()](const SubscriberEntry& entry) {
                    return entry.id == id;
                }),
            subscribers.end()
        );
    }

    /**
     * Emit an event
     * @param event Event name
     * @param data Event data
     */
    void emit(const std::string& event, const json& data = json::object()) {
        std::vector<EventCallback> callbacks;

        {
            std::lock_guard<std::mutex> lock(m_mutex);

            auto it = m_subscribers.find(event);
            if (it != m_subscribers.end()) {
                for (const auto& entry : it->second) {
                    if (entry.subscription->isActive() && matches(entry, data)) {
                        callbacks.push_back(entry.callback);
                    }
                }
            }
        }

        // Call callbacks outside of lock
        for (const auto& callback : callbacks) {
            try {
                callback(data);
            } catch (const std::exception& e) {
                Logger::instance().warn("Subscriber of '{}' threw: {}", event, e.what());
            }
        }
    }

    size_t getSubscriberCount(const std::string& event) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_subscribers.find(event);
        return it != m_subscribers.end() ? it->second.size() : 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscribers.clear();
    }

private:
    struct SubscriberEntry {
        uint64_t id;
        std::string key;
        EventCallback callback;
        SubscriptionPtr subscription;
    };

    SubscriptionPtr addSubscriber(const std::string& event, const std::string& key, EventCallback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);

        uint64_t id = m_nextId++;
        auto subscription = std::make_shared<Subscription>(id, event);

        m_subscribers[event].push_back({id, key, std::move(callback), subscription});

        return subscription;
    }

    static bool matches(const SubscriberEntry& entry, const json& data) {
        if (entry.key.empty()) return true;
        auto it = data.find("id");
        return it != data.end() && it->is_string() && it->get<std::string>() == entry.key;
    }

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::vector<SubscriberEntry>> m_subscribers;
    std::atomic<uint64_t> m_nextId{0};
};

} // namespace wum::core

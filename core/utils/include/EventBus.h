#pragma once
#include <string>
#include <functional>
#include <vector>
#include <unordered_map>
#include <any>
#include <memory>
#include <shared_mutex>
#include <atomic>
#include <cstdint>

namespace LanScout {

    using EventCallback = std::function<void(const std::any&)>;
    using EventFilter = std::function<bool(const std::any&)>;

    /**
     * @brief Synchronous topic-based publish/subscribe hub.
     *
     * Callbacks run on the publishing thread, highest priority first. A
     * throwing callback is logged and does not prevent later subscribers from
     * running. Publishing takes a snapshot of the subscriber list, so a
     * callback may subscribe or unsubscribe without deadlocking.
     */
    class EventBus {
    public:
        using SubscriptionId = std::uint64_t;

        SubscriptionId subscribe(const std::string& eventName,
                                 EventCallback callback,
                                 int priority = 0,
                                 EventFilter filter = nullptr);

        bool unsubscribe(SubscriptionId id);

        /**
         * @return number of subscribers that received the event
         */
        std::size_t publish(const std::string& eventName, const std::any& data);

        std::size_t subscriberCount(const std::string& eventName) const;

    private:
        struct Subscription {
            SubscriptionId id;
            EventCallback callback;
            int priority;
            EventFilter filter;
        };
        using SubscriptionList = std::vector<Subscription>;

        std::unordered_map<std::string, std::shared_ptr<const SubscriptionList>> subscribers_;
        mutable std::shared_mutex mutex_;
        std::atomic<SubscriptionId> nextId_{1};
    };

}

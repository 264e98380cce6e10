#include "EventBus.h"
#include "Logger.h"

#include <algorithm>
#include <exception>
#include <mutex>
#include <utility>

namespace LanScout {

    EventBus::SubscriptionId EventBus::subscribe(const std::string& eventName,
                                                 EventCallback callback,
                                                 int priority,
                                                 EventFilter filter) {
        SubscriptionId id = nextId_.fetch_add(1);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& current = subscribers_[eventName];
        auto updated = current ? std::make_shared<SubscriptionList>(*current)
                               : std::make_shared<SubscriptionList>();

        auto insertPos = std::find_if(updated->begin(), updated->end(),
                                      [priority](const Subscription& s) { return priority > s.priority; });
        updated->insert(insertPos, Subscription{id, std::move(callback), priority, std::move(filter)});
        current = std::move(updated);
        return id;
    }

    bool EventBus::unsubscribe(SubscriptionId id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto& [name, list] : subscribers_) {
            if (!list) continue;
            auto it = std::find_if(list->begin(), list->end(),
                                   [id](const Subscription& s) { return s.id == id; });
            if (it == list->end()) continue;

            auto updated = std::make_shared<SubscriptionList>(*list);
            updated->erase(updated->begin() + (it - list->begin()));
            list = std::move(updated);
            return true;
        }
        return false;
    }

    std::size_t EventBus::publish(const std::string& eventName, const std::any& data) {
        std::shared_ptr<const SubscriptionList> snapshot;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = subscribers_.find(eventName);
            if (it == subscribers_.end() || !it->second) {
                return 0;
            }
            snapshot = it->second;
        }

        std::size_t delivered = 0;
        for (const auto& sub : *snapshot) {
            if (sub.filter && !sub.filter(data)) {
                continue;
            }
            try {
                sub.callback(data);
                ++delivered;
            } catch (const std::exception& e) {
                Logger::instance().warn("Subscriber for " + eventName + " threw: " + e.what(), "EventBus");
            }
        }
        return delivered;
    }

    std::size_t EventBus::subscriberCount(const std::string& eventName) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = subscribers_.find(eventName);
        return (it == subscribers_.end() || !it->second) ? 0 : it->second->size();
    }

}

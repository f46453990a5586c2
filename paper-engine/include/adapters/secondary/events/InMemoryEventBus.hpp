#pragma once

#include "ports/output/IEventBus.hpp"
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace paper::adapters::secondary {

/**
 * @brief In-memory реализация событийной шины
 *
 * Синхронная доставка в потоке публикации. Подписка на "*"
 * получает все события. Исключение одного обработчика
 * логируется и не мешает остальным.
 */
class InMemoryEventBus : public ports::output::IEventBus {
public:
    static constexpr const char* WILDCARD = "*";

    void publish(const domain::DomainEvent& event) override {
        std::vector<ports::output::EventHandler> targets;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            for (const auto& type : {event.eventType, std::string(WILDCARD)}) {
                auto it = handlers_.find(type);
                if (it != handlers_.end()) {
                    targets.insert(targets.end(), it->second.begin(), it->second.end());
                }
            }
        }

        // handlers вызываются без мьютекса: обработчик может подписываться сам
        for (const auto& handler : targets) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                std::cerr << "[InMemoryEventBus] Handler for " << event.eventType
                          << " failed: " << e.what() << std::endl;
            }
        }
    }

    void subscribe(const std::string& eventType, ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_[eventType].push_back(std::move(handler));
    }

    void unsubscribe(const std::string& eventType) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_.erase(eventType);
    }

    bool hasSubscribers(const std::string& eventType) const override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() && !it->second.empty();
    }

    size_t subscriberCount(const std::string& eventType) const {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() ? it->second.size() : 0;
    }

private:
    mutable std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
};

} // namespace paper::adapters::secondary

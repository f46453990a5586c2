#pragma once

#include "domain/events/DomainEvent.hpp"
#include <string>
#include <functional>

namespace paper::ports::output {

using EventHandler = std::function<void(const domain::DomainEvent&)>;

/**
 * @brief Интерфейс событийной шины
 *
 * Output Port для публикации доменных событий движка.
 */
class IEventBus {
public:
    virtual ~IEventBus() = default;

    virtual void publish(const domain::DomainEvent& event) = 0;

    /**
     * @brief Подписаться на тип события
     *
     * @param eventType Тип события ("order.filled") или "*" для всех
     */
    virtual void subscribe(const std::string& eventType, EventHandler handler) = 0;

    /**
     * @note Удаляет ВСЕ handlers для данного eventType
     */
    virtual void unsubscribe(const std::string& eventType) = 0;

    virtual bool hasSubscribers(const std::string& eventType) const = 0;
};

} // namespace paper::ports::output

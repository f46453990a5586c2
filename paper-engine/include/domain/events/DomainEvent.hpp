#pragma once

#include "domain/Timestamp.hpp"
#include "utils/IdGenerator.hpp"
#include <string>
#include <memory>

namespace paper::domain {

/**
 * @brief Базовый класс для всех доменных событий
 *
 * Публикуется через IEventBus после успешной записи в хранилище.
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (order.filled, position.risk_exit)
    Timestamp timestamp;        ///< Время создания события

    DomainEvent()
        : eventId(utils::IdGenerator::eventId()), timestamp(Timestamp::now()) {}

    explicit DomainEvent(const std::string& type)
        : eventId(utils::IdGenerator::eventId()), eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

} // namespace paper::domain

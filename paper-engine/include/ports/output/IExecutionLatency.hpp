#pragma once

#include <chrono>

namespace paper::ports::output {

/**
 * @brief Задержка между срабатыванием условия ордера и финальной котировкой
 *
 * Имитирует время доставки ордера на биржу. В тестах подменяется нулевой.
 */
class IExecutionLatency {
public:
    virtual ~IExecutionLatency() = default;

    /**
     * @brief Выбрать задержку для очередного исполнения
     */
    virtual std::chrono::milliseconds next() = 0;

    /**
     * @brief Выдержать задержку (блокирует вызывающий поток)
     */
    virtual void wait(std::chrono::milliseconds delay) = 0;
};

} // namespace paper::ports::output

#pragma once

#include "domain/OperationResult.hpp"
#include <optional>
#include <string>

namespace paper::ports::input {

/**
 * @brief Входной порт: правила автоматического выхода из позиции
 */
class IRiskService {
public:
    virtual ~IRiskService() = default;

    virtual domain::OperationResult addRiskManagement(
        const std::string& accountId,
        const std::string& symbol,
        std::optional<double> stopLoss,
        std::optional<double> takeProfit,
        std::optional<double> trailingStopPercent) = 0;

    /**
     * @brief Переоценить позиции всех счетов и проверить правила риска
     * @return Количество выполненных риск-выходов
     */
    virtual size_t refreshAll() = 0;
};

} // namespace paper::ports::input

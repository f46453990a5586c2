#pragma once

#include "domain/OrderRequest.hpp"
#include "domain/OrderResult.hpp"
#include <string>

namespace paper::ports::input {

/**
 * @brief Входной порт: выставление, исполнение и отмена ордеров
 */
class IOrderService {
public:
    virtual ~IOrderService() = default;

    /**
     * @brief Проверить и выставить ордер
     *
     * Рыночный ордер исполняется сразу, остальные ждут Order Monitor.
     */
    virtual domain::OrderResult placeOrder(const domain::OrderRequest& request) = 0;

    /**
     * @brief Отменить PENDING ордер (только в основную сессию)
     */
    virtual domain::OrderResult cancelOrder(const std::string& orderId) = 0;

    /**
     * @brief Один проход по всем PENDING ордерам
     * @return Количество ордеров, перешедших в конечный статус
     */
    virtual size_t monitorPendingOrders() = 0;
};

} // namespace paper::ports::input

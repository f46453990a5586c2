#pragma once

namespace paper::domain {

/**
 * @brief Метрики риска портфеля
 *
 * Эвристические заглушки для отображения, не статистика.
 * В исполнении ордеров не используются.
 */
struct RiskMetrics {
    double volatility = 0.0;   ///< %, 0..100
    double beta = 0.0;         ///< 0..3
    double sharpeRatio = 0.0;  ///< -3..3
    double maxDrawdown = 0.0;  ///< %, -100..0
    double var95 = 0.0;        ///< >= 0
    double correlation = 0.0;
};

} // namespace paper::domain

#pragma once

#include <iomanip>
#include <sstream>
#include <string>

namespace paper::utils {

/**
 * @brief Цена в долларах с двумя знаками: "$189.75"
 */
inline std::string formatPrice(double value) {
    std::ostringstream ss;
    ss << '$' << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

/**
 * @brief Доля в процентах с двумя знаками: 0.001 -> "0.10%"
 */
inline std::string formatPercent(double fraction) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << fraction * 100.0 << '%';
    return ss.str();
}

} // namespace paper::utils

#pragma once

#include "Timestamp.hpp"
#include <cstdint>
#include <string>

namespace paper::domain {

/**
 * @brief Котировка от внешнего поставщика
 */
struct Quote {
    std::string symbol;
    double price = 0.0;
    int64_t volume = 0;
    Timestamp asOf;
};

} // namespace paper::domain

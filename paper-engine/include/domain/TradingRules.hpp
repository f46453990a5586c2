#pragma once

#include <cstdint>

namespace paper::domain::rules {

// Размер ордера, штук
constexpr int64_t MIN_ORDER_SIZE = 1;
constexpr int64_t MAX_ORDER_SIZE = 1000000;

// Доля кэша, доступная для одного ордера на покупку
constexpr double MAX_CASH_USAGE = 0.95;

// Комиссия: фиксированная, два уровня по объёму сделки
constexpr double COMMISSION_SMALL = 0.99;
constexpr double COMMISSION_LARGE = 9.99;
constexpr double COMMISSION_THRESHOLD = 1000.0;

// Проскальзывание по объёму сделки
constexpr double SLIPPAGE_SMALL = 0.001;    // < $10k
constexpr double SLIPPAGE_MEDIUM = 0.002;   // $10k .. $100k
constexpr double SLIPPAGE_LARGE = 0.005;    // >= $100k
constexpr double SLIPPAGE_SMALL_LIMIT = 10000.0;
constexpr double SLIPPAGE_MEDIUM_LIMIT = 100000.0;

// Начальный баланс счёта
constexpr double MIN_INITIAL_BALANCE = 1000.0;
constexpr double MAX_INITIAL_BALANCE = 10000000.0;
constexpr double DEFAULT_INITIAL_BALANCE = 100000.0;

} // namespace paper::domain::rules

#pragma once

#include "domain/Quote.hpp"
#include <optional>
#include <string>

namespace paper::ports::output {

/**
 * @brief Внешний поставщик котировок
 *
 * Output Port. Отсутствие котировки - штатная ситуация (nullopt),
 * а не ошибка: движок откладывает решение до следующего цикла.
 *
 * Реализации:
 * - SimulatedQuoteProvider - случайное блуждание
 * - TimeoutQuoteProvider - декоратор с ограничением времени ответа
 */
class IQuoteProvider {
public:
    virtual ~IQuoteProvider() = default;

    virtual std::optional<domain::Quote> getQuote(const std::string& symbol) = 0;
};

} // namespace paper::ports::output

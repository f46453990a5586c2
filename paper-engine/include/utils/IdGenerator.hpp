#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace paper::utils {

/**
 * @brief Идентификаторы сущностей движка
 *
 * Счета, ордера и транзакции: "<kind>-" + 16 hex-цифр (64 бита случайности).
 * События: UUID v4, как принято для eventId во внешних логах.
 * Генератор свой у каждого потока.
 */
class IdGenerator {
public:
    static std::string accountId() { return tagged("acc"); }
    static std::string orderId() { return tagged("ord"); }
    static std::string transactionId() { return tagged("txn"); }

    static std::string eventId() {
        uint64_t high = next();
        uint64_t low = next();

        // версия 4 в старшем полубайте третьей группы, вариант 10xx в четвёртой
        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        std::ostringstream out;
        out << std::hex << std::setfill('0')
            << std::setw(8) << (high >> 32) << '-'
            << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
            << std::setw(4) << (high & 0xFFFF) << '-'
            << std::setw(4) << (low >> 48) << '-'
            << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
        return out.str();
    }

private:
    static std::string tagged(const char* kind) {
        std::ostringstream out;
        out << kind << '-' << std::hex << std::setfill('0') << std::setw(16) << next();
        return out.str();
    }

    static uint64_t next() {
        thread_local std::mt19937_64 engine(std::random_device{}());
        return engine();
    }
};

} // namespace paper::utils

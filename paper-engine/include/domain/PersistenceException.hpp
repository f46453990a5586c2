#pragma once

#include <stdexcept>
#include <string>

namespace paper::domain {

/**
 * @brief Ошибка хранилища (соединение, SQL, нарушение целостности)
 */
class PersistenceException : public std::runtime_error {
public:
    explicit PersistenceException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace paper::domain

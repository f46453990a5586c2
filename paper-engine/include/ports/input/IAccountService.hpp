#pragma once

#include "domain/AccountResult.hpp"
#include "domain/OperationResult.hpp"
#include "domain/RiskMetrics.hpp"
#include "domain/TradingStats.hpp"
#include "domain/Account.hpp"
#include <optional>
#include <string>
#include <vector>

namespace paper::ports::input {

/**
 * @brief Входной порт: жизненный цикл счёта и отчёты
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    virtual domain::AccountResult createAccount(
        const std::string& ownerId, const std::string& name, double initialBalance) = 0;

    virtual domain::AccountResult getAccount(const std::string& accountId) = 0;

    virtual std::vector<domain::Account> getAccounts(const std::string& ownerId) = 0;

    virtual domain::OperationResult deleteAccount(const std::string& accountId) = 0;

    virtual std::optional<domain::TradingStats> getTradingStats(const std::string& accountId) = 0;

    virtual std::optional<domain::RiskMetrics> getRiskMetrics(const std::string& accountId) = 0;
};

} // namespace paper::ports::input

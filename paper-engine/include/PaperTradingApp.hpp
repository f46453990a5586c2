#pragma once

#include <boost/di.hpp>
#include <atomic>
#include <memory>

// Forward declarations - Ports
namespace paper::ports::input {
    class IAccountService;
    class IOrderService;
    class IRiskService;
}

namespace paper::ports::output {
    class IEventBus;
    class ITradingStore;
    class IQuoteProvider;
}

namespace paper::application {
    class Scheduler;
}

namespace paper::settings {
    class EngineSettings;
}

/**
 * @class PaperTradingApp
 * @brief Главное приложение Paper Trading Engine
 *
 * Жизненный цикл:
 * 1. configureInjection() - Boost.DI биндинги портов к адаптерам и сервисам
 * 2. run() - запуск фоновых циклов и ожидание stop()
 * 3. stop() - остановка (безопасно вызывать из обработчика сигнала)
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Secondary Adapters: InMemory/Postgres store, SimulatedQuoteProvider,
 *   UsEquityMarketClock, InMemoryEventBus
 * - Application: OrderEngine, RiskService, AccountService, Scheduler
 */
class PaperTradingApp
{
public:
    PaperTradingApp();
    ~PaperTradingApp();

    /**
     * @brief Собрать граф зависимостей и работать до stop()
     */
    void run();

    /**
     * @brief Запросить остановку
     */
    void stop();

    std::shared_ptr<paper::ports::input::IOrderService> orderService() const { return orderService_; }
    std::shared_ptr<paper::ports::input::IAccountService> accountService() const { return accountService_; }
    std::shared_ptr<paper::ports::input::IRiskService> riskService() const { return riskService_; }

private:
    /**
     * @brief Настроить Boost.DI контейнер
     *
     * 1. Биндинг Output Ports к Secondary Adapters
     * 2. Биндинг Input Ports к Application Services
     * 3. Создание Scheduler с автоматическим разрешением зависимостей
     */
    void configureInjection();

    std::shared_ptr<paper::ports::output::ITradingStore> createStore(
        const paper::settings::EngineSettings& settings);

    std::shared_ptr<paper::ports::output::IQuoteProvider> createQuoteProvider(
        const paper::settings::EngineSettings& settings);

    void subscribeEventLog();

    void createDemoAccount(const paper::settings::EngineSettings& settings);

    void printStartupBanner();

    std::shared_ptr<paper::ports::output::IEventBus> eventBus_;
    std::shared_ptr<paper::ports::input::IOrderService> orderService_;
    std::shared_ptr<paper::ports::input::IAccountService> accountService_;
    std::shared_ptr<paper::ports::input::IRiskService> riskService_;
    std::shared_ptr<paper::application::Scheduler> scheduler_;

    std::atomic<bool> stopRequested_;
};

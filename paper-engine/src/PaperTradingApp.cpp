#include "PaperTradingApp.hpp"

// Application Services
#include "application/AccountLocks.hpp"
#include "application/AccountService.hpp"
#include "application/OrderEngine.hpp"
#include "application/RiskService.hpp"
#include "application/Scheduler.hpp"

// Secondary Adapters
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "adapters/secondary/execution/RandomExecutionLatency.hpp"
#include "adapters/secondary/market/SimulatedQuoteProvider.hpp"
#include "adapters/secondary/market/TimeoutQuoteProvider.hpp"
#include "adapters/secondary/market/UsEquityMarketClock.hpp"
#include "adapters/secondary/persistence/InMemoryTradingStore.hpp"
#include "adapters/secondary/persistence/PostgresTradingStore.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/EngineSettings.hpp"
#include "settings/SimulatorSettings.hpp"

#include "domain/TradingRules.hpp"

#include <chrono>
#include <iostream>
#include <thread>

namespace di = boost::di;

// ============================================================================
// Конфигурационные константы
// ============================================================================
namespace config
{
    constexpr unsigned int SIMULATOR_SEED = 0;          // 0 = random_device
    constexpr int STOP_POLL_INTERVAL_MS = 200;
    constexpr const char* DEMO_ACCOUNT_NAME = "Demo";
}

// ============================================================================
// PaperTradingApp Implementation
// ============================================================================

PaperTradingApp::PaperTradingApp()
    : stopRequested_(false)
{
    std::cout << "[PaperTradingApp] Application created" << std::endl;
}

PaperTradingApp::~PaperTradingApp()
{
    if (scheduler_)
    {
        scheduler_->stop();
    }
    std::cout << "[PaperTradingApp] Application destroyed" << std::endl;
}

void PaperTradingApp::run()
{
    configureInjection();

    scheduler_->start();
    std::cout << "[PaperTradingApp] Engine running" << std::endl;

    while (!stopRequested_)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(config::STOP_POLL_INTERVAL_MS));
    }

    std::cout << "[PaperTradingApp] Stopping..." << std::endl;
    scheduler_->stop();
}

void PaperTradingApp::stop()
{
    stopRequested_ = true;
}

void PaperTradingApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[PaperTradingApp] Configuring Boost.DI injection..." << std::endl;

    auto engineSettings = std::make_shared<paper::settings::EngineSettings>();

    auto store = createStore(*engineSettings);
    auto quotes = createQuoteProvider(*engineSettings);

    // ========================================================================
    // Boost.DI Injector Configuration
    // ========================================================================

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        // IEngineSettings ← EngineSettings (env)
        di::bind<paper::ports::output::IEngineSettings>().to(engineSettings),

        // ITradingStore ← InMemory или Postgres (PAPER_STORE)
        di::bind<paper::ports::output::ITradingStore>().to(store),

        // IQuoteProvider ← TimeoutQuoteProvider(SimulatedQuoteProvider)
        di::bind<paper::ports::output::IQuoteProvider>().to(quotes),

        // IMarketClock ← UsEquityMarketClock (America/New_York)
        di::bind<paper::ports::output::IMarketClock>()
            .to(std::make_shared<paper::adapters::secondary::UsEquityMarketClock>()),

        // IExecutionLatency ← RandomExecutionLatency [min, max]
        di::bind<paper::ports::output::IExecutionLatency>()
            .to(std::make_shared<paper::adapters::secondary::RandomExecutionLatency>(
                engineSettings->getExecDelayMin(),
                engineSettings->getExecDelayMax())),

        // IEventBus ← InMemoryEventBus
        di::bind<paper::ports::output::IEventBus>()
            .to<paper::adapters::secondary::InMemoryEventBus>()
            .in(di::singleton),

        // Общие блокировки счетов для всех сервисов
        di::bind<paper::application::AccountLocks>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<paper::ports::input::IOrderService>()
            .to<paper::application::OrderEngine>()
            .in(di::singleton),

        di::bind<paper::ports::input::IRiskService>()
            .to<paper::application::RiskService>()
            .in(di::singleton),

        di::bind<paper::ports::input::IAccountService>()
            .to<paper::application::AccountService>()
            .in(di::singleton),

        di::bind<paper::application::Scheduler>()
            .in(di::singleton));

    eventBus_ = injector.create<std::shared_ptr<paper::ports::output::IEventBus>>();
    orderService_ = injector.create<std::shared_ptr<paper::ports::input::IOrderService>>();
    riskService_ = injector.create<std::shared_ptr<paper::ports::input::IRiskService>>();
    accountService_ = injector.create<std::shared_ptr<paper::ports::input::IAccountService>>();
    scheduler_ = injector.create<std::shared_ptr<paper::application::Scheduler>>();

    std::cout << "\n📦 Boost.DI Injector configured:" << std::endl;
    std::cout << "  ✓ Secondary Adapters (7 bindings)" << std::endl;
    std::cout << "  ✓ Application Services (4 bindings)" << std::endl;

    subscribeEventLog();
    createDemoAccount(*engineSettings);

    std::cout << "[PaperTradingApp] DI configuration completed" << std::endl;
}

std::shared_ptr<paper::ports::output::ITradingStore> PaperTradingApp::createStore(
    const paper::settings::EngineSettings& settings)
{
    if (settings.getStoreType() == "postgres")
    {
        paper::settings::DbSettings dbSettings;
        std::cout << "[PaperTradingApp] Using PostgreSQL store at "
                  << dbSettings.getHost() << ":" << dbSettings.getPort() << std::endl;
        return std::make_shared<paper::adapters::secondary::PostgresTradingStore>(
            dbSettings.getConnectionString());
    }

    std::cout << "[PaperTradingApp] Using in-memory store" << std::endl;
    return std::make_shared<paper::adapters::secondary::InMemoryTradingStore>();
}

std::shared_ptr<paper::ports::output::IQuoteProvider> PaperTradingApp::createQuoteProvider(
    const paper::settings::EngineSettings& settings)
{
    paper::settings::SimulatorSettings simSettings;

    auto simulator = std::make_shared<paper::adapters::secondary::SimulatedQuoteProvider>(
        simSettings.getStep(), config::SIMULATOR_SEED);

    for (const auto& instrument : simSettings.getInstruments())
    {
        simulator->initInstrument(instrument.symbol, instrument.startPrice, simSettings.getVolatility());
        std::cout << "  ✓ Simulated instrument " << instrument.symbol
                  << " @ " << instrument.startPrice << std::endl;
    }

    return std::make_shared<paper::adapters::secondary::TimeoutQuoteProvider>(
        simulator, settings.getQuoteTimeout());
}

void PaperTradingApp::subscribeEventLog()
{
    eventBus_->subscribe("*", [](const paper::domain::DomainEvent& event) {
        std::cout << "[EventLog] " << event.toJson() << std::endl;
    });
}

void PaperTradingApp::createDemoAccount(const paper::settings::EngineSettings& settings)
{
    if (settings.getDemoOwner().empty())
    {
        return;
    }

    auto result = accountService_->createAccount(
        settings.getDemoOwner(),
        config::DEMO_ACCOUNT_NAME,
        paper::domain::rules::DEFAULT_INITIAL_BALANCE);

    if (result.isSuccess())
    {
        std::cout << "[PaperTradingApp] Demo account " << result.snapshot->account.id
                  << " created for " << settings.getDemoOwner() << std::endl;
    }
    else
    {
        std::cerr << "[PaperTradingApp] Demo account creation failed: " << result.message << std::endl;
    }
}

void PaperTradingApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║           Paper Trading Simulation Engine            ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Market Hours: Boost.DateTime (America/New_York)     ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}

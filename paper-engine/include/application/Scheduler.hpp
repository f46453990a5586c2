#pragma once

#include "ports/input/IOrderService.hpp"
#include "ports/input/IRiskService.hpp"
#include "ports/output/IMarketClock.hpp"
#include "ports/output/IEngineSettings.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace paper::application {

/**
 * @brief Фоновые циклы движка
 *
 * Два независимых потока, запускаются и останавливаются вместе:
 * - Price Refresh: переоценка позиций и риск-выходы
 * - Order Monitor: проверка условий PENDING ордеров
 *
 * Период каждого цикла выбирается заново после каждого прохода
 * в зависимости от того, идёт ли основная сессия.
 * stop() дожидается завершения текущих проходов.
 */
class Scheduler {
public:
    Scheduler(
        std::shared_ptr<ports::input::IRiskService> riskService,
        std::shared_ptr<ports::input::IOrderService> orderService,
        std::shared_ptr<ports::output::IMarketClock> clock,
        std::shared_ptr<ports::output::IEngineSettings> settings)
        : riskService_(std::move(riskService))
        , orderService_(std::move(orderService))
        , clock_(std::move(clock))
        , settings_(std::move(settings))
        , running_(false)
        , priceRefreshCount_(0)
        , orderMonitorCount_(0)
    {}

    ~Scheduler() {
        stop();
    }

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        std::cout << "[Scheduler] Starting price refresh and order monitor loops" << std::endl;
        priceRefreshThread_ = std::thread([this]() {
            runLoop([this]() { runPriceRefreshOnce(); },
                    [this]() { return currentPriceRefreshInterval(); });
        });
        orderMonitorThread_ = std::thread([this]() {
            runLoop([this]() { runOrderMonitorOnce(); },
                    [this]() { return currentOrderMonitorInterval(); });
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(waitMutex_);
            running_ = false;
        }
        wakeup_.notify_all();

        bool joined = false;
        if (priceRefreshThread_.joinable()) {
            priceRefreshThread_.join();
            joined = true;
        }
        if (orderMonitorThread_.joinable()) {
            orderMonitorThread_.join();
            joined = true;
        }
        if (joined) {
            std::cout << "[Scheduler] Stopped" << std::endl;
        }
    }

    bool isRunning() const { return running_; }

    /**
     * @brief Один проход Price Refresh (вызывается потоком или тестом)
     */
    void runPriceRefreshOnce() {
        try {
            size_t exits = riskService_->refreshAll();
            if (exits > 0) {
                std::cout << "[Scheduler] Price refresh closed " << exits << " position(s)" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[Scheduler] Price refresh cycle failed: " << e.what() << std::endl;
        }
        ++priceRefreshCount_;
    }

    /**
     * @brief Один проход Order Monitor (вызывается потоком или тестом)
     */
    void runOrderMonitorOnce() {
        try {
            size_t finalized = orderService_->monitorPendingOrders();
            if (finalized > 0) {
                std::cout << "[Scheduler] Order monitor finalized " << finalized << " order(s)" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[Scheduler] Order monitor cycle failed: " << e.what() << std::endl;
        }
        ++orderMonitorCount_;
    }

    std::chrono::milliseconds currentPriceRefreshInterval() const {
        return clock_->getMarketSession().isOpen
            ? settings_->getPriceRefreshOpenInterval()
            : settings_->getPriceRefreshClosedInterval();
    }

    std::chrono::milliseconds currentOrderMonitorInterval() const {
        return clock_->getMarketSession().isOpen
            ? settings_->getOrderMonitorOpenInterval()
            : settings_->getOrderMonitorClosedInterval();
    }

    uint64_t priceRefreshCount() const { return priceRefreshCount_; }

    uint64_t orderMonitorCount() const { return orderMonitorCount_; }

private:
    std::shared_ptr<ports::input::IRiskService> riskService_;
    std::shared_ptr<ports::input::IOrderService> orderService_;
    std::shared_ptr<ports::output::IMarketClock> clock_;
    std::shared_ptr<ports::output::IEngineSettings> settings_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> priceRefreshCount_;
    std::atomic<uint64_t> orderMonitorCount_;

    std::thread priceRefreshThread_;
    std::thread orderMonitorThread_;
    std::mutex waitMutex_;
    std::condition_variable wakeup_;

    template <typename Cycle, typename Interval>
    void runLoop(Cycle cycle, Interval interval) {
        while (running_) {
            cycle();
            auto delay = interval();

            std::unique_lock<std::mutex> lock(waitMutex_);
            wakeup_.wait_for(lock, delay, [this]() { return !running_; });
        }
    }
};

} // namespace paper::application

#pragma once

#include "ports/output/IQuoteProvider.hpp"
#include <chrono>
#include <cstdint>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace paper::adapters::secondary {

/**
 * @brief Декоратор: ограничение времени ответа поставщика котировок
 *
 * Запрос выполняется в отдельном потоке. Если ответ не пришёл
 * за timeout, котировка считается недоступной. Исключение поставщика
 * логируется и тоже даёт nullopt.
 *
 * На каждый символ не больше одного запроса в полёте: повторный вызов,
 * пока предыдущий не завершился, ждёт тот же ответ, а не запускает
 * новый поток. Зависший поставщик держит один поток на символ.
 * Потоки join-ятся при завершении запроса и в деструкторе.
 */
class TimeoutQuoteProvider : public ports::output::IQuoteProvider {
public:
    TimeoutQuoteProvider(
        std::shared_ptr<ports::output::IQuoteProvider> delegate,
        std::chrono::milliseconds timeout)
        : delegate_(std::move(delegate))
        , timeout_(timeout)
    {}

    ~TimeoutQuoteProvider() override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [symbol, request] : inFlight_) {
            if (request.worker.joinable()) {
                request.worker.join();
            }
        }
    }

    TimeoutQuoteProvider(const TimeoutQuoteProvider&) = delete;
    TimeoutQuoteProvider& operator=(const TimeoutQuoteProvider&) = delete;

    std::optional<domain::Quote> getQuote(const std::string& symbol) override {
        QuoteFuture future;
        uint64_t requestId = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = inFlight_.find(symbol);
            if (it != inFlight_.end() && isReady(it->second.result)) {
                it->second.worker.join();
                inFlight_.erase(it);
                it = inFlight_.end();
            }
            if (it == inFlight_.end()) {
                it = startRequest(symbol);
            }
            future = it->second.result;
            requestId = it->second.id;
        }

        if (future.wait_for(timeout_) != std::future_status::ready) {
            std::cerr << "[TimeoutQuoteProvider] Quote for " << symbol << " timed out after "
                      << timeout_.count() << " ms" << std::endl;
            return std::nullopt;
        }

        finish(symbol, requestId);
        return future.get();
    }

    /**
     * @brief Число символов с незавершённым запросом
     */
    size_t inFlightCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& [symbol, request] : inFlight_) {
            if (!isReady(request.result)) {
                ++count;
            }
        }
        return count;
    }

private:
    using QuoteFuture = std::shared_future<std::optional<domain::Quote>>;

    struct Request {
        uint64_t id = 0;
        QuoteFuture result;
        std::thread worker;
    };

    std::shared_ptr<ports::output::IQuoteProvider> delegate_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex mutex_;
    std::map<std::string, Request> inFlight_;
    uint64_t nextRequestId_ = 1;

    static bool isReady(const QuoteFuture& future) {
        return future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
    }

    /// Вызывается под mutex_
    std::map<std::string, Request>::iterator startRequest(const std::string& symbol) {
        std::promise<std::optional<domain::Quote>> promise;
        Request request;
        request.id = nextRequestId_++;
        request.result = promise.get_future().share();
        request.worker = std::thread(
            [delegate = delegate_, symbol](std::promise<std::optional<domain::Quote>> p) {
                try {
                    p.set_value(delegate->getQuote(symbol));
                } catch (const std::exception& e) {
                    std::cerr << "[TimeoutQuoteProvider] Quote for " << symbol << " failed: " << e.what() << std::endl;
                    p.set_value(std::nullopt);
                }
            },
            std::move(promise));
        return inFlight_.emplace(symbol, std::move(request)).first;
    }

    void finish(const std::string& symbol, uint64_t requestId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = inFlight_.find(symbol);
        if (it == inFlight_.end() || it->second.id != requestId) {
            return;
        }
        if (it->second.worker.joinable()) {
            it->second.worker.join();
        }
        inFlight_.erase(it);
    }
};

} // namespace paper::adapters::secondary

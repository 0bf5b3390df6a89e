#pragma once

#include "ports/output/IPriceOracle.hpp"
#include "domain/PriceData.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace arena::application {

/**
 * @brief Фоновый поток, через который идут все запросы к IPriceOracle
 *
 * Один долгоживущий поток на экземпляр вместо потока на каждый вызов.
 * Вызывающий ждёт ответ не дольше таймаута; зависший оракул занимает
 * только этот поток, а очередь ожидающих запросов ограничена
 * MAX_PENDING_REQUESTS.
 *
 * Поток отсоединён и держит общее состояние через shared_ptr, поэтому
 * деструктор не ждёт оракул, который так и не ответил. После
 * деструктора поток завершается, как только текущий вызов вернётся.
 *
 * @example
 * ```cpp
 * PriceFetchWorker worker(oracle);
 * auto price = worker.fetch("feed-usdc", std::chrono::milliseconds{2000});
 * ```
 *
 * Thread-safe: да
 */
class PriceFetchWorker {
public:
    static constexpr std::size_t MAX_PENDING_REQUESTS = 16;

    explicit PriceFetchWorker(std::shared_ptr<ports::output::IPriceOracle> oracle);

    ~PriceFetchWorker();

    // Non-copyable, non-movable
    PriceFetchWorker(const PriceFetchWorker&) = delete;
    PriceFetchWorker& operator=(const PriceFetchWorker&) = delete;

    /**
     * @brief Запросить цену и дождаться ответа
     *
     * @throws ArenaException(OracleUnavailable) при таймауте, переполненной
     *         очереди или ошибке оракула
     */
    domain::PriceData fetch(const std::string& priceFeedId, std::chrono::milliseconds timeout);

    /**
     * @brief Запросы, ещё не взятые потоком
     */
    std::size_t pendingRequests() const;

private:
    struct Request {
        std::string priceFeedId;
        std::promise<domain::PriceData> promise;
    };

    struct State {
        std::mutex mutex;
        std::condition_variable wakeUp;
        std::deque<std::shared_ptr<Request>> queue;
        std::shared_ptr<ports::output::IPriceOracle> oracle;
        bool stopping = false;
    };

    std::shared_ptr<State> state_;

    static void runLoop(std::shared_ptr<State> state);
};

} // namespace arena::application

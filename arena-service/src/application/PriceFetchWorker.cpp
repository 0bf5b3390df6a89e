#include "application/PriceFetchWorker.hpp"
#include "domain/ArenaError.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>

namespace arena::application {

using domain::ArenaException;
using domain::ErrorCode;
using domain::PriceData;

PriceFetchWorker::PriceFetchWorker(std::shared_ptr<ports::output::IPriceOracle> oracle)
    : state_(std::make_shared<State>())
{
    state_->oracle = std::move(oracle);
    std::thread(&PriceFetchWorker::runLoop, state_).detach();
}

PriceFetchWorker::~PriceFetchWorker() {
    std::deque<std::shared_ptr<Request>> abandoned;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
        state_->oracle.reset();
        abandoned.swap(state_->queue);
    }
    state_->wakeUp.notify_all();

    for (auto& request : abandoned) {
        request->promise.set_exception(std::make_exception_ptr(
            ArenaException(ErrorCode::OracleUnavailable, "price worker stopped")));
    }
}

PriceData PriceFetchWorker::fetch(const std::string& priceFeedId, std::chrono::milliseconds timeout) {
    auto request = std::make_shared<Request>();
    request->priceFeedId = priceFeedId;
    auto future = request->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->queue.size() >= MAX_PENDING_REQUESTS) {
            std::cerr << "[PriceFetchWorker] Queue full, rejecting feed " << priceFeedId << std::endl;
            throw ArenaException(ErrorCode::OracleUnavailable,
                "price feed " + priceFeedId + ": " + std::to_string(MAX_PENDING_REQUESTS) + " requests pending");
        }
        state_->queue.push_back(request);
    }
    state_->wakeUp.notify_one();

    if (future.wait_for(timeout) != std::future_status::ready) {
        {
            // Запрос, который поток ещё не взял, больше никому не нужен
            std::lock_guard<std::mutex> lock(state_->mutex);
            auto& queue = state_->queue;
            queue.erase(std::remove(queue.begin(), queue.end(), request), queue.end());
        }
        std::cerr << "[PriceFetchWorker] Timeout after " << timeout.count()
                  << "ms for feed " << priceFeedId << std::endl;
        throw ArenaException(ErrorCode::OracleUnavailable,
            "price feed " + priceFeedId + " timed out after " + std::to_string(timeout.count()) + "ms");
    }

    try {
        return future.get();
    } catch (const ArenaException&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[PriceFetchWorker] Feed " << priceFeedId << " failed: " << e.what() << std::endl;
        throw ArenaException(ErrorCode::OracleUnavailable, "price feed " + priceFeedId + ": " + e.what());
    }
}

std::size_t PriceFetchWorker::pendingRequests() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

void PriceFetchWorker::runLoop(std::shared_ptr<State> state) {
    while (true) {
        std::shared_ptr<Request> request;
        std::shared_ptr<ports::output::IPriceOracle> oracle;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->wakeUp.wait(lock, [&] { return state->stopping || !state->queue.empty(); });
            if (state->stopping) {
                return;
            }
            request = state->queue.front();
            state->queue.pop_front();
            oracle = state->oracle;
        }

        // Исключение оракула доставляется вызывающему через future
        try {
            request->promise.set_value(oracle->getPrice(request->priceFeedId));
        } catch (...) {
            request->promise.set_exception(std::current_exception());
        }
    }
}

} // namespace arena::application

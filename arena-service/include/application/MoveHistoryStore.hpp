#pragma once

#include "application/ConfigRegistry.hpp"
#include "domain/enums/Action.hpp"
#include "ThreadSafeMap.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace arena::application {

/**
 * @brief Последние W ходов игрока по каждому аккаунту
 *
 * W = historyWindow из конфигурации; при переполнении вытесняется
 * самый старый ход. Пишется только после успешного commit раунда.
 */
class MoveHistoryStore {
public:
    explicit MoveHistoryStore(std::shared_ptr<ConfigRegistry> config)
        : config_(std::move(config)) {}

    void append(const std::string& accountId, domain::Action action) {
        std::size_t window = config_->get().historyWindow;
        auto slot = moves_.getOrCreate(accountId, [] { return std::make_shared<HistorySlot>(); });

        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->actions.push_back(action);
        while (slot->actions.size() > window) {
            slot->actions.pop_front();
        }
    }

    /**
     * @brief Ходы аккаунта, старые первыми (не больше текущего окна)
     */
    std::vector<domain::Action> get(const std::string& accountId) const {
        auto slot = moves_.find(accountId);
        if (!slot) {
            return {};
        }
        std::size_t window = config_->get().historyWindow;

        std::lock_guard<std::mutex> lock(slot->mutex);
        std::size_t skip = slot->actions.size() > window ? slot->actions.size() - window : 0;
        return std::vector<domain::Action>(slot->actions.begin() + static_cast<std::ptrdiff_t>(skip),
                                           slot->actions.end());
    }

private:
    struct HistorySlot {
        std::mutex mutex;
        std::deque<domain::Action> actions;
    };

    std::shared_ptr<ConfigRegistry> config_;
    ThreadSafeMap<std::string, HistorySlot> moves_;
};

} // namespace arena::application

#pragma once

#include <deque>
#include <cstdint>

namespace arena::domain {

/**
 * @brief Статистика фактических побед соперника
 *
 * recent - скользящее окно последних исходов (true = соперник выиграл).
 */
struct WinRateStats {
    uint64_t rounds = 0;
    uint64_t opponentWins = 0;
    std::deque<bool> recent;

    double lifetimeRate() const {
        return rounds == 0 ? 0.0 : static_cast<double>(opponentWins) / static_cast<double>(rounds);
    }

    double rollingRate() const {
        if (recent.empty()) return 0.0;
        std::size_t wins = 0;
        for (bool won : recent) {
            if (won) ++wins;
        }
        return static_cast<double>(wins) / static_cast<double>(recent.size());
    }

    void record(bool opponentWon, std::size_t window) {
        ++rounds;
        if (opponentWon) ++opponentWins;
        recent.push_back(opponentWon);
        while (recent.size() > window) {
            recent.pop_front();
        }
    }
};

} // namespace arena::domain

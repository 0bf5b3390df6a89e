#include "application/opponent/WinRateController.hpp"
#include <algorithm>

namespace arena::application::opponent {

domain::WinRateStats WinRateController::statsFor(const std::string& accountId) const {
    if (config_->get().winRateScope == domain::WinRateScope::PLATFORM) {
        std::lock_guard<std::mutex> lock(platform_.mutex);
        return platform_.stats;
    }
    auto slot = perAccount_.find(accountId);
    if (!slot) {
        return {};
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->stats;
}

void WinRateController::record(const std::string& accountId, bool opponentWon) {
    std::size_t window = config_->get().winRateWindow;
    auto slot = perAccount_.getOrCreate(accountId, [] { return std::make_shared<StatsSlot>(); });
    recordInto(*slot, opponentWon, window);
    recordInto(platform_, opponentWon, window);
}

void WinRateController::recordInto(StatsSlot& slot, bool opponentWon, std::size_t window) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.stats.record(opponentWon, window == 0 ? 1 : window);
}

double WinRateController::bias(const domain::WinRateStats& stats, double target) {
    if (stats.rounds == 0) {
        return 0.0;
    }
    double proportional = target - stats.rollingRate();
    double deficit = target * static_cast<double>(stats.rounds) - static_cast<double>(stats.opponentWins);
    double value = PROPORTIONAL_GAIN * proportional + INTEGRAL_GAIN * deficit;
    return std::clamp(value, -1.0, 1.0);
}

} // namespace arena::application::opponent

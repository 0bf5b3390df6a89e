#include "application/opponent/AIOpponent.hpp"
#include "application/opponent/MoveSelector.hpp"
#include "application/opponent/WinRateController.hpp"
#include "domain/DifficultyProfile.hpp"

namespace arena::application::opponent {

domain::Action AIOpponent::selectAction(
    const std::vector<domain::Action>& history,
    domain::Difficulty difficulty,
    const domain::WinRateStats& stats,
    double targetWinRate,
    ports::output::IRandomSource& random
) {
    auto analysis = recognizer_.analyze(history);
    auto profile = domain::DifficultyProfile::forDifficulty(difficulty);
    double bias = WinRateController::bias(stats, targetWinRate);
    auto distribution = MoveSelector::distribution(analysis, profile, bias, targetWinRate);
    return MoveSelector::sample(distribution, random);
}

} // namespace arena::application::opponent

#include "application/opponent/MoveSelector.hpp"
#include <algorithm>

namespace arena::application::opponent {

using domain::Action;
using domain::MoveDistribution;

MoveDistribution MoveSelector::distribution(
    const domain::PatternAnalysis& analysis,
    const domain::DifficultyProfile& profile,
    double bias,
    double target
) {
    MoveDistribution result;
    result.fill(1.0 / 3.0);
    if (!analysis.predicted) {
        return result;
    }

    const double tie = std::clamp(profile.tieWeight, 0.0, 1.0);
    const double floor = std::clamp(profile.randomnessFloor, 0.0, 1.0);
    const double maxExploit = std::max(0.0, 1.0 - tie - floor);

    // Слабые предсказания игнорируются
    double effective = 0.0;
    if (analysis.confidence >= profile.confidenceThreshold) {
        effective = std::clamp(analysis.confidence * profile.confidence, 0.0, 1.0);
    }

    const double neutral = std::clamp((3.0 * target - 1.0 + tie) / 2.0, 0.0, maxExploit);
    const double b = std::clamp(bias, -1.0, 1.0);
    const double shifted = b >= 0.0
        ? neutral + b * (maxExploit - neutral)
        : neutral * (1.0 + b);

    const double exploit = effective * shifted;
    const double tieShare = effective * tie;
    const double uniform = std::max(0.0, 1.0 - exploit - tieShare);

    const Action predicted = *analysis.predicted;
    result.fill(uniform / 3.0);
    result[domain::index(domain::counterOf(predicted))] += exploit;
    result[domain::index(predicted)] += tieShare;
    return result;
}

Action MoveSelector::sample(const MoveDistribution& distribution, ports::output::IRandomSource& random) {
    double u = std::clamp(random.nextUnit(), 0.0, 1.0);
    double cumulative = 0.0;
    for (auto action : domain::ALL_ACTIONS) {
        cumulative += distribution[domain::index(action)];
        if (u < cumulative) {
            return action;
        }
    }
    return domain::ALL_ACTIONS.back();
}

} // namespace arena::application::opponent

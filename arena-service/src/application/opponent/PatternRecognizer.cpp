#include "application/opponent/PatternRecognizer.hpp"
#include <algorithm>
#include <array>

namespace arena::application::opponent {

using domain::Action;
using domain::ACTION_COUNT;
using domain::PatternAnalysis;

namespace {

/**
 * @brief Индекс максимума; при равенстве побеждает больший tieBreak
 */
std::size_t argmax(const std::array<std::size_t, ACTION_COUNT>& counts,
                   const std::array<long, ACTION_COUNT>& tieBreak) {
    std::size_t best = 0;
    for (std::size_t i = 1; i < ACTION_COUNT; ++i) {
        if (counts[i] > counts[best] ||
            (counts[i] == counts[best] && tieBreak[i] > tieBreak[best])) {
            best = i;
        }
    }
    return best;
}

} // namespace

PatternAnalysis PatternRecognizer::analyze(const std::vector<Action>& history) const {
    PatternAnalysis result;
    const std::size_t n = history.size();
    result.sampleSize = n;

    std::array<long, ACTION_COUNT> lastPosition;
    lastPosition.fill(-1);
    for (std::size_t i = 0; i < n; ++i) {
        ++result.frequencies[domain::index(history[i])];
        lastPosition[domain::index(history[i])] = static_cast<long>(i);
    }
    if (n == 0) {
        return result;
    }

    // Самый длинный повторяющийся суффикс
    const std::size_t maxLength = std::min(maxPatternLength_, n - 1);
    for (std::size_t length = maxLength; length >= 1; --length) {
        const auto suffix = history.begin() + static_cast<std::ptrdiff_t>(n - length);

        std::array<std::size_t, ACTION_COUNT> followers{};
        std::array<long, ACTION_COUNT> followerSeen;
        followerSeen.fill(-1);
        std::size_t occurrences = 0;

        for (std::size_t i = 0; i + length < n; ++i) {
            const auto start = history.begin() + static_cast<std::ptrdiff_t>(i);
            if (std::equal(start, start + static_cast<std::ptrdiff_t>(length), suffix)) {
                std::size_t next = domain::index(history[i + length]);
                ++followers[next];
                followerSeen[next] = static_cast<long>(i);
                ++occurrences;
            }
        }

        if (occurrences > 0) {
            std::size_t best = argmax(followers, followerSeen);
            result.patternLength = length;
            result.patternOccurrences = occurrences;
            result.predicted = domain::ALL_ACTIONS[best];
            result.confidence = static_cast<double>(followers[best]) / static_cast<double>(occurrences);
            return result;
        }
    }

    // Паттерна нет - самый частый ход
    std::size_t best = argmax(result.frequencies, lastPosition);
    double share = static_cast<double>(result.frequencies[best]) / static_cast<double>(n);
    result.predicted = domain::ALL_ACTIONS[best];
    result.confidence = std::clamp((share - 1.0 / 3.0) / (2.0 / 3.0), 0.0, 1.0);
    return result;
}

} // namespace arena::application::opponent

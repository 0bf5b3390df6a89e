#pragma once

#include "domain/PatternAnalysis.hpp"
#include "domain/enums/Action.hpp"
#include <cstddef>
#include <vector>

namespace arena::application::opponent {

/**
 * @brief Анализ истории ходов игрока
 *
 * 1. Частоты ходов в окне.
 * 2. Самый длинный суффикс истории (длиной до maxPatternLength), который
 *    уже встречался раньше; распределение ходов, следовавших за ним.
 * 3. Предсказание: самый частый "следующий" ход для найденного суффикса,
 *    иначе самый частый ход окна (при равенстве - более поздний).
 *
 * Confidence для паттерна - доля предсказанного хода среди последователей;
 * для частотного предсказания - превышение доли над равномерной 1/3,
 * отмасштабированное в [0, 1].
 */
class PatternRecognizer {
public:
    static constexpr std::size_t DEFAULT_MAX_PATTERN_LENGTH = 4;

    explicit PatternRecognizer(std::size_t maxPatternLength = DEFAULT_MAX_PATTERN_LENGTH)
        : maxPatternLength_(maxPatternLength == 0 ? 1 : maxPatternLength) {}

    domain::PatternAnalysis analyze(const std::vector<domain::Action>& history) const;

    std::size_t maxPatternLength() const { return maxPatternLength_; }

private:
    std::size_t maxPatternLength_;
};

} // namespace arena::application::opponent

#pragma once

#include <array>
#include <optional>
#include <string>
#include <stdexcept>

namespace arena::domain {

/**
 * @brief Ход раунда
 *
 * Цикл фиксирован: ROCK бьёт SCISSORS, PAPER бьёт ROCK, SCISSORS бьёт PAPER.
 */
enum class Action {
    ROCK = 0,
    PAPER = 1,
    SCISSORS = 2
};

constexpr std::size_t ACTION_COUNT = 3;

constexpr std::array<Action, ACTION_COUNT> ALL_ACTIONS = {
    Action::ROCK, Action::PAPER, Action::SCISSORS
};

constexpr std::size_t index(Action action) {
    return static_cast<std::size_t>(action);
}

/**
 * @brief Ход, который бьёт данный
 */
constexpr Action counterOf(Action action) {
    switch (action) {
        case Action::ROCK:     return Action::PAPER;
        case Action::PAPER:    return Action::SCISSORS;
        case Action::SCISSORS: return Action::ROCK;
    }
    return Action::ROCK;
}

constexpr bool beats(Action lhs, Action rhs) {
    return counterOf(rhs) == lhs;
}

inline std::string toString(Action action) {
    switch (action) {
        case Action::ROCK:     return "ROCK";
        case Action::PAPER:    return "PAPER";
        case Action::SCISSORS: return "SCISSORS";
    }
    return "UNKNOWN";
}

/**
 * @brief Разобрать ход из строки
 * @return nullopt если строка не является допустимым ходом
 */
inline std::optional<Action> tryParseAction(const std::string& str) {
    if (str == "ROCK")     return Action::ROCK;
    if (str == "PAPER")    return Action::PAPER;
    if (str == "SCISSORS") return Action::SCISSORS;
    return std::nullopt;
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline Action actionFromString(const std::string& str) {
    auto parsed = tryParseAction(str);
    if (!parsed) {
        throw std::invalid_argument("Unknown Action: " + str);
    }
    return *parsed;
}

} // namespace arena::domain

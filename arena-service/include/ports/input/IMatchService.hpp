#pragma once

#include "domain/RoundResult.hpp"
#include "domain/Match.hpp"
#include "domain/WinRateStats.hpp"
#include "domain/enums/Difficulty.hpp"
#include <optional>
#include <string>
#include <vector>

namespace arena::ports::input {

/**
 * @brief Интерфейс сервиса раундов
 */
class IMatchService {
public:
    virtual ~IMatchService() = default;

    /**
     * @brief Сыграть раунд против соперника
     *
     * @param accountId Аккаунт игрока
     * @param roundInput Ход игрока ("ROCK", "PAPER", "SCISSORS")
     * @param stake Ставка в кредитах
     * @param difficulty Уровень сложности (по умолчанию из конфигурации)
     * @return Результат разрешённого раунда
     *
     * @throws domain::ArenaException при отказе; состояние не меняется
     */
    virtual domain::RoundResult playRound(
        const std::string& accountId,
        const std::string& roundInput,
        domain::Credits stake,
        std::optional<domain::Difficulty> difficulty = std::nullopt
    ) = 0;

    virtual std::vector<domain::Match> getMatchHistory(const std::string& accountId) = 0;

    virtual std::vector<domain::Action> getMoveHistory(const std::string& accountId) = 0;

    /**
     * @brief Статистика, по которой соперник подстраивается под аккаунт
     *
     * При WinRateScope::PLATFORM возвращается общая статистика.
     */
    virtual domain::WinRateStats getWinRateStats(const std::string& accountId) = 0;
};

} // namespace arena::ports::input

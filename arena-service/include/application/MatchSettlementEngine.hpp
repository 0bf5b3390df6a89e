#pragma once

#include "ports/input/IMatchService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IMatchRepository.hpp"
#include "ports/output/IOpponentStrategy.hpp"
#include "ports/output/IRandomSource.hpp"
#include "ports/output/IVerificationProvider.hpp"
#include "application/AccountLockRegistry.hpp"
#include "application/ConfigRegistry.hpp"
#include "application/DailyLimitTracker.hpp"
#include "application/EventLog.hpp"
#include "application/Ledger.hpp"
#include "application/MoveHistoryStore.hpp"
#include "application/opponent/WinRateController.hpp"
#include <memory>

namespace arena::application {

/**
 * @brief Разрешение раунда и атомарная выплата
 *
 * Раунд проходит состояния
 * INITIATED -> LIMIT_RESERVED -> STAKE_DEBITED -> OPPONENT_MOVED -> RESOLVED,
 * либо ABORTED с восстановлением исходного состояния.
 *
 * Всё, начиная с резерва лимита, выполняется под блокировкой аккаунта.
 * Ledger-транзакция и резерв лимита откатываются автоматически при любом
 * исключении. Матч, история ходов, статистика и журнал событий пишутся
 * только после commit.
 */
class MatchSettlementEngine : public ports::input::IMatchService {
public:
    MatchSettlementEngine(
        std::shared_ptr<Ledger> ledger,
        std::shared_ptr<DailyLimitTracker> limits,
        std::shared_ptr<MoveHistoryStore> history,
        std::shared_ptr<opponent::WinRateController> winRate,
        std::shared_ptr<EventLog> eventLog,
        std::shared_ptr<ConfigRegistry> config,
        std::shared_ptr<AccountLockRegistry> locks,
        std::shared_ptr<ports::output::IVerificationProvider> verification,
        std::shared_ptr<ports::output::IOpponentStrategy> opponent,
        std::shared_ptr<ports::output::IRandomSource> random,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IMatchRepository> matches
    );

    domain::RoundResult playRound(
        const std::string& accountId,
        const std::string& roundInput,
        domain::Credits stake,
        std::optional<domain::Difficulty> difficulty = std::nullopt
    ) override;

    std::vector<domain::Match> getMatchHistory(const std::string& accountId) override;

    std::vector<domain::Action> getMoveHistory(const std::string& accountId) override;

    domain::WinRateStats getWinRateStats(const std::string& accountId) override;

    /**
     * @brief Выплата по исходу с позиции игрока
     *
     * WIN  -> stake * winMultiplierBps / 10000, округление вниз
     * TIE  -> stake
     * LOSE -> 0
     */
    static domain::Credits computePayout(domain::Credits stake, domain::Outcome outcome, int64_t winMultiplierBps);

private:
    std::shared_ptr<Ledger> ledger_;
    std::shared_ptr<DailyLimitTracker> limits_;
    std::shared_ptr<MoveHistoryStore> history_;
    std::shared_ptr<opponent::WinRateController> winRate_;
    std::shared_ptr<EventLog> eventLog_;
    std::shared_ptr<ConfigRegistry> config_;
    std::shared_ptr<AccountLockRegistry> locks_;
    std::shared_ptr<ports::output::IVerificationProvider> verification_;
    std::shared_ptr<ports::output::IOpponentStrategy> opponent_;
    std::shared_ptr<ports::output::IRandomSource> random_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IMatchRepository> matches_;
};

} // namespace arena::application

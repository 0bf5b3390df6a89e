#include "application/MatchSettlementEngine.hpp"
#include "domain/ArenaError.hpp"
#include "domain/events/RoundSettledEvent.hpp"
#include "utils/IdGenerator.hpp"
#include <iostream>

namespace arena::application {

using domain::ArenaException;
using domain::Credits;
using domain::ErrorCode;
using domain::Outcome;
using domain::RoundState;

MatchSettlementEngine::MatchSettlementEngine(
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
) : ledger_(std::move(ledger))
  , limits_(std::move(limits))
  , history_(std::move(history))
  , winRate_(std::move(winRate))
  , eventLog_(std::move(eventLog))
  , config_(std::move(config))
  , locks_(std::move(locks))
  , verification_(std::move(verification))
  , opponent_(std::move(opponent))
  , random_(std::move(random))
  , clock_(std::move(clock))
  , matches_(std::move(matches))
{}

Credits MatchSettlementEngine::computePayout(Credits stake, Outcome outcome, int64_t winMultiplierBps) {
    switch (outcome) {
        case Outcome::WIN:
            return domain::checked::mulDiv(stake, winMultiplierBps, 10'000, domain::Rounding::DOWN);
        case Outcome::TIE:
            return stake;
        case Outcome::LOSE:
            return 0;
    }
    throw domain::InvariantViolation("unknown outcome");
}

domain::RoundResult MatchSettlementEngine::playRound(
    const std::string& accountId,
    const std::string& roundInput,
    Credits stake,
    std::optional<domain::Difficulty> difficulty
) {
    auto cfg = config_->get();
    if (cfg.paused) {
        throw ArenaException(ErrorCode::SystemPaused, "rounds are paused");
    }

    auto playerAction = domain::tryParseAction(roundInput);
    if (!playerAction) {
        throw ArenaException(ErrorCode::InvalidInput, "unknown round input '" + roundInput + "'");
    }
    if (stake <= 0) {
        throw ArenaException(ErrorCode::InvalidStake, "stake must be positive, got " + std::to_string(stake));
    }
    auto level = difficulty.value_or(cfg.defaultDifficulty);

    auto lock = locks_->lock(accountId);

    Credits balance = ledger_->getBalance(accountId);
    if (stake > balance) {
        throw ArenaException(ErrorCode::InsufficientBalance,
            "stake " + std::to_string(stake) + " > balance " + std::to_string(balance));
    }
    if (!verification_->isVerified(accountId)) {
        throw ArenaException(ErrorCode::Unverified, accountId);
    }

    RoundState state = RoundState::INITIATED;
    try {
        auto now = clock_->now();
        auto reservation = limits_->reserve(accountId, stake, now);
        state = RoundState::LIMIT_RESERVED;

        domain::Match match;
        match.id = utils::IdGenerator::generateWithPrefix("match");
        match.accountId = accountId;
        match.sequence = matches_->countByAccountId(accountId) + 1;
        match.playerAction = *playerAction;
        match.difficulty = level;
        match.stake = stake;
        match.timestamp = now;

        auto tx = ledger_->begin(accountId);
        tx.debit(stake, domain::LedgerReason::STAKE, match.id);
        state = RoundState::STAKE_DEBITED;

        auto moves = history_->get(accountId);
        auto stats = winRate_->statsFor(accountId);
        match.opponentAction = opponent_->selectAction(moves, level, stats, cfg.targetWinRate, *random_);
        state = RoundState::OPPONENT_MOVED;

        match.outcome = domain::resolveOutcome(match.playerAction, match.opponentAction);
        match.payout = computePayout(stake, match.outcome, cfg.winMultiplierBps);
        if (match.payout > 0) {
            tx.credit(match.payout, domain::LedgerReason::PAYOUT, match.id);
        }
        match.balanceAfter = tx.balance();

        std::string payload = domain::RoundSettledEvent(match).toJson();

        // Последний шаг, который может бросить: до него ни баланс, ни лимиты не опубликованы
        matches_->save(match);

        tx.commit();
        reservation.commit();
        state = RoundState::RESOLVED;

        history_->append(accountId, match.playerAction);
        winRate_->record(accountId, match.opponentWon());
        eventLog_->append(accountId, domain::EventKind::ROUND, match.id, payload, now);

        std::cout << "[MatchSettlementEngine] " << accountId << " #" << match.sequence << ": "
                  << domain::toString(match.playerAction) << " vs " << domain::toString(match.opponentAction)
                  << " -> " << domain::toString(match.outcome)
                  << " (stake=" << stake << ", payout=" << match.payout
                  << ", balance=" << match.balanceAfter << ")" << std::endl;

        domain::RoundResult result;
        result.matchId = match.id;
        result.sequence = match.sequence;
        result.playerAction = match.playerAction;
        result.opponentAction = match.opponentAction;
        result.outcome = match.outcome;
        result.stake = match.stake;
        result.payout = match.payout;
        result.balanceAfter = match.balanceAfter;
        result.state = state;
        return result;
    } catch (const ArenaException& e) {
        std::cerr << "[MatchSettlementEngine] Round rejected for " << accountId
                  << " in state " << domain::toString(state) << ": " << e.what() << std::endl;
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[MatchSettlementEngine] Round " << domain::toString(RoundState::ABORTED)
                  << " for " << accountId << " after " << domain::toString(state)
                  << ": " << e.what() << std::endl;
        throw;
    }
}

std::vector<domain::Match> MatchSettlementEngine::getMatchHistory(const std::string& accountId) {
    return matches_->findByAccountId(accountId);
}

std::vector<domain::Action> MatchSettlementEngine::getMoveHistory(const std::string& accountId) {
    return history_->get(accountId);
}

domain::WinRateStats MatchSettlementEngine::getWinRateStats(const std::string& accountId) {
    return winRate_->statsFor(accountId);
}

} // namespace arena::application

#include "paperdesk/prediction_engine.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include "paperdesk/util.hpp"

namespace paperdesk {

PredictionEngine::PredictionEngine(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

std::string PredictionEngine::normalize_outcome(const std::string& outcome) {
    std::string normalized = trim(outcome);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return normalized;
}

Result<Bet> PredictionEngine::place_bet(Account& account, const PredictionMarket* market,
                                        const std::string& outcome, double amount) const {
    if (!std::isfinite(amount) || amount <= 0.0) return ErrorCode::InvalidAmount;
    if (!market) return ErrorCode::MarketNotFound;
    if (market->resolved) return ErrorCode::MarketAlreadyResolved;

    std::string key = normalize_outcome(outcome);
    auto it = market->outcomes.find(key);
    if (it == market->outcomes.end()) return ErrorCode::InvalidOutcome;

    double odds = it->second;
    if (!(odds > 0.0)) return ErrorCode::InvalidOdds;
    if (account.cash < amount) {
        if (logger_) {
            logger_->warn("Insufficient cash for bet on {}: need ${:.2f}, have ${:.2f}",
                          market->market_id, amount, account.cash);
        }
        return ErrorCode::InsufficientCash;
    }

    Bet bet;
    bet.account_id = account.id;
    bet.market_id = market->market_id;
    bet.outcome = key;
    bet.amount = amount;
    bet.odds = odds;
    bet.shares = amount / odds;

    account.cash -= amount;
    account.poly.add(bet.market_id, key, bet.shares, amount);
    return bet;
}

Result<Resolution> PredictionEngine::resolve_market(LedgerStore& store, const std::string& market_id,
                                                    const std::string& winning_outcome) const {
    PredictionMarket* market = store.find_market(trim(market_id));
    if (!market) return ErrorCode::MarketNotFound;

    std::string winner = normalize_outcome(winning_outcome);
    if (!market->outcomes.count(winner)) return ErrorCode::InvalidWinningOutcome;
    if (market->resolved) return ErrorCode::AlreadyResolved;

    market->resolved = true;
    market->winning_outcome = winner;

    Resolution resolution;
    resolution.market_id = market->market_id;
    resolution.winning_outcome = winner;

    for (const auto& account_id : store.account_ids()) {
        Account* account = store.find_account(account_id);
        if (!account) continue;

        double shares = account->poly.shares(market->market_id, winner);
        if (shares > 0.0) {
            account->cash += shares;
            account->poly_realized_pnl += shares;
            resolution.payouts.push_back({account->id, account->display_name, shares});
        }
        account->poly.erase(market->market_id);
    }
    return resolution;
}

} // namespace paperdesk

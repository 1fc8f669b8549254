#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "ledger_store.hpp"
#include "types.hpp"

namespace paperdesk {

// Mark-to-market equity of accounts against the store's last-known prices
// and current market odds.
class ValuationService {
public:
    explicit ValuationService(double starting_cash);

    Valuation value(const Account& account, const LedgerStore& store) const;

    // Every account (or only eligible ones), equity descending. Ties keep
    // registration order.
    std::vector<LeaderboardRow> leaderboard(const LedgerStore& store, bool eligible_only = false) const;

    // 1-based rank among eligible accounts, and the eligible count.
    std::pair<std::optional<std::size_t>, std::size_t> rank_of(const LedgerStore& store,
                                                               const std::string& account_id) const;

    // Replays the account's registration, order and bet events. max_points is
    // clamped to [3, 200]; the last point is the current valuation at `now`.
    std::vector<EquityPoint> equity_curve(const LedgerStore& store, const std::string& account_id,
                                          std::size_t max_points, const std::string& now) const;

    double starting_cash() const { return starting_cash_; }

private:
    double starting_cash_;
};

} // namespace paperdesk
